#ifndef CLI_HPP
#define CLI_HPP

// Command-line front end: encode, decode, info, snr.
namespace audstego {

    enum ExitCode {
        EXIT_OK = 0,
        EXIT_USAGE = 1,      // bad flags or echo parameters
        EXIT_CAPACITY = 2,   // message does not fit the cover
        EXIT_IO = 3          // unreadable/malformed WAV, key file errors
    };

    int runCli(int argc, char** argv);

}

#endif // CLI_HPP
