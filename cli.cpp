#include "cli.hpp"
#include "echo_audio_stego.hpp"
#include "echo_params.hpp"
#include "lsb_audio_stego.hpp"
#include "metrics.hpp"
#include "wav_io.hpp"

#include <opencv2/core.hpp>
#include <exception>
#include <stdexcept>
#include <iostream>
#include <string>

namespace audstego {

namespace {

    const char* KEYS =
        "{help h usage ? |       | print this message }"
        "{@command       |       | encode, decode, info or snr }"
        "{method m       | lsb   | lsb or echo }"
        "{in i           | <none>| input WAV (cover for encode, stego for decode) }"
        "{out o          | <none>| output stego WAV }"
        "{original       | <none>| original cover WAV (echo decode, snr) }"
        "{message        | <none>| text to hide }"
        "{d0             | 200   | echo delay for bit 0, samples }"
        "{d1             | 400   | echo delay for bit 1, samples }"
        "{alpha          | 0.5   | echo strength }"
        "{params p       | <none>| echo key file (.yml/.json); written by encode, read by decode }"
        "{verbose v      | false | print per-chunk echo correlations }";

    bool readEchoParams(const cv::CommandLineParser& parser, audstego::EchoParams& params)
    {
        params.d0 = parser.get<int>("d0");
        params.d1 = parser.get<int>("d1");
        params.alpha = parser.get<double>("alpha");

        std::string reason;
        if (!audstego::checkEchoParams(params, reason)) {
            std::cerr << "[params] " << reason << std::endl;
            return false;
        }
        return true;
    }

    int runEncode(const cv::CommandLineParser& parser, const std::string& method)
    {
        if (!parser.has("in") || !parser.has("out") || !parser.has("message")) {
            std::cerr << "[encode] --in, --out and --message are required" << std::endl;
            return EXIT_USAGE;
        }

        std::string inPath = parser.get<std::string>("in");
        std::string outPath = parser.get<std::string>("out");
        std::string message = parser.get<std::string>("message");

        audstego::SampleBuffer cover = wavio::readWavFile(inPath);
        audstego::SampleBuffer stego;

        if (method == "lsb") {
            if (!audstego::encodeLSB(cover, message, stego)) {
                std::cerr << "[encode] Message is too large for this audio file (max "
                          << audstego::lsbMaxMessageChars(cover) << " chars)" << std::endl;
                return EXIT_CAPACITY;
            }
        } else {
            audstego::EchoParams params;
            if (!readEchoParams(parser, params)) return EXIT_USAGE;

            if (!audstego::encodeEcho(cover, message, params, stego)) {
                std::cerr << "[encode] Message is too large for this audio file (max "
                          << audstego::echoMaxMessageChars(cover, params) << " chars)" << std::endl;
                return EXIT_CAPACITY;
            }

            if (parser.has("params")) {
                std::string keyPath = parser.get<std::string>("params");
                if (!audstego::saveEchoParams(keyPath, params)) return EXIT_IO;
                std::cout << "[encode] Echo parameters saved: " << keyPath << std::endl;
            }
            std::cout << "[encode] Keep the original audio file, it is needed to decode." << std::endl;
        }

        wavio::writeWavFile(outPath, stego);
        std::cout << "[encode] Saved: " << outPath << std::endl;
        return EXIT_OK;
    }

    int runDecode(const cv::CommandLineParser& parser, const std::string& method)
    {
        if (!parser.has("in")) {
            std::cerr << "[decode] --in is required" << std::endl;
            return EXIT_USAGE;
        }
        audstego::SampleBuffer stego = wavio::readWavFile(parser.get<std::string>("in"));

        if (method == "lsb") {
            std::cout << audstego::decodeLSB(stego) << std::endl;
            return EXIT_OK;
        }

        if (!parser.has("original")) {
            std::cerr << "[decode] echo decoding needs --original" << std::endl;
            return EXIT_USAGE;
        }
        audstego::SampleBuffer original = wavio::readWavFile(parser.get<std::string>("original"));

        audstego::EchoParams params;
        if (parser.has("params")) {
            if (!audstego::loadEchoParams(parser.get<std::string>("params"), params)) {
                return EXIT_IO;
            }
        } else if (!readEchoParams(parser, params)) {
            return EXIT_USAGE;
        }

        audstego::EchoDecodeResult result;
        audstego::decodeEcho(original, stego, params.d0, params.d1, result);

        if (parser.get<bool>("verbose")) {
            for (const audstego::ChunkDiagnostic& d : result.diagnostics) {
                std::cerr << "[echo extract] " << audstego::formatDiagnostic(d) << "\n";
            }
        }

        std::cout << result.message << std::endl;
        return EXIT_OK;
    }

    int runInfo(const cv::CommandLineParser& parser)
    {
        if (!parser.has("in")) {
            std::cerr << "[info] --in is required" << std::endl;
            return EXIT_USAGE;
        }
        audstego::SampleBuffer buf = wavio::readWavFile(parser.get<std::string>("in"));

        audstego::EchoParams params;
        params.d0 = parser.get<int>("d0");
        params.d1 = parser.get<int>("d1");

        std::cout << "channels:     " << buf.format.channels << "\n"
                  << "sample rate:  " << buf.format.sampleRate << "\n"
                  << "frames:       " << buf.format.frames << "\n"
                  << "samples:      " << buf.size() << "\n"
                  << "lsb capacity: " << audstego::lsbMaxMessageChars(buf) << " chars\n"
                  << "echo capacity: " << audstego::echoMaxMessageChars(buf, params)
                  << " chars (d0=" << params.d0 << ", d1=" << params.d1 << ")" << std::endl;
        return EXIT_OK;
    }

    int runSnr(const cv::CommandLineParser& parser)
    {
        if (!parser.has("in") || !parser.has("original")) {
            std::cerr << "[snr] --original and --in are required" << std::endl;
            return EXIT_USAGE;
        }
        audstego::SampleBuffer original = wavio::readWavFile(parser.get<std::string>("original"));
        audstego::SampleBuffer stego = wavio::readWavFile(parser.get<std::string>("in"));

        std::cout << "SNR: " << metrics::computeSNR(original, stego) << " dB" << std::endl;
        return EXIT_OK;
    }

}

    int runCli(int argc, char** argv)
    {
        cv::CommandLineParser parser(argc, argv, KEYS);
        parser.about("audstego: hide text in 16-bit PCM WAV files (LSB or echo hiding)");

        if (parser.has("help")) {
            parser.printMessage();
            return EXIT_OK;
        }

        std::string command = parser.get<std::string>("@command");
        std::string method = parser.get<std::string>("method");

        if (!parser.check()) {
            parser.printErrors();
            return EXIT_USAGE;
        }

        if (method != "lsb" && method != "echo") {
            std::cerr << "Unknown method: " << method << " (use lsb or echo)" << std::endl;
            return EXIT_USAGE;
        }

        try {
            if (command == "encode") return runEncode(parser, method);
            if (command == "decode") return runDecode(parser, method);
            if (command == "info") return runInfo(parser);
            if (command == "snr") return runSnr(parser);
        } catch (const wavio::FormatError& e) {
            std::cerr << "[wav] " << e.what() << std::endl;
            return EXIT_IO;
        } catch (const std::invalid_argument& e) {
            std::cerr << "[params] " << e.what() << std::endl;
            return EXIT_USAGE;
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << std::endl;
            return EXIT_IO;
        }

        parser.printMessage();
        return EXIT_USAGE;
    }

}
