#ifndef ECHO_PARAMS_HPP
#define ECHO_PARAMS_HPP

#include "echo_audio_stego.hpp"

#include <string>

namespace audstego {

    // Ranges offered to users; the engines accept any distinct positive delays.
    constexpr int ECHO_DELAY_MIN = 100;
    constexpr int ECHO_DELAY_MAX = 500;
    constexpr int ECHO_DELAY_STEP = 50;
    constexpr double ECHO_ALPHA_MIN = 0.3;
    constexpr double ECHO_ALPHA_MAX = 0.8;

    // false + reason if params fall outside the ranges above or d0 == d1
    bool checkEchoParams(const EchoParams& params, std::string& outReason);

    // Echo key file (YAML/JSON by extension): d0, d1, alpha, chunk_size.
    // Decoding needs the same delays, so the CLI stores them beside the stego file.
    bool saveEchoParams(const std::string& path, const EchoParams& params);
    bool loadEchoParams(const std::string& path, EchoParams& outParams);

}

#endif // ECHO_PARAMS_HPP
