#include "echo_params.hpp"

#include <opencv2/core.hpp>
#include <iostream>
#include <sstream>

namespace audstego {

    static bool delayInRange(int d)
    {
        return d >= ECHO_DELAY_MIN && d <= ECHO_DELAY_MAX &&
               (d - ECHO_DELAY_MIN) % ECHO_DELAY_STEP == 0;
    }

    bool checkEchoParams(const EchoParams& params, std::string& outReason)
    {
        std::ostringstream why;

        if (!delayInRange(params.d0) || !delayInRange(params.d1)) {
            why << "delays must be in [" << ECHO_DELAY_MIN << ", " << ECHO_DELAY_MAX
                << "] in steps of " << ECHO_DELAY_STEP
                << " (got d0=" << params.d0 << ", d1=" << params.d1 << ")";
        } else if (params.d0 == params.d1) {
            why << "d0 and d1 must differ (both " << params.d0 << ")";
        } else if (!(params.alpha >= ECHO_ALPHA_MIN - 1e-9 && params.alpha <= ECHO_ALPHA_MAX + 1e-9)) {
            why << "alpha must be in [" << ECHO_ALPHA_MIN << ", " << ECHO_ALPHA_MAX
                << "] (got " << params.alpha << ")";
        } else {
            return true;
        }

        outReason = why.str();
        return false;
    }

    bool saveEchoParams(const std::string& path, const EchoParams& params)
    {
        try {
            cv::FileStorage fs(path, cv::FileStorage::WRITE);
            if (!fs.isOpened()) {
                std::cerr << "[params] Failed to open for writing: " << path << std::endl;
                return false;
            }

            fs << "d0" << params.d0;
            fs << "d1" << params.d1;
            fs << "alpha" << params.alpha;
            fs << "chunk_size" << ECHO_CHUNK_SIZE;
            fs.release();
        } catch (const cv::Exception& e) {
            std::cerr << "[params] Failed to write " << path << ": " << e.what() << std::endl;
            return false;
        }
        return true;
    }

    static bool readKeyFile(const std::string& path, EchoParams& outParams)
    {
        cv::FileStorage fs(path, cv::FileStorage::READ);
        if (!fs.isOpened()) {
            std::cerr << "[params] Failed to open: " << path << std::endl;
            return false;
        }

        cv::FileNode d0 = fs["d0"];
        cv::FileNode d1 = fs["d1"];
        cv::FileNode alpha = fs["alpha"];
        cv::FileNode chunk = fs["chunk_size"];

        if (d0.empty() || d1.empty() || alpha.empty() || chunk.empty()) {
            std::cerr << "[params] Missing key in " << path << std::endl;
            return false;
        }

        if (static_cast<int>(chunk) != ECHO_CHUNK_SIZE) {
            std::cerr << "[params] Unsupported chunk_size " << static_cast<int>(chunk)
                      << " (expected " << ECHO_CHUNK_SIZE << ")" << std::endl;
            return false;
        }

        EchoParams p;
        p.d0 = static_cast<int>(d0);
        p.d1 = static_cast<int>(d1);
        p.alpha = static_cast<double>(alpha);

        outParams = p;
        return true;
    }

    bool loadEchoParams(const std::string& path, EchoParams& outParams)
    {
        // the parser throws on malformed YAML/JSON
        try {
            return readKeyFile(path, outParams);
        } catch (const cv::Exception& e) {
            std::cerr << "[params] Failed to parse " << path << ": " << e.what() << std::endl;
            return false;
        }
    }

}
