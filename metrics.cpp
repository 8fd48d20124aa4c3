#include "metrics.hpp"

#include <opencv2/core.hpp>
#include <algorithm>
#include <cmath>
#include <limits>

namespace metrics {

    // --- SNR ---
    double computeSNR(const audstego::SampleBuffer& original,
                      const audstego::SampleBuffer& stego)
    {
        audstego::checkSampleBuffer(original);
        audstego::checkSampleBuffer(stego);

        const int n = static_cast<int>(std::min(original.size(), stego.size()));
        if (n == 0) return 0.0;

        cv::Mat o, s;
        original.samples.colRange(0, n).convertTo(o, CV_64F);
        stego.samples.colRange(0, n).convertTo(s, CV_64F);

        double signal = cv::norm(o, cv::NORM_L2SQR);
        double noise = cv::norm(o, s, cv::NORM_L2SQR);

        if (noise == 0.0) return std::numeric_limits<double>::infinity();
        return 10.0 * std::log10(signal / noise);
    }

    // --- BER ---
    double computeBER(const std::string& original, const std::string& extracted)
    {
        if (original.size() != extracted.size()) {
            return 1.0; // 100% wrong
        }
        if (original.empty()) return 0.0;

        int bitErrors = 0;
        int totalBits = static_cast<int>(original.size()) * 8;

        for (size_t i = 0; i < original.size(); i++) {
            uint8_t a = original[i];
            uint8_t b = extracted[i];

            uint8_t diff = a ^ b;
            bitErrors += __builtin_popcount(diff);
        }

        return (double)bitErrors / totalBits;
    }

    double computeBitErrorRate(const std::vector<uint8_t>& expected,
                               const std::vector<uint8_t>& actual)
    {
        const size_t longest = std::max(expected.size(), actual.size());
        if (longest == 0) return 0.0;

        const size_t common = std::min(expected.size(), actual.size());
        size_t errors = longest - common;
        for (size_t i = 0; i < common; ++i) {
            if ((expected[i] & 1) != (actual[i] & 1)) ++errors;
        }
        return static_cast<double>(errors) / longest;
    }

}
