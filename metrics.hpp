#ifndef METRICS_HPP
#define METRICS_HPP

#include "sample_buffer.hpp"

#include <string>
#include <vector>
#include <cstdint>

namespace metrics {

    // Signal-to-noise ratio of stego against original in dB, over the common
    // length. +inf when the two are identical.
    double computeSNR(const audstego::SampleBuffer& original,
                      const audstego::SampleBuffer& stego);

    // BER for extracted vs original text
    double computeBER(const std::string& original, const std::string& extracted);

    // BER between two bitstreams (0/1 per element); missing bits count as errors
    double computeBitErrorRate(const std::vector<uint8_t>& expected,
                               const std::vector<uint8_t>& actual);
}

#endif
