#ifndef LSB_AUDIO_STEGO_HPP
#define LSB_AUDIO_STEGO_HPP

#include "sample_buffer.hpp"

#include <string>
#include <cstddef>

// LSB: one payload bit in the lowest bit of each 16-bit sample
namespace audstego {

    // Hide message in cover -> outStego (a fresh copy, cover is untouched).
    // Returns false when message + terminator needs more bits than samples.
    bool encodeLSB(const SampleBuffer& cover,
                   const std::string& message,
                   SampleBuffer& outStego);

    // Returns false if no terminated message is present.
    bool extractLSB(const SampleBuffer& stego,
                    std::string& outMessage);

    // Same as extractLSB, but yields NO_MESSAGE_FOUND instead of false.
    std::string decodeLSB(const SampleBuffer& stego);

    size_t lsbCapacityBits(const SampleBuffer& buffer);
    size_t lsbMaxMessageChars(const SampleBuffer& buffer);

}

#endif // LSB_AUDIO_STEGO_HPP
