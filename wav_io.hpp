#ifndef WAV_IO_HPP
#define WAV_IO_HPP

#include "sample_buffer.hpp"

#include <stdexcept>
#include <string>
#include <vector>
#include <cstdint>

// 16-bit PCM WAV container. Assumes a little-endian host.
namespace wavio {

    // Malformed RIFF/WAVE data or anything other than 16-bit PCM.
    class FormatError : public std::runtime_error {
    public:
        explicit FormatError(const std::string& what)
            : std::runtime_error(what) {}
    };

    audstego::SampleBuffer readWav(const std::vector<uint8_t>& bytes);
    std::vector<uint8_t> writeWav(const audstego::SampleBuffer& buffer);

    // File variants; I/O failures throw std::runtime_error.
    audstego::SampleBuffer readWavFile(const std::string& path);
    void writeWavFile(const std::string& path, const audstego::SampleBuffer& buffer);

}

#endif // WAV_IO_HPP
