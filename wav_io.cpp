#include "wav_io.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <cstring>

namespace wavio {

    struct RiffHeader {
        char chunkId[4];
        uint32_t chunkSize;
        char format[4];
    };

    struct ChunkHeader {
        char id[4];
        uint32_t size;
    };

    struct FmtBody {
        uint16_t audioFormat;
        uint16_t numChannels;
        uint32_t sampleRate;
        uint32_t byteRate;
        uint16_t blockAlign;
        uint16_t bitsPerSample;
    };

    static const uint16_t WAVE_FORMAT_PCM = 1;

    static void readAt(const std::vector<uint8_t>& bytes, size_t pos, void* dst, size_t size)
    {
        if (pos > bytes.size() || bytes.size() - pos < size) {
            throw FormatError("Unexpected end of WAV data");
        }
        std::memcpy(dst, bytes.data() + pos, size);
    }

    audstego::SampleBuffer readWav(const std::vector<uint8_t>& bytes)
    {
        RiffHeader riff{};
        readAt(bytes, 0, &riff, sizeof(RiffHeader));
        if (std::strncmp(riff.chunkId, "RIFF", 4) != 0 || std::strncmp(riff.format, "WAVE", 4) != 0) {
            throw FormatError("Invalid WAV file");
        }

        FmtBody fmt{};
        bool haveFmt = false;
        size_t pos = sizeof(RiffHeader);

        while (true) {
            ChunkHeader header{};
            readAt(bytes, pos, &header, sizeof(ChunkHeader));
            pos += sizeof(ChunkHeader);

            if (std::strncmp(header.id, "fmt ", 4) == 0) {
                if (header.size < sizeof(FmtBody)) {
                    throw FormatError("Invalid fmt chunk");
                }
                readAt(bytes, pos, &fmt, sizeof(FmtBody));
                haveFmt = true;
            } else if (std::strncmp(header.id, "data", 4) == 0) {
                if (!haveFmt) {
                    throw FormatError("data chunk before fmt chunk");
                }
                if (fmt.audioFormat != WAVE_FORMAT_PCM || fmt.bitsPerSample != 16) {
                    throw FormatError("Only 16-bit PCM WAV supported");
                }
                if (fmt.numChannels == 0) {
                    throw FormatError("WAV declares zero channels");
                }

                // tolerate a data size running past the end of a truncated file
                size_t available = bytes.size() - pos;
                size_t dataSize = std::min<size_t>(header.size, available);
                size_t frames = dataSize / (sizeof(int16_t) * fmt.numChannels);
                size_t count = frames * fmt.numChannels;

                std::vector<int16_t> pcm(count);
                if (count > 0) {
                    std::memcpy(pcm.data(), bytes.data() + pos, count * sizeof(int16_t));
                }
                return audstego::makeSampleBuffer(pcm, fmt.numChannels,
                                                  static_cast<int>(fmt.sampleRate));
            }

            // chunks are word aligned
            pos += static_cast<size_t>(header.size) + (header.size & 1);
        }
    }

    std::vector<uint8_t> writeWav(const audstego::SampleBuffer& buffer)
    {
        audstego::checkSampleBuffer(buffer);

        const audstego::AudioFormat& f = buffer.format;
        const uint16_t channels = static_cast<uint16_t>(f.channels > 0 ? f.channels : 1);
        const uint32_t dataSize = static_cast<uint32_t>(buffer.size() * sizeof(int16_t));
        const uint32_t fmtChunkSize = sizeof(FmtBody);

        RiffHeader riff{};
        std::memcpy(riff.chunkId, "RIFF", 4);
        riff.chunkSize = 4 + (8 + fmtChunkSize) + (8 + dataSize);
        std::memcpy(riff.format, "WAVE", 4);

        ChunkHeader fmtHeader{};
        std::memcpy(fmtHeader.id, "fmt ", 4);
        fmtHeader.size = fmtChunkSize;

        FmtBody fmt{};
        fmt.audioFormat = WAVE_FORMAT_PCM;
        fmt.numChannels = channels;
        fmt.sampleRate = static_cast<uint32_t>(f.sampleRate);
        fmt.bitsPerSample = 16;
        fmt.blockAlign = static_cast<uint16_t>(channels * (fmt.bitsPerSample / 8));
        fmt.byteRate = fmt.sampleRate * fmt.blockAlign;

        ChunkHeader dataHeader{};
        std::memcpy(dataHeader.id, "data", 4);
        dataHeader.size = dataSize;

        std::vector<uint8_t> out;
        out.reserve(sizeof(RiffHeader) + 2 * sizeof(ChunkHeader) + fmtChunkSize + dataSize);

        auto append = [&out](const void* p, size_t size) {
            const uint8_t* b = static_cast<const uint8_t*>(p);
            out.insert(out.end(), b, b + size);
        };

        append(&riff, sizeof(RiffHeader));
        append(&fmtHeader, sizeof(ChunkHeader));
        append(&fmt, sizeof(FmtBody));
        append(&dataHeader, sizeof(ChunkHeader));
        if (dataSize > 0) {
            append(buffer.data(), dataSize);
        }
        return out;
    }

    audstego::SampleBuffer readWavFile(const std::string& path)
    {
        std::ifstream in(path, std::ios::binary);
        if (!in) {
            throw std::runtime_error("Failed to open WAV file: " + path);
        }
        std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)),
                                   std::istreambuf_iterator<char>());
        return readWav(bytes);
    }

    void writeWavFile(const std::string& path, const audstego::SampleBuffer& buffer)
    {
        std::vector<uint8_t> bytes = writeWav(buffer);

        std::ofstream out(path, std::ios::binary);
        if (!out) {
            throw std::runtime_error("Failed to open output WAV file: " + path);
        }
        out.write(reinterpret_cast<const char*>(bytes.data()), bytes.size());
        if (!out) {
            throw std::runtime_error("Failed to write WAV file: " + path);
        }
    }

}
