#ifndef ECHO_AUDIO_STEGO_HPP
#define ECHO_AUDIO_STEGO_HPP

#include "sample_buffer.hpp"

#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>

// Echo hiding: each bit adds a delayed, attenuated copy of one chunk of the
// cover. The delay (d0 or d1) carries the bit value. Decoding needs the
// original cover as well as the stego signal.
namespace audstego {

    constexpr int ECHO_CHUNK_SIZE = 8192;   // samples per embedded bit

    struct EchoParams {
        int d0 = 200;        // delay for bit 0, samples
        int d1 = 400;        // delay for bit 1, samples
        double alpha = 0.5;  // echo amplitude
    };

    struct ChunkDiagnostic {
        size_t chunk = 0;
        double corrD0 = 0.0;
        double corrD1 = 0.0;
        int bit = 0;
    };

    struct EchoDecodeResult {
        bool found = false;
        std::string message;                      // NO_MESSAGE_FOUND if !found
        std::vector<ChunkDiagnostic> diagnostics; // one entry per chunk
        std::vector<uint8_t> bits;
    };

    // Throws std::invalid_argument if d0 == d1, a delay is not positive or
    // alpha is outside (0, 1]. Returns false when the message needs more
    // than bits * ECHO_CHUNK_SIZE + max(d0, d1) samples.
    bool encodeEcho(const SampleBuffer& cover,
                    const std::string& message,
                    const EchoParams& params,
                    SampleBuffer& outStego);

    // Buffers of different length are compared over the shorter one.
    // Returns out.found. Throws std::invalid_argument on bad delays.
    bool decodeEcho(const SampleBuffer& original,
                    const SampleBuffer& stego,
                    int d0,
                    int d1,
                    EchoDecodeResult& out);

    std::string formatDiagnostic(const ChunkDiagnostic& d);

    size_t echoMaxMessageChars(const SampleBuffer& buffer, const EchoParams& params);

}

#endif // ECHO_AUDIO_STEGO_HPP
