#include "lsb_audio_stego.hpp"
#include "bit_codec.hpp"

#include <vector>
#include <iostream>
#include <cstdint>

namespace audstego {

    size_t lsbCapacityBits(const SampleBuffer& buffer)
    {
        return buffer.size();
    }

    size_t lsbMaxMessageChars(const SampleBuffer& buffer)
    {
        size_t chars = lsbCapacityBits(buffer) / 8;
        return chars > TERMINATOR.size() ? chars - TERMINATOR.size() : 0;
    }

    bool encodeLSB(const SampleBuffer& cover,
                   const std::string& message,
                   SampleBuffer& outStego)
    {
        checkSampleBuffer(cover);
        std::vector<uint8_t> bits = encodeBits(message);
        size_t capacityBits = lsbCapacityBits(cover);

        if (bits.size() > capacityBits) {
            std::cerr << "[lsb embed] Message too long. Need " << bits.size()
                      << " bits, capacity = " << capacityBits << " bits.\n";
            return false;
        }

        SampleBuffer stego = cloneBuffer(cover);
        int16_t* samples = stego.data();

        for (size_t i = 0; i < bits.size(); ++i) {
            // work on the raw 16-bit pattern, never the signed value
            uint16_t pattern = static_cast<uint16_t>(samples[i]);
            pattern = static_cast<uint16_t>((pattern & 0xFFFE) | bits[i]);
            samples[i] = static_cast<int16_t>(pattern);
        }

        outStego = stego;
        std::cout << "[lsb embed] Done. " << bits.size() << " bits in "
                  << capacityBits << " samples." << std::endl;
        return true;
    }

    bool extractLSB(const SampleBuffer& stego,
                    std::string& outMessage)
    {
        checkSampleBuffer(stego);
        const int16_t* samples = stego.data();

        std::vector<uint8_t> bits;
        bits.reserve(stego.size());

        // 把所有 LSB 读出来
        for (size_t i = 0; i < stego.size(); ++i) {
            bits.push_back(static_cast<uint16_t>(samples[i]) & 1);
        }

        return decodeBits(bits, outMessage);
    }

    std::string decodeLSB(const SampleBuffer& stego)
    {
        std::string message;
        if (!extractLSB(stego, message)) {
            return NO_MESSAGE_FOUND;
        }
        return message;
    }

}
