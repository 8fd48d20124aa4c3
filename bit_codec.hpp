#ifndef BIT_CODEC_HPP
#define BIT_CODEC_HPP

#include <string>
#include <vector>
#include <cstdint>

// Text <-> framed bitstream shared by the LSB and echo engines.
// Every message is sent as  message + TERMINATOR, 8 bits per char, MSB first.
namespace audstego {

    extern const std::string TERMINATOR;        // "###"
    extern const std::string NO_MESSAGE_FOUND;  // "No hidden message found"

    // One element per bit, each 0 or 1.
    std::vector<uint8_t> encodeBits(const std::string& message);

    // Reads the stream 8 bits at a time until the accumulated text ends with
    // TERMINATOR. A zero byte or a partial tail stops the scan. With
    // asciiOnly, byte values above 127 stop it too (echo mode).
    // A message that itself contains "###" is cut at that point.
    // Returns false if no terminator was reached.
    bool decodeBits(const std::vector<uint8_t>& bits,
                    std::string& outMessage,
                    bool asciiOnly = false);

}

#endif // BIT_CODEC_HPP
