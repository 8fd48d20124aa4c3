#include "bit_codec.hpp"

namespace audstego {

    const std::string TERMINATOR = "###";
    const std::string NO_MESSAGE_FOUND = "No hidden message found";

    static bool endsWith(const std::string& s, const std::string& suffix) {
        return s.size() >= suffix.size() &&
               s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
    }

    std::vector<uint8_t> encodeBits(const std::string& message)
    {
        const std::string framed = message + TERMINATOR;

        std::vector<uint8_t> bits;
        bits.reserve(framed.size() * 8);

        for (char c : framed) {
            uint8_t byte = static_cast<uint8_t>(c);
            for (int i = 7; i >= 0; --i) {
                bits.push_back((byte >> i) & 1);
            }
        }
        return bits;
    }

    bool decodeBits(const std::vector<uint8_t>& bits,
                    std::string& outMessage,
                    bool asciiOnly)
    {
        std::string chars;

        for (size_t pos = 0; pos + 8 <= bits.size(); pos += 8) {
            uint8_t cur = 0;
            for (int i = 0; i < 8; ++i) {
                cur = (cur << 1) | (bits[pos + i] & 1);
            }

            // unused capacity reads back as zero bytes
            if (cur == 0) break;
            if (asciiOnly && cur > 127) break;

            chars.push_back(static_cast<char>(cur));

            // first terminator wins; bits after it are whatever the cover held
            if (endsWith(chars, TERMINATOR)) {
                outMessage = chars.substr(0, chars.size() - TERMINATOR.size());
                return true;
            }
        }

        return false;
    }

}
