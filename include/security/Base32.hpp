#pragma once

#include <string>
#include <optional>
#include <cstdint>

namespace authcore::security {

/**
 * @brief base32 (RFC 4648) для TOTP секретов
 *
 * encode пишет без паддинга, decode принимает любой регистр и
 * завершающие '='.
 */
class Base32 {
public:
    static std::string encode(const std::string& input) {
        static const char* alphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZ234567";
        std::string result;
        result.reserve((input.size() * 8 + 4) / 5);
        uint32_t buffer = 0;
        int bits = 0;
        for (unsigned char c : input) {
            buffer = (buffer << 8) | c;
            bits += 8;
            while (bits >= 5) {
                result.push_back(alphabet[(buffer >> (bits - 5)) & 0x1F]);
                bits -= 5;
            }
        }
        if (bits > 0) {
            result.push_back(alphabet[(buffer << (5 - bits)) & 0x1F]);
        }
        return result;
    }

    static std::optional<std::string> decode(const std::string& input) {
        size_t end = input.size();
        while (end > 0 && input[end - 1] == '=') --end;

        std::string result;
        uint32_t buffer = 0;
        int bits = 0;
        for (size_t i = 0; i < end; ++i) {
            int d = lookup(static_cast<unsigned char>(input[i]));
            if (d < 0) return std::nullopt;
            buffer = ((buffer << 5) | static_cast<uint32_t>(d)) & 0xFFFF;
            bits += 5;
            if (bits >= 8) {
                result.push_back(static_cast<char>((buffer >> (bits - 8)) & 0xFF));
                bits -= 8;
            }
        }
        return result;
    }

private:
    static int lookup(unsigned char c) {
        if (c >= 'A' && c <= 'Z') return c - 'A';
        if (c >= 'a' && c <= 'z') return c - 'a';
        if (c >= '2' && c <= '7') return c - '2' + 26;
        return -1;
    }
};

} // namespace authcore::security
