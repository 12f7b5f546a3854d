#pragma once

#include "domain/Timestamp.hpp"
#include "security/Base32.hpp"
#include "security/SecretCodec.hpp"
#include <openssl/hmac.h>
#include <openssl/evp.h>
#include <string>
#include <optional>
#include <chrono>
#include <cstdint>
#include <cctype>

namespace authcore::security {

/**
 * @brief TOTP (RFC 6238): HMAC-SHA1, шаг 30 секунд, 6 цифр
 */
class Totp {
public:
    static constexpr int64_t STEP_SECONDS = 30;
    static constexpr int DIGITS = 6;
    static constexpr int DEFAULT_SKEW = 1;

    /**
     * @brief Код для момента at
     * @return std::nullopt, если seed не base32 или пуст
     */
    static std::optional<std::string> generate(const std::string& seed, domain::TimePoint at) {
        auto key = Base32::decode(seed);
        if (!key || key->empty()) return std::nullopt;
        return codeForCounter(*key, counterFor(at));
    }

    /**
     * @brief Проверить код с допуском +-skew шагов
     */
    static bool verify(const std::string& seed, const std::string& code,
                       domain::TimePoint now, int skew = DEFAULT_SKEW) {
        if (code.size() != DIGITS) return false;
        for (char c : code) {
            if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        }

        auto key = Base32::decode(seed);
        if (!key || key->empty()) return false;

        int64_t counter = counterFor(now);
        bool matched = false;
        for (int offset = -skew; offset <= skew; ++offset) {
            if (counter + offset < 0) continue;
            auto candidate = codeForCounter(*key, static_cast<uint64_t>(counter + offset));
            if (!candidate) continue;
            // без раннего выхода, чтобы время не зависело от позиции совпадения
            if (SecretCodec::constantTimeEquals(*candidate, code)) matched = true;
        }
        return matched;
    }

    /**
     * @brief URI для QR кода в приложении-аутентификаторе
     */
    static std::string provisioningUri(const std::string& issuer,
                                       const std::string& accountName,
                                       const std::string& seed) {
        return "otpauth://totp/" + urlEncode(issuer) + ":" + urlEncode(accountName) +
               "?secret=" + seed +
               "&issuer=" + urlEncode(issuer) +
               "&algorithm=SHA1&digits=" + std::to_string(DIGITS) +
               "&period=" + std::to_string(STEP_SECONDS);
    }

private:
    static int64_t counterFor(domain::TimePoint at) {
        auto seconds = std::chrono::duration_cast<std::chrono::seconds>(
            at.time_since_epoch()).count();
        return seconds / STEP_SECONDS;
    }

    static std::optional<std::string> codeForCounter(const std::string& key, uint64_t counter) {
        unsigned char message[8];
        for (int i = 7; i >= 0; --i) {
            message[i] = static_cast<unsigned char>(counter & 0xFF);
            counter >>= 8;
        }

        unsigned char mac[EVP_MAX_MD_SIZE];
        unsigned int macLength = 0;
        if (!HMAC(EVP_sha1(), key.data(), static_cast<int>(key.size()),
                  message, sizeof(message), mac, &macLength) || macLength < 20) {
            return std::nullopt;
        }

        int offset = mac[macLength - 1] & 0x0F;
        uint32_t binary = (static_cast<uint32_t>(mac[offset] & 0x7F) << 24) |
                          (static_cast<uint32_t>(mac[offset + 1]) << 16) |
                          (static_cast<uint32_t>(mac[offset + 2]) << 8) |
                          static_cast<uint32_t>(mac[offset + 3]);

        uint32_t code = binary % 1000000;
        std::string result = std::to_string(code);
        return std::string(DIGITS - result.size(), '0') + result;
    }

    static std::string urlEncode(const std::string& value) {
        static const char* hex = "0123456789ABCDEF";
        std::string result;
        for (unsigned char c : value) {
            if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
                result.push_back(static_cast<char>(c));
            } else {
                result.push_back('%');
                result.push_back(hex[c >> 4]);
                result.push_back(hex[c & 0x0F]);
            }
        }
        return result;
    }
};

} // namespace authcore::security
