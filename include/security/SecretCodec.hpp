#pragma once

#include "domain/Timestamp.hpp"
#include "domain/errors/CredentialException.hpp"
#include "security/Base32.hpp"
#include <openssl/rand.h>
#include <openssl/evp.h>
#include <openssl/crypto.h>
#include <openssl/err.h>
#include <string>
#include <chrono>

namespace authcore::security {

/**
 * @brief Генерация секретов и lookup digest
 *
 * Источник случайности - RAND_bytes (OpenSSL), потокобезопасен.
 * digest - SHA-256 в hex: быстрый детерминированный ключ поиска по
 * индексированной колонке, не хэш пароля. Секрет сам по себе несёт
 * полную энтропию, поэтому соль и медленный хэш здесь не нужны.
 */
class SecretCodec {
public:
    static constexpr size_t DEFAULT_SECRET_BYTES = 32;
    static constexpr size_t RECOVERY_CODE_LENGTH = 8;
    static constexpr size_t TOTP_SEED_BYTES = 32;

    /**
     * @brief Случайный секрет в hex (по умолчанию 64 символа)
     * @throws domain::RandomSourceException при отказе источника
     */
    std::string generate(size_t byteLength = DEFAULT_SECRET_BYTES) const {
        return toHex(randomBytes(byteLength));
    }

    std::string digest(const std::string& secret) const {
        unsigned char hash[EVP_MAX_MD_SIZE];
        unsigned int length = 0;
        if (EVP_Digest(secret.data(), secret.size(), hash, &length, EVP_sha256(), nullptr) != 1) {
            throw std::runtime_error("SHA-256 digest failed: " + lastError());
        }
        return toHex(std::string(reinterpret_cast<const char*>(hash), length));
    }

    /**
     * @brief Код восстановления из [0-9A-Za-z]
     *
     * Выборка с отклонением: байты >= 248 отбрасываются, иначе
     * первые символы алфавита выпадали бы чаще.
     */
    std::string recoveryCode() const {
        static const char* alphabet =
            "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";
        constexpr unsigned int alphabetSize = 62;
        constexpr unsigned int limit = 256 - (256 % alphabetSize);

        std::string code;
        code.reserve(RECOVERY_CODE_LENGTH);
        while (code.size() < RECOVERY_CODE_LENGTH) {
            auto bytes = randomBytes(RECOVERY_CODE_LENGTH * 2);
            for (unsigned char b : bytes) {
                if (b >= limit) continue;
                code.push_back(alphabet[b % alphabetSize]);
                if (code.size() == RECOVERY_CODE_LENGTH) break;
            }
        }
        return code;
    }

    std::string totpSeed() const {
        return Base32::encode(randomBytes(TOTP_SEED_BYTES));
    }

    domain::TimePoint expiryFrom(domain::TimePoint now, std::chrono::seconds ttl) const {
        return now + ttl;
    }

    static std::string randomBytes(size_t count) {
        std::string buffer(count, '\0');
        if (count == 0) return buffer;
        if (RAND_bytes(reinterpret_cast<unsigned char*>(buffer.data()),
                       static_cast<int>(count)) != 1) {
            throw domain::RandomSourceException("RAND_bytes failed: " + lastError());
        }
        return buffer;
    }

    static bool constantTimeEquals(const std::string& a, const std::string& b) {
        if (a.size() != b.size()) return false;
        return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
    }

    static std::string toHex(const std::string& bytes) {
        static const char* digits = "0123456789abcdef";
        std::string hex;
        hex.reserve(bytes.size() * 2);
        for (unsigned char c : bytes) {
            hex.push_back(digits[c >> 4]);
            hex.push_back(digits[c & 0x0F]);
        }
        return hex;
    }

    static std::string lastError() {
        char buffer[256];
        ERR_error_string_n(ERR_get_error(), buffer, sizeof(buffer));
        return buffer;
    }
};

} // namespace authcore::security
