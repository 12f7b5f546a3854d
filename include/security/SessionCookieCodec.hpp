#pragma once

#include "domain/SessionState.hpp"
#include "security/Base64Url.hpp"
#include "security/SecretCodec.hpp"
#include <openssl/evp.h>
#include <nlohmann/json.hpp>
#include <string>
#include <memory>
#include <stdexcept>
#include <iostream>

namespace authcore::security {

/**
 * @brief Что сделать с cookie при ответе
 */
enum class CookieAction {
    NONE,   ///< Заголовок не трогаем
    SET,    ///< Выставить новое значение
    CLEAR   ///< Стереть cookie (Max-Age=0)
};

struct CookieUpdate {
    CookieAction action = CookieAction::NONE;
    std::string value;
};

/**
 * @brief Шифрованный конверт состояния сессии для cookie
 *
 * Формат токена: base64url(version | nonce(12) | ciphertext | tag(16)),
 * AES-256-GCM, ключ = SHA-256 от серверного секрета.
 *
 * decode никогда не бросает: любой сбой (нет cookie, мусор, чужой ключ,
 * подмена) даёт пустое состояние, то есть анонимный запрос.
 */
class SessionCookieCodec {
public:
    static constexpr unsigned char FORMAT_VERSION = 0x01;
    static constexpr size_t NONCE_SIZE = 12;
    static constexpr size_t TAG_SIZE = 16;

    explicit SessionCookieCodec(const std::string& secret) {
        if (secret.empty()) {
            throw std::invalid_argument("Session cookie secret must not be empty");
        }
        unsigned int length = 0;
        if (EVP_Digest(secret.data(), secret.size(), key_, &length, EVP_sha256(), nullptr) != 1 ||
            length != sizeof(key_)) {
            throw std::runtime_error("Failed to derive session cookie key: " + SecretCodec::lastError());
        }
        std::cout << "[SessionCookieCodec] Created" << std::endl;
    }

    /**
     * @throws std::runtime_error при сбое шифрования или RNG
     */
    std::string encode(const domain::SessionState& state) const {
        std::string plaintext = state.data().dump();
        std::string nonce = SecretCodec::randomBytes(NONCE_SIZE);

        CipherContext ctx(EVP_CIPHER_CTX_new());
        if (!ctx) throw std::runtime_error("EVP_CIPHER_CTX_new failed");

        std::string ciphertext(plaintext.size(), '\0');
        int outLength = 0;
        int finalLength = 0;
        unsigned char tag[TAG_SIZE];

        if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
            EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, NONCE_SIZE, nullptr) != 1 ||
            EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key_, bytes(nonce)) != 1 ||
            EVP_EncryptUpdate(ctx.get(), nullptr, &outLength, aad(), aadLength()) != 1 ||
            EVP_EncryptUpdate(ctx.get(), bytes(ciphertext), &outLength,
                              bytes(plaintext), static_cast<int>(plaintext.size())) != 1 ||
            EVP_EncryptFinal_ex(ctx.get(), bytes(ciphertext) + outLength, &finalLength) != 1 ||
            EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, TAG_SIZE, tag) != 1) {
            throw std::runtime_error("Session cookie encryption failed: " + SecretCodec::lastError());
        }
        ciphertext.resize(static_cast<size_t>(outLength + finalLength));

        std::string envelope;
        envelope.reserve(1 + NONCE_SIZE + ciphertext.size() + TAG_SIZE);
        envelope.push_back(static_cast<char>(FORMAT_VERSION));
        envelope += nonce;
        envelope += ciphertext;
        envelope.append(reinterpret_cast<const char*>(tag), TAG_SIZE);

        return Base64Url::encode(envelope);
    }

    domain::SessionState decode(const std::string& token) const {
        if (token.empty()) return {};

        auto envelope = Base64Url::decode(token);
        if (!envelope) {
            return rejected("malformed token encoding");
        }
        if (envelope->size() < 1 + NONCE_SIZE + TAG_SIZE) {
            return rejected("token too short");
        }
        if (static_cast<unsigned char>((*envelope)[0]) != FORMAT_VERSION) {
            return rejected("unsupported format version");
        }

        std::string nonce = envelope->substr(1, NONCE_SIZE);
        std::string ciphertext = envelope->substr(1 + NONCE_SIZE,
                                                  envelope->size() - 1 - NONCE_SIZE - TAG_SIZE);
        std::string tag = envelope->substr(envelope->size() - TAG_SIZE);

        CipherContext ctx(EVP_CIPHER_CTX_new());
        if (!ctx) return rejected("EVP_CIPHER_CTX_new failed");

        std::string plaintext(ciphertext.size(), '\0');
        int outLength = 0;
        int finalLength = 0;

        if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
            EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, NONCE_SIZE, nullptr) != 1 ||
            EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key_, bytes(nonce)) != 1 ||
            EVP_DecryptUpdate(ctx.get(), nullptr, &outLength, aad(), aadLength()) != 1 ||
            EVP_DecryptUpdate(ctx.get(), bytes(plaintext), &outLength,
                              bytes(ciphertext), static_cast<int>(ciphertext.size())) != 1 ||
            EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, TAG_SIZE, bytes(tag)) != 1 ||
            EVP_DecryptFinal_ex(ctx.get(), bytes(plaintext) + outLength, &finalLength) != 1) {
            return rejected("authentication failed");
        }
        plaintext.resize(static_cast<size_t>(outLength + finalLength));

        auto json = nlohmann::json::parse(plaintext, nullptr, false);
        if (json.is_discarded() || !json.is_object()) {
            return rejected("payload is not a JSON object");
        }
        return domain::SessionState::fromJson(json);
    }

    /**
     * @brief Решить, что писать в Set-Cookie
     *
     * Непустое текущее состояние - перешифровать и выставить.
     * Было непустое, стало пустое - стереть. Иначе ничего.
     * Сбой шифрования логируется, cookie не выставляется.
     */
    CookieUpdate prepareResponse(const domain::SessionState& initial,
                                 const domain::SessionState& current) const {
        if (!current.empty()) {
            try {
                return {CookieAction::SET, encode(current)};
            } catch (const std::exception& e) {
                std::cerr << "[SessionCookieCodec] encode() failed: " << e.what() << std::endl;
                return {};
            }
        }
        if (!initial.empty()) {
            return {CookieAction::CLEAR, ""};
        }
        return {};
    }

private:
    struct CipherContextDeleter {
        void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
    };
    using CipherContext = std::unique_ptr<EVP_CIPHER_CTX, CipherContextDeleter>;

    unsigned char key_[32];

    static const unsigned char* aad() {
        return reinterpret_cast<const unsigned char*>("authcore-session-v1");
    }

    static int aadLength() { return 19; }

    static unsigned char* bytes(std::string& s) {
        return reinterpret_cast<unsigned char*>(s.data());
    }

    static const unsigned char* bytes(const std::string& s) {
        return reinterpret_cast<const unsigned char*>(s.data());
    }

    static domain::SessionState rejected(const std::string& reason) {
        std::cerr << "[SessionCookieCodec] Cookie rejected: " << reason << std::endl;
        return {};
    }
};

} // namespace authcore::security
