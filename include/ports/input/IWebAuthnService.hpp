#pragma once

#include "domain/CredentialKinds.hpp"
#include "pagination/Page.hpp"
#include <string>
#include <cstdint>

namespace authcore::ports::input {

/**
 * @brief Результат аутентификации ключом
 */
struct AuthenticationResult {
    bool success;
    int64_t subjectId;
    std::string message;
};

/**
 * @brief Интерфейс сервиса WebAuthn
 *
 * Проверка подписи и attestation - на стороне вызывающего; сервис
 * ведёт challenge и ключи.
 */
class IWebAuthnService {
public:
    virtual ~IWebAuthnService() = default;

    virtual domain::Issued<domain::WebAuthnChallenge> issueChallenge(int64_t subjectId) = 0;

    /**
     * @brief Зарегистрировать ключ по challenge, выданному этому субъекту
     * @throws domain::CredentialException если challenge недействителен
     */
    virtual domain::WebAuthnCredential registerCredential(
        int64_t subjectId,
        const std::string& challenge,
        const domain::WebAuthnCredentialMetadata& metadata
    ) = 0;

    virtual AuthenticationResult authenticate(
        const std::string& challenge,
        const std::string& credentialId,
        uint32_t signCount
    ) = 0;

    virtual pagination::Page<domain::WebAuthnCredential> listCredentials(
        int64_t subjectId,
        const pagination::PageArgs& args
    ) = 0;

    virtual bool renameCredential(int64_t subjectId, int64_t id, const std::string& nickname) = 0;

    virtual bool revokeCredential(int64_t subjectId, int64_t id) = 0;
};

} // namespace authcore::ports::input
