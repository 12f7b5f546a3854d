#pragma once

#include "ports/input/IWebAuthnService.hpp"
#include "application/CredentialStore.hpp"
#include "application/WebAuthnCredentialStore.hpp"
#include <memory>
#include <iostream>

namespace authcore::application {

/**
 * @brief Сервис WebAuthn: challenge и ключи
 */
class WebAuthnService : public ports::input::IWebAuthnService {
public:
    WebAuthnService(
        std::shared_ptr<CredentialStore<domain::WebAuthnChallengeKind>> challenges,
        std::shared_ptr<WebAuthnCredentialStore> credentials
    ) : challenges_(std::move(challenges))
      , credentials_(std::move(credentials))
    {
        std::cout << "[WebAuthnService] Created" << std::endl;
    }

    domain::Issued<domain::WebAuthnChallenge> issueChallenge(int64_t subjectId) override {
        return challenges_->create(subjectId);
    }

    domain::WebAuthnCredential registerCredential(
        int64_t subjectId,
        const std::string& challenge,
        const domain::WebAuthnCredentialMetadata& metadata
    ) override {
        auto result = challenges_->redeemForSubject(subjectId, challenge);
        if (!result.found()) {
            throw domain::lookupFailure(result.status, "webauthn challenge");
        }
        return credentials_->registerCredential(subjectId, metadata);
    }

    ports::input::AuthenticationResult authenticate(
        const std::string& challenge,
        const std::string& credentialId,
        uint32_t signCount
    ) override {
        auto issued = challenges_->redeem(challenge);
        if (!issued.found()) {
            return {false, 0, "Invalid or expired challenge"};
        }

        auto credential = credentials_->lookupForSubject(issued.record->subjectId, credentialId);
        if (!credential.found()) {
            return {false, 0, "Unknown credential"};
        }

        switch (credentials_->advanceSignCount(credentialId, signCount)) {
            case SignCountCheck::ACCEPTED:
                return {true, credential.record->subjectId, "Authenticated"};
            case SignCountCheck::CLONE_SUSPECTED:
                return {false, 0, "Credential sign count did not increase"};
            case SignCountCheck::NOT_FOUND:
                break;
        }
        return {false, 0, "Unknown credential"};
    }

    pagination::Page<domain::WebAuthnCredential> listCredentials(
        int64_t subjectId,
        const pagination::PageArgs& args
    ) override {
        return credentials_->listBySubject(subjectId, args);
    }

    bool renameCredential(int64_t subjectId, int64_t id, const std::string& nickname) override {
        return credentials_->rename(subjectId, id, nickname);
    }

    bool revokeCredential(int64_t subjectId, int64_t id) override {
        return credentials_->revoke(subjectId, id);
    }

private:
    std::shared_ptr<CredentialStore<domain::WebAuthnChallengeKind>> challenges_;
    std::shared_ptr<WebAuthnCredentialStore> credentials_;
};

} // namespace authcore::application
