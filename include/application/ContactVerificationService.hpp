#pragma once

#include "ports/input/IContactVerificationService.hpp"
#include "application/CredentialStore.hpp"
#include <memory>
#include <iostream>

namespace authcore::application {

/**
 * @brief Подтверждение email и телефона одноразовыми токенами
 *
 * Новый запрос отзывает прежние неподтверждённые токены субъекта.
 */
class ContactVerificationService : public ports::input::IContactVerificationService {
public:
    ContactVerificationService(
        std::shared_ptr<CredentialStore<domain::EmailVerificationTokenKind>> emailTokens,
        std::shared_ptr<CredentialStore<domain::PhoneVerificationTokenKind>> phoneTokens
    ) : emailTokens_(std::move(emailTokens))
      , phoneTokens_(std::move(phoneTokens))
    {
        std::cout << "[ContactVerificationService] Created" << std::endl;
    }

    domain::Issued<domain::EmailVerificationToken> requestEmailVerification(
        int64_t subjectId, const std::string& email
    ) override {
        if (email.empty()) {
            throw domain::ValidationException("email must not be empty");
        }
        emailTokens_->revokeAll(subjectId);
        return emailTokens_->create(subjectId, {email});
    }

    ports::input::VerificationResult confirmEmail(int64_t subjectId, const std::string& token) override {
        auto result = emailTokens_->redeemForSubject(subjectId, token);
        if (!result.found()) {
            return {false, 0, result.status, "Invalid or expired verification token"};
        }
        return {true, subjectId, result.status, "Email verified: " + result.record->metadata.email};
    }

    domain::Issued<domain::PhoneVerificationToken> requestPhoneVerification(
        int64_t subjectId, const std::string& phoneNumber
    ) override {
        if (phoneNumber.empty()) {
            throw domain::ValidationException("phone number must not be empty");
        }
        phoneTokens_->revokeAll(subjectId);
        return phoneTokens_->create(subjectId, {phoneNumber});
    }

    ports::input::VerificationResult confirmPhone(int64_t subjectId, const std::string& token) override {
        auto result = phoneTokens_->redeemForSubject(subjectId, token);
        if (!result.found()) {
            return {false, 0, result.status, "Invalid or expired verification token"};
        }
        return {true, subjectId, result.status, "Phone verified: " + result.record->metadata.phoneNumber};
    }

private:
    std::shared_ptr<CredentialStore<domain::EmailVerificationTokenKind>> emailTokens_;
    std::shared_ptr<CredentialStore<domain::PhoneVerificationTokenKind>> phoneTokens_;
};

} // namespace authcore::application
