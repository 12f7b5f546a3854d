#pragma once

#include "ports/input/IPasswordResetService.hpp"
#include "application/CredentialStore.hpp"
#include <memory>
#include <iostream>

namespace authcore::application {

/**
 * @brief Сервис сброса пароля
 */
class PasswordResetService : public ports::input::IPasswordResetService {
public:
    PasswordResetService(
        std::shared_ptr<CredentialStore<domain::PasswordResetTokenKind>> resetTokens,
        std::shared_ptr<CredentialStore<domain::TemporaryTwoFactorChallengeKind>> challenges
    ) : resetTokens_(std::move(resetTokens))
      , challenges_(std::move(challenges))
    {
        std::cout << "[PasswordResetService] Created" << std::endl;
    }

    domain::Issued<domain::PasswordResetToken> requestReset(int64_t subjectId) override {
        return resetTokens_->create(subjectId);
    }

    ports::input::VerificationResult verifyToken(const std::string& resetToken) override {
        auto result = resetTokens_->lookup(resetToken);
        if (!result.found()) {
            return {false, 0, result.status, "Invalid or expired reset token"};
        }
        return {true, result.record->subjectId, result.status, "Reset token is valid"};
    }

    domain::Issued<domain::TemporaryTwoFactorChallenge> beginTwoFactor(
        const std::string& resetToken
    ) override {
        auto token = resetTokens_->lookup(resetToken);
        if (!token.found()) {
            throw domain::lookupFailure(token.status, "password reset token");
        }
        return challenges_->create(token.record->subjectId, {token.record->id});
    }

    ports::input::VerificationResult completeReset(
        const std::string& resetToken,
        const std::optional<std::string>& twoFactorChallenge
    ) override {
        auto token = resetTokens_->lookup(resetToken);
        if (!token.found()) {
            return {false, 0, token.status, "Invalid or expired reset token"};
        }

        if (twoFactorChallenge) {
            auto challenge = challenges_->lookupForResetToken(*twoFactorChallenge, token.record->id);
            if (!challenge.found()) {
                return {false, 0, challenge.status, "Invalid or expired two factor challenge"};
            }
            challenges_->consume(*challenge.record);
        }

        resetTokens_->consume(*token.record);
        return {true, token.record->subjectId, domain::LookupStatus::FOUND, "Password reset completed"};
    }

private:
    std::shared_ptr<CredentialStore<domain::PasswordResetTokenKind>> resetTokens_;
    std::shared_ptr<CredentialStore<domain::TemporaryTwoFactorChallengeKind>> challenges_;
};

} // namespace authcore::application
