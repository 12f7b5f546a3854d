#pragma once

#include "ports/input/ITwoFactorService.hpp"
#include "ports/output/IClock.hpp"
#include "application/CredentialStore.hpp"
#include "security/SecretCodec.hpp"
#include "security/Totp.hpp"
#include <memory>
#include <iostream>

namespace authcore::application {

/**
 * @brief Сервис 2FA: подключение TOTP и коды восстановления
 *
 * Сохранение подтверждённого seed в аккаунте - на стороне вызывающего.
 */
class TwoFactorService : public ports::input::ITwoFactorService {
public:
    static constexpr const char* ISSUER = "AuthCore";

    TwoFactorService(
        std::shared_ptr<CredentialStore<domain::TwoFactorChallengeKind>> challenges,
        std::shared_ptr<CredentialStore<domain::RecoveryCodeKind>> recoveryCodes,
        std::shared_ptr<security::SecretCodec> codec,
        std::shared_ptr<ports::output::IClock> clock
    ) : challenges_(std::move(challenges))
      , recoveryCodes_(std::move(recoveryCodes))
      , codec_(std::move(codec))
      , clock_(std::move(clock))
    {
        std::cout << "[TwoFactorService] Created" << std::endl;
    }

    ports::input::EnrollmentStart beginEnrollment(int64_t subjectId,
                                                  const std::string& accountName) override {
        std::string seed = codec_->totpSeed();
        auto issued = challenges_->create(subjectId, {seed});
        return {issued.secret, seed, security::Totp::provisioningUri(ISSUER, accountName, seed)};
    }

    ports::input::EnrollmentResult confirmEnrollment(
        int64_t subjectId,
        const std::string& challenge,
        const std::string& code
    ) override {
        auto result = challenges_->lookupForSubject(subjectId, challenge);
        if (!result.found()) {
            return {false, "", {}, "Invalid or expired two factor challenge"};
        }

        const std::string& seed = result.record->metadata.totpSeed;
        if (!security::Totp::verify(seed, code, clock_->now())) {
            return {false, "", {}, "Invalid verification code"};
        }

        challenges_->consume(*result.record);
        return {true, seed, regenerateRecoveryCodes(subjectId), "Two factor authentication enabled"};
    }

    bool redeemRecoveryCode(int64_t subjectId, const std::string& code) override {
        return recoveryCodes_->redeemForSubject(subjectId, code).found();
    }

    std::vector<std::string> regenerateRecoveryCodes(int64_t subjectId) override {
        std::vector<std::string> codes;
        for (auto& issued : recoveryCodes_->regenerate(subjectId)) {
            codes.push_back(std::move(issued.secret));
        }
        return codes;
    }

    size_t remainingRecoveryCodes(int64_t subjectId) override {
        return recoveryCodes_->listAll(subjectId).size();
    }

private:
    std::shared_ptr<CredentialStore<domain::TwoFactorChallengeKind>> challenges_;
    std::shared_ptr<CredentialStore<domain::RecoveryCodeKind>> recoveryCodes_;
    std::shared_ptr<security::SecretCodec> codec_;
    std::shared_ptr<ports::output::IClock> clock_;
};

} // namespace authcore::application
