#pragma once

#include "domain/CredentialKinds.hpp"
#include "ports/input/VerificationResult.hpp"
#include <string>
#include <optional>
#include <cstdint>

namespace authcore::ports::input {

/**
 * @brief Интерфейс сервиса сброса пароля
 *
 * Доставка токена (email/SMS) и смена хэша пароля - на стороне вызывающего.
 */
class IPasswordResetService {
public:
    virtual ~IPasswordResetService() = default;

    virtual domain::Issued<domain::PasswordResetToken> requestReset(int64_t subjectId) = 0;

    virtual VerificationResult verifyToken(const std::string& resetToken) = 0;

    /**
     * @brief Выдать 2FA challenge, привязанный к токену сброса
     * @throws domain::CredentialException если токен недействителен
     */
    virtual domain::Issued<domain::TemporaryTwoFactorChallenge> beginTwoFactor(
        const std::string& resetToken) = 0;

    /**
     * @brief Завершить сброс: потребить challenge (если задан) и токен
     */
    virtual VerificationResult completeReset(
        const std::string& resetToken,
        const std::optional<std::string>& twoFactorChallenge
    ) = 0;
};

} // namespace authcore::ports::input
