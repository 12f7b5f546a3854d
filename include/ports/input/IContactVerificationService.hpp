#pragma once

#include "domain/CredentialKinds.hpp"
#include "ports/input/VerificationResult.hpp"
#include <string>
#include <cstdint>

namespace authcore::ports::input {

/**
 * @brief Интерфейс подтверждения email и телефона
 *
 * Доставка секрета (письмо, SMS) - на стороне вызывающего.
 */
class IContactVerificationService {
public:
    virtual ~IContactVerificationService() = default;

    virtual domain::Issued<domain::EmailVerificationToken> requestEmailVerification(
        int64_t subjectId, const std::string& email) = 0;

    virtual VerificationResult confirmEmail(int64_t subjectId, const std::string& token) = 0;

    virtual domain::Issued<domain::PhoneVerificationToken> requestPhoneVerification(
        int64_t subjectId, const std::string& phoneNumber) = 0;

    virtual VerificationResult confirmPhone(int64_t subjectId, const std::string& token) = 0;
};

} // namespace authcore::ports::input
