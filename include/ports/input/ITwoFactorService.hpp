#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace authcore::ports::input {

/**
 * @brief Начало подключения 2FA
 */
struct EnrollmentStart {
    std::string challenge;
    std::string totpSeed;
    std::string provisioningUri;
};

/**
 * @brief Результат подтверждения 2FA
 */
struct EnrollmentResult {
    bool success;
    std::string totpSeed;
    std::vector<std::string> recoveryCodes;
    std::string message;
};

/**
 * @brief Интерфейс сервиса двухфакторной аутентификации
 */
class ITwoFactorService {
public:
    virtual ~ITwoFactorService() = default;

    virtual EnrollmentStart beginEnrollment(int64_t subjectId, const std::string& accountName) = 0;

    /**
     * @brief Проверить TOTP код и выдать коды восстановления
     *
     * Неверный код не потребляет challenge: можно повторить до истечения срока.
     */
    virtual EnrollmentResult confirmEnrollment(
        int64_t subjectId,
        const std::string& challenge,
        const std::string& code
    ) = 0;

    virtual bool redeemRecoveryCode(int64_t subjectId, const std::string& code) = 0;

    virtual std::vector<std::string> regenerateRecoveryCodes(int64_t subjectId) = 0;

    virtual size_t remainingRecoveryCodes(int64_t subjectId) = 0;
};

} // namespace authcore::ports::input
