#pragma once

#include <string>

namespace authcore::domain {

/**
 * @brief Политика потребления credential
 */
enum class ConsumptionPolicy {
    REUSABLE,   ///< Живёт до явного отзыва (сессии, WebAuthn/OAuth привязки)
    SINGLE_USE  ///< Удаляется сразу после успешной проверки
};

/**
 * @brief Откуда берётся секрет credential
 */
enum class SecretSource {
    GENERATED_TOKEN,          ///< Случайный hex-токен
    GENERATED_RECOVERY_CODE,  ///< 8 символов, читаемых человеком
    SUPPLIED                  ///< Передаётся извне (id аутентификатора, id у провайдера)
};

inline std::string toString(ConsumptionPolicy policy) {
    switch (policy) {
        case ConsumptionPolicy::REUSABLE:   return "REUSABLE";
        case ConsumptionPolicy::SINGLE_USE: return "SINGLE_USE";
        default: return "UNKNOWN";
    }
}

} // namespace authcore::domain
