#pragma once

#include <string>

namespace authcore::domain {

/**
 * @brief Требуемый уровень доступа к защищённой операции
 */
enum class AccessLevel {
    AUTHENTICATED,
    SUDO_MODE   ///< Недавняя повторная аутентификация
};

/**
 * @brief Причина отказа
 */
enum class DenyReason {
    NOT_AUTHENTICATED,
    SUDO_MODE_REQUIRED
};

inline std::string toString(AccessLevel level) {
    switch (level) {
        case AccessLevel::AUTHENTICATED: return "AUTHENTICATED";
        case AccessLevel::SUDO_MODE:     return "SUDO_MODE";
        default: return "UNKNOWN";
    }
}

inline std::string toString(DenyReason reason) {
    switch (reason) {
        case DenyReason::NOT_AUTHENTICATED:  return "User is not authenticated";
        case DenyReason::SUDO_MODE_REQUIRED: return "Action requires sudo mode";
        default: return "Access denied";
    }
}

} // namespace authcore::domain
