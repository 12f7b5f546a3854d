#pragma once

#include <string>

namespace authcore::domain {

/**
 * @brief Результат поиска credential по секрету
 */
enum class LookupStatus {
    FOUND,
    NOT_FOUND,
    EXPIRED,
    DIGEST_MISMATCH  ///< Секрет не совпал ни с одним digest в области поиска
};

inline std::string toString(LookupStatus status) {
    switch (status) {
        case LookupStatus::FOUND:           return "FOUND";
        case LookupStatus::NOT_FOUND:       return "NOT_FOUND";
        case LookupStatus::EXPIRED:         return "EXPIRED";
        case LookupStatus::DIGEST_MISMATCH: return "DIGEST_MISMATCH";
        default: return "UNKNOWN";
    }
}

} // namespace authcore::domain
