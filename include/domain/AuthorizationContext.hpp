#pragma once

#include "Timestamp.hpp"
#include "enums/AccessLevel.hpp"
#include <optional>
#include <cstdint>

namespace authcore::domain {

/**
 * @brief Контекст авторизации, вычисляется заново на каждый запрос
 */
struct AuthorizationContext {
    bool isAuthenticated = false;
    std::optional<int64_t> subjectId;
    std::optional<TimePoint> sudoModeExpiresAt;
};

/**
 * @brief Решение гейта: разрешить или отказать с причиной
 */
struct AuthorizationDecision {
    bool allowed = false;
    std::optional<DenyReason> reason;

    static AuthorizationDecision allow() {
        return {true, std::nullopt};
    }

    static AuthorizationDecision deny(DenyReason reason) {
        return {false, reason};
    }
};

} // namespace authcore::domain
