#pragma once

#include "domain/SessionState.hpp"
#include "domain/AuthorizationContext.hpp"
#include "domain/Timestamp.hpp"
#include "domain/enums/AccessLevel.hpp"
#include "ports/output/IClock.hpp"
#include <memory>
#include <iostream>

namespace authcore::application {

/**
 * @brief Гейт доступа к защищённой операции
 *
 * Решение зависит только от состояния сессии и текущего времени.
 * Вызывается непосредственно перед операцией; при отказе операция
 * не выполняется.
 */
class AuthorizationGate {
public:
    explicit AuthorizationGate(std::shared_ptr<ports::output::IClock> clock)
        : clock_(std::move(clock))
    {
        std::cout << "[AuthorizationGate] Created" << std::endl;
    }

    domain::AuthorizationDecision check(const domain::SessionState& state,
                                        domain::AccessLevel level) const {
        switch (level) {
            case domain::AccessLevel::AUTHENTICATED:
                return checkAuthenticated(state);
            case domain::AccessLevel::SUDO_MODE:
                return checkSudoMode(state);
        }
        return domain::AuthorizationDecision::deny(domain::DenyReason::NOT_AUTHENTICATED);
    }

    domain::AuthorizationContext context(const domain::SessionState& state) const {
        domain::AuthorizationContext ctx;
        ctx.subjectId = state.subjectId();
        ctx.isAuthenticated = ctx.subjectId.has_value();
        if (auto raw = state.sudoModeExpiresAt()) {
            if (auto parsed = domain::Timestamp::parse(*raw)) {
                ctx.sudoModeExpiresAt = parsed->value;
            }
        }
        return ctx;
    }

private:
    std::shared_ptr<ports::output::IClock> clock_;

    domain::AuthorizationDecision checkAuthenticated(const domain::SessionState& state) const {
        if (!state.subjectId()) {
            return domain::AuthorizationDecision::deny(domain::DenyReason::NOT_AUTHENTICATED);
        }
        return domain::AuthorizationDecision::allow();
    }

    domain::AuthorizationDecision checkSudoMode(const domain::SessionState& state) const {
        auto authenticated = checkAuthenticated(state);
        if (!authenticated.allowed) return authenticated;

        auto raw = state.sudoModeExpiresAt();
        if (!raw) {
            return domain::AuthorizationDecision::deny(domain::DenyReason::SUDO_MODE_REQUIRED);
        }
        auto expiresAt = domain::Timestamp::parse(*raw);
        if (!expiresAt || !(expiresAt->value > clock_->now())) {
            return domain::AuthorizationDecision::deny(domain::DenyReason::SUDO_MODE_REQUIRED);
        }
        return domain::AuthorizationDecision::allow();
    }
};

} // namespace authcore::application
