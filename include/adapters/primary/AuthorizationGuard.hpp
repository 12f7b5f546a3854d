#pragma once

#include "adapters/primary/ISessionHandler.hpp"
#include "adapters/primary/HttpErrors.hpp"
#include "application/AuthorizationGate.hpp"
#include <memory>

namespace authcore::adapters::primary {

/**
 * @brief Охрана обработчика гейтом доступа
 *
 * При отказе отвечает 401 (не аутентифицирован) или 403 (нужен
 * sudo mode), внутренний обработчик не вызывается.
 */
class AuthorizationGuard : public ISessionHandler {
public:
    AuthorizationGuard(
        std::shared_ptr<application::AuthorizationGate> gate,
        domain::AccessLevel level,
        std::shared_ptr<ISessionHandler> inner
    ) : gate_(std::move(gate))
      , level_(level)
      , inner_(std::move(inner))
    {}

    void handle(IRequest& req, IResponse& res, RequestContext& ctx) override {
        auto decision = gate_->check(ctx.session, level_);
        if (!decision.allowed) {
            auto reason = decision.reason.value_or(domain::DenyReason::NOT_AUTHENTICATED);
            int status = reason == domain::DenyReason::SUDO_MODE_REQUIRED ? 403 : 401;
            sendError(res, status, domain::toString(reason));
            return;
        }
        inner_->handle(req, res, ctx);
    }

private:
    std::shared_ptr<application::AuthorizationGate> gate_;
    domain::AccessLevel level_;
    std::shared_ptr<ISessionHandler> inner_;
};

} // namespace authcore::adapters::primary
