#pragma once

#include "adapters/primary/ISessionHandler.hpp"
#include "adapters/primary/HttpErrors.hpp"
#include "ports/input/ISessionService.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace authcore::adapters::primary {

/**
 * @brief POST /api/v1/auth/logout
 *
 * Очищает состояние сессии; middleware ответит стиранием cookie.
 */
class LogoutHandler : public ISessionHandler {
public:
    explicit LogoutHandler(std::shared_ptr<ports::input::ISessionService> sessionService)
        : sessionService_(std::move(sessionService))
    {
        std::cout << "[LogoutHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res, RequestContext& ctx) override {
        try {
            bool revoked = sessionService_->logout(ctx.session);

            nlohmann::json response;
            response["success"] = true;
            response["message"] = revoked ? "Logged out" : "Session already ended";
            res.setResult(200, "application/json", response.dump());

        } catch (const domain::CredentialException& e) {
            // состояние всё равно очищаем: клиент не должен остаться залогиненным
            ctx.session.clear();
            sendCredentialError(res, e);
        } catch (const std::exception& e) {
            ctx.session.clear();
            std::cerr << "[LogoutHandler] Error: " << e.what() << std::endl;
            sendError(res, 500, "Internal server error");
        }
    }

private:
    std::shared_ptr<ports::input::ISessionService> sessionService_;
};

} // namespace authcore::adapters::primary
