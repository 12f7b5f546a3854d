#pragma once

#include "adapters/primary/ISessionHandler.hpp"
#include "adapters/primary/HttpErrors.hpp"
#include "ports/input/ISessionService.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace authcore::adapters::primary {

/**
 * @brief POST /api/v1/sessions/revoke-others - выйти на всех других устройствах
 */
class RevokeOtherSessionsHandler : public ISessionHandler {
public:
    explicit RevokeOtherSessionsHandler(std::shared_ptr<ports::input::ISessionService> sessionService)
        : sessionService_(std::move(sessionService))
    {
        std::cout << "[RevokeOtherSessionsHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res, RequestContext& ctx) override {
        try {
            size_t revoked = sessionService_->revokeOtherSessions(ctx.session);

            nlohmann::json response;
            response["message"] = "Other sessions revoked";
            response["revoked"] = revoked;
            res.setResult(200, "application/json", response.dump());

        } catch (const domain::CredentialException& e) {
            sendCredentialError(res, ctx, e);
        } catch (const std::exception& e) {
            std::cerr << "[RevokeOtherSessionsHandler] Error: " << e.what() << std::endl;
            sendError(res, 500, "Internal server error");
        }
    }

private:
    std::shared_ptr<ports::input::ISessionService> sessionService_;
};

} // namespace authcore::adapters::primary
