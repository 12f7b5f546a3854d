#pragma once

#include "adapters/primary/ISessionHandler.hpp"
#include "adapters/primary/HttpErrors.hpp"
#include "adapters/primary/PageJson.hpp"
#include "ports/input/ISessionService.hpp"
#include "ports/input/IWebAuthnService.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace authcore::adapters::primary {

/**
 * @brief GET /api/v1/webauthn/credentials - ключи пользователя
 */
class ListWebAuthnCredentialsHandler : public ISessionHandler {
public:
    ListWebAuthnCredentialsHandler(
        std::shared_ptr<ports::input::ISessionService> sessionService,
        std::shared_ptr<ports::input::IWebAuthnService> webAuthnService
    ) : sessionService_(std::move(sessionService))
      , webAuthnService_(std::move(webAuthnService))
    {
        std::cout << "[ListWebAuthnCredentialsHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res, RequestContext& ctx) override {
        try {
            auto current = sessionService_->currentSession(ctx.session);
            if (!current) {
                ctx.session.clear();
                sendError(res, 401, "Session is no longer active");
                return;
            }

            auto page = webAuthnService_->listCredentials(current->subjectId, readPageArgs(req));

            nlohmann::json response;
            response["credentials"] = nlohmann::json::array();
            for (const auto& credential : page.items) {
                response["credentials"].push_back(webAuthnCredentialToJson(credential));
            }
            response["page_info"] = pageInfoToJson(page);

            res.setResult(200, "application/json", response.dump());

        } catch (const domain::CredentialException& e) {
            sendCredentialError(res, ctx, e);
        } catch (const std::exception& e) {
            std::cerr << "[ListWebAuthnCredentialsHandler] Error: " << e.what() << std::endl;
            sendError(res, 500, "Internal server error");
        }
    }

private:
    std::shared_ptr<ports::input::ISessionService> sessionService_;
    std::shared_ptr<ports::input::IWebAuthnService> webAuthnService_;
};

} // namespace authcore::adapters::primary
