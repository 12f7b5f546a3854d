#pragma once

#include "adapters/primary/ISessionHandler.hpp"
#include "adapters/primary/HttpErrors.hpp"
#include "adapters/primary/WebAuthnAssertionJson.hpp"
#include "ports/input/ISessionService.hpp"
#include "ports/input/IWebAuthnService.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace authcore::adapters::primary {

/**
 * @brief Вход ключом: подтверждение challenge и начало сессии
 *
 * POST /api/v1/auth/webauthn/login
 *
 * Response:
 * {
 *   "success": true,
 *   "user_id": 42,
 *   "session_id": 7
 * }
 *
 * Cookie выставляет SessionCookieMiddleware по новому состоянию.
 */
class WebAuthnLoginHandler : public ISessionHandler {
public:
    WebAuthnLoginHandler(
        std::shared_ptr<ports::input::ISessionService> sessionService,
        std::shared_ptr<ports::input::IWebAuthnService> webAuthnService
    ) : sessionService_(std::move(sessionService))
      , webAuthnService_(std::move(webAuthnService))
    {
        std::cout << "[WebAuthnLoginHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res, RequestContext& ctx) override {
        try {
            auto assertion = readAssertion(req.getBody());
            if (!assertion) {
                sendError(res, 400, "challenge, credential_id and sign_count are required");
                return;
            }

            auto result = webAuthnService_->authenticate(
                assertion->challenge, assertion->credentialId, assertion->signCount);
            if (!result.success) {
                sendError(res, 401, result.message);
                return;
            }

            auto started = sessionService_->startSession(
                ctx.session, result.subjectId, ctx.userAgent, ctx.ipAddress);

            nlohmann::json response;
            response["success"] = true;
            response["user_id"] = result.subjectId;
            response["session_id"] = started.sessionId;
            response["message"] = started.message;
            res.setResult(200, "application/json", response.dump());

        } catch (const nlohmann::json::exception& e) {
            sendError(res, 400, "Invalid JSON");
        } catch (const domain::CredentialException& e) {
            sendCredentialError(res, e);
        } catch (const std::exception& e) {
            std::cerr << "[WebAuthnLoginHandler] Error: " << e.what() << std::endl;
            sendError(res, 500, "Internal server error");
        }
    }

private:
    std::shared_ptr<ports::input::ISessionService> sessionService_;
    std::shared_ptr<ports::input::IWebAuthnService> webAuthnService_;
};

} // namespace authcore::adapters::primary
