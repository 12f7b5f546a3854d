#pragma once

#include "adapters/primary/ISessionHandler.hpp"
#include "adapters/primary/HttpErrors.hpp"
#include "adapters/primary/WebAuthnAssertionJson.hpp"
#include "ports/input/ISessionService.hpp"
#include "ports/input/IWebAuthnService.hpp"
#include "domain/Timestamp.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace authcore::adapters::primary {

/**
 * @brief POST /api/v1/auth/sudo - повторная аутентификация ключом
 *
 * Ключ должен принадлежать владельцу текущей сессии. При успехе в
 * состояние пишется срок sudo mode.
 */
class SudoModeHandler : public ISessionHandler {
public:
    SudoModeHandler(
        std::shared_ptr<ports::input::ISessionService> sessionService,
        std::shared_ptr<ports::input::IWebAuthnService> webAuthnService
    ) : sessionService_(std::move(sessionService))
      , webAuthnService_(std::move(webAuthnService))
    {
        std::cout << "[SudoModeHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res, RequestContext& ctx) override {
        try {
            auto current = sessionService_->currentSession(ctx.session);
            if (!current) {
                ctx.session.clear();
                sendError(res, 401, "Session is no longer active");
                return;
            }

            auto assertion = readAssertion(req.getBody());
            if (!assertion) {
                sendError(res, 400, "challenge, credential_id and sign_count are required");
                return;
            }

            auto result = webAuthnService_->authenticate(
                assertion->challenge, assertion->credentialId, assertion->signCount);
            if (!result.success || result.subjectId != current->subjectId) {
                sendError(res, 401, result.success ? "Credential belongs to another user" : result.message);
                return;
            }

            auto expiresAt = sessionService_->enterSudoMode(ctx.session);

            nlohmann::json response;
            response["success"] = true;
            response["sudo_mode_expires_at"] = domain::Timestamp(expiresAt).toString();
            res.setResult(200, "application/json", response.dump());

        } catch (const nlohmann::json::exception& e) {
            sendError(res, 400, "Invalid JSON");
        } catch (const domain::CredentialException& e) {
            sendCredentialError(res, ctx, e);
        } catch (const std::exception& e) {
            std::cerr << "[SudoModeHandler] Error: " << e.what() << std::endl;
            sendError(res, 500, "Internal server error");
        }
    }

private:
    std::shared_ptr<ports::input::ISessionService> sessionService_;
    std::shared_ptr<ports::input::IWebAuthnService> webAuthnService_;
};

} // namespace authcore::adapters::primary
