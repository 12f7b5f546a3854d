#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/HttpErrors.hpp"
#include "ports/input/IWebAuthnService.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace authcore::adapters::primary {

/**
 * @brief Challenge для входа ключом
 *
 * POST /api/v1/auth/webauthn/challenge
 * {
 *   "user_id": 42
 * }
 *
 * Response:
 * {
 *   "challenge": "9f86d0...",
 *   "expires_at": "2024-01-31T12:05:00Z"
 * }
 */
class WebAuthnChallengeHandler : public IHttpHandler {
public:
    explicit WebAuthnChallengeHandler(std::shared_ptr<ports::input::IWebAuthnService> webAuthnService)
        : webAuthnService_(std::move(webAuthnService))
    {
        std::cout << "[WebAuthnChallengeHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override {
        try {
            auto body = nlohmann::json::parse(req.getBody());

            auto it = body.find("user_id");
            if (it == body.end() || !it->is_number_integer() || it->get<int64_t>() <= 0) {
                sendError(res, 400, "user_id must be a positive integer");
                return;
            }

            auto issued = webAuthnService_->issueChallenge(it->get<int64_t>());

            nlohmann::json response;
            response["challenge"] = issued.secret;
            response["expires_at"] = issued.record.expiresAt
                ? nlohmann::json(domain::Timestamp(*issued.record.expiresAt).toString())
                : nlohmann::json(nullptr);
            res.setResult(200, "application/json", response.dump());

        } catch (const nlohmann::json::exception& e) {
            sendError(res, 400, "Invalid JSON");
        } catch (const domain::CredentialException& e) {
            sendCredentialError(res, e);
        } catch (const std::exception& e) {
            std::cerr << "[WebAuthnChallengeHandler] Error: " << e.what() << std::endl;
            sendError(res, 500, "Internal server error");
        }
    }

private:
    std::shared_ptr<ports::input::IWebAuthnService> webAuthnService_;
};

} // namespace authcore::adapters::primary
