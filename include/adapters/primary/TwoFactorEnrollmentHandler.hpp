#pragma once

#include "adapters/primary/ISessionHandler.hpp"
#include "adapters/primary/HttpErrors.hpp"
#include "ports/input/ISessionService.hpp"
#include "ports/input/ITwoFactorService.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace authcore::adapters::primary {

/**
 * @brief Подключение TOTP для владельца текущей сессии
 *
 * POST /api/v1/2fa/enrollment
 * { "account_name": "john@example.com" }
 *
 * POST /api/v1/2fa/enrollment/confirm
 * { "challenge": "...", "code": "123456" }
 *
 * Один класс на оба шага: шаг задаётся при регистрации маршрута.
 */
class TwoFactorEnrollmentHandler : public ISessionHandler {
public:
    enum class Step { BEGIN, CONFIRM };

    TwoFactorEnrollmentHandler(
        std::shared_ptr<ports::input::ISessionService> sessionService,
        std::shared_ptr<ports::input::ITwoFactorService> twoFactorService,
        Step step
    ) : sessionService_(std::move(sessionService))
      , twoFactorService_(std::move(twoFactorService))
      , step_(step)
    {
        std::cout << "[TwoFactorEnrollmentHandler] Created ("
                  << (step_ == Step::BEGIN ? "begin" : "confirm") << ")" << std::endl;
    }

    void handle(IRequest& req, IResponse& res, RequestContext& ctx) override {
        try {
            auto current = sessionService_->currentSession(ctx.session);
            if (!current) {
                ctx.session.clear();
                sendError(res, 401, "Session is no longer active");
                return;
            }

            auto body = nlohmann::json::parse(req.getBody());
            if (step_ == Step::BEGIN) {
                begin(res, current->subjectId, body);
            } else {
                confirm(res, current->subjectId, body);
            }

        } catch (const nlohmann::json::exception& e) {
            sendError(res, 400, "Invalid JSON");
        } catch (const domain::CredentialException& e) {
            sendCredentialError(res, ctx, e);
        } catch (const std::exception& e) {
            std::cerr << "[TwoFactorEnrollmentHandler] Error: " << e.what() << std::endl;
            sendError(res, 500, "Internal server error");
        }
    }

private:
    std::shared_ptr<ports::input::ISessionService> sessionService_;
    std::shared_ptr<ports::input::ITwoFactorService> twoFactorService_;
    Step step_;

    void begin(IResponse& res, int64_t subjectId, const nlohmann::json& body) {
        std::string accountName = body.value("account_name", "");
        if (accountName.empty()) {
            accountName = "user-" + std::to_string(subjectId);
        }

        auto started = twoFactorService_->beginEnrollment(subjectId, accountName);

        nlohmann::json response;
        response["challenge"] = started.challenge;
        response["totp_seed"] = started.totpSeed;
        response["provisioning_uri"] = started.provisioningUri;
        res.setResult(200, "application/json", response.dump());
    }

    void confirm(IResponse& res, int64_t subjectId, const nlohmann::json& body) {
        std::string challenge = body.value("challenge", "");
        std::string code = body.value("code", "");
        if (challenge.empty() || code.empty()) {
            sendError(res, 400, "challenge and code are required");
            return;
        }

        auto result = twoFactorService_->confirmEnrollment(subjectId, challenge, code);
        if (!result.success) {
            sendError(res, 400, result.message);
            return;
        }

        nlohmann::json response;
        response["success"] = true;
        response["message"] = result.message;
        response["recovery_codes"] = result.recoveryCodes;
        res.setResult(200, "application/json", response.dump());
    }
};

} // namespace authcore::adapters::primary
