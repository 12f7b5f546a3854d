#pragma once

#include "adapters/primary/ISessionHandler.hpp"
#include "adapters/primary/HttpErrors.hpp"
#include "ports/input/ISessionService.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace authcore::adapters::primary {

/**
 * @brief DELETE /api/v1/sessions/{id} - отозвать другую сессию
 *
 * Роутер регистрирует с паттерном "/api/v1/sessions/*". Требует sudo mode.
 */
class RevokeSessionHandler : public ISessionHandler {
public:
    explicit RevokeSessionHandler(std::shared_ptr<ports::input::ISessionService> sessionService)
        : sessionService_(std::move(sessionService))
    {
        std::cout << "[RevokeSessionHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res, RequestContext& ctx) override {
        auto sessionId = parseId(req.getPathParam(0).value_or(""));
        if (!sessionId) {
            sendError(res, 400, "Session ID must be a positive integer");
            return;
        }

        try {
            if (!sessionService_->revokeSession(ctx.session, *sessionId)) {
                sendError(res, 404, "Session not found");
                return;
            }

            nlohmann::json response;
            response["message"] = "Session revoked";
            response["session_id"] = *sessionId;
            res.setResult(200, "application/json", response.dump());

        } catch (const domain::CredentialException& e) {
            sendCredentialError(res, ctx, e);
        } catch (const std::exception& e) {
            std::cerr << "[RevokeSessionHandler] Error: " << e.what() << std::endl;
            sendError(res, 500, "Internal server error");
        }
    }

private:
    std::shared_ptr<ports::input::ISessionService> sessionService_;

    static std::optional<int64_t> parseId(const std::string& value) {
        if (value.empty() || value.size() > 18) return std::nullopt;
        int64_t id = 0;
        for (char c : value) {
            if (c < '0' || c > '9') return std::nullopt;
            id = id * 10 + (c - '0');
        }
        if (id <= 0) return std::nullopt;
        return id;
    }
};

} // namespace authcore::adapters::primary
