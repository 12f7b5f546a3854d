#pragma once

#include "adapters/primary/ISessionHandler.hpp"
#include "adapters/primary/HttpErrors.hpp"
#include "adapters/primary/PageJson.hpp"
#include "ports/input/ISessionService.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace authcore::adapters::primary {

/**
 * @brief GET /api/v1/sessions - другие сессии пользователя
 *
 * Query: first, last, before, after. Текущая сессия в список не входит.
 */
class ListSessionsHandler : public ISessionHandler {
public:
    explicit ListSessionsHandler(std::shared_ptr<ports::input::ISessionService> sessionService)
        : sessionService_(std::move(sessionService))
    {
        std::cout << "[ListSessionsHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res, RequestContext& ctx) override {
        try {
            auto page = sessionService_->listSessions(ctx.session, readPageArgs(req));

            nlohmann::json response;
            response["sessions"] = nlohmann::json::array();
            for (const auto& session : page.items) {
                response["sessions"].push_back(sessionToJson(session));
            }
            response["page_info"] = pageInfoToJson(page);

            res.setResult(200, "application/json", response.dump());

        } catch (const domain::CredentialException& e) {
            sendCredentialError(res, ctx, e);
        } catch (const std::exception& e) {
            std::cerr << "[ListSessionsHandler] Error: " << e.what() << std::endl;
            sendError(res, 500, "Internal server error");
        }
    }

private:
    std::shared_ptr<ports::input::ISessionService> sessionService_;
};

} // namespace authcore::adapters::primary
