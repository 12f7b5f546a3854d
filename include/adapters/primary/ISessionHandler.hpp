#pragma once

#include <IRequest.hpp>
#include <IResponse.hpp>
#include "adapters/primary/RequestContext.hpp"

namespace authcore::adapters::primary {

/**
 * @brief Обработчик, которому нужно состояние сессии запроса
 */
class ISessionHandler {
public:
    virtual ~ISessionHandler() = default;

    virtual void handle(IRequest& req, IResponse& res, RequestContext& ctx) = 0;
};

} // namespace authcore::adapters::primary
