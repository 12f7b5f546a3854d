#pragma once

#include "domain/SessionState.hpp"
#include <string>

namespace authcore::adapters::primary {

/**
 * @brief Состояние запроса для обработчиков, знающих о сессии
 *
 * Создаётся SessionCookieMiddleware и передаётся параметром; изменения
 * session попадают в Set-Cookie ответа.
 */
struct RequestContext {
    domain::SessionState session;
    std::string userAgent;
    std::string ipAddress;
};

} // namespace authcore::adapters::primary
