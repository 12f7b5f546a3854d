#pragma once

#include "domain/CredentialKinds.hpp"
#include "domain/SessionState.hpp"
#include "pagination/Page.hpp"
#include <string>
#include <optional>
#include <cstdint>

namespace authcore::ports::input {

/**
 * @brief Результат входа
 */
struct StartSessionResult {
    bool success;
    int64_t sessionId;
    std::string message;
};

/**
 * @brief Интерфейс сервиса сессий
 *
 * Состояние сессии запроса передаётся явно и изменяется на месте;
 * cookie по нему выставляет SessionCookieMiddleware. Операции над
 * сессиями и sudo mode требуют, чтобы текущая сессия ещё действовала,
 * иначе CredentialException с кодом UNAUTHENTICATED.
 */
class ISessionService {
public:
    virtual ~ISessionService() = default;

    /**
     * @brief Начать сессию после успешной аутентификации
     *
     * Прежнее состояние запроса отбрасывается.
     */
    virtual StartSessionResult startSession(
        domain::SessionState& state,
        int64_t subjectId,
        const std::string& userAgent,
        const std::string& ipAddress
    ) = 0;

    /**
     * @brief Запись текущей сессии, если она ещё действует
     */
    virtual std::optional<domain::Session> currentSession(const domain::SessionState& state) = 0;

    /**
     * @brief Остальные сессии субъекта, постранично
     */
    virtual pagination::Page<domain::Session> listSessions(
        const domain::SessionState& state,
        const pagination::PageArgs& args
    ) = 0;

    /**
     * @brief Отозвать одну из других сессий
     * @return false, если у субъекта нет такой сессии (или это текущая)
     */
    virtual bool revokeSession(const domain::SessionState& state, int64_t sessionId) = 0;

    /**
     * @return число отозванных сессий
     */
    virtual size_t revokeOtherSessions(const domain::SessionState& state) = 0;

    /**
     * @brief Выход: удалить текущую сессию и очистить состояние
     */
    virtual bool logout(domain::SessionState& state) = 0;

    /**
     * @brief Открыть окно sudo mode после повторной аутентификации
     */
    virtual domain::TimePoint enterSudoMode(domain::SessionState& state) = 0;
};

} // namespace authcore::ports::input
