#pragma once

#include "ports/input/ISessionService.hpp"
#include "ports/output/IClock.hpp"
#include "application/CredentialStore.hpp"
#include "adapters/secondary/SessionSettings.hpp"
#include <memory>
#include <iostream>

namespace authcore::application {

/**
 * @brief Сервис сессий
 */
class SessionService : public ports::input::ISessionService {
public:
    SessionService(
        std::shared_ptr<adapters::secondary::SessionSettings> settings,
        std::shared_ptr<CredentialStore<domain::SessionKind>> sessions,
        std::shared_ptr<ports::output::IClock> clock
    ) : settings_(std::move(settings))
      , sessions_(std::move(sessions))
      , clock_(std::move(clock))
    {
        std::cout << "[SessionService] Created" << std::endl;
    }

    ports::input::StartSessionResult startSession(
        domain::SessionState& state,
        int64_t subjectId,
        const std::string& userAgent,
        const std::string& ipAddress
    ) override {
        auto issued = sessions_->create(subjectId, {userAgent, ipAddress});

        // новое состояние целиком: ничего из анонимной сессии не переносим
        state.clear();
        state.setSubjectId(subjectId);
        state.setSessionToken(issued.secret);

        return {true, issued.record.id, "Session started"};
    }

    std::optional<domain::Session> currentSession(const domain::SessionState& state) override {
        auto subjectId = state.subjectId();
        auto token = state.sessionToken();
        if (!subjectId || !token) return std::nullopt;

        auto result = sessions_->lookupForSubject(*subjectId, *token);
        if (!result.found()) return std::nullopt;
        return result.record;
    }

    pagination::Page<domain::Session> listSessions(
        const domain::SessionState& state,
        const pagination::PageArgs& args
    ) override {
        auto current = requireCurrent(state);
        return sessions_->listBySubject(current.subjectId, args, *state.sessionToken());
    }

    bool revokeSession(const domain::SessionState& state, int64_t sessionId) override {
        auto current = requireCurrent(state);
        return sessions_->revoke(current.subjectId, sessionId, *state.sessionToken());
    }

    size_t revokeOtherSessions(const domain::SessionState& state) override {
        auto current = requireCurrent(state);
        return sessions_->revokeAll(current.subjectId, *state.sessionToken());
    }

    bool logout(domain::SessionState& state) override {
        bool revoked = false;
        if (auto current = currentSession(state)) {
            revoked = sessions_->revoke(current->subjectId, current->id);
        }
        state.clear();
        return revoked;
    }

    domain::TimePoint enterSudoMode(domain::SessionState& state) override {
        requireCurrent(state);
        auto expiresAt = clock_->now() + settings_->getSudoModeDuration();
        state.setSudoModeExpiresAt(expiresAt);
        return expiresAt;
    }

private:
    std::shared_ptr<adapters::secondary::SessionSettings> settings_;
    std::shared_ptr<CredentialStore<domain::SessionKind>> sessions_;
    std::shared_ptr<ports::output::IClock> clock_;

    /**
     * @brief Действующая запись сессии из состояния запроса
     * @throws domain::CredentialException UNAUTHENTICATED, если сессии нет,
     *         она истекла или отозвана с другого устройства
     */
    domain::Session requireCurrent(const domain::SessionState& state) {
        auto current = currentSession(state);
        if (!current) {
            throw domain::CredentialException(domain::ErrorCode::UNAUTHENTICATED, "Session is no longer active");
        }
        return *current;
    }
};

} // namespace authcore::application
