#pragma once

#include <BoostBeastApplication.hpp>
#include <boost/di.hpp>

// Ports
#include "ports/input/ISessionService.hpp"
#include "ports/input/ITwoFactorService.hpp"
#include "ports/input/IWebAuthnService.hpp"
#include "ports/output/ICredentialRepository.hpp"
#include "ports/output/IClock.hpp"

// Application
#include "application/CredentialStore.hpp"
#include "application/WebAuthnCredentialStore.hpp"
#include "application/AuthorizationGate.hpp"
#include "application/SessionService.hpp"
#include "application/TwoFactorService.hpp"
#include "application/WebAuthnService.hpp"

// Security
#include "security/SecretCodec.hpp"
#include "security/SessionCookieCodec.hpp"

// Secondary Adapters
#include "adapters/secondary/DbSettings.hpp"
#include "adapters/secondary/SessionSettings.hpp"
#include "adapters/secondary/SystemClock.hpp"
#include "adapters/secondary/PostgresCredentialRepository.hpp"

// Primary Adapters
#include "adapters/primary/HealthHandler.hpp"
#include "adapters/primary/SessionCookieMiddleware.hpp"
#include "adapters/primary/AuthorizationGuard.hpp"
#include "adapters/primary/ListSessionsHandler.hpp"
#include "adapters/primary/RevokeSessionHandler.hpp"
#include "adapters/primary/RevokeOtherSessionsHandler.hpp"
#include "adapters/primary/LogoutHandler.hpp"
#include "adapters/primary/ListWebAuthnCredentialsHandler.hpp"
#include "adapters/primary/WebAuthnChallengeHandler.hpp"
#include "adapters/primary/WebAuthnLoginHandler.hpp"
#include "adapters/primary/SudoModeHandler.hpp"
#include "adapters/primary/TwoFactorEnrollmentHandler.hpp"

#include <memory>
#include <iostream>

namespace di = boost::di;

namespace authcore {

/**
 * @brief Auth Core Application
 *
 * Настраивает Boost.DI контейнер и регистрирует HTTP handlers.
 * Обработчики сессии оборачиваются в AuthorizationGuard и
 * SessionCookieMiddleware. Сессия начинается входом по ключу WebAuthn.
 *
 * Сброс пароля, подтверждение контактов и привязка OAuth не имеют HTTP
 * поверхности: доставку секрета и внешний провайдер ведёт вызывающий
 * сервис, который использует их как библиотеку.
 */
class AuthCoreApp : public BoostBeastApplication {
public:
    AuthCoreApp() {
        std::cout << "[AuthCoreApp] Initializing..." << std::endl;
    }

    ~AuthCoreApp() override = default;

protected:
    void loadEnvironment(int argc, char* argv[]) override {
        BoostBeastApplication::loadEnvironment(argc, argv);
        std::cout << "[AuthCoreApp] Environment loaded" << std::endl;
    }

    void configureInjection() override {
        std::cout << "[AuthCoreApp] Configuring Boost.DI injection..." << std::endl;

        using namespace adapters::secondary;
        using application::CredentialStore;

        auto dbSettings = std::make_shared<DbSettings>();
        auto sessionSettings = std::make_shared<SessionSettings>();
        std::cout << "[AuthCoreApp] Database: " << dbSettings->describe() << std::endl;
        auto cookieCodec = std::make_shared<security::SessionCookieCodec>(sessionSettings->getSecret());

        auto injector = di::make_injector(

            // ================================================================
            // Layer 1: Settings & Infrastructure
            // ================================================================
            di::bind<DbSettings>()
                .to(dbSettings),

            di::bind<SessionSettings>()
                .to(sessionSettings),

            di::bind<security::SessionCookieCodec>()
                .to(cookieCodec),

            di::bind<security::SecretCodec>()
                .in(di::singleton),

            di::bind<ports::output::IClock>()
                .to<SystemClock>()
                .in(di::singleton),

            // ================================================================
            // Layer 2: Secondary Adapters (одна таблица на вид credential)
            // ================================================================
            di::bind<ports::output::ICredentialRepository<domain::SessionKind>>()
                .to<PostgresCredentialRepository<domain::SessionKind>>()
                .in(di::singleton),

            di::bind<ports::output::ICredentialRepository<domain::WebAuthnChallengeKind>>()
                .to<PostgresCredentialRepository<domain::WebAuthnChallengeKind>>()
                .in(di::singleton),

            di::bind<ports::output::IWebAuthnCredentialRepository>()
                .to<PostgresWebAuthnCredentialRepository>()
                .in(di::singleton),

            di::bind<ports::output::ICredentialRepository<domain::TwoFactorChallengeKind>>()
                .to<PostgresCredentialRepository<domain::TwoFactorChallengeKind>>()
                .in(di::singleton),

            di::bind<ports::output::ICredentialRepository<domain::RecoveryCodeKind>>()
                .to<PostgresCredentialRepository<domain::RecoveryCodeKind>>()
                .in(di::singleton),

            // ================================================================
            // Layer 3: Credential stores & Application Services
            // ================================================================
            di::bind<CredentialStore<domain::SessionKind>>().in(di::singleton),
            di::bind<CredentialStore<domain::WebAuthnChallengeKind>>().in(di::singleton),
            di::bind<CredentialStore<domain::TwoFactorChallengeKind>>().in(di::singleton),
            di::bind<CredentialStore<domain::RecoveryCodeKind>>().in(di::singleton),
            di::bind<application::WebAuthnCredentialStore>().in(di::singleton),
            di::bind<application::AuthorizationGate>().in(di::singleton),

            di::bind<ports::input::ISessionService>()
                .to<application::SessionService>()
                .in(di::singleton),

            di::bind<ports::input::ITwoFactorService>()
                .to<application::TwoFactorService>()
                .in(di::singleton),

            di::bind<ports::input::IWebAuthnService>()
                .to<application::WebAuthnService>()
                .in(di::singleton)
        );

        std::cout << "[AuthCoreApp] DI Injector configured:" << std::endl;
        std::cout << "  ✓ Credential repositories (5 bindings)" << std::endl;
        std::cout << "  ✓ Application Services (3 bindings)" << std::endl;

        // ====================================================================
        // Layer 4: Primary Adapters (HTTP Handlers)
        // ====================================================================

        std::cout << "[AuthCoreApp] Registering HTTP Handlers via DI..." << std::endl;

        auto gate = injector.create<std::shared_ptr<application::AuthorizationGate>>();
        auto sessionService = injector.create<std::shared_ptr<ports::input::ISessionService>>();
        auto twoFactorService = injector.create<std::shared_ptr<ports::input::ITwoFactorService>>();

        // Guard + cookie middleware вокруг обработчика сессии
        auto wrap = [&](domain::AccessLevel level, std::shared_ptr<adapters::primary::ISessionHandler> handler) {
            auto guarded = std::make_shared<adapters::primary::AuthorizationGuard>(gate, level, std::move(handler));
            return std::make_shared<adapters::primary::SessionCookieMiddleware>(
                sessionSettings, cookieCodec, guarded);
        };

        // Только cookie middleware: вход доступен без сессии
        auto withCookie = [&](std::shared_ptr<adapters::primary::ISessionHandler> handler) {
            return std::make_shared<adapters::primary::SessionCookieMiddleware>(
                sessionSettings, cookieCodec, std::move(handler));
        };

        {
            auto handler = injector.create<std::shared_ptr<adapters::primary::HealthHandler>>();
            registerEndpoint("GET", "/health", handler);
            std::cout << "  ✓ HealthHandler: GET /health" << std::endl;
        }

        {
            auto handler = injector.create<std::shared_ptr<adapters::primary::ListSessionsHandler>>();
            registerEndpoint("GET", "/api/v1/sessions", wrap(domain::AccessLevel::AUTHENTICATED, handler));
            std::cout << "  ✓ ListSessionsHandler: GET /api/v1/sessions" << std::endl;
        }

        {
            auto handler = injector.create<std::shared_ptr<adapters::primary::RevokeSessionHandler>>();
            registerEndpoint("DELETE", "/api/v1/sessions/*", wrap(domain::AccessLevel::SUDO_MODE, handler));
            std::cout << "  ✓ RevokeSessionHandler: DELETE /api/v1/sessions/*" << std::endl;
        }

        {
            auto handler = injector.create<std::shared_ptr<adapters::primary::RevokeOtherSessionsHandler>>();
            registerEndpoint("POST", "/api/v1/sessions/revoke-others", wrap(domain::AccessLevel::SUDO_MODE, handler));
            std::cout << "  ✓ RevokeOtherSessionsHandler: POST /api/v1/sessions/revoke-others" << std::endl;
        }

        {
            auto handler = injector.create<std::shared_ptr<adapters::primary::LogoutHandler>>();
            registerEndpoint("POST", "/api/v1/auth/logout", wrap(domain::AccessLevel::AUTHENTICATED, handler));
            std::cout << "  ✓ LogoutHandler: POST /api/v1/auth/logout" << std::endl;
        }

        {
            auto handler = injector.create<std::shared_ptr<adapters::primary::ListWebAuthnCredentialsHandler>>();
            registerEndpoint("GET", "/api/v1/webauthn/credentials", wrap(domain::AccessLevel::AUTHENTICATED, handler));
            std::cout << "  ✓ ListWebAuthnCredentialsHandler: GET /api/v1/webauthn/credentials" << std::endl;
        }

        {
            auto handler = injector.create<std::shared_ptr<adapters::primary::WebAuthnChallengeHandler>>();
            registerEndpoint("POST", "/api/v1/auth/webauthn/challenge", handler);
            std::cout << "  ✓ WebAuthnChallengeHandler: POST /api/v1/auth/webauthn/challenge" << std::endl;
        }

        {
            auto handler = injector.create<std::shared_ptr<adapters::primary::WebAuthnLoginHandler>>();
            registerEndpoint("POST", "/api/v1/auth/webauthn/login", withCookie(handler));
            std::cout << "  ✓ WebAuthnLoginHandler: POST /api/v1/auth/webauthn/login" << std::endl;
        }

        {
            auto handler = injector.create<std::shared_ptr<adapters::primary::SudoModeHandler>>();
            registerEndpoint("POST", "/api/v1/auth/sudo", wrap(domain::AccessLevel::AUTHENTICATED, handler));
            std::cout << "  ✓ SudoModeHandler: POST /api/v1/auth/sudo" << std::endl;
        }

        {
            using Step = adapters::primary::TwoFactorEnrollmentHandler::Step;
            auto begin = std::make_shared<adapters::primary::TwoFactorEnrollmentHandler>(
                sessionService, twoFactorService, Step::BEGIN);
            auto confirm = std::make_shared<adapters::primary::TwoFactorEnrollmentHandler>(
                sessionService, twoFactorService, Step::CONFIRM);
            registerEndpoint("POST", "/api/v1/2fa/enrollment", wrap(domain::AccessLevel::AUTHENTICATED, begin));
            registerEndpoint("POST", "/api/v1/2fa/enrollment/confirm", wrap(domain::AccessLevel::AUTHENTICATED, confirm));
            std::cout << "  ✓ TwoFactorEnrollmentHandler: POST /api/v1/2fa/enrollment[/confirm]" << std::endl;
        }

        std::cout << "[AuthCoreApp] Configuration complete! 11 handlers registered." << std::endl;
    }
};

} // namespace authcore
