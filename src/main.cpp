#include "AuthCoreApp.hpp"
#include <iostream>
#include <csignal>
#include <cstring>

namespace {

authcore::AuthCoreApp* g_app = nullptr;

void signalHandler(int signal) {
    std::cout << "\n[main] Received signal " << signal << ", shutting down..." << std::endl;
    if (g_app) {
        g_app->stop();
    }
}

bool hasFlag(int argc, char* argv[], const char* flag) {
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], flag) == 0) return true;
    }
    return false;
}

void printConfiguration(const authcore::adapters::secondary::DbSettings& db,
                        const authcore::adapters::secondary::SessionSettings& session) {
    std::cout << "  Database:    " << db.describe() << std::endl;
    std::cout << "  Cookie:      " << session.getCookieName()
              << " (max-age " << session.getCookieMaxAge() << "s, "
              << (session.isCookieSecure() ? "secure" : "insecure") << ")" << std::endl;
    std::cout << "  Sudo window: " << session.getSudoModeDuration().count() << "s" << std::endl;
}

} // namespace

/**
 * Коды выхода: 0 - штатная остановка, 1 - ошибка во время работы,
 * 2 - неверная конфигурация. С --check-config только проверяет ENV.
 */
int main(int argc, char* argv[]) {
    using namespace authcore::adapters::secondary;

    try {
        // Конфигурация проверяется до открытия порта
        DbSettings db;
        SessionSettings session;

        std::cout << "========================================" << std::endl;
        std::cout << "  Auth Core v1.0.0" << std::endl;
        printConfiguration(db, session);
        std::cout << "========================================" << std::endl;

        if (hasFlag(argc, argv, "--check-config")) {
            std::cout << "[main] Configuration OK" << std::endl;
            return 0;
        }

        authcore::AuthCoreApp app;
        g_app = &app;

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        app.run(argc, argv);

        g_app = nullptr;
        std::cout << "[main] Auth Core stopped" << std::endl;
        return 0;

    } catch (const ConfigurationError& e) {
        std::cerr << "[main] Configuration error: " << e.what() << std::endl;
        return 2;
    } catch (const std::exception& e) {
        g_app = nullptr;
        std::cerr << "[main] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
