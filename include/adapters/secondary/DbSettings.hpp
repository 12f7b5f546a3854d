#pragma once

#include "adapters/secondary/Env.hpp"
#include <string>
#include <set>

namespace authcore::adapters::secondary {

/**
 * @brief Подключение к PostgreSQL с таблицами credential
 *
 * AUTHCORE_DB_PASSWORD обязателен. Пароль не попадает в describe(),
 * которое пишется в лог при старте.
 */
class DbSettings {
public:
    static constexpr const char* APPLICATION_NAME = "auth-core";

    DbSettings() {
        host_ = env::getOrDefault("AUTHCORE_DB_HOST", "localhost");
        port_ = env::getInt("AUTHCORE_DB_PORT", 5432, 1, 65535);
        name_ = env::getOrDefault("AUTHCORE_DB_NAME", "authcore");
        user_ = env::getOrDefault("AUTHCORE_DB_USER", "authcore");
        password_ = env::getOrThrow("AUTHCORE_DB_PASSWORD");
        sslMode_ = env::getOrDefault("AUTHCORE_DB_SSLMODE", "prefer");
        connectTimeoutSeconds_ = env::getInt("AUTHCORE_DB_CONNECT_TIMEOUT_SECONDS", 5, 1, 300);

        static const std::set<std::string> sslModes = {
            "disable", "allow", "prefer", "require", "verify-ca", "verify-full"
        };
        if (sslModes.count(sslMode_) == 0) {
            throw ConfigurationError("AUTHCORE_DB_SSLMODE is not a libpq sslmode: " + sslMode_);
        }
        if (host_.empty() || name_.empty() || user_.empty()) {
            throw ConfigurationError("AUTHCORE_DB_HOST, AUTHCORE_DB_NAME and AUTHCORE_DB_USER must not be empty");
        }
    }

    std::string getHost() const { return host_; }
    int getPort() const { return port_; }
    std::string getName() const { return name_; }
    std::string getUser() const { return user_; }
    std::string getSslMode() const { return sslMode_; }
    int getConnectTimeoutSeconds() const { return connectTimeoutSeconds_; }

    /**
     * @brief Строка подключения libpq (key=value)
     */
    std::string getConnectionString() const {
        return "host=" + quote(host_) +
               " port=" + std::to_string(port_) +
               " dbname=" + quote(name_) +
               " user=" + quote(user_) +
               " password=" + quote(password_) +
               " sslmode=" + sslMode_ +
               " connect_timeout=" + std::to_string(connectTimeoutSeconds_) +
               " application_name=" + APPLICATION_NAME;
    }

    std::string describe() const {
        return user_ + "@" + host_ + ":" + std::to_string(port_) + "/" + name_ +
               " (sslmode=" + sslMode_ + ")";
    }

private:
    std::string host_;
    int port_;
    std::string name_;
    std::string user_;
    std::string password_;
    std::string sslMode_;
    int connectTimeoutSeconds_;

    // libpq: значение в одинарных кавычках, \ и ' экранируются
    static std::string quote(const std::string& value) {
        std::string quoted = "'";
        for (char c : value) {
            if (c == '\\' || c == '\'') quoted += '\\';
            quoted += c;
        }
        quoted += "'";
        return quoted;
    }
};

} // namespace authcore::adapters::secondary
