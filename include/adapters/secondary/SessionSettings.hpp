#pragma once

#include "adapters/secondary/Env.hpp"
#include <string>
#include <chrono>

namespace authcore::adapters::secondary {

/**
 * @brief Ключ и политика cookie сессии из ENV
 *
 * Атрибуты cookie применяются одинаково при установке и при стирании.
 */
class SessionSettings {
public:
    static constexpr size_t MIN_SECRET_LENGTH = 16;

    SessionSettings() {
        secret_ = env::getOrThrow("AUTHCORE_SESSION_SECRET");
        cookieName_ = env::getOrDefault("AUTHCORE_SESSION_COOKIE_NAME", "session");
        cookiePath_ = env::getOrDefault("AUTHCORE_SESSION_COOKIE_PATH", "/");
        cookieDomain_ = env::getOrDefault("AUTHCORE_SESSION_COOKIE_DOMAIN", "");
        cookieMaxAge_ = env::getInt("AUTHCORE_SESSION_COOKIE_MAX_AGE", 86400, 1, 400 * 86400);
        cookieSecure_ = env::getBool("AUTHCORE_SESSION_COOKIE_SECURE", true);
        cookieSameSite_ = env::getOrDefault("AUTHCORE_SESSION_COOKIE_SAME_SITE", "Lax");
        sudoModeSeconds_ = env::getInt("AUTHCORE_SUDO_MODE_SECONDS", 900, 1, 86400);

        if (secret_.size() < MIN_SECRET_LENGTH) {
            throw ConfigurationError("AUTHCORE_SESSION_SECRET must be at least " +
                                     std::to_string(MIN_SECRET_LENGTH) + " characters");
        }
        if (cookieName_.empty() || cookieName_.find_first_of("=; \t") != std::string::npos) {
            throw ConfigurationError("AUTHCORE_SESSION_COOKIE_NAME is not a valid cookie name");
        }
        if (cookieSameSite_ != "Strict" && cookieSameSite_ != "Lax" &&
            cookieSameSite_ != "None" && !cookieSameSite_.empty()) {
            throw ConfigurationError("AUTHCORE_SESSION_COOKIE_SAME_SITE must be Strict, Lax or None");
        }
        // браузеры отбрасывают SameSite=None без Secure
        if (cookieSameSite_ == "None" && !cookieSecure_) {
            throw ConfigurationError("SameSite=None requires AUTHCORE_SESSION_COOKIE_SECURE=true");
        }
    }

    const std::string& getSecret() const { return secret_; }
    std::string getCookieName() const { return cookieName_; }
    std::string getCookiePath() const { return cookiePath_; }
    std::string getCookieDomain() const { return cookieDomain_; }
    int getCookieMaxAge() const { return cookieMaxAge_; }
    bool isCookieSecure() const { return cookieSecure_; }
    std::string getCookieSameSite() const { return cookieSameSite_; }
    std::chrono::seconds getSudoModeDuration() const { return std::chrono::seconds(sudoModeSeconds_); }

private:
    std::string secret_;
    std::string cookieName_;
    std::string cookiePath_;
    std::string cookieDomain_;
    int cookieMaxAge_;
    bool cookieSecure_;
    std::string cookieSameSite_;
    int sudoModeSeconds_;
};

} // namespace authcore::adapters::secondary
