#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/ISessionHandler.hpp"
#include "adapters/primary/RequestContext.hpp"
#include "adapters/secondary/SessionSettings.hpp"
#include "security/SessionCookieCodec.hpp"
#include <memory>
#include <string>
#include <optional>
#include <iostream>

namespace authcore::adapters::primary {

/**
 * @brief Декоратор: cookie сессии -> RequestContext -> Set-Cookie
 *
 * До обработчика расшифровывает cookie (сбой = пустое состояние),
 * после него сравнивает состояние с исходным и решает, выставить,
 * стереть или не трогать cookie. Атрибуты одинаковы для установки и
 * стирания.
 */
class SessionCookieMiddleware : public IHttpHandler {
public:
    SessionCookieMiddleware(
        std::shared_ptr<secondary::SessionSettings> settings,
        std::shared_ptr<security::SessionCookieCodec> codec,
        std::shared_ptr<ISessionHandler> inner
    ) : settings_(std::move(settings))
      , codec_(std::move(codec))
      , inner_(std::move(inner))
    {}

    void handle(IRequest& req, IResponse& res) override {
        auto initial = codec_->decode(readCookie(req).value_or(""));

        RequestContext ctx;
        ctx.session = initial;
        ctx.userAgent = req.getHeader("User-Agent").value_or("");
        ctx.ipAddress = req.getIp();

        inner_->handle(req, res, ctx);

        auto update = codec_->prepareResponse(initial, ctx.session);
        switch (update.action) {
            case security::CookieAction::SET:
                res.setHeader("Set-Cookie", formatCookie(update.value, settings_->getCookieMaxAge()));
                break;
            case security::CookieAction::CLEAR:
                res.setHeader("Set-Cookie", formatCookie("", 0));
                break;
            case security::CookieAction::NONE:
                break;
        }
    }

    /**
     * @brief Значение cookie с именем сессии из заголовка Cookie
     */
    std::optional<std::string> readCookie(IRequest& req) const {
        auto header = req.getHeader("Cookie");
        if (!header) return std::nullopt;

        const std::string name = settings_->getCookieName();
        const std::string& cookies = *header;
        size_t pos = 0;
        while (pos < cookies.size()) {
            size_t end = cookies.find(';', pos);
            if (end == std::string::npos) end = cookies.size();

            std::string pair = trim(cookies.substr(pos, end - pos));
            size_t eq = pair.find('=');
            if (eq != std::string::npos && pair.substr(0, eq) == name) {
                return pair.substr(eq + 1);
            }
            pos = end + 1;
        }
        return std::nullopt;
    }

    std::string formatCookie(const std::string& value, int maxAge) const {
        std::string cookie = settings_->getCookieName() + "=" + value;
        cookie += "; Path=" + settings_->getCookiePath();
        if (!settings_->getCookieDomain().empty()) {
            cookie += "; Domain=" + settings_->getCookieDomain();
        }
        cookie += "; Max-Age=" + std::to_string(maxAge);
        cookie += "; HttpOnly";
        if (settings_->isCookieSecure()) {
            cookie += "; Secure";
        }
        if (!settings_->getCookieSameSite().empty()) {
            cookie += "; SameSite=" + settings_->getCookieSameSite();
        }
        return cookie;
    }

private:
    std::shared_ptr<secondary::SessionSettings> settings_;
    std::shared_ptr<security::SessionCookieCodec> codec_;
    std::shared_ptr<ISessionHandler> inner_;

    static std::string trim(const std::string& s) {
        size_t start = s.find_first_not_of(" \t");
        if (start == std::string::npos) return "";
        size_t end = s.find_last_not_of(" \t");
        return s.substr(start, end - start + 1);
    }
};

} // namespace authcore::adapters::primary
