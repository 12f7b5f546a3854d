#pragma once

#include <IRequest.hpp>
#include "pagination/Page.hpp"
#include "pagination/CursorPager.hpp"
#include "domain/CredentialKinds.hpp"
#include "domain/Timestamp.hpp"
#include "domain/errors/CredentialException.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <optional>
#include <cctype>

namespace authcore::adapters::primary {

/**
 * @brief Разобрать first/last/before/after из query string
 * @throws domain::ValidationException если first/last не целые числа
 */
inline pagination::PageArgs readPageArgs(IRequest& req) {
    auto readInt = [&req](const std::string& name) -> std::optional<int> {
        auto raw = req.getQueryParam(name);
        if (!raw) return std::nullopt;

        const std::string& value = *raw;
        size_t start = (!value.empty() && value[0] == '-') ? 1 : 0;
        if (value.size() == start || value.size() - start > 9) {
            throw domain::ValidationException(name + " parameter must be an integer");
        }
        for (size_t i = start; i < value.size(); ++i) {
            if (!std::isdigit(static_cast<unsigned char>(value[i]))) {
                throw domain::ValidationException(name + " parameter must be an integer");
            }
        }
        return std::stoi(value);
    };

    pagination::PageArgs args;
    args.first = readInt("first");
    args.last = readInt("last");
    args.before = req.getQueryParam("before");
    args.after = req.getQueryParam("after");
    return args;
}

template <typename T>
nlohmann::json pageInfoToJson(const pagination::Page<T>& page) {
    nlohmann::json info;
    info["has_next_page"] = page.hasNext;
    info["has_previous_page"] = page.hasPrevious;
    info["start_cursor"] = page.startCursor ? nlohmann::json(*page.startCursor) : nlohmann::json(nullptr);
    info["end_cursor"] = page.endCursor ? nlohmann::json(*page.endCursor) : nlohmann::json(nullptr);
    return info;
}

inline nlohmann::json sessionToJson(const domain::Session& session) {
    nlohmann::json json;
    json["id"] = session.id;
    json["cursor"] = pagination::CursorPager::cursorFor(session.id).value_or("");
    json["user_agent"] = session.metadata.userAgent;
    json["ip_address"] = session.metadata.ipAddress;
    json["issued_at"] = domain::Timestamp(session.issuedAt).toString();
    json["expires_at"] = session.expiresAt
        ? nlohmann::json(domain::Timestamp(*session.expiresAt).toString())
        : nlohmann::json(nullptr);
    return json;
}

inline nlohmann::json webAuthnCredentialToJson(const domain::WebAuthnCredential& credential) {
    nlohmann::json json;
    json["id"] = credential.id;
    json["cursor"] = pagination::CursorPager::cursorFor(credential.id).value_or("");
    json["credential_id"] = credential.metadata.credentialId;
    json["nickname"] = credential.metadata.nickname;
    json["device_type"] = credential.metadata.deviceType;
    json["backed_up"] = credential.metadata.backedUp;
    json["transports"] = credential.metadata.transports;
    json["created_at"] = domain::Timestamp(credential.issuedAt).toString();
    return json;
}

} // namespace authcore::adapters::primary
