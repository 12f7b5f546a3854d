#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <optional>
#include <cstdint>
#include <limits>

namespace authcore::adapters::primary {

/**
 * @brief Подтверждение ключом из тела запроса
 *
 * {
 *   "challenge": "...",
 *   "credential_id": "...",
 *   "sign_count": 17
 * }
 *
 * Подпись проверяется до этого сервиса; сюда приходит результат.
 */
struct WebAuthnAssertion {
    std::string challenge;
    std::string credentialId;
    uint32_t signCount;
};

/**
 * @return std::nullopt, если поля нет или sign_count вне uint32
 * @throws nlohmann::json::exception если тело не JSON
 */
inline std::optional<WebAuthnAssertion> readAssertion(const std::string& body) {
    auto json = nlohmann::json::parse(body);

    WebAuthnAssertion assertion;
    assertion.challenge = json.value("challenge", "");
    assertion.credentialId = json.value("credential_id", "");
    if (assertion.challenge.empty() || assertion.credentialId.empty()) {
        return std::nullopt;
    }

    auto it = json.find("sign_count");
    if (it == json.end() || !it->is_number_integer()) return std::nullopt;
    auto signCount = it->get<int64_t>();
    if (signCount < 0 || signCount > std::numeric_limits<uint32_t>::max()) {
        return std::nullopt;
    }
    assertion.signCount = static_cast<uint32_t>(signCount);
    return assertion;
}

} // namespace authcore::adapters::primary
