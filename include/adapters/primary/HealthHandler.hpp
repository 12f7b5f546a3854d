#pragma once

#include <IHttpHandler.hpp>
#include "domain/CredentialKinds.hpp"
#include <nlohmann/json.hpp>

namespace authcore::adapters::primary {

/**
 * @brief GET /health
 *
 * Кроме статуса отдаёт обслуживаемые виды credential и их TTL.
 */
class HealthHandler : public IHttpHandler {
public:
    void handle(IRequest& req, IResponse& res) override {
        nlohmann::json response;
        response["status"] = "healthy";
        response["service"] = "auth-core";
        response["version"] = "1.0.0";

        auto& kinds = response["credential_kinds"] = nlohmann::json::array();
        describe<domain::SessionKind>(kinds);
        describe<domain::PasswordResetTokenKind>(kinds);
        describe<domain::WebAuthnChallengeKind>(kinds);
        describe<domain::WebAuthnCredentialKind>(kinds);
        describe<domain::OAuthCredentialKind>(kinds);
        describe<domain::TwoFactorChallengeKind>(kinds);
        describe<domain::RecoveryCodeKind>(kinds);
        describe<domain::TemporaryTwoFactorChallengeKind>(kinds);
        describe<domain::EmailVerificationTokenKind>(kinds);
        describe<domain::PhoneVerificationTokenKind>(kinds);

        res.setResult(200, "application/json", response.dump());
    }

private:
    template <typename Kind>
    static void describe(nlohmann::json& kinds) {
        kinds.push_back({
            {"name", Kind::name},
            {"ttl_seconds", Kind::ttl.count()},
            {"single_use", Kind::consumption == domain::ConsumptionPolicy::SINGLE_USE}
        });
    }
};

} // namespace authcore::adapters::primary
