#pragma once

#include "Credential.hpp"
#include "enums/CredentialPolicy.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <string>
#include <vector>
#include <cstdint>

namespace authcore::domain {

// ============================================================================
// Метаданные по видам credential
// ============================================================================

struct NoMetadata {
    bool operator==(const NoMetadata&) const { return true; }
};

struct SessionMetadata {
    std::string userAgent;
    std::string ipAddress;
};

/**
 * @brief Метаданные ключа WebAuthn
 *
 * credentialId - публичный идентификатор аутентификатора (base64url),
 * нужен для allowCredentials, поэтому хранится рядом с digest.
 */
struct WebAuthnCredentialMetadata {
    std::string credentialId;
    std::string publicKey;              ///< COSE ключ, base64url
    uint32_t signCount = 0;
    std::string deviceType;
    bool backedUp = false;
    std::vector<std::string> transports;
    std::string nickname;
};

struct OAuthMetadata {
    std::string provider;
    std::string providerUserId;
};

struct TwoFactorChallengeMetadata {
    std::string totpSeed;   ///< base32
};

struct TemporaryTwoFactorChallengeMetadata {
    int64_t passwordResetTokenId = 0;
};

struct EmailVerificationMetadata {
    std::string email;
};

struct PhoneVerificationMetadata {
    std::string phoneNumber;
};

// JSON (колонка metadata JSONB)

inline void to_json(nlohmann::json& j, const NoMetadata&) {
    j = nlohmann::json::object();
}

inline void from_json(const nlohmann::json&, NoMetadata&) {}

inline void to_json(nlohmann::json& j, const SessionMetadata& m) {
    j = {{"user_agent", m.userAgent}, {"ip_address", m.ipAddress}};
}

inline void from_json(const nlohmann::json& j, SessionMetadata& m) {
    m.userAgent = j.value("user_agent", "");
    m.ipAddress = j.value("ip_address", "");
}

inline void to_json(nlohmann::json& j, const WebAuthnCredentialMetadata& m) {
    j = {
        {"credential_id", m.credentialId},
        {"public_key", m.publicKey},
        {"sign_count", m.signCount},
        {"device_type", m.deviceType},
        {"backed_up", m.backedUp},
        {"transports", m.transports},
        {"nickname", m.nickname}
    };
}

inline void from_json(const nlohmann::json& j, WebAuthnCredentialMetadata& m) {
    m.credentialId = j.value("credential_id", "");
    m.publicKey = j.value("public_key", "");
    m.signCount = j.value("sign_count", 0u);
    m.deviceType = j.value("device_type", "");
    m.backedUp = j.value("backed_up", false);
    m.transports = j.value("transports", std::vector<std::string>{});
    m.nickname = j.value("nickname", "");
}

inline void to_json(nlohmann::json& j, const OAuthMetadata& m) {
    j = {{"provider", m.provider}, {"provider_user_id", m.providerUserId}};
}

inline void from_json(const nlohmann::json& j, OAuthMetadata& m) {
    m.provider = j.value("provider", "");
    m.providerUserId = j.value("provider_user_id", "");
}

inline void to_json(nlohmann::json& j, const TwoFactorChallengeMetadata& m) {
    j = {{"totp_seed", m.totpSeed}};
}

inline void from_json(const nlohmann::json& j, TwoFactorChallengeMetadata& m) {
    m.totpSeed = j.value("totp_seed", "");
}

inline void to_json(nlohmann::json& j, const TemporaryTwoFactorChallengeMetadata& m) {
    j = {{"password_reset_token_id", m.passwordResetTokenId}};
}

inline void from_json(const nlohmann::json& j, TemporaryTwoFactorChallengeMetadata& m) {
    m.passwordResetTokenId = j.value("password_reset_token_id", int64_t{0});
}

inline void to_json(nlohmann::json& j, const EmailVerificationMetadata& m) {
    j = {{"email", m.email}};
}

inline void from_json(const nlohmann::json& j, EmailVerificationMetadata& m) {
    m.email = j.value("email", "");
}

inline void to_json(nlohmann::json& j, const PhoneVerificationMetadata& m) {
    j = {{"phone_number", m.phoneNumber}};
}

inline void from_json(const nlohmann::json& j, PhoneVerificationMetadata& m) {
    m.phoneNumber = j.value("phone_number", "");
}

// ============================================================================
// Виды credential
//
// ttl == 0 - запись без срока действия.
// listable - субъект может просматривать записи постранично и отзывать их.
// ============================================================================

struct SessionKind {
    using Metadata = SessionMetadata;
    static constexpr const char* name = "session";
    static constexpr const char* table = "sessions";
    static constexpr std::chrono::seconds ttl = std::chrono::hours(24);
    static constexpr ConsumptionPolicy consumption = ConsumptionPolicy::REUSABLE;
    static constexpr SecretSource source = SecretSource::GENERATED_TOKEN;
    static constexpr bool listable = true;
};

struct PasswordResetTokenKind {
    using Metadata = NoMetadata;
    static constexpr const char* name = "password reset token";
    static constexpr const char* table = "password_reset_tokens";
    static constexpr std::chrono::seconds ttl = std::chrono::hours(1);
    static constexpr ConsumptionPolicy consumption = ConsumptionPolicy::SINGLE_USE;
    static constexpr SecretSource source = SecretSource::GENERATED_TOKEN;
    static constexpr bool listable = false;
};

/**
 * @brief Challenge церемонии WebAuthn
 *
 * subjectId - аккаунт, для которого challenge сгенерирован; при регистрации
 * он ещё не подтверждён.
 */
struct WebAuthnChallengeKind {
    using Metadata = NoMetadata;
    static constexpr const char* name = "webauthn challenge";
    static constexpr const char* table = "webauthn_challenges";
    static constexpr std::chrono::seconds ttl = std::chrono::minutes(5);
    static constexpr ConsumptionPolicy consumption = ConsumptionPolicy::SINGLE_USE;
    static constexpr SecretSource source = SecretSource::GENERATED_TOKEN;
    static constexpr bool listable = false;
};

struct WebAuthnCredentialKind {
    using Metadata = WebAuthnCredentialMetadata;
    static constexpr const char* name = "webauthn credential";
    static constexpr const char* table = "webauthn_credentials";
    static constexpr std::chrono::seconds ttl = std::chrono::seconds::zero();
    static constexpr ConsumptionPolicy consumption = ConsumptionPolicy::REUSABLE;
    static constexpr SecretSource source = SecretSource::SUPPLIED;
    static constexpr bool listable = true;
};

/**
 * @brief Привязка внешнего OAuth провайдера
 *
 * Секрет - "provider:providerUserId", поэтому уникальность digest
 * означает одну привязку на пользователя провайдера.
 */
struct OAuthCredentialKind {
    using Metadata = OAuthMetadata;
    static constexpr const char* name = "oauth credential";
    static constexpr const char* table = "oauth_credentials";
    static constexpr std::chrono::seconds ttl = std::chrono::seconds::zero();
    static constexpr ConsumptionPolicy consumption = ConsumptionPolicy::REUSABLE;
    static constexpr SecretSource source = SecretSource::SUPPLIED;
    static constexpr bool listable = false;
};

struct TwoFactorChallengeKind {
    using Metadata = TwoFactorChallengeMetadata;
    static constexpr const char* name = "two factor challenge";
    static constexpr const char* table = "two_factor_authentication_challenges";
    static constexpr std::chrono::seconds ttl = std::chrono::minutes(5);
    static constexpr ConsumptionPolicy consumption = ConsumptionPolicy::SINGLE_USE;
    static constexpr SecretSource source = SecretSource::GENERATED_TOKEN;
    static constexpr bool listable = false;
};

struct RecoveryCodeKind {
    using Metadata = NoMetadata;
    static constexpr const char* name = "recovery code";
    static constexpr const char* table = "recovery_codes";
    static constexpr std::chrono::seconds ttl = std::chrono::seconds::zero();
    static constexpr ConsumptionPolicy consumption = ConsumptionPolicy::SINGLE_USE;
    static constexpr SecretSource source = SecretSource::GENERATED_RECOVERY_CODE;
    static constexpr bool listable = false;
};

/**
 * @brief 2FA challenge внутри сброса пароля
 *
 * Привязан к конкретному токену сброса (metadata.passwordResetTokenId).
 */
struct TemporaryTwoFactorChallengeKind {
    using Metadata = TemporaryTwoFactorChallengeMetadata;
    static constexpr const char* name = "temporary two factor challenge";
    static constexpr const char* table = "temporary_two_factor_challenges";
    static constexpr std::chrono::seconds ttl = std::chrono::minutes(5);
    static constexpr ConsumptionPolicy consumption = ConsumptionPolicy::SINGLE_USE;
    static constexpr SecretSource source = SecretSource::GENERATED_TOKEN;
    static constexpr bool listable = false;
};

struct EmailVerificationTokenKind {
    using Metadata = EmailVerificationMetadata;
    static constexpr const char* name = "email verification token";
    static constexpr const char* table = "email_verification_tokens";
    static constexpr std::chrono::seconds ttl = std::chrono::hours(24);
    static constexpr ConsumptionPolicy consumption = ConsumptionPolicy::SINGLE_USE;
    static constexpr SecretSource source = SecretSource::GENERATED_TOKEN;
    static constexpr bool listable = false;
};

struct PhoneVerificationTokenKind {
    using Metadata = PhoneVerificationMetadata;
    static constexpr const char* name = "phone verification token";
    static constexpr const char* table = "phone_verification_tokens";
    static constexpr std::chrono::seconds ttl = std::chrono::hours(24);
    static constexpr ConsumptionPolicy consumption = ConsumptionPolicy::SINGLE_USE;
    static constexpr SecretSource source = SecretSource::GENERATED_TOKEN;
    static constexpr bool listable = false;
};

using Session = Credential<SessionKind>;
using PasswordResetToken = Credential<PasswordResetTokenKind>;
using WebAuthnChallenge = Credential<WebAuthnChallengeKind>;
using WebAuthnCredential = Credential<WebAuthnCredentialKind>;
using OAuthCredential = Credential<OAuthCredentialKind>;
using TwoFactorChallenge = Credential<TwoFactorChallengeKind>;
using RecoveryCode = Credential<RecoveryCodeKind>;
using TemporaryTwoFactorChallenge = Credential<TemporaryTwoFactorChallengeKind>;
using EmailVerificationToken = Credential<EmailVerificationTokenKind>;
using PhoneVerificationToken = Credential<PhoneVerificationTokenKind>;

} // namespace authcore::domain
