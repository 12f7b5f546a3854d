#pragma once

#include "Timestamp.hpp"
#include "enums/LookupStatus.hpp"
#include <string>
#include <optional>
#include <cstdint>

namespace authcore::domain {

/**
 * @brief Запись credential
 *
 * Общая форма для всех видов; Kind задаёт тип метаданных,
 * TTL и политику потребления (см. CredentialKinds.hpp).
 * Открытый секрет никогда не хранится, только его digest.
 */
template <typename Kind>
struct Credential {
    using Metadata = typename Kind::Metadata;

    int64_t id = 0;             ///< Монотонный идентификатор (BIGSERIAL)
    int64_t subjectId = 0;      ///< Владелец (аккаунт)
    std::string secretDigest;   ///< SHA-256 секрета, уникален в пределах вида
    TimePoint issuedAt;
    std::optional<TimePoint> expiresAt;  ///< nullopt - без срока действия
    Metadata metadata;

    /**
     * @brief Истёк ли срок действия к моменту now
     */
    bool isExpired(TimePoint now) const {
        return expiresAt && now > *expiresAt;
    }
};

/**
 * @brief Результат lookup: запись есть только при FOUND
 */
template <typename Record>
struct LookupResult {
    LookupStatus status = LookupStatus::NOT_FOUND;
    std::optional<Record> record;

    bool found() const { return status == LookupStatus::FOUND; }

    static LookupResult of(Record value) {
        return {LookupStatus::FOUND, std::move(value)};
    }

    static LookupResult failed(LookupStatus status) {
        return {status, std::nullopt};
    }
};

/**
 * @brief Выпущенный credential
 *
 * secret возвращается вызывающему один раз и больше не восстановим.
 */
template <typename Record>
struct Issued {
    std::string secret;
    Record record;
};

} // namespace authcore::domain
