#pragma once

#include "domain/Credential.hpp"
#include "domain/CredentialKinds.hpp"
#include "domain/errors/CredentialException.hpp"
#include "ports/output/ICredentialRepository.hpp"
#include "ports/output/IClock.hpp"
#include "pagination/CursorPager.hpp"
#include "security/SecretCodec.hpp"
#include <memory>
#include <string>
#include <vector>
#include <unordered_set>
#include <type_traits>
#include <iostream>

namespace authcore::application {

/**
 * @brief Жизненный цикл credential одного вида
 *
 * Выпуск секрета, поиск по digest с проверкой срока, одноразовое
 * потребление, отзыв и постраничный список. Поведение вида задают
 * traits Kind (см. domain/CredentialKinds.hpp).
 *
 * Ошибки хранилища переводятся в CredentialException(STORAGE_FAILURE),
 * нарушение уникальности - в ALREADY_EXISTS. Исходы поиска
 * (NOT_FOUND, EXPIRED, DIGEST_MISMATCH) возвращаются в LookupResult.
 */
template <typename Kind>
class CredentialStore {
public:
    using Record = domain::Credential<Kind>;
    using Metadata = typename Kind::Metadata;
    using Repository = ports::output::ICredentialRepository<Kind>;
    using Lookup = domain::LookupResult<Record>;

    /// Повторы при коллизии digest: секрет генерируется заново
    static constexpr int MAX_CREATE_ATTEMPTS = 3;
    static constexpr size_t DEFAULT_BATCH_SIZE = 10;

    CredentialStore(
        std::shared_ptr<Repository> repository,
        std::shared_ptr<security::SecretCodec> codec,
        std::shared_ptr<ports::output::IClock> clock
    ) : repository_(std::move(repository))
      , codec_(std::move(codec))
      , clock_(std::move(clock))
    {
        std::cout << "[CredentialStore] Created (" << Kind::name << ")" << std::endl;
    }

    virtual ~CredentialStore() = default;

    // ========================================================================
    // Выпуск
    // ========================================================================

    /**
     * @brief Выпустить credential со сгенерированным секретом
     *
     * Открытый секрет возвращается один раз, в хранилище только digest.
     */
    domain::Issued<Record> create(int64_t subjectId, const Metadata& metadata = {}) {
        static_assert(Kind::source != domain::SecretSource::SUPPLIED,
                      "credential with supplied secret is created by createWithSecret()");
        requireSubject(subjectId);

        for (int attempt = 1; attempt <= MAX_CREATE_ATTEMPTS; ++attempt) {
            std::string secret = newSecret();
            Record record = build(subjectId, secret, metadata);
            try {
                return {secret, repository_->insert(record)};
            } catch (const domain::DuplicateKeyException&) {
                std::cerr << "[CredentialStore] create() digest collision ("
                          << Kind::name << "), attempt " << attempt << std::endl;
            } catch (const domain::StorageException& e) {
                throw storageFailure("create", e);
            }
        }
        throw domain::CredentialException(domain::ErrorCode::ALREADY_EXISTS,
                                          std::string(Kind::name) + " already exists");
    }

    /**
     * @brief Сохранить credential с секретом, полученным извне
     * @throws CredentialException(ALREADY_EXISTS), если такой секрет уже привязан
     */
    Record createWithSecret(int64_t subjectId, const std::string& secret, const Metadata& metadata = {}) {
        requireSubject(subjectId);
        if (secret.empty()) {
            throw domain::ValidationException(std::string(Kind::name) + " secret must not be empty");
        }

        try {
            return repository_->insert(build(subjectId, secret, metadata));
        } catch (const domain::DuplicateKeyException&) {
            throw domain::CredentialException(domain::ErrorCode::ALREADY_EXISTS,
                                              std::string(Kind::name) + " already exists");
        } catch (const domain::StorageException& e) {
            throw storageFailure("createWithSecret", e);
        }
    }

    /**
     * @brief Выпустить пачку одной транзакцией
     *
     * Либо сохраняются все записи, либо ни одной.
     */
    std::vector<domain::Issued<Record>> createMany(int64_t subjectId,
                                                   size_t count = DEFAULT_BATCH_SIZE,
                                                   const Metadata& metadata = {}) {
        return issueBatch("createMany", subjectId, count, metadata,
            [this](const std::vector<Record>& records) {
                return repository_->insertMany(records);
            });
    }

    /**
     * @brief Заменить все записи субъекта новой пачкой одной транзакцией
     */
    std::vector<domain::Issued<Record>> regenerate(int64_t subjectId,
                                                   size_t count = DEFAULT_BATCH_SIZE,
                                                   const Metadata& metadata = {}) {
        return issueBatch("regenerate", subjectId, count, metadata,
            [this, subjectId](const std::vector<Record>& records) {
                return repository_->replaceForSubject(subjectId, records);
            });
    }

    // ========================================================================
    // Поиск
    // ========================================================================

    /**
     * @brief Найти по открытому секрету
     *
     * Истёкшая запись даёт EXPIRED, даже если строка ещё в хранилище.
     */
    Lookup lookup(const std::string& secret) {
        if (secret.empty()) return Lookup::failed(domain::LookupStatus::NOT_FOUND);

        std::optional<Record> record;
        try {
            record = repository_->findByDigest(codec_->digest(secret));
        } catch (const domain::StorageException& e) {
            throw storageFailure("lookup", e);
        }

        if (!record) return Lookup::failed(domain::LookupStatus::NOT_FOUND);
        if (record->isExpired(clock_->now())) return Lookup::failed(domain::LookupStatus::EXPIRED);
        return Lookup::of(std::move(*record));
    }

    /**
     * @brief Поиск в пределах субъекта; чужая запись даёт DIGEST_MISMATCH
     */
    Lookup lookupForSubject(int64_t subjectId, const std::string& secret) {
        return lookupBound(secret, [subjectId](const Record& record) {
            return record.subjectId == subjectId;
        });
    }

    /**
     * @brief Поиск с дополнительной привязкой записи
     *
     * Если запись найдена, но predicate(record) ложен - DIGEST_MISMATCH.
     */
    template <typename Predicate>
    Lookup lookupBound(const std::string& secret, Predicate predicate) {
        auto result = lookup(secret);
        if (result.found() && !predicate(*result.record)) {
            return Lookup::failed(domain::LookupStatus::DIGEST_MISMATCH);
        }
        return result;
    }

    /**
     * @brief Временный 2FA challenge, выданный для конкретного токена сброса
     */
    Lookup lookupForResetToken(const std::string& secret, int64_t passwordResetTokenId) {
        static_assert(std::is_same_v<Kind, domain::TemporaryTwoFactorChallengeKind>,
                      "only temporary two factor challenges are bound to a reset token");
        return lookupBound(secret, [passwordResetTokenId](const Record& record) {
            return record.metadata.passwordResetTokenId == passwordResetTokenId;
        });
    }

    std::optional<Record> findById(int64_t id) {
        try {
            auto record = repository_->findById(id);
            if (!record || record->isExpired(clock_->now())) return std::nullopt;
            return record;
        } catch (const domain::StorageException& e) {
            throw storageFailure("findById", e);
        }
    }

    /**
     * @brief Самая свежая действующая запись субъекта
     */
    std::optional<Record> latestForSubject(int64_t subjectId) {
        auto records = listAll(subjectId);
        if (records.empty()) return std::nullopt;
        return records.front();
    }

    // ========================================================================
    // Одноразовое потребление
    // ========================================================================

    /**
     * @brief Удалить запись после успешной проверки
     *
     * Сбой удаления не проваливает операцию: он логируется, а
     * оставшаяся строка безвредна до истечения срока.
     * @return true, если запись удалена
     */
    bool consume(const Record& record) {
        static_assert(Kind::consumption == domain::ConsumptionPolicy::SINGLE_USE,
                      "reusable credentials are removed by revoke()");
        try {
            return repository_->deleteById(record.id);
        } catch (const std::exception& e) {
            std::cerr << "[CredentialStore] consume() failed (" << Kind::name
                      << ", id=" << record.id << "): " << e.what() << std::endl;
            return false;
        }
    }

    /**
     * @brief lookup + consume
     */
    Lookup redeem(const std::string& secret) {
        auto result = lookup(secret);
        if (result.found()) consume(*result.record);
        return result;
    }

    Lookup redeemForSubject(int64_t subjectId, const std::string& secret) {
        auto result = lookupForSubject(subjectId, secret);
        if (result.found()) consume(*result.record);
        return result;
    }

    // ========================================================================
    // Список и отзыв
    // ========================================================================

    /**
     * @brief Страница записей субъекта по возрастанию id
     * @param exceptSecret запись с этим секретом (текущая сессия) не попадает в список
     * @throws ValidationException при неверных аргументах, до обращения к хранилищу
     */
    pagination::Page<Record> listBySubject(int64_t subjectId,
                                           const pagination::PageArgs& args,
                                           const std::string& exceptSecret = "") {
        static_assert(Kind::listable, "credential kind is not listable");

        auto query = pagination::CursorPager::toQuery(args);
        query.activeAt = clock_->now();

        try {
            auto fetched = repository_->findPage(subjectId, query, exceptDigest(exceptSecret));
            return pagination::CursorPager::paginate(std::move(fetched), query);
        } catch (const domain::StorageException& e) {
            throw storageFailure("listBySubject", e);
        }
    }

    /**
     * @brief Действующие записи субъекта без пагинации, новые первыми
     */
    std::vector<Record> listAll(int64_t subjectId, const std::string& exceptSecret = "") {
        std::vector<Record> records;
        try {
            records = repository_->findBySubject(subjectId, exceptDigest(exceptSecret));
        } catch (const domain::StorageException& e) {
            throw storageFailure("listAll", e);
        }

        auto now = clock_->now();
        std::vector<Record> active;
        for (auto& record : records) {
            if (!record.isExpired(now)) active.push_back(std::move(record));
        }
        return active;
    }

    /**
     * @brief Запись субъекта по id (перед выборочным отзывом)
     */
    std::optional<Record> findForSubject(int64_t subjectId, int64_t id,
                                         const std::string& exceptSecret = "") {
        auto record = findById(id);
        if (!record || record->subjectId != subjectId) return std::nullopt;
        if (!exceptSecret.empty() && record->secretDigest == codec_->digest(exceptSecret)) {
            return std::nullopt;
        }
        return record;
    }

    /**
     * @return false, если у субъекта нет такой записи
     */
    bool revoke(int64_t subjectId, int64_t id, const std::string& exceptSecret = "") {
        auto record = findForSubject(subjectId, id, exceptSecret);
        if (!record) return false;
        try {
            return repository_->deleteById(record->id);
        } catch (const domain::StorageException& e) {
            throw storageFailure("revoke", e);
        }
    }

    size_t revokeMany(const std::vector<int64_t>& ids) {
        if (ids.empty()) return 0;
        try {
            return repository_->deleteByIds(ids);
        } catch (const domain::StorageException& e) {
            throw storageFailure("revokeMany", e);
        }
    }

    /**
     * @brief Отозвать все записи субъекта, кроме exceptSecret
     */
    size_t revokeAll(int64_t subjectId, const std::string& exceptSecret = "") {
        try {
            return repository_->deleteBySubject(subjectId, exceptDigest(exceptSecret));
        } catch (const domain::StorageException& e) {
            throw storageFailure("revokeAll", e);
        }
    }

    /**
     * @brief Полное обновление записи (metadata, subject)
     */
    bool update(const Record& record) {
        try {
            return repository_->update(record);
        } catch (const domain::StorageException& e) {
            throw storageFailure("update", e);
        }
    }

    std::string digestOf(const std::string& secret) const {
        return codec_->digest(secret);
    }

protected:
    std::shared_ptr<Repository> repository_;
    std::shared_ptr<security::SecretCodec> codec_;
    std::shared_ptr<ports::output::IClock> clock_;

    static void requireSubject(int64_t subjectId) {
        if (subjectId <= 0) {
            throw domain::ValidationException("subject id must be positive");
        }
    }

    static domain::CredentialException storageFailure(const char* operation,
                                                      const domain::StorageException& e) {
        std::cerr << "[CredentialStore] " << operation << "() failed (" << Kind::name
                  << "): " << e.what() << std::endl;
        return domain::CredentialException(domain::ErrorCode::STORAGE_FAILURE,
                                           "storage failure", e.what());
    }

    std::string newSecret() const {
        if constexpr (Kind::source == domain::SecretSource::GENERATED_RECOVERY_CODE) {
            return codec_->recoveryCode();
        } else {
            return codec_->generate();
        }
    }

    Record build(int64_t subjectId, const std::string& secret, const Metadata& metadata) const {
        Record record;
        record.subjectId = subjectId;
        record.secretDigest = codec_->digest(secret);
        record.issuedAt = clock_->now();
        if (Kind::ttl.count() > 0) {
            record.expiresAt = codec_->expiryFrom(record.issuedAt, Kind::ttl);
        }
        record.metadata = metadata;
        return record;
    }

    std::string exceptDigest(const std::string& exceptSecret) const {
        return exceptSecret.empty() ? std::string() : codec_->digest(exceptSecret);
    }

private:
    template <typename Persist>
    std::vector<domain::Issued<Record>> issueBatch(const char* operation,
                                                   int64_t subjectId,
                                                   size_t count,
                                                   const Metadata& metadata,
                                                   Persist persist) {
        static_assert(Kind::source != domain::SecretSource::SUPPLIED,
                      "batches are only issued for generated secrets");
        requireSubject(subjectId);
        if (count == 0) {
            throw domain::ValidationException("batch size must be positive");
        }

        for (int attempt = 1; attempt <= MAX_CREATE_ATTEMPTS; ++attempt) {
            std::vector<std::string> secrets;
            std::vector<Record> records;
            std::unordered_set<std::string> digests;
            while (secrets.size() < count) {
                std::string secret = newSecret();
                Record record = build(subjectId, secret, metadata);
                // внутри пачки совпадение невозможно сохранить, генерируем заново
                if (!digests.insert(record.secretDigest).second) continue;
                secrets.push_back(std::move(secret));
                records.push_back(std::move(record));
            }

            try {
                auto stored = persist(records);
                std::vector<domain::Issued<Record>> issued;
                issued.reserve(stored.size());
                for (size_t i = 0; i < stored.size(); ++i) {
                    issued.push_back({secrets[i], std::move(stored[i])});
                }
                return issued;
            } catch (const domain::DuplicateKeyException&) {
                std::cerr << "[CredentialStore] " << operation << "() digest collision ("
                          << Kind::name << "), attempt " << attempt << std::endl;
            } catch (const domain::StorageException& e) {
                throw storageFailure(operation, e);
            }
        }
        throw domain::CredentialException(domain::ErrorCode::ALREADY_EXISTS,
                                          std::string(Kind::name) + " already exists");
    }
};

} // namespace authcore::application
