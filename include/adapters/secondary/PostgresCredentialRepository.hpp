#pragma once

#include "ports/output/ICredentialRepository.hpp"
#include "domain/errors/CredentialException.hpp"
#include "DbSettings.hpp"
#include <pqxx/pqxx>
#include <nlohmann/json.hpp>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <optional>
#include <chrono>
#include <utility>
#include <iostream>

namespace authcore::adapters::secondary {

/**
 * @brief PostgreSQL хранилище credential одного вида
 *
 * Таблица Kind::table, общая форма (см. migrations/001_create_credentials.sql):
 * id BIGSERIAL, subject_id, secret_digest UNIQUE, issued_at, expires_at NULL,
 * metadata JSONB.
 *
 * Port - реализуемый интерфейс; для WebAuthn это расширенный
 * IWebAuthnCredentialRepository.
 */
template <typename Kind, typename Port = ports::output::ICredentialRepository<Kind>>
class PostgresCredentialRepository : public Port {
public:
    using Record = domain::Credential<Kind>;

    explicit PostgresCredentialRepository(std::shared_ptr<DbSettings> settings)
        : settings_(std::move(settings))
        , table_(Kind::table)
    {
        std::cout << "[PostgresCredentialRepository] Connecting (" << table_ << ")..." << std::endl;
        try {
            connection_ = std::make_unique<pqxx::connection>(settings_->getConnectionString());
            std::cout << "[PostgresCredentialRepository] Connected (" << table_ << ")" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresCredentialRepository] Connection failed: " << e.what() << std::endl;
            throw;
        }
    }

    ~PostgresCredentialRepository() override {
        if (connection_ && connection_->is_open()) {
            connection_->close();
        }
    }

    Record insert(const Record& record) override {
        return run("insert", [&](pqxx::work& txn) {
            Record stored = insertRow(txn, record);
            txn.commit();
            return stored;
        });
    }

    std::vector<Record> insertMany(const std::vector<Record>& records) override {
        return run("insertMany", [&](pqxx::work& txn) {
            std::vector<Record> stored;
            stored.reserve(records.size());
            for (const auto& record : records) {
                stored.push_back(insertRow(txn, record));
            }
            txn.commit();
            return stored;
        });
    }

    std::vector<Record> replaceForSubject(int64_t subjectId,
                                          const std::vector<Record>& records) override {
        return run("replaceForSubject", [&](pqxx::work& txn) {
            txn.exec_params("DELETE FROM " + table_ + " WHERE subject_id = $1", subjectId);
            std::vector<Record> stored;
            stored.reserve(records.size());
            for (const auto& record : records) {
                stored.push_back(insertRow(txn, record));
            }
            txn.commit();
            return stored;
        });
    }

    std::optional<Record> findByDigest(const std::string& digest) override {
        return run("findByDigest", [&](pqxx::work& txn) -> std::optional<Record> {
            auto result = txn.exec_params(selectColumns() + " WHERE secret_digest = $1", digest);
            txn.commit();
            if (result.empty()) return std::nullopt;
            return rowToRecord(result[0]);
        });
    }

    std::optional<Record> findById(int64_t id) override {
        return run("findById", [&](pqxx::work& txn) -> std::optional<Record> {
            auto result = txn.exec_params(selectColumns() + " WHERE id = $1", id);
            txn.commit();
            if (result.empty()) return std::nullopt;
            return rowToRecord(result[0]);
        });
    }

    std::vector<Record> findBySubject(int64_t subjectId, const std::string& excludeDigest = "") override {
        return run("findBySubject", [&](pqxx::work& txn) {
            auto result = txn.exec_params(
                selectColumns() +
                R"( WHERE subject_id = $1
                      AND ($2 = '' OR secret_digest <> $2)
                    ORDER BY id DESC)",
                subjectId, excludeDigest);
            txn.commit();
            return rowsToRecords(result);
        });
    }

    std::vector<Record> findPage(int64_t subjectId,
                                 const pagination::KeysetQuery& query,
                                 const std::string& excludeDigest = "") override {
        std::optional<int64_t> activeAtUs;
        if (query.activeAt) activeAtUs = toMicros(*query.activeAt);

        return run("findPage", [&](pqxx::work& txn) {
            auto result = txn.exec_params(
                selectColumns() +
                R"( WHERE subject_id = $1
                      AND ($2::bigint IS NULL OR id > $2::bigint)
                      AND ($3::bigint IS NULL OR id < $3::bigint)
                      AND ($4 = '' OR secret_digest <> $4)
                      AND ($5::bigint IS NULL OR expires_at IS NULL
                           OR expires_at >= to_timestamp($5::bigint / 1000000.0))
                    ORDER BY id )" + std::string(query.backward ? "DESC" : "ASC") +
                " LIMIT $6",
                subjectId, query.afterId, query.beforeId, excludeDigest, activeAtUs,
                static_cast<int64_t>(query.limit));
            txn.commit();
            return rowsToRecords(result);
        });
    }

    bool update(const Record& record) override {
        return run("update", [&](pqxx::work& txn) {
            auto result = txn.exec_params(
                "UPDATE " + table_ + R"(
                    SET subject_id = $2,
                        expires_at = to_timestamp($3::bigint / 1000000.0),
                        metadata = $4::jsonb
                    WHERE id = $1)",
                record.id, record.subjectId, optionalMicros(record.expiresAt),
                metadataJson(record));
            txn.commit();
            return result.affected_rows() > 0;
        });
    }

    bool deleteById(int64_t id) override {
        return run("deleteById", [&](pqxx::work& txn) {
            auto result = txn.exec_params("DELETE FROM " + table_ + " WHERE id = $1", id);
            txn.commit();
            return result.affected_rows() > 0;
        });
    }

    size_t deleteByIds(const std::vector<int64_t>& ids) override {
        return run("deleteByIds", [&](pqxx::work& txn) {
            size_t deleted = 0;
            for (int64_t id : ids) {
                auto result = txn.exec_params("DELETE FROM " + table_ + " WHERE id = $1", id);
                deleted += result.affected_rows();
            }
            txn.commit();
            return deleted;
        });
    }

    size_t deleteBySubject(int64_t subjectId, const std::string& excludeDigest = "") override {
        return run("deleteBySubject", [&](pqxx::work& txn) {
            auto result = txn.exec_params(
                "DELETE FROM " + table_ +
                " WHERE subject_id = $1 AND ($2 = '' OR secret_digest <> $2)",
                subjectId, excludeDigest);
            txn.commit();
            return static_cast<size_t>(result.affected_rows());
        });
    }

protected:
    std::shared_ptr<DbSettings> settings_;
    std::unique_ptr<pqxx::connection> connection_;
    std::string table_;
    mutable std::mutex mutex_;

    /**
     * @brief Выполнить операцию в транзакции под мьютексом соединения
     *
     * unique_violation -> DuplicateKeyException, прочие сбои -> StorageException.
     */
    template <typename Operation>
    auto run(const char* operation, Operation op) -> decltype(op(std::declval<pqxx::work&>())) {
        std::lock_guard<std::mutex> lock(mutex_);
        try {
            pqxx::work txn(*connection_);
            return op(txn);
        } catch (const pqxx::unique_violation& e) {
            std::cerr << "[PostgresCredentialRepository] " << operation << "() duplicate key ("
                      << table_ << "): " << e.what() << std::endl;
            throw domain::DuplicateKeyException(operation, e.what());
        } catch (const std::exception& e) {
            std::cerr << "[PostgresCredentialRepository] " << operation << "() failed ("
                      << table_ << "): " << e.what() << std::endl;
            throw domain::StorageException(operation, e.what());
        }
    }

    static int64_t toMicros(domain::TimePoint tp) {
        return std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()).count();
    }

    static domain::TimePoint fromMicros(int64_t us) {
        return domain::TimePoint(std::chrono::duration_cast<domain::TimePoint::duration>(
            std::chrono::microseconds(us)));
    }

private:
    std::string selectColumns() const {
        return R"(SELECT id, subject_id, secret_digest,
                         (EXTRACT(EPOCH FROM issued_at) * 1000000)::bigint AS issued_us,
                         (EXTRACT(EPOCH FROM expires_at) * 1000000)::bigint AS expires_us,
                         metadata::text AS metadata
                  FROM )" + table_;
    }

    static std::optional<int64_t> optionalMicros(const std::optional<domain::TimePoint>& tp) {
        if (!tp) return std::nullopt;
        return toMicros(*tp);
    }

    static std::string metadataJson(const Record& record) {
        nlohmann::json json = record.metadata;
        return json.dump();
    }

    Record insertRow(pqxx::work& txn, const Record& record) {
        auto result = txn.exec_params(
            "INSERT INTO " + table_ + R"( (subject_id, secret_digest, issued_at, expires_at, metadata)
                VALUES ($1, $2,
                        to_timestamp($3::bigint / 1000000.0),
                        to_timestamp($4::bigint / 1000000.0),
                        $5::jsonb)
                RETURNING id)",
            record.subjectId, record.secretDigest, toMicros(record.issuedAt),
            optionalMicros(record.expiresAt), metadataJson(record));

        Record stored = record;
        stored.id = result[0]["id"].template as<int64_t>();
        return stored;
    }

    Record rowToRecord(const pqxx::row& row) const {
        Record record;
        record.id = row["id"].template as<int64_t>();
        record.subjectId = row["subject_id"].template as<int64_t>();
        record.secretDigest = row["secret_digest"].template as<std::string>();
        record.issuedAt = fromMicros(row["issued_us"].template as<int64_t>());
        if (!row["expires_us"].is_null()) {
            record.expiresAt = fromMicros(row["expires_us"].template as<int64_t>());
        }
        auto json = nlohmann::json::parse(row["metadata"].template as<std::string>());
        record.metadata = json.template get<typename Kind::Metadata>();
        return record;
    }

    std::vector<Record> rowsToRecords(const pqxx::result& result) const {
        std::vector<Record> records;
        records.reserve(result.size());
        for (const auto& row : result) {
            records.push_back(rowToRecord(row));
        }
        return records;
    }
};

/**
 * @brief Ключи WebAuthn с атомарным продвижением счётчика подписей
 */
class PostgresWebAuthnCredentialRepository
    : public PostgresCredentialRepository<domain::WebAuthnCredentialKind,
                                          ports::output::IWebAuthnCredentialRepository> {
public:
    using PostgresCredentialRepository::PostgresCredentialRepository;

    bool advanceSignCount(int64_t id, uint32_t signCount) override {
        return run("advanceSignCount", [&](pqxx::work& txn) {
            auto result = txn.exec_params(
                "UPDATE " + table_ + R"(
                    SET metadata = jsonb_set(metadata, '{sign_count}', to_jsonb($2::bigint))
                    WHERE id = $1
                      AND COALESCE((metadata->>'sign_count')::bigint, 0) < $2::bigint)",
                id, static_cast<int64_t>(signCount));
            txn.commit();
            return result.affected_rows() > 0;
        });
    }
};

} // namespace authcore::adapters::secondary
