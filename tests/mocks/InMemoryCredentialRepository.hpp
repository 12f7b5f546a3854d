#pragma once

#include "ports/output/ICredentialRepository.hpp"
#include "pagination/CursorPager.hpp"
#include "domain/errors/CredentialException.hpp"
#include <map>
#include <mutex>
#include <algorithm>

namespace authcore::tests::mocks {

/**
 * @brief In-Memory реализация репозитория credential для unit-тестов
 *
 * Уникальность secret_digest проверяется как в PostgreSQL.
 * failStorage/failDeletes имитируют сбой хранилища.
 */
template <typename Kind, typename Port = ports::output::ICredentialRepository<Kind>>
class InMemoryCredentialRepository : public Port {
public:
    using Record = domain::Credential<Kind>;

    Record insert(const Record& record) override {
        std::lock_guard<std::mutex> lock(mutex_);
        checkStorage("insert");
        return insertLocked(record);
    }

    std::vector<Record> insertMany(const std::vector<Record>& records) override {
        std::lock_guard<std::mutex> lock(mutex_);
        checkStorage("insertMany");
        auto snapshot = records_;
        auto nextId = nextId_;
        try {
            std::vector<Record> stored;
            for (const auto& record : records) {
                stored.push_back(insertLocked(record));
            }
            return stored;
        } catch (const domain::DuplicateKeyException&) {
            records_ = std::move(snapshot);
            nextId_ = nextId;
            throw;
        }
    }

    std::vector<Record> replaceForSubject(int64_t subjectId,
                                          const std::vector<Record>& records) override {
        std::lock_guard<std::mutex> lock(mutex_);
        checkStorage("replaceForSubject");
        auto snapshot = records_;
        auto nextId = nextId_;
        try {
            eraseIf([subjectId](const Record& r) { return r.subjectId == subjectId; });
            std::vector<Record> stored;
            for (const auto& record : records) {
                stored.push_back(insertLocked(record));
            }
            return stored;
        } catch (const domain::DuplicateKeyException&) {
            records_ = std::move(snapshot);
            nextId_ = nextId;
            throw;
        }
    }

    std::optional<Record> findByDigest(const std::string& digest) override {
        std::lock_guard<std::mutex> lock(mutex_);
        checkStorage("findByDigest");
        for (const auto& [id, record] : records_) {
            if (record.secretDigest == digest) return record;
        }
        return std::nullopt;
    }

    std::optional<Record> findById(int64_t id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        checkStorage("findById");
        auto it = records_.find(id);
        if (it == records_.end()) return std::nullopt;
        return it->second;
    }

    std::vector<Record> findBySubject(int64_t subjectId, const std::string& excludeDigest = "") override {
        std::lock_guard<std::mutex> lock(mutex_);
        checkStorage("findBySubject");
        auto result = ascending(subjectId, excludeDigest, std::nullopt);
        std::reverse(result.begin(), result.end());
        return result;
    }

    std::vector<Record> findPage(int64_t subjectId,
                                 const pagination::KeysetQuery& query,
                                 const std::string& excludeDigest = "") override {
        std::lock_guard<std::mutex> lock(mutex_);
        checkStorage("findPage");
        return pagination::CursorPager::select(ascending(subjectId, excludeDigest, query.activeAt), query);
    }

    bool update(const Record& record) override {
        std::lock_guard<std::mutex> lock(mutex_);
        checkStorage("update");
        auto it = records_.find(record.id);
        if (it == records_.end()) return false;
        it->second.subjectId = record.subjectId;
        it->second.expiresAt = record.expiresAt;
        it->second.metadata = record.metadata;
        return true;
    }

    bool deleteById(int64_t id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        checkDeletes("deleteById");
        return records_.erase(id) > 0;
    }

    size_t deleteByIds(const std::vector<int64_t>& ids) override {
        std::lock_guard<std::mutex> lock(mutex_);
        checkDeletes("deleteByIds");
        size_t deleted = 0;
        for (int64_t id : ids) deleted += records_.erase(id);
        return deleted;
    }

    size_t deleteBySubject(int64_t subjectId, const std::string& excludeDigest = "") override {
        std::lock_guard<std::mutex> lock(mutex_);
        checkDeletes("deleteBySubject");
        return eraseIf([&](const Record& r) {
            return r.subjectId == subjectId && (excludeDigest.empty() || r.secretDigest != excludeDigest);
        });
    }

    // Test helpers
    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        records_.clear();
        nextId_ = 1;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_.size();
    }

    void failStorage(bool fail) { failStorage_ = fail; }
    void failDeletes(bool fail) { failDeletes_ = fail; }

    /**
     * @brief Следующие count вставок получат ошибку уникальности
     */
    void failNextInserts(int count) { duplicateInserts_ = count; }

    /**
     * @brief Подменить срок действия, минуя CredentialStore
     */
    void setExpiresAt(int64_t id, std::optional<domain::TimePoint> expiresAt) {
        std::lock_guard<std::mutex> lock(mutex_);
        records_.at(id).expiresAt = expiresAt;
    }

protected:
    mutable std::mutex mutex_;
    std::map<int64_t, Record> records_;

private:
    int64_t nextId_ = 1;
    bool failStorage_ = false;
    bool failDeletes_ = false;
    int duplicateInserts_ = 0;

    void checkStorage(const char* operation) const {
        if (failStorage_) throw domain::StorageException(operation, "connection lost");
    }

    void checkDeletes(const char* operation) const {
        checkStorage(operation);
        if (failDeletes_) throw domain::StorageException(operation, "delete failed");
    }

    Record insertLocked(const Record& record) {
        if (duplicateInserts_ > 0) {
            --duplicateInserts_;
            throw domain::DuplicateKeyException("insert", "duplicate key value violates unique constraint");
        }
        for (const auto& [id, existing] : records_) {
            if (existing.secretDigest == record.secretDigest) {
                throw domain::DuplicateKeyException("insert", "duplicate key value violates unique constraint");
            }
        }
        Record stored = record;
        stored.id = nextId_++;
        records_[stored.id] = stored;
        return stored;
    }

    std::vector<Record> ascending(int64_t subjectId, const std::string& excludeDigest,
                                  const std::optional<domain::TimePoint>& activeAt) const {
        std::vector<Record> result;
        for (const auto& [id, record] : records_) {
            if (record.subjectId != subjectId) continue;
            if (!excludeDigest.empty() && record.secretDigest == excludeDigest) continue;
            if (activeAt && record.isExpired(*activeAt)) continue;
            result.push_back(record);
        }
        return result;
    }

    template <typename Predicate>
    size_t eraseIf(Predicate predicate) {
        size_t erased = 0;
        for (auto it = records_.begin(); it != records_.end();) {
            if (predicate(it->second)) {
                it = records_.erase(it);
                ++erased;
            } else {
                ++it;
            }
        }
        return erased;
    }
};

/**
 * @brief Ключи WebAuthn в памяти
 */
class InMemoryWebAuthnCredentialRepository
    : public InMemoryCredentialRepository<domain::WebAuthnCredentialKind,
                                          ports::output::IWebAuthnCredentialRepository> {
public:
    bool advanceSignCount(int64_t id, uint32_t signCount) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = records_.find(id);
        if (it == records_.end() || it->second.metadata.signCount >= signCount) return false;
        it->second.metadata.signCount = signCount;
        return true;
    }
};

} // namespace authcore::tests::mocks
