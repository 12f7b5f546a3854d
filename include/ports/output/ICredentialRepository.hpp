#pragma once

#include "domain/Credential.hpp"
#include "domain/CredentialKinds.hpp"
#include "pagination/Page.hpp"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace authcore::ports::output {

/**
 * @brief Интерфейс хранилища credential одного вида
 *
 * Сбои бросают domain::StorageException, нарушение уникальности
 * secret_digest - domain::DuplicateKeyException. Срок действия здесь
 * не проверяется, это делает CredentialStore.
 */
template <typename Kind>
class ICredentialRepository {
public:
    using Record = domain::Credential<Kind>;

    virtual ~ICredentialRepository() = default;

    /**
     * @brief Вставить запись, id назначает хранилище
     */
    virtual Record insert(const Record& record) = 0;

    /**
     * @brief Вставить пачку в одной транзакции: либо все, либо ничего
     * @return записи с назначенными id в порядке входа
     */
    virtual std::vector<Record> insertMany(const std::vector<Record>& records) = 0;

    /**
     * @brief Удалить все записи субъекта и вставить новые в одной транзакции
     */
    virtual std::vector<Record> replaceForSubject(int64_t subjectId,
                                                  const std::vector<Record>& records) = 0;

    virtual std::optional<Record> findByDigest(const std::string& digest) = 0;
    virtual std::optional<Record> findById(int64_t id) = 0;

    /**
     * @brief Записи субъекта, новые первыми
     * @param excludeDigest запись с этим digest пропускается (пустой - без фильтра)
     */
    virtual std::vector<Record> findBySubject(int64_t subjectId,
                                              const std::string& excludeDigest = "") = 0;

    /**
     * @brief Выборка страницы; порядок см. pagination::KeysetQuery
     */
    virtual std::vector<Record> findPage(int64_t subjectId,
                                         const pagination::KeysetQuery& query,
                                         const std::string& excludeDigest = "") = 0;

    /**
     * @brief Обновить subject_id, expires_at и metadata
     * @return false, если записи нет
     */
    virtual bool update(const Record& record) = 0;

    virtual bool deleteById(int64_t id) = 0;

    /**
     * @return количество удалённых записей
     */
    virtual size_t deleteByIds(const std::vector<int64_t>& ids) = 0;

    virtual size_t deleteBySubject(int64_t subjectId, const std::string& excludeDigest = "") = 0;
};

/**
 * @brief Хранилище ключей WebAuthn с узким обновлением счётчика подписей
 */
class IWebAuthnCredentialRepository
    : public ICredentialRepository<domain::WebAuthnCredentialKind> {
public:
    /**
     * @brief Записать счётчик, только если он больше сохранённого
     * @return false, если записи нет или счётчик не вырос
     */
    virtual bool advanceSignCount(int64_t id, uint32_t signCount) = 0;
};

} // namespace authcore::ports::output
