#pragma once

#include "application/CredentialStore.hpp"
#include <memory>
#include <string>
#include <iostream>

namespace authcore::application {

/**
 * @brief Результат проверки счётчика подписей
 */
enum class SignCountCheck {
    ACCEPTED,
    CLONE_SUSPECTED,    ///< Счётчик не вырос: вероятна копия аутентификатора
    NOT_FOUND
};

inline std::string toString(SignCountCheck check) {
    switch (check) {
        case SignCountCheck::ACCEPTED:        return "ACCEPTED";
        case SignCountCheck::CLONE_SUSPECTED: return "CLONE_SUSPECTED";
        case SignCountCheck::NOT_FOUND:       return "NOT_FOUND";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Ключи WebAuthn: секрет - credential id от аутентификатора
 *
 * Счётчик подписей обновляется узкой операцией advanceSignCount,
 * отдельно от полного update (переименование).
 */
class WebAuthnCredentialStore : public CredentialStore<domain::WebAuthnCredentialKind> {
public:
    WebAuthnCredentialStore(
        std::shared_ptr<ports::output::IWebAuthnCredentialRepository> repository,
        std::shared_ptr<security::SecretCodec> codec,
        std::shared_ptr<ports::output::IClock> clock
    ) : CredentialStore(repository, std::move(codec), std::move(clock))
      , webAuthnRepository_(std::move(repository))
    {}

    /**
     * @brief Зарегистрировать ключ; credentialId сохраняется и в metadata
     */
    Record registerCredential(int64_t subjectId, Metadata metadata) {
        std::string credentialId = metadata.credentialId;
        return createWithSecret(subjectId, credentialId, metadata);
    }

    /**
     * @brief Проверить и продвинуть счётчик подписей
     *
     * Аутентификаторы без счётчика всегда присылают 0: если и сохранённый
     * счётчик 0, проверка пропускается. В остальных случаях новый
     * счётчик обязан быть строго больше сохранённого.
     */
    SignCountCheck advanceSignCount(const std::string& credentialId, uint32_t signCount) {
        auto result = lookup(credentialId);
        if (!result.found()) return SignCountCheck::NOT_FOUND;

        const auto& record = *result.record;
        uint32_t stored = record.metadata.signCount;
        if (stored == 0 && signCount == 0) {
            return SignCountCheck::ACCEPTED;
        }
        if (signCount <= stored) {
            std::cerr << "[WebAuthnCredentialStore] Sign count did not increase (id="
                      << record.id << ", stored=" << stored << ", received=" << signCount
                      << "), possible cloned authenticator" << std::endl;
            return SignCountCheck::CLONE_SUSPECTED;
        }

        bool advanced = false;
        try {
            advanced = webAuthnRepository_->advanceSignCount(record.id, signCount);
        } catch (const domain::StorageException& e) {
            throw storageFailure("advanceSignCount", e);
        }
        // гонка с параллельной аутентификацией тем же ключом
        return advanced ? SignCountCheck::ACCEPTED : SignCountCheck::CLONE_SUSPECTED;
    }

    /**
     * @return false, если у субъекта нет такого ключа
     */
    bool rename(int64_t subjectId, int64_t id, const std::string& nickname) {
        if (nickname.empty()) {
            throw domain::ValidationException("nickname must not be empty");
        }
        auto record = findForSubject(subjectId, id);
        if (!record) return false;
        record->metadata.nickname = nickname;
        return update(*record);
    }

private:
    std::shared_ptr<ports::output::IWebAuthnCredentialRepository> webAuthnRepository_;
};

} // namespace authcore::application
