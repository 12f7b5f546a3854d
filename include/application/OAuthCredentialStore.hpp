#pragma once

#include "application/CredentialStore.hpp"
#include <memory>
#include <string>
#include <optional>

namespace authcore::application {

/**
 * @brief Привязки OAuth провайдеров
 *
 * Секрет привязки - "provider:providerUserId"; одна привязка на
 * пользователя провайдера, повтор даёт ALREADY_EXISTS.
 */
class OAuthCredentialStore : public CredentialStore<domain::OAuthCredentialKind> {
public:
    using CredentialStore::CredentialStore;

    static std::string linkKey(const std::string& provider, const std::string& providerUserId) {
        return provider + ":" + providerUserId;
    }

    Record link(int64_t subjectId, const std::string& provider, const std::string& providerUserId) {
        if (provider.empty() || providerUserId.empty()) {
            throw domain::ValidationException("provider and provider user id are required");
        }
        return createWithSecret(subjectId, linkKey(provider, providerUserId),
                                {provider, providerUserId});
    }

    Lookup findByProviderUser(const std::string& provider, const std::string& providerUserId) {
        return lookup(linkKey(provider, providerUserId));
    }

    std::optional<Record> findBySubjectProvider(int64_t subjectId, const std::string& provider) {
        for (auto& record : listAll(subjectId)) {
            if (record.metadata.provider == provider) return record;
        }
        return std::nullopt;
    }

    /**
     * @return false, если у субъекта нет привязки к провайдеру
     */
    bool unlink(int64_t subjectId, const std::string& provider) {
        auto record = findBySubjectProvider(subjectId, provider);
        if (!record) return false;
        return revoke(subjectId, record->id);
    }
};

} // namespace authcore::application
