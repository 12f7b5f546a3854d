#pragma once

#include "Timestamp.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <optional>
#include <cstdint>

namespace authcore::domain {

/**
 * @brief Состояние сессии, которое хранит клиент в cookie
 *
 * Произвольный набор ключ/значение. Приходит от клиента, поэтому
 * типизированные геттеры не доверяют содержимому: неверный тип
 * значения равнозначен его отсутствию.
 */
class SessionState {
public:
    static constexpr const char* USER_ID_KEY = "user_id";
    static constexpr const char* SESSION_TOKEN_KEY = "session_token";
    static constexpr const char* SUDO_MODE_EXPIRES_AT_KEY = "sudo_mode_expires_at";

    SessionState() : data_(nlohmann::json::object()) {}

    /**
     * @brief Создать из JSON; не-объект даёт пустое состояние
     */
    static SessionState fromJson(const nlohmann::json& json) {
        SessionState state;
        if (json.is_object()) {
            state.data_ = json;
        }
        return state;
    }

    bool empty() const { return data_.empty(); }
    size_t size() const { return data_.size(); }

    bool contains(const std::string& key) const {
        return data_.contains(key);
    }

    std::optional<nlohmann::json> find(const std::string& key) const {
        auto it = data_.find(key);
        if (it == data_.end()) return std::nullopt;
        return *it;
    }

    void set(const std::string& key, nlohmann::json value) {
        data_[key] = std::move(value);
    }

    void erase(const std::string& key) {
        data_.erase(key);
    }

    void clear() {
        data_ = nlohmann::json::object();
    }

    const nlohmann::json& data() const { return data_; }

    // ========================================================================
    // Типизированный доступ к известным ключам
    // ========================================================================

    /**
     * @brief Идентификатор аутентифицированного субъекта
     * @return std::nullopt, если ключа нет, он не целое число или <= 0
     */
    std::optional<int64_t> subjectId() const {
        auto it = data_.find(USER_ID_KEY);
        if (it == data_.end() || !it->is_number_integer()) return std::nullopt;
        auto id = it->get<int64_t>();
        if (id <= 0) return std::nullopt;
        return id;
    }

    void setSubjectId(int64_t subjectId) {
        data_[USER_ID_KEY] = subjectId;
    }

    std::optional<std::string> sessionToken() const {
        auto it = data_.find(SESSION_TOKEN_KEY);
        if (it == data_.end() || !it->is_string()) return std::nullopt;
        return it->get<std::string>();
    }

    void setSessionToken(const std::string& token) {
        data_[SESSION_TOKEN_KEY] = token;
    }

    /**
     * @brief Сырое значение срока sudo mode (строка RFC 3339)
     */
    std::optional<std::string> sudoModeExpiresAt() const {
        auto it = data_.find(SUDO_MODE_EXPIRES_AT_KEY);
        if (it == data_.end() || !it->is_string()) return std::nullopt;
        return it->get<std::string>();
    }

    void setSudoModeExpiresAt(TimePoint expiresAt) {
        data_[SUDO_MODE_EXPIRES_AT_KEY] = Timestamp(expiresAt).toPreciseString();
    }

    bool operator==(const SessionState& other) const {
        return data_ == other.data_;
    }

    bool operator!=(const SessionState& other) const {
        return !(*this == other);
    }

private:
    nlohmann::json data_;
};

} // namespace authcore::domain
