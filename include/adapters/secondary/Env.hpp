#pragma once

#include <string>
#include <cstdlib>
#include <cerrno>
#include <stdexcept>

namespace authcore::adapters::secondary {

/**
 * @brief Неверная или отсутствующая переменная окружения
 */
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Чтение настроек из ENV с проверкой значений
 */
namespace env {

inline std::string getOrDefault(const char* name, const std::string& defaultValue) {
    const char* value = std::getenv(name);
    return value ? value : defaultValue;
}

inline std::string getOrThrow(const char* name) {
    const char* value = std::getenv(name);
    if (!value) {
        throw ConfigurationError(std::string("Required env variable not set: ") + name);
    }
    return value;
}

/**
 * @throws ConfigurationError если значение не целое или вне [min, max]
 */
inline int getInt(const char* name, int defaultValue, int min, int max) {
    const char* raw = std::getenv(name);
    if (!raw) return defaultValue;

    errno = 0;
    char* end = nullptr;
    long value = std::strtol(raw, &end, 10);
    if (end == raw || *end != '\0' || errno == ERANGE || value < min || value > max) {
        throw ConfigurationError(std::string(name) + " must be an integer in [" +
                                 std::to_string(min) + ", " + std::to_string(max) + "]");
    }
    return static_cast<int>(value);
}

/**
 * @brief true/1/yes или false/0/no
 * @throws ConfigurationError для любого другого значения
 */
inline bool getBool(const char* name, bool defaultValue) {
    const char* raw = std::getenv(name);
    if (!raw) return defaultValue;

    std::string value = raw;
    if (value == "true" || value == "1" || value == "yes") return true;
    if (value == "false" || value == "0" || value == "no") return false;
    throw ConfigurationError(std::string(name) + " must be true or false");
}

} // namespace env

} // namespace authcore::adapters::secondary
