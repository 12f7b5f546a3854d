#pragma once

#include "domain/enums/LookupStatus.hpp"
#include <stdexcept>
#include <string>

namespace authcore::domain {

/**
 * @brief Коды ошибок операций с credential
 */
enum class ErrorCode {
    NOT_FOUND,
    EXPIRED,
    DIGEST_MISMATCH,
    ALREADY_EXISTS,
    VALIDATION_ERROR,
    STORAGE_FAILURE,
    UNAUTHENTICATED
};

inline std::string toString(ErrorCode code) {
    switch (code) {
        case ErrorCode::NOT_FOUND:        return "NOT_FOUND";
        case ErrorCode::EXPIRED:          return "EXPIRED";
        case ErrorCode::DIGEST_MISMATCH:  return "DIGEST_MISMATCH";
        case ErrorCode::ALREADY_EXISTS:   return "ALREADY_EXISTS";
        case ErrorCode::VALIDATION_ERROR: return "VALIDATION_ERROR";
        case ErrorCode::STORAGE_FAILURE:  return "STORAGE_FAILURE";
        case ErrorCode::UNAUTHENTICATED:  return "UNAUTHENTICATED";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Ошибка операции с credential
 *
 * Сообщение безопасно отдавать клиенту. Только STORAGE_FAILURE
 * несёт причину (cause) для диагностики, её в ответ не выводим.
 */
class CredentialException : public std::runtime_error {
public:
    CredentialException(ErrorCode code, const std::string& message, const std::string& cause = "")
        : std::runtime_error(message)
        , code_(code)
        , cause_(cause) {}

    ErrorCode code() const { return code_; }
    const std::string& cause() const { return cause_; }

private:
    ErrorCode code_;
    std::string cause_;
};

/**
 * @brief Неверные аргументы (пагинация, пустой обязательный ввод)
 */
class ValidationException : public CredentialException {
public:
    explicit ValidationException(const std::string& message)
        : CredentialException(ErrorCode::VALIDATION_ERROR, message) {}
};

/**
 * @brief Сбой хранилища, выбрасывается адаптерами репозиториев
 */
class StorageException : public std::runtime_error {
public:
    StorageException(const std::string& operation, const std::string& message)
        : std::runtime_error(operation + ": " + message)
        , operation_(operation) {}

    const std::string& operation() const { return operation_; }

private:
    std::string operation_;
};

/**
 * @brief Нарушение уникальности (digest, привязка OAuth)
 */
class DuplicateKeyException : public StorageException {
public:
    DuplicateKeyException(const std::string& operation, const std::string& message)
        : StorageException(operation, message) {}
};

/**
 * @brief Отказ криптографического источника случайности
 */
class RandomSourceException : public std::runtime_error {
public:
    explicit RandomSourceException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Исключение для неуспешного lookup, когда вызывающему нужна ошибка
 *
 * @param subject что искали ("password reset token")
 */
inline CredentialException lookupFailure(LookupStatus status, const std::string& subject) {
    switch (status) {
        case LookupStatus::EXPIRED:
            return CredentialException(ErrorCode::EXPIRED, subject + " has expired");
        case LookupStatus::DIGEST_MISMATCH:
            return CredentialException(ErrorCode::DIGEST_MISMATCH, subject + " does not match");
        default:
            return CredentialException(ErrorCode::NOT_FOUND, subject + " not found");
    }
}

} // namespace authcore::domain
