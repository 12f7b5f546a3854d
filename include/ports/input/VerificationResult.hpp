#pragma once

#include "domain/enums/LookupStatus.hpp"
#include <string>
#include <cstdint>

namespace authcore::ports::input {

/**
 * @brief Результат проверки одноразового секрета
 */
struct VerificationResult {
    bool success;
    int64_t subjectId;
    domain::LookupStatus status;
    std::string message;
};

} // namespace authcore::ports::input
