#pragma once

#include "domain/Timestamp.hpp"

namespace authcore::ports::output {

/**
 * @brief Источник текущего времени
 */
class IClock {
public:
    virtual ~IClock() = default;

    virtual domain::TimePoint now() const = 0;
};

} // namespace authcore::ports::output
