#pragma once

#include "ports/output/IClock.hpp"
#include <chrono>

namespace authcore::adapters::secondary {

class SystemClock : public ports::output::IClock {
public:
    domain::TimePoint now() const override {
        return std::chrono::system_clock::now();
    }
};

} // namespace authcore::adapters::secondary
