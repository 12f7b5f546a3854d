#pragma once

#include "ports/output/IClock.hpp"
#include <chrono>

namespace authcore::tests::mocks {

/**
 * @brief Управляемые часы для тестов сроков действия
 */
class FakeClock : public ports::output::IClock {
public:
    FakeClock() : now_(domain::Timestamp::fromEpochSeconds(1700000000).value) {}

    domain::TimePoint now() const override { return now_; }

    void set(domain::TimePoint tp) { now_ = tp; }

    template <typename Duration>
    void advance(Duration d) {
        now_ += std::chrono::duration_cast<domain::TimePoint::duration>(d);
    }

private:
    domain::TimePoint now_;
};

} // namespace authcore::tests::mocks
