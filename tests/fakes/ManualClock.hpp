#pragma once

#include <atomic>
#include <chrono>
#include "trainsync/core/time/Clock.hpp"

namespace trainsync {
namespace testing {

// Часы, которые двигаются только вручную
class ManualClock : public core::time::Clock {
public:
    explicit ManualClock(core::time::EpochMillis start = 1704067200000LL) : now_(start) {} // 2024-01-01 (пн)
    core::time::EpochMillis nowMillis() const override { return now_.load(); }
    void setMillis(core::time::EpochMillis value) { now_.store(value); }
    void advance(std::chrono::milliseconds delta) { now_.fetch_add(delta.count()); }
private:
    std::atomic<core::time::EpochMillis> now_;
};

} // namespace testing
} // namespace trainsync
