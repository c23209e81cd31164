#include "trainsync/core/plan/TrainingWeeks.hpp"
#include <algorithm>

namespace trainsync {
namespace core {
namespace plan {
namespace weeks {

namespace {

constexpr int64_t kSecondsPerDay = 24 * 60 * 60;

int64_t floorDiv(int64_t a, int64_t b) {
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) {
        --q;
    }
    return q;
}

int64_t floorMod(int64_t a, int64_t b) {
    return a - floorDiv(a, b) * b;
}

} // namespace

int64_t epochDay(int64_t epochSeconds) {
    return floorDiv(epochSeconds, kSecondsPerDay);
}

int64_t mondayOf(int64_t day) {
    // 1970-01-01 - четверг: индекс дня недели (пн = 0) равен (day + 3) mod 7
    return day - floorMod(day + 3, 7);
}

int currentWeek(int64_t planStartEpoch, int64_t nowEpoch) {
    const int64_t startMonday = mondayOf(epochDay(planStartEpoch));
    const int64_t nowMonday = mondayOf(epochDay(nowEpoch));
    const int64_t week = floorDiv(nowMonday - startMonday, 7) + 1;
    return static_cast<int>(std::max<int64_t>(week, 1));
}

int totalWeeks(int64_t planStartEpoch, int64_t raceEpoch) {
    const int64_t startDay = epochDay(planStartEpoch);
    const int64_t raceDay = epochDay(raceEpoch);
    if (raceDay < startDay) {
        return 1;
    }
    const int64_t daysDiff = mondayOf(raceDay) - mondayOf(startDay);
    return static_cast<int>((daysDiff + 6) / 7 + 1);
}

} // namespace weeks
} // namespace plan
} // namespace core
} // namespace trainsync
