#pragma once

#include <cstdint>

namespace trainsync {
namespace core {
namespace plan {

// Календарная арифметика недель плана (UTC, недели с понедельника, целые epoch-секунды)
namespace weeks {

int64_t epochDay(int64_t epochSeconds);         // Номер дня от 1970-01-01
int64_t mondayOf(int64_t epochDay);             // Понедельник недели дня (номер дня)

// Текущая неделя плана: 1 = неделя старта; никогда не меньше 1
int currentWeek(int64_t planStartEpoch, int64_t nowEpoch);

// Недель от старта до гонки включительно: ceil(дней между понедельниками / 7) + 1;
// гонка раньше старта -> 1
int totalWeeks(int64_t planStartEpoch, int64_t raceEpoch);

} // namespace weeks

} // namespace plan
} // namespace core
} // namespace trainsync
