#include <cassert>
#include <iostream>
#include "trainsync/core/plan/TrainingWeeks.hpp"

using namespace trainsync::core::plan;

namespace {
constexpr int64_t kDay = 24 * 3600;
constexpr int64_t kMonday = 1704067200; // 2024-01-01 00:00 UTC
} // namespace

void testMondayArithmetic() {
    std::cout << "Testing week boundary arithmetic...\n";
    assert(weeks::epochDay(0) == 0);
    assert(weeks::epochDay(-1) == -1);
    // 1970-01-01 - четверг, понедельник той недели - 1969-12-29
    assert(weeks::mondayOf(0) == -3);
    assert(weeks::mondayOf(weeks::epochDay(kMonday)) == weeks::epochDay(kMonday));
    assert(weeks::mondayOf(weeks::epochDay(kMonday + 6 * kDay)) == weeks::epochDay(kMonday));
    std::cout << "[OK] week boundary arithmetic\n";
}

void testCurrentWeek() {
    std::cout << "Testing current training week...\n";
    assert(weeks::currentWeek(kMonday, kMonday) == 1);
    assert(weeks::currentWeek(kMonday, kMonday + 6 * kDay + 23 * 3600) == 1); // Воскресенье
    assert(weeks::currentWeek(kMonday, kMonday + 7 * kDay) == 2);
    assert(weeks::currentWeek(kMonday, kMonday + 30 * kDay) == 5);
    // Старт в среду: следующий понедельник - уже вторая неделя
    assert(weeks::currentWeek(kMonday + 2 * kDay, kMonday + 7 * kDay) == 2);
    // Время до старта плана не дает недель меньше 1
    assert(weeks::currentWeek(kMonday, kMonday - 20 * kDay) == 1);
    std::cout << "[OK] current training week\n";
}

void testTotalWeeks() {
    std::cout << "Testing total training weeks...\n";
    // Старт в воскресенье 2025-10-26, гонка 2025-11-26 (среда): 6 недель
    const int64_t start = 1761436800; // 2025-10-26 00:00 UTC
    const int64_t race = start + 31 * kDay;
    assert(weeks::totalWeeks(start, race) == 6);
    assert(weeks::totalWeeks(kMonday, kMonday) == 1);
    assert(weeks::totalWeeks(kMonday, kMonday + 6 * kDay) == 1);
    assert(weeks::totalWeeks(kMonday, kMonday + 7 * kDay) == 2);
    assert(weeks::totalWeeks(kMonday, kMonday - kDay) == 1); // Гонка раньше старта
    std::cout << "[OK] total training weeks\n";
}

int main() {
    try {
        testMondayArithmetic();
        testCurrentWeek();
        testTotalWeeks();
        std::cout << "All TrainingWeeks tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "TrainingWeeks test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
