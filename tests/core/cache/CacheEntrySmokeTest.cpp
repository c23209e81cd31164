#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include "trainsync/core/cache/CacheEntry.hpp"
#include "trainsync/core/model/WeeklySummary.hpp"
#include "fakes/ManualClock.hpp"

using namespace trainsync::core;
using trainsync::testing::ManualClock;

namespace {

model::WeeklySummary summary(int week) {
    model::WeeklySummary s;
    s.weekNumber = week;
    s.distanceKm = 31.5;
    s.completionPercentage = 80.0;
    s.summary = "solid week";
    return s;
}

void putRaw(storage::MemoryKeyValueStore& store, const std::string& key, const std::string& text) {
    store.set(key, storage::Bytes(text.begin(), text.end()));
}

} // namespace

void testWriteRead() {
    std::cout << "Testing CacheEntry write/read...\n";
    auto store = std::make_shared<storage::MemoryKeyValueStore>();
    auto clock = std::make_shared<ManualClock>();
    cache::CacheEntry<model::WeeklySummary> entry("cache_weekly_summary", store, clock);

    assert(!entry.read().has_value());
    assert(entry.isExpired(std::chrono::seconds(1800))); // Нет записи = просрочено
    assert(entry.write(summary(3)));
    auto loaded = entry.read();
    assert(loaded.has_value());
    assert(*loaded == summary(3));
    assert(entry.capturedAt() == clock->nowMillis());
    assert(entry.sizeBytes() > 0);
    std::cout << "[OK] CacheEntry write/read\n";
}

void testTtlBoundary() {
    std::cout << "Testing CacheEntry TTL boundary...\n";
    auto store = std::make_shared<storage::MemoryKeyValueStore>();
    auto clock = std::make_shared<ManualClock>();
    cache::CacheEntry<model::WeeklySummary> entry("k", store, clock);
    assert(entry.write(summary(1)));
    const auto ttl = std::chrono::seconds(1800);

    clock->advance(std::chrono::seconds(1799));
    assert(!entry.isExpired(ttl));
    assert(entry.age() == std::chrono::milliseconds(1799000));

    clock->advance(std::chrono::seconds(2)); // T + 1801 s
    assert(entry.isExpired(ttl));
    // Проверка TTL ничего не удаляет
    assert(entry.read().has_value());
    std::cout << "[OK] CacheEntry TTL boundary\n";
}

void testCorruptionClears() {
    std::cout << "Testing CacheEntry corruption handling...\n";
    auto store = std::make_shared<storage::MemoryKeyValueStore>();
    auto clock = std::make_shared<ManualClock>();
    cache::CacheEntry<model::WeeklySummary> entry("k", store, clock);

    const std::string corrupt[] = {
        "not json at all",
        "{\"payload\":{\"week_number\":1,\"distance_km\":1.0,\"completion_percentage\":1.0}}", // Нет времени
        "{\"captured_at_ms\":1,\"payload\":{\"week_number\":\"one\",\"distance_km\":1.0,\"completion_percentage\":1.0}}",
        "{\"captured_at_ms\":1,\"payload\":{\"week_number\":1}}", // Неполный payload
    };
    for (const auto& text : corrupt) {
        putRaw(*store, "k", text);
        assert(!entry.read().has_value());
        assert(!store->contains("k"));     // Очищено немедленно
        assert(!entry.read().has_value()); // Повторное чтение тоже пусто
    }

    // capturedAt/age не очищают запись
    putRaw(*store, "k", "garbage");
    assert(!entry.age().has_value());
    assert(entry.isExpired(std::chrono::seconds(10)));
    assert(store->contains("k"));
    std::cout << "[OK] CacheEntry corruption handling\n";
}

void testRejectedWriteKeepsPrevious() {
    std::cout << "Testing CacheEntry rejected write...\n";
    auto store = std::make_shared<storage::MemoryKeyValueStore>();
    auto clock = std::make_shared<ManualClock>();
    cache::CacheEntry<model::WeeklySummary> entry("k", store, clock);
    assert(entry.write(summary(1)));
    store->setRejectWrites(true);
    assert(!entry.write(summary(2)));
    assert(entry.read()->weekNumber == 1);
    store->setRejectWrites(false);
    entry.clear();
    assert(!entry.read().has_value());
    assert(entry.sizeBytes() == 0);
    std::cout << "[OK] CacheEntry rejected write\n";
}

int main() {
    try {
        testWriteRead();
        testTtlBoundary();
        testCorruptionClears();
        testRejectedWriteKeepsPrevious();
        std::cout << "All CacheEntry tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "CacheEntry test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
