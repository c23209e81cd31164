#include <cassert>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include "trainsync/core/cache/manager/CacheEventBus.hpp"
#include "fakes/FakeCacheable.hpp"

using namespace trainsync::core::cache;
using trainsync::testing::FakeCacheable;
using trainsync::testing::RecordingListener;

namespace {

// Все идентификаторы стандартной таблицы
std::map<std::string, std::shared_ptr<FakeCacheable>> registerStandard(CacheEventBus& bus) {
    std::map<std::string, std::shared_ptr<FakeCacheable>> caches;
    for (const auto& identity : InvalidationMap::standard().allIdentities()) {
        auto cache = std::make_shared<FakeCacheable>(identity);
        assert(bus.registerCache(cache));
        caches[identity] = cache;
    }
    return caches;
}

} // namespace

void testIdempotentRegistration() {
    std::cout << "Testing CacheEventBus idempotent registration...\n";
    CacheEventBus bus;
    auto first = std::make_shared<FakeCacheable>(identities::kVdot, 10);
    auto second = std::make_shared<FakeCacheable>(identities::kVdot, 99);
    assert(bus.registerCache(first));
    assert(!bus.registerCache(second));
    assert(!bus.registerCache(identities::kHrv, nullptr));

    auto status = bus.status();
    assert(status.totalCaches == 1);
    assert(status.totalSizeBytes == 10); // Первая регистрация победила

    bus.unregisterCache(identities::kVdot);
    assert(!bus.isRegistered(identities::kVdot));
    assert(bus.registerCache(second));
    std::cout << "[OK] CacheEventBus idempotent registration\n";
}

void testStandardTable() {
    std::cout << "Testing standard invalidation table...\n";
    const auto& map = InvalidationMap::standard();
    assert(map.affected(DataDomain::TrainingPlan) == (std::set<CacheIdentity>{"training_plan", "weekly_summary"}));
    assert(map.affected(DataDomain::WeeklySummary) == (std::set<CacheIdentity>{"weekly_summary"}));
    assert(map.affected(DataDomain::Targets) == (std::set<CacheIdentity>{"targets", "training_plan"}));
    assert(map.affected(DataDomain::Workouts) == (std::set<CacheIdentity>{"workouts_v2", "workout_upload"}));
    assert(map.affected(DataDomain::User) == map.allIdentities());
    assert(map.allIdentities().size() == 8);
    for (auto domain : allDataDomains()) {
        assert(dataDomainFromString(toString(domain)) == domain);
    }
    std::cout << "[OK] standard invalidation table\n";
}

void testDataChangedClearsExactSet() {
    std::cout << "Testing dataChanged invalidation completeness...\n";
    CacheEventBus bus;
    auto caches = registerStandard(bus);

    for (auto domain : allDataDomains()) {
        std::map<std::string, int> before;
        for (const auto& [identity, cache] : caches) {
            before[identity] = cache->clearCount();
        }
        auto cleared = bus.invalidate(InvalidationReason::dataChanged(domain));
        const auto& expected = InvalidationMap::standard().affected(domain);
        assert(cleared == expected.size());
        for (const auto& [identity, cache] : caches) {
            const int delta = cache->clearCount() - before[identity];
            assert(delta == (expected.count(identity) ? 1 : 0));
        }
    }
    std::cout << "[OK] dataChanged invalidation completeness\n";
}

void testPartialMapFixture() {
    std::cout << "Testing invalidation with a partial map fixture...\n";
    InvalidationMap fixture{
        {DataDomain::Hrv, {"hrv"}}
    };
    CacheEventBus bus(fixture);
    auto hrv = std::make_shared<FakeCacheable>("hrv");
    auto health = std::make_shared<FakeCacheable>("health_data");
    bus.registerCache(hrv);
    bus.registerCache(health); // Не упомянут в таблице: предупреждение, но регистрируется
    assert(bus.isRegistered("health_data"));

    assert(bus.invalidate(InvalidationReason::dataChanged(DataDomain::Hrv)) == 1);
    assert(hrv->clearCount() == 1);
    assert(health->clearCount() == 0);

    // Пустой набор домена - ничего не очищается
    assert(bus.invalidate(InvalidationReason::dataChanged(DataDomain::Vdot)) == 0);

    // Полная очистка затрагивает и неупомянутые кэши
    assert(bus.invalidate(InvalidationReason::manualClear()) == 2);
    assert(health->clearCount() == 1);
    std::cout << "[OK] invalidation with a partial map fixture\n";
}

void testUserDomainClearsEveryRegisteredCache() {
    std::cout << "Testing user domain invalidation...\n";
    CacheEventBus bus;
    auto caches = registerStandard(bus);
    auto custom = std::make_shared<FakeCacheable>("custom_cache");
    assert(bus.registerCache(custom)); // Не упомянут в таблице

    assert(bus.invalidate(InvalidationReason::dataChanged(DataDomain::User)) == caches.size() + 1);
    assert(custom->clearCount() == 1);
    for (const auto& [identity, cache] : caches) {
        assert(cache->clearCount() == 1);
    }

    // Источник исключается и здесь
    assert(bus.invalidate(InvalidationReason::dataChanged(DataDomain::User), "custom_cache") == caches.size());
    assert(custom->clearCount() == 1);
    std::cout << "[OK] user domain invalidation\n";
}

void testOriginExclusion() {
    std::cout << "Testing origin identity exclusion...\n";
    CacheEventBus bus;
    auto caches = registerStandard(bus);
    auto cleared = bus.invalidate(InvalidationReason::dataChanged(DataDomain::TrainingPlan),
                                  identities::kTrainingPlan);
    assert(cleared == 1);
    assert(caches["training_plan"]->clearCount() == 0);
    assert(caches["weekly_summary"]->clearCount() == 1);

    // Для logout источник не исключается
    bus.invalidate(InvalidationReason::userLogout(), identities::kTrainingPlan);
    assert(caches["training_plan"]->clearCount() == 1);
    std::cout << "[OK] origin identity exclusion\n";
}

void testExpiredOnlyClearsExpired() {
    std::cout << "Testing expired invalidation...\n";
    CacheEventBus bus;
    auto fresh = std::make_shared<FakeCacheable>("targets", 50);
    auto stale = std::make_shared<FakeCacheable>("vdot", 70);
    stale->setExpired(true);
    bus.registerCache(fresh);
    bus.registerCache(stale);

    auto status = bus.status();
    assert(status.totalCaches == 2);
    assert(status.totalSizeBytes == 120);
    assert(status.expiredCount == 1);
    // status() без побочных эффектов
    assert(stale->clearCount() == 0);

    assert(bus.invalidate(InvalidationReason::expired()) == 1);
    assert(stale->clearCount() == 1);
    assert(fresh->clearCount() == 0);
    assert(bus.status().toJson().at("totalCaches") == 2);
    std::cout << "[OK] expired invalidation\n";
}

void testListenersIsolatedAndWeak() {
    std::cout << "Testing listener notification...\n";
    CacheEventBus bus;
    auto failing = std::make_shared<RecordingListener>(true);
    auto healthy = std::make_shared<RecordingListener>();
    bus.addListener(failing);
    bus.addListener(healthy);
    {
        auto temporary = std::make_shared<RecordingListener>();
        bus.addListener(temporary);
        assert(bus.listenerCount() == 3);
    }

    // Исключение слушателя не доходит до вызывающего и не блокирует остальных
    bus.invalidate(InvalidationReason::manualClear());
    assert(failing->reasons.size() == 1);
    assert(healthy->reasons.size() == 1);
    assert(healthy->reasons[0] == "manualClear");
    assert(bus.listenerCount() == 2); // Уничтоженный слушатель удален

    bus.invalidate(InvalidationReason::dataChanged(DataDomain::Vdot));
    assert(healthy->reasons.back() == "dataChanged(vdot)");
    std::cout << "[OK] listener notification\n";
}

int main() {
    try {
        testIdempotentRegistration();
        testStandardTable();
        testDataChangedClearsExactSet();
        testPartialMapFixture();
        testUserDomainClearsEveryRegisteredCache();
        testOriginExclusion();
        testExpiredOnlyClearsExpired();
        testListenersIsolatedAndWeak();
        std::cout << "All CacheEventBus tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "CacheEventBus test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
