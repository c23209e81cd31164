#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "trainsync/core/cache/Cacheable.hpp"
#include "trainsync/core/cache/manager/InvalidationMap.hpp"

namespace trainsync {
namespace core {
namespace cache {

// CacheEventBus - реестр кэшей по идентификатору, инвалидация по причине/домену,
// уведомление слушателей. Создается явно и передается зависимым компонентам.
class CacheEventBus {
public:
    explicit CacheEventBus(InvalidationMap map = InvalidationMap::standard()); // Конструктор
    CacheEventBus(const CacheEventBus&) = delete;
    CacheEventBus& operator=(const CacheEventBus&) = delete;

    bool registerCache(const CacheIdentity& identity, std::shared_ptr<Cacheable> cache); // Первая регистрация побеждает
    bool registerCache(std::shared_ptr<Cacheable> cache); // identity из самого кэша
    void unregisterCache(const CacheIdentity& identity);  // Отмена регистрации
    bool isRegistered(const CacheIdentity& identity) const;

    void addListener(std::weak_ptr<CacheEventListener> listener); // Слабая ссылка
    size_t listenerCount() const; // Живые слушатели

    // Очистить затронутые кэши и уведомить слушателей. originIdentity не очищается
    // при DataChanged (источник только что записал свежие данные).
    // Возвращает число очищенных кэшей.
    size_t invalidate(const InvalidationReason& reason, const CacheIdentity& originIdentity = {});

    CacheStatus status() const; // Без побочных эффектов
    const InvalidationMap& invalidationMap() const { return map_; }

private:
    std::vector<std::pair<CacheIdentity, std::shared_ptr<Cacheable>>>
    selectTargets(const InvalidationReason& reason, const CacheIdentity& originIdentity) const;
    std::vector<std::shared_ptr<CacheEventListener>> liveListeners();

    InvalidationMap map_;
    std::map<CacheIdentity, std::shared_ptr<Cacheable>> caches_; // Реестр
    std::vector<std::weak_ptr<CacheEventListener>> listeners_;
    mutable std::mutex mutex_;
};

} // namespace cache
} // namespace core
} // namespace trainsync
