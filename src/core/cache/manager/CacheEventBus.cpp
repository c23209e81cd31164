#include "trainsync/core/cache/manager/CacheEventBus.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>
#include "trainsync/core/logging/Logging.hpp"

namespace trainsync {
namespace core {
namespace cache {

CacheEventBus::CacheEventBus(InvalidationMap map)
    : map_(std::move(map)) {}

bool CacheEventBus::registerCache(const CacheIdentity& identity, std::shared_ptr<Cacheable> cache) {
    auto logger = logging::getLogger("cache");
    if (!cache) {
        logger->error("CacheEventBus: попытка зарегистрировать nullptr cache для '{}'", identity);
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (caches_.find(identity) != caches_.end()) {
        logger->warn("Cache '{}' already registered, keeping the first registration", identity);
        return false;
    }
    if (!map_.references(identity)) {
        logger->warn("Cache '{}' is not referenced by any data domain and is cleared only by user/logout/manual/expired",
                     identity);
    }
    caches_.emplace(identity, std::move(cache));
    logger->info("CacheEventBus: зарегистрирован кэш '{}'", identity);
    return true;
}

bool CacheEventBus::registerCache(std::shared_ptr<Cacheable> cache) {
    if (!cache) {
        return registerCache(CacheIdentity{}, nullptr);
    }
    auto identity = cache->identity();
    return registerCache(identity, std::move(cache));
}

void CacheEventBus::unregisterCache(const CacheIdentity& identity) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = caches_.find(identity);
    if (it == caches_.end()) {
        logging::getLogger("cache")->warn("Cache '{}' not found", identity);
        return;
    }
    caches_.erase(it);
    logging::getLogger("cache")->info("Cache '{}' unregistered", identity);
}

bool CacheEventBus::isRegistered(const CacheIdentity& identity) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return caches_.find(identity) != caches_.end();
}

void CacheEventBus::addListener(std::weak_ptr<CacheEventListener> listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.push_back(std::move(listener));
}

size_t CacheEventBus::listenerCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(std::count_if(listeners_.begin(), listeners_.end(),
        [](const std::weak_ptr<CacheEventListener>& l) { return !l.expired(); }));
}

std::vector<std::pair<CacheIdentity, std::shared_ptr<Cacheable>>>
CacheEventBus::selectTargets(const InvalidationReason& reason, const CacheIdentity& originIdentity) const {
    std::vector<std::pair<CacheIdentity, std::shared_ptr<Cacheable>>> targets;
    std::lock_guard<std::mutex> lock(mutex_);
    switch (reason.kind) {
    case InvalidationReason::Kind::UserLogout:
    case InvalidationReason::Kind::ManualClear:
    case InvalidationReason::Kind::Expired:
        // Для Expired фильтрация по isExpired() выполняется вне блокировки
        for (const auto& entry : caches_) {
            targets.push_back(entry);
        }
        break;
    case InvalidationReason::Kind::DataChanged:
        if (!reason.domain) {
            logging::getLogger("cache")->error("CacheEventBus: dataChanged без домена, ничего не очищено");
            break;
        }
        if (*reason.domain == DataDomain::User) {
            // Смена пользователя: все зарегистрированные кэши, и вне таблицы тоже
            for (const auto& entry : caches_) {
                if (entry.first != originIdentity) {
                    targets.push_back(entry);
                }
            }
            break;
        }
        for (const auto& identity : map_.affected(*reason.domain)) {
            if (identity == originIdentity) {
                continue;
            }
            auto it = caches_.find(identity);
            if (it != caches_.end()) {
                targets.push_back(*it);
            }
        }
        break;
    }
    return targets;
}

std::vector<std::shared_ptr<CacheEventListener>> CacheEventBus::liveListeners() {
    std::vector<std::shared_ptr<CacheEventListener>> live;
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = listeners_.begin();
    while (it != listeners_.end()) {
        if (auto listener = it->lock()) {
            live.push_back(std::move(listener));
            ++it;
        } else {
            it = listeners_.erase(it);
        }
    }
    return live;
}

size_t CacheEventBus::invalidate(const InvalidationReason& reason, const CacheIdentity& originIdentity) {
    auto logger = logging::getLogger("cache");
    const auto reasonName = reason.toString();
    size_t cleared = 0;
    for (const auto& [identity, cache] : selectTargets(reason, originIdentity)) {
        if (reason.kind == InvalidationReason::Kind::Expired && !cache->isExpired()) {
            continue;
        }
        cache->clearCache();
        ++cleared;
        logger->debug("Cache '{}' cleared ({})", identity, reasonName);
    }
    logger->info("CacheEventBus: invalidate {} -> очищено кэшей: {}", reasonName, cleared);

    // Слушатели вызываются без блокировки реестра
    for (const auto& listener : liveListeners()) {
        try {
            listener->onCacheInvalidated(reason);
        } catch (const std::exception& e) {
            logger->error("CacheEventBus: listener failed on {}: {}", reasonName, e.what());
        } catch (...) {
            logger->error("CacheEventBus: listener failed on {}: unknown exception", reasonName);
        }
    }
    return cleared;
}

CacheStatus CacheEventBus::status() const {
    std::vector<std::shared_ptr<Cacheable>> caches;
    CacheStatus status;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [identity, cache] : caches_) {
            status.identities.push_back(identity);
            caches.push_back(cache);
        }
    }
    status.totalCaches = caches.size();
    for (const auto& cache : caches) {
        status.totalSizeBytes += cache->getCacheSize();
        if (cache->isExpired()) {
            ++status.expiredCount;
        }
    }
    return status;
}

} // namespace cache
} // namespace core
} // namespace trainsync
