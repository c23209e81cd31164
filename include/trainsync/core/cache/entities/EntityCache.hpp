#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include "trainsync/core/cache/CacheConfig.hpp"
#include "trainsync/core/cache/CacheEntry.hpp"
#include "trainsync/core/cache/Cacheable.hpp"

namespace trainsync {
namespace core {
namespace cache {

// EntityCache - общая основа кэшей сущностей: одна CacheEntry<Data> под ключом
// keyPrefix + identity и TTL из CacheConfig
template<typename Data>
class EntityCache : public Cacheable {
public:
    EntityCache(CacheIdentity identity,
                std::shared_ptr<storage::KeyValueStore> store,
                std::shared_ptr<const time::Clock> clock,
                const CacheConfig& config)
        : identity_(std::move(identity)),
          ttl_(config.ttlFor(identity_)),
          entry_(config.storageKey(identity_), std::move(store), clock),
          clock_(std::move(clock)) {}

    CacheIdentity identity() const override { return identity_; }
    void clearCache() override {
        std::lock_guard<std::mutex> lock(mutex_);
        entry_.clear();
    }
    size_t getCacheSize() const override { return entry_.sizeBytes(); }
    bool isExpired() const override { return entry_.isExpired(ttl_); }

    std::chrono::seconds ttl() const { return ttl_; }
    std::optional<std::chrono::milliseconds> age() const { return entry_.age(); }

protected:
    time::EpochMillis nowMillis() const { return clock_->nowMillis(); }

    // Чтение-изменение-запись всей записи под mutex_
    template<typename Mutator>
    bool update(Mutator&& mutate) {
        std::lock_guard<std::mutex> lock(mutex_);
        Data data = entry_.read().value_or(Data{});
        mutate(data);
        return entry_.write(data);
    }

    std::optional<Data> snapshot() {
        std::lock_guard<std::mutex> lock(mutex_);
        return entry_.read();
    }

private:
    CacheIdentity identity_;
    std::chrono::seconds ttl_;
    CacheEntry<Data> entry_;
    std::shared_ptr<const time::Clock> clock_;
    std::mutex mutex_;
};

} // namespace cache
} // namespace core
} // namespace trainsync
