#pragma once
#include <chrono>
#include <map>
#include <string>
#include <nlohmann/json.hpp>
#include "trainsync/core/cache/CacheTypes.hpp"

namespace trainsync {
namespace core {
namespace cache {

// CacheConfig - параметры кэшей (storage, префикс ключей, TTL по идентификатору)
struct CacheConfig {
    std::string storagePath = "./cache";  // Каталог FileKeyValueStore
    std::string keyPrefix = "cache_";     // Префикс ключей хранилища
    std::chrono::seconds defaultTtl = std::chrono::seconds(1800); // TTL по умолчанию (30 мин)
    std::map<CacheIdentity, std::chrono::seconds> ttlOverrides;   // TTL для отдельных кэшей

    std::chrono::seconds ttlFor(const CacheIdentity& identity) const {
        auto it = ttlOverrides.find(identity);
        return it != ttlOverrides.end() ? it->second : defaultTtl;
    }
    std::string storageKey(const CacheIdentity& identity) const {
        return keyPrefix + identity;
    }
    bool validate() const {
        if (storagePath.empty() || defaultTtl.count() <= 0) return false;
        for (const auto& [identity, ttl] : ttlOverrides) {
            if (identity.empty() || ttl.count() <= 0) return false;
        }
        return true;
    }

    nlohmann::json toJson() const;
    static CacheConfig fromJson(const nlohmann::json& j); // Отсутствующие поля -> значения по умолчанию
};

} // namespace cache
} // namespace core
} // namespace trainsync
