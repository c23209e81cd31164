#include "trainsync/core/cache/CacheConfig.hpp"

namespace trainsync {
namespace core {
namespace cache {

nlohmann::json CacheConfig::toJson() const {
    nlohmann::json overrides = nlohmann::json::object();
    for (const auto& [identity, ttl] : ttlOverrides) {
        overrides[identity] = ttl.count();
    }
    return {
        {"storagePath", storagePath},
        {"keyPrefix", keyPrefix},
        {"defaultTtlSeconds", defaultTtl.count()},
        {"ttlOverrides", overrides}
    };
}

CacheConfig CacheConfig::fromJson(const nlohmann::json& j) {
    CacheConfig config;
    config.storagePath = j.value("storagePath", config.storagePath);
    config.keyPrefix = j.value("keyPrefix", config.keyPrefix);
    config.defaultTtl = std::chrono::seconds(j.value("defaultTtlSeconds", static_cast<int64_t>(config.defaultTtl.count())));
    if (j.contains("ttlOverrides")) {
        for (const auto& [identity, seconds] : j.at("ttlOverrides").items()) {
            config.ttlOverrides[identity] = std::chrono::seconds(seconds.get<int64_t>());
        }
    }
    return config;
}

} // namespace cache
} // namespace core
} // namespace trainsync
