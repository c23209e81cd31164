#pragma once

#include <cstdint>
#include <optional>
#include "trainsync/core/cache/entities/EntityCache.hpp"
#include "trainsync/core/model/WorkoutUpload.hpp"

namespace trainsync {
namespace core {
namespace cache {

// WorkoutUploadCache - кэш "workout_upload": какие тренировки уже загружены
class WorkoutUploadCache : public EntityCache<model::WorkoutUploadLedger> {
public:
    WorkoutUploadCache(std::shared_ptr<storage::KeyValueStore> store,
                       std::shared_ptr<const time::Clock> clock,
                       const CacheConfig& config);

    bool markUploaded(const model::WorkoutKey& workout, int64_t uploadedAtEpoch);
    bool isUploaded(const model::WorkoutKey& workout);
    std::optional<int64_t> uploadedAt(const model::WorkoutKey& workout);
    size_t uploadedCount();
};

} // namespace cache
} // namespace core
} // namespace trainsync
