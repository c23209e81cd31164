#include "trainsync/core/cache/entities/WorkoutUploadCache.hpp"

namespace trainsync {
namespace core {
namespace cache {

WorkoutUploadCache::WorkoutUploadCache(std::shared_ptr<storage::KeyValueStore> store,
                                       std::shared_ptr<const time::Clock> clock,
                                       const CacheConfig& config)
    : EntityCache(identities::kWorkoutUpload, std::move(store), std::move(clock), config) {}

bool WorkoutUploadCache::markUploaded(const model::WorkoutKey& workout, int64_t uploadedAtEpoch) {
    const auto id = workout.stableId();
    return update([&id, uploadedAtEpoch](model::WorkoutUploadLedger& ledger) {
        ledger.uploads[id] = uploadedAtEpoch;
    });
}

bool WorkoutUploadCache::isUploaded(const model::WorkoutKey& workout) {
    return uploadedAt(workout).has_value();
}

std::optional<int64_t> WorkoutUploadCache::uploadedAt(const model::WorkoutKey& workout) {
    auto ledger = snapshot();
    if (!ledger) {
        return std::nullopt;
    }
    auto it = ledger->uploads.find(workout.stableId());
    if (it == ledger->uploads.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t WorkoutUploadCache::uploadedCount() {
    auto ledger = snapshot();
    return ledger ? ledger->uploads.size() : 0;
}

} // namespace cache
} // namespace core
} // namespace trainsync
