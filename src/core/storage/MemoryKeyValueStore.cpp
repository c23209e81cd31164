#include "trainsync/core/storage/KeyValueStore.hpp"
#include "trainsync/core/logging/Logging.hpp"

namespace trainsync {
namespace core {
namespace storage {

std::optional<Bytes> MemoryKeyValueStore::get(const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = data_.find(key);
    if (it == data_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool MemoryKeyValueStore::set(const std::string& key, const Bytes& value) {
    if (rejectWrites_) {
        logging::getLogger("storage")->warn("MemoryKeyValueStore: write rejected for key='{}'", key);
        return false;
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);
    data_[key] = value;
    return true;
}

void MemoryKeyValueStore::remove(const std::string& key) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    data_.erase(key);
}

void MemoryKeyValueStore::setRejectWrites(bool reject) {
    rejectWrites_ = reject;
}

bool MemoryKeyValueStore::contains(const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return data_.find(key) != data_.end();
}

size_t MemoryKeyValueStore::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return data_.size();
}

} // namespace storage
} // namespace core
} // namespace trainsync
