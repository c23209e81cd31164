#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "trainsync/core/logging/Logging.hpp"
#include "trainsync/core/storage/KeyValueStore.hpp"
#include "trainsync/core/time/Clock.hpp"

namespace trainsync {
namespace core {
namespace cache {

// CacheEntry - типизированная запись кэша: payload + время захвата.
// Формат хранения: JSON {"captured_at_ms": <int64>, "payload": <T::toJson()>}.
// T обязан предоставить `nlohmann::json toJson() const` и `static T fromJson(const nlohmann::json&)`.
// Повреждённая запись при чтении удаляется и никогда не возвращается.
template<typename T>
class CacheEntry {
public:
    using Payload = T;

    CacheEntry(std::string key,
               std::shared_ptr<storage::KeyValueStore> store,
               std::shared_ptr<const time::Clock> clock); // Конструктор

    bool write(const T& payload);                           // Сохранить (false = хранилище отказало)
    std::optional<T> read();                                // Прочитать; повреждённое -> очистить
    std::optional<std::chrono::milliseconds> age() const;   // now - capturedAt
    bool isExpired(std::chrono::milliseconds ttl) const;    // Нет записи = просрочено
    std::optional<time::EpochMillis> capturedAt() const;    // Время захвата
    void clear();                                           // Удалить
    size_t sizeBytes() const;                               // Размер сериализованной записи
    const std::string& key() const { return key_; }

private:
    std::optional<time::EpochMillis> capturedAtLocked() const;

    std::string key_;
    std::shared_ptr<storage::KeyValueStore> store_;
    std::shared_ptr<const time::Clock> clock_;
    mutable std::mutex mutex_;
};

template<typename T>
CacheEntry<T>::CacheEntry(std::string key,
                          std::shared_ptr<storage::KeyValueStore> store,
                          std::shared_ptr<const time::Clock> clock)
    : key_(std::move(key)), store_(std::move(store)), clock_(std::move(clock)) {}

template<typename T>
bool CacheEntry<T>::write(const T& payload) {
    auto logger = logging::getLogger("cache");
    storage::Bytes bytes;
    try {
        nlohmann::json j = {
            {"captured_at_ms", clock_->nowMillis()},
            {"payload", payload.toJson()}
        };
        std::string text = j.dump();
        bytes.assign(text.begin(), text.end());
    } catch (const std::exception& e) {
        logger->error("CacheEntry '{}': ошибка сериализации: {}", key_, e.what());
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!store_->set(key_, bytes)) {
        logger->error("CacheEntry '{}': store rejected write of {} bytes, previous value kept", key_, bytes.size());
        return false;
    }
    logger->debug("CacheEntry '{}': saved {} bytes", key_, bytes.size());
    return true;
}

template<typename T>
std::optional<T> CacheEntry<T>::read() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto bytes = store_->get(key_);
    if (!bytes) {
        return std::nullopt;
    }
    try {
        auto j = nlohmann::json::parse(bytes->begin(), bytes->end());
        auto captured = j.at("captured_at_ms").template get<time::EpochMillis>();
        T payload = T::fromJson(j.at("payload"));
        logging::getLogger("cache")->debug("CacheEntry '{}': read ok, age={} ms",
                                           key_, clock_->nowMillis() - captured);
        return payload;
    } catch (const std::exception& e) {
        logging::getLogger("cache")->warn("CacheEntry '{}': повреждённая запись удалена: {}", key_, e.what());
        store_->remove(key_);
        return std::nullopt;
    }
}

template<typename T>
std::optional<time::EpochMillis> CacheEntry<T>::capturedAtLocked() const {
    auto bytes = store_->get(key_);
    if (!bytes) {
        return std::nullopt;
    }
    try {
        auto j = nlohmann::json::parse(bytes->begin(), bytes->end());
        return j.at("captured_at_ms").template get<time::EpochMillis>();
    } catch (const std::exception&) {
        // Очистка только в read(): запросы возраста не имеют побочных эффектов
        return std::nullopt;
    }
}

template<typename T>
std::optional<time::EpochMillis> CacheEntry<T>::capturedAt() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return capturedAtLocked();
}

template<typename T>
std::optional<std::chrono::milliseconds> CacheEntry<T>::age() const {
    auto captured = capturedAt();
    if (!captured) {
        return std::nullopt;
    }
    return std::chrono::milliseconds(clock_->nowMillis() - *captured);
}

template<typename T>
bool CacheEntry<T>::isExpired(std::chrono::milliseconds ttl) const {
    auto current = age();
    return current ? *current > ttl : true;
}

template<typename T>
void CacheEntry<T>::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    store_->remove(key_);
}

template<typename T>
size_t CacheEntry<T>::sizeBytes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto bytes = store_->get(key_);
    return bytes ? bytes->size() : 0;
}

} // namespace cache
} // namespace core
} // namespace trainsync
