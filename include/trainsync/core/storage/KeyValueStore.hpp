#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace trainsync {
namespace core {
namespace storage {

using Bytes = std::vector<uint8_t>;

// KeyValueStore - непрозрачное хранилище байтов по строковому ключу.
// Транзакций и атомарной записи нескольких ключей нет.
class KeyValueStore {
public:
    virtual ~KeyValueStore() = default;
    virtual std::optional<Bytes> get(const std::string& key) const = 0; // Получить
    virtual bool set(const std::string& key, const Bytes& value) = 0;  // Сохранить (false = отказ)
    virtual void remove(const std::string& key) = 0;                   // Удалить
};

// MemoryKeyValueStore - хранилище в памяти (тесты, volatile-режим)
class MemoryKeyValueStore : public KeyValueStore {
public:
    MemoryKeyValueStore() = default;
    std::optional<Bytes> get(const std::string& key) const override;
    bool set(const std::string& key, const Bytes& value) override;
    void remove(const std::string& key) override;
    void setRejectWrites(bool reject); // Имитация "диск заполнен"
    bool contains(const std::string& key) const;
    size_t size() const;
private:
    std::unordered_map<std::string, Bytes> data_;
    mutable std::shared_mutex mutex_;
    std::atomic<bool> rejectWrites_{false};
};

// FileKeyValueStore - один файл на ключ в каталоге storagePath
class FileKeyValueStore : public KeyValueStore {
public:
    explicit FileKeyValueStore(const std::filesystem::path& directory); // Конструктор
    std::optional<Bytes> get(const std::string& key) const override;
    bool set(const std::string& key, const Bytes& value) override;
    void remove(const std::string& key) override;
    const std::filesystem::path& directory() const { return directory_; }
    static std::string fileNameForKey(const std::string& key); // Ключ -> безопасное имя файла
private:
    std::filesystem::path pathFor(const std::string& key) const;
    std::filesystem::path directory_;
    mutable std::mutex mutex_; // Защищает временные файлы одного ключа
};

} // namespace storage
} // namespace core
} // namespace trainsync
