#include "trainsync/core/storage/KeyValueStore.hpp"
#include "trainsync/core/logging/Logging.hpp"
#include <fstream>
#include <iterator>
#include <system_error>

namespace trainsync {
namespace core {
namespace storage {

FileKeyValueStore::FileKeyValueStore(const std::filesystem::path& directory)
    : directory_(directory) {
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        logging::getLogger("storage")->error("FileKeyValueStore: не удалось создать каталог '{}': {}",
                                             directory_.string(), ec.message());
    }
}

std::string FileKeyValueStore::fileNameForKey(const std::string& key) {
    static const char* hex = "0123456789ABCDEF";
    std::string name;
    name.reserve(key.size() + 4);
    for (unsigned char c : key) {
        bool safe = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                    (c >= '0' && c <= '9') || c == '_' || c == '-' || c == '.';
        if (safe) {
            name.push_back(static_cast<char>(c));
        } else {
            name.push_back('%');
            name.push_back(hex[c >> 4]);
            name.push_back(hex[c & 0x0F]);
        }
    }
    // "." и ".." не должны указывать на служебные записи каталога
    if (name.empty() || name == "." || name == "..") {
        name = "%" + name;
    }
    return name + ".kv";
}

std::filesystem::path FileKeyValueStore::pathFor(const std::string& key) const {
    return directory_ / fileNameForKey(key);
}

std::optional<Bytes> FileKeyValueStore::get(const std::string& key) const {
    std::ifstream file(pathFor(key), std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    Bytes data((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        logging::getLogger("storage")->error("FileKeyValueStore: read failed for key='{}'", key);
        return std::nullopt;
    }
    return data;
}

bool FileKeyValueStore::set(const std::string& key, const Bytes& value) {
    auto logger = logging::getLogger("storage");
    auto target = pathFor(key);
    auto temp = target;
    temp += ".tmp";

    std::lock_guard<std::mutex> lock(mutex_);
    {
        std::ofstream file(temp, std::ios::binary | std::ios::trunc);
        if (!file) {
            logger->error("FileKeyValueStore: не удалось открыть '{}' для записи", temp.string());
            return false;
        }
        file.write(reinterpret_cast<const char*>(value.data()), static_cast<std::streamsize>(value.size()));
        file.flush();
        if (!file) {
            logger->error("FileKeyValueStore: write failed for key='{}' ({} bytes)", key, value.size());
            std::error_code ignored;
            std::filesystem::remove(temp, ignored);
            return false;
        }
    }

    std::error_code ec;
    std::filesystem::rename(temp, target, ec);
    if (ec) {
        logger->error("FileKeyValueStore: rename failed for key='{}': {}", key, ec.message());
        std::error_code ignored;
        std::filesystem::remove(temp, ignored);
        return false;
    }
    logger->debug("FileKeyValueStore: stored key='{}', size={}", key, value.size());
    return true;
}

void FileKeyValueStore::remove(const std::string& key) {
    std::error_code ec;
    std::filesystem::remove(pathFor(key), ec);
    if (ec) {
        logging::getLogger("storage")->warn("FileKeyValueStore: remove failed for key='{}': {}", key, ec.message());
    }
}

} // namespace storage
} // namespace core
} // namespace trainsync
