#pragma once

#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>
#include "trainsync/core/cache/CacheConfig.hpp"
#include "trainsync/core/logging/Logging.hpp"
#include "trainsync/core/thread/ThreadPool.hpp"

namespace trainsync {
namespace core {
namespace config {

// ConfigError - файл конфигурации не читается или невалиден
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// AppConfig - конфигурация процесса
struct AppConfig {
    logging::LoggingConfig logging;
    cache::CacheConfig cache;
    thread::ThreadPoolConfig threads;

    bool validate() const {
        return logging.validate() && cache.validate() && threads.validate();
    }
    nlohmann::json toJson() const;
    static AppConfig fromJson(const nlohmann::json& j); // Отсутствующие секции -> значения по умолчанию
};

// Загрузить и проверить конфиг (ConfigError при ошибке)
AppConfig loadConfig(const std::string& path);

} // namespace config
} // namespace core
} // namespace trainsync
