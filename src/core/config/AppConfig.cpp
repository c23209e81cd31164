#include "trainsync/core/config/AppConfig.hpp"
#include <fstream>

namespace trainsync {
namespace core {
namespace config {

namespace {

logging::LoggingConfig loggingFromJson(const nlohmann::json& j) {
    logging::LoggingConfig config;
    config.level = j.value("level", config.level);
    config.filePath = j.value("filePath", config.filePath);
    config.maxFileSize = j.value("maxFileSize", config.maxFileSize);
    config.maxFiles = j.value("maxFiles", config.maxFiles);
    config.console = j.value("console", config.console);
    return config;
}

nlohmann::json loggingToJson(const logging::LoggingConfig& config) {
    return {
        {"level", config.level},
        {"filePath", config.filePath},
        {"maxFileSize", config.maxFileSize},
        {"maxFiles", config.maxFiles},
        {"console", config.console}
    };
}

} // namespace

nlohmann::json AppConfig::toJson() const {
    return {
        {"logging", loggingToJson(logging)},
        {"cache", cache.toJson()},
        {"threads", threads.toJson()}
    };
}

AppConfig AppConfig::fromJson(const nlohmann::json& j) {
    AppConfig config;
    if (j.contains("logging")) {
        config.logging = loggingFromJson(j.at("logging"));
    }
    if (j.contains("cache")) {
        config.cache = cache::CacheConfig::fromJson(j.at("cache"));
    }
    if (j.contains("threads")) {
        config.threads = thread::ThreadPoolConfig::fromJson(j.at("threads"));
    }
    return config;
}

AppConfig loadConfig(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("cannot open config file: " + path);
    }
    AppConfig config;
    try {
        config = AppConfig::fromJson(nlohmann::json::parse(in));
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError("invalid config " + path + ": " + e.what());
    }
    if (!config.validate()) {
        throw ConfigError("config " + path + " failed validation");
    }
    return config;
}

} // namespace config
} // namespace core
} // namespace trainsync
