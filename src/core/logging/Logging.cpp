#include "trainsync/core/logging/Logging.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <set>
#include <vector>

namespace trainsync {
namespace core {
namespace logging {

namespace {

constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

std::mutex& sinksMutex() {
    static std::mutex mutex;
    return mutex;
}

std::vector<spdlog::sink_ptr>& processSinks() {
    static std::vector<spdlog::sink_ptr> sinks;
    return sinks;
}

// Имена логгеров, созданных через getLogger()
std::set<std::string>& createdLoggers() {
    static std::set<std::string> names;
    return names;
}

spdlog::level::level_enum& processLevel() {
    static spdlog::level::level_enum level = spdlog::level::info;
    return level;
}

// Вызывается под sinksMutex()
void ensureDefaultSinks() {
    auto& sinks = processSinks();
    if (!sinks.empty()) {
        return;
    }
    auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console->set_pattern(kPattern);
    sinks.push_back(console);
}

} // namespace

void initializeLogging(const LoggingConfig& config) {
    std::lock_guard<std::mutex> lock(sinksMutex());
    std::vector<spdlog::sink_ptr> sinks;
    try {
        if (config.console) {
            auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            console->set_pattern(kPattern);
            sinks.push_back(console);
        }
        if (!config.filePath.empty()) {
            auto parent = std::filesystem::path(config.filePath).parent_path();
            if (!parent.empty()) {
                std::filesystem::create_directories(parent);
            }
            auto rotating = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.filePath, config.maxFileSize, config.maxFiles);
            rotating->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] [%t] %v");
            sinks.push_back(rotating);
        }
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
        throw;
    }

    processSinks() = std::move(sinks);
    processLevel() = spdlog::level::from_str(config.level);

    // sinks живых логгеров не меняются: логгеры снимаются с регистрации
    // и пересоздаются на новых sinks при следующем getLogger()
    for (const auto& name : createdLoggers()) {
        spdlog::drop(name);
    }
    createdLoggers().clear();
}

std::shared_ptr<spdlog::logger> getLogger(const std::string& name) {
    if (auto logger = spdlog::get(name)) {
        return logger;
    }
    std::lock_guard<std::mutex> lock(sinksMutex());
    if (auto logger = spdlog::get(name)) {
        return logger;
    }
    ensureDefaultSinks();
    auto& sinks = processSinks();
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(processLevel());
    try {
        spdlog::register_logger(logger);
        createdLoggers().insert(name);
    } catch (const spdlog::spdlog_ex&) {
        // Гонка регистрации: логгер уже зарегистрирован другим потоком
        if (auto existing = spdlog::get(name)) {
            return existing;
        }
    }
    return logger;
}

void flushAll() {
    spdlog::apply_all([](const std::shared_ptr<spdlog::logger>& logger) {
        logger->flush();
    });
}

} // namespace logging
} // namespace core
} // namespace trainsync
