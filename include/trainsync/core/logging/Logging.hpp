#pragma once

#include <memory>
#include <string>
#include <cstddef>
#include <spdlog/spdlog.h>

namespace trainsync {
namespace core {
namespace logging {

// LoggingConfig - параметры логирования (уровень, файл, ротация)
struct LoggingConfig {
    std::string level = "info";          // Уровень: trace/debug/info/warn/error
    std::string filePath;                // Пусто = только консоль
    size_t maxFileSize = 1024 * 1024 * 5; // 5 MB
    size_t maxFiles = 2;                 // Кол-во файлов ротации
    bool console = true;                 // Консольный sink
    bool validate() const {
        return spdlog::level::from_str(level) != spdlog::level::off || level == "off";
    }
};

// Настроить общие sinks процесса. Вызывать при старте, до рабочих потоков.
// Повторный вызов пересоздает sinks; уже полученные shared_ptr логгеров
// продолжают писать в старые sinks, getLogger() отдает новые логгеры.
void initializeLogging(const LoggingConfig& config);

// Получить именованный логгер (создается при первом обращении)
std::shared_ptr<spdlog::logger> getLogger(const std::string& name);

// Сбросить буферы всех логгеров
void flushAll();

} // namespace logging
} // namespace core
} // namespace trainsync
