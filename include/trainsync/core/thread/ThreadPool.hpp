#pragma once

#include <functional>
#include <memory>
#include <nlohmann/json.hpp>

namespace trainsync {
namespace core {
namespace thread {

// Структура для хранения метрик пула потоков
struct ThreadPoolMetrics {
    size_t activeThreads = 0;    // Активные потоки
    size_t queueSize = 0;        // Размер очереди
    size_t totalThreads = 0;     // Всего потоков
    size_t completedTasks = 0;   // Выполнено задач
};

// Структура для конфигурации пула потоков
struct ThreadPoolConfig {
    size_t minThreads = 2;       // Мин. потоки
    size_t maxThreads = 4;       // Макс. потоки
    size_t queueSize = 0;        // Макс. очередь (0 = без ограничения)
    size_t stackSize = 1024 * 1024; // Размер стека

    bool validate() const {
        if (minThreads > maxThreads) return false;
        if (minThreads == 0) return false;
        if (stackSize == 0) return false;
        return true;
    }

    nlohmann::json toJson() const {
        return {
            {"minThreads", minThreads},
            {"maxThreads", maxThreads},
            {"queueSize", queueSize},
            {"stackSize", stackSize}
        };
    }
    static ThreadPoolConfig fromJson(const nlohmann::json& j) {
        ThreadPoolConfig config;
        config.minThreads = j.value("minThreads", config.minThreads);
        config.maxThreads = j.value("maxThreads", config.maxThreads);
        config.queueSize = j.value("queueSize", config.queueSize);
        config.stackSize = j.value("stackSize", config.stackSize);
        return config;
    }
};

// Пул потоков. Очередь FIFO; число потоков растет от minThreads до maxThreads,
// когда все заняты. stop() дожидается выполнения уже поставленных задач.
class ThreadPool {
public:
    explicit ThreadPool(const ThreadPoolConfig& config); // Конструктор (invalid_argument при неверном конфиге)
    ~ThreadPool(); // Деструктор (stop)
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    void enqueue(std::function<void()> task); // Добавить задачу (runtime_error: пул остановлен или очередь полна)
    size_t getActiveThreadCount() const; // Активные потоки
    size_t getQueueSize() const; // Размер очереди
    bool isQueueEmpty() const; // Очередь пуста?
    void waitForCompletion(); // Ждать завершения
    void stop(); // Остановить пул
    ThreadPoolMetrics getMetrics() const; // Метрики
    ThreadPoolConfig getConfiguration() const; // Получить конфиг
private:
    struct Impl;
    std::unique_ptr<Impl> pImpl; // Реализация
};

} // namespace thread
} // namespace core
} // namespace trainsync
