#include "trainsync/core/thread/ThreadPool.hpp"
#include <condition_variable>
#include <deque>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>
#include <spdlog/spdlog.h>
#include "trainsync/core/logging/Logging.hpp"

namespace trainsync {
namespace core {
namespace thread {

struct ThreadPool::Impl {
    explicit Impl(const ThreadPoolConfig& cfg) : config(cfg) {}

    void spawnWorker() {
        workers.emplace_back([this] { workerLoop(); });
    }

    void workerLoop() {
        for (;;) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(mutex);
                ++idleWorkers;
                taskAvailable.wait(lock, [this] { return stopping || !tasks.empty(); });
                --idleWorkers;
                if (tasks.empty()) {
                    return; // stopping и очередь пуста
                }
                task = std::move(tasks.front());
                tasks.pop_front();
                ++activeTasks;
            }
            try {
                task();
            } catch (const std::exception& e) {
                logging::getLogger("threadpool")->error("ThreadPool: задача завершилась исключением: {}", e.what());
            } catch (...) {
                logging::getLogger("threadpool")->error("ThreadPool: задача завершилась неизвестным исключением");
            }
            // Задача уничтожается до уменьшения счетчика: waitForCompletion видит освобожденные ресурсы
            task = nullptr;
            {
                std::lock_guard<std::mutex> lock(mutex);
                --activeTasks;
                ++completedTasks;
                if (tasks.empty() && activeTasks == 0) {
                    allDone.notify_all();
                }
            }
        }
    }

    ThreadPoolConfig config;
    std::vector<std::thread> workers;
    std::deque<std::function<void()>> tasks;
    mutable std::mutex mutex;
    std::condition_variable taskAvailable;
    std::condition_variable allDone;
    size_t idleWorkers = 0;
    size_t activeTasks = 0;
    size_t completedTasks = 0;
    bool stopping = false;
};

ThreadPool::ThreadPool(const ThreadPoolConfig& config) {
    if (!config.validate()) {
        throw std::invalid_argument("Invalid ThreadPool configuration");
    }
    pImpl = std::make_unique<Impl>(config);
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    for (size_t i = 0; i < config.minThreads; ++i) {
        pImpl->spawnWorker();
    }
    logging::getLogger("threadpool")->debug("ThreadPool: запущено {} потоков (max {})",
                                             config.minThreads, config.maxThreads);
}

ThreadPool::~ThreadPool() {
    stop();
}

void ThreadPool::enqueue(std::function<void()> task) {
    if (!task) {
        throw std::invalid_argument("ThreadPool: empty task");
    }
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        if (pImpl->stopping) {
            throw std::runtime_error("ThreadPool is stopped");
        }
        if (pImpl->config.queueSize > 0 && pImpl->tasks.size() >= pImpl->config.queueSize) {
            throw std::runtime_error("ThreadPool queue is full");
        }
        pImpl->tasks.push_back(std::move(task));
        // Все потоки заняты: добавляем новый, пока не достигнут maxThreads
        if (pImpl->idleWorkers < pImpl->tasks.size() && pImpl->workers.size() < pImpl->config.maxThreads) {
            pImpl->spawnWorker();
            logging::getLogger("threadpool")->debug("ThreadPool: grew to {} threads", pImpl->workers.size());
        }
    }
    pImpl->taskAvailable.notify_one();
}

size_t ThreadPool::getActiveThreadCount() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->activeTasks;
}

size_t ThreadPool::getQueueSize() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->tasks.size();
}

bool ThreadPool::isQueueEmpty() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->tasks.empty();
}

void ThreadPool::waitForCompletion() {
    std::unique_lock<std::mutex> lock(pImpl->mutex);
    pImpl->allDone.wait(lock, [this] { return pImpl->tasks.empty() && pImpl->activeTasks == 0; });
}

void ThreadPool::stop() {
    std::vector<std::thread> workers;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        if (pImpl->stopping && pImpl->workers.empty()) {
            return;
        }
        pImpl->stopping = true;
        workers.swap(pImpl->workers);
    }
    pImpl->taskAvailable.notify_all();
    for (auto& worker : workers) {
        if (worker.get_id() == std::this_thread::get_id()) {
            // stop() из собственной задачи: поток завершится сам
            worker.detach();
        } else if (worker.joinable()) {
            worker.join();
        }
    }
    logging::getLogger("threadpool")->debug("ThreadPool stopped, {} threads joined", workers.size());
}

ThreadPoolMetrics ThreadPool::getMetrics() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    ThreadPoolMetrics metrics;
    metrics.activeThreads = pImpl->activeTasks;
    metrics.queueSize = pImpl->tasks.size();
    metrics.totalThreads = pImpl->workers.size();
    metrics.completedTasks = pImpl->completedTasks;
    return metrics;
}

ThreadPoolConfig ThreadPool::getConfiguration() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->config;
}

} // namespace thread
} // namespace core
} // namespace trainsync
