#pragma once

#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <spdlog/spdlog.h>
#include "trainsync/core/logging/Logging.hpp"
#include "trainsync/core/task/CancellationToken.hpp"
#include "trainsync/core/thread/ThreadPool.hpp"

namespace trainsync {
namespace core {
namespace task {

// Итог выполнения задачи
enum class TaskOutcome {
    Completed,
    Canceled,
    Failed
};

std::string toString(TaskOutcome outcome);

// TaskCoordinator - дедупликация и отмена именованных асинхронных операций одного владельца.
// Новый execute с тем же id отменяет предыдущий; тела одного id никогда не пересекаются:
// следующее тело попадает в пул только после завершения предыдущего.
// Ошибки и отмена не пробрасываются: результат будущего - std::nullopt.
class TaskCoordinator {
public:
    TaskCoordinator(std::string owner, std::shared_ptr<thread::ThreadPool> pool); // Конструктор
    ~TaskCoordinator(); // cancelAll без ожидания
    TaskCoordinator(const TaskCoordinator&) = delete;
    TaskCoordinator& operator=(const TaskCoordinator&) = delete;

    template<typename T>
    std::future<std::optional<T>> execute(const std::string& id,
                                          std::function<T(const CancellationToken&)> operation);

    void cancel(const std::string& id); // Отменить задачу id (если есть)
    void cancelAll();                   // Отменить все задачи владельца
    bool isActive(const std::string& id) const;
    size_t activeCount() const;         // Живые (неотмененные) задачи
    void waitForIdle();                 // Ждать завершения всех тел и уничтожения их замыканий
    const std::string& owner() const { return owner_; }

private:
    struct State;
    struct Registration {
        uint64_t generation = 0;
        CancellationToken token;
    };
    using Job = std::function<void()>;
    using Reject = std::function<void()>; // Задача не попала в пул

    Registration registerTask(const std::string& id);
    void submit(const std::string& id, uint64_t generation, Job job, Reject reject);
    static void dispatch(const std::shared_ptr<State>& state, const std::string& id,
                         uint64_t generation, Job job, Reject reject);
    static void runNext(const std::shared_ptr<State>& state, const std::string& id);
    static void finishTask(const std::shared_ptr<State>& state, const std::string& id, uint64_t generation);
    static void reportOutcome(const std::shared_ptr<State>& state, const std::string& id,
                              TaskOutcome outcome, const std::string& message);

    std::string owner_;
    std::shared_ptr<State> state_; // Разделяется с выполняющимися задачами
    std::shared_ptr<thread::ThreadPool> pool_;
    std::mutex scheduleMutex_;     // Регистрация и постановка одного execute неделимы
};

template<typename T>
std::future<std::optional<T>> TaskCoordinator::execute(const std::string& id,
                                                       std::function<T(const CancellationToken&)> operation) {
    auto result = std::make_shared<std::promise<std::optional<T>>>();
    auto future = result->get_future();
    if (id.empty() || !operation) {
        logging::getLogger("taskcoordinator")->error("[{}] execute rejected: empty id or operation", owner_);
        result->set_value(std::nullopt);
        return future;
    }

    std::lock_guard<std::mutex> scheduleLock(scheduleMutex_);
    auto registration = registerTask(id);
    auto state = state_;

    auto job = [state, id, registration, result, body = std::move(operation)]() mutable {
        std::optional<T> value;
        TaskOutcome outcome = TaskOutcome::Canceled;
        std::string message;
        if (!registration.token.isCancelled()) {
            try {
                value = body(registration.token);
                outcome = TaskOutcome::Completed;
            } catch (const OperationCanceled&) {
                outcome = TaskOutcome::Canceled;
            } catch (const std::exception& e) {
                outcome = TaskOutcome::Failed;
                message = e.what();
            } catch (...) {
                outcome = TaskOutcome::Failed;
                message = "unknown exception";
            }
        }
        // Замыкание уничтожается до снятия регистрации
        body = nullptr;
        reportOutcome(state, id, outcome, message);
        finishTask(state, id, registration.generation);
        result->set_value(std::move(value));
        runNext(state, id);
    };
    submit(id, registration.generation, std::move(job), [result] { result->set_value(std::nullopt); });
    return future;
}

} // namespace task
} // namespace core
} // namespace trainsync
