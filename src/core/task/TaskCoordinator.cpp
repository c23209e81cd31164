#include "trainsync/core/task/TaskCoordinator.hpp"
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <stdexcept>

namespace trainsync {
namespace core {
namespace task {

std::string toString(TaskOutcome outcome) {
    switch (outcome) {
    case TaskOutcome::Completed: return "completed";
    case TaskOutcome::Canceled: return "canceled";
    case TaskOutcome::Failed: return "failed";
    }
    return "unknown";
}

struct TaskCoordinator::State {
    struct Handle {
        uint64_t generation = 0;
        CancellationSource source;
    };
    struct Pending {
        uint64_t generation = 0;
        Job job;
        Reject reject;
    };
    // Очередь тел одного id: в пуле не более одного
    struct Chain {
        std::deque<Pending> pending;
    };

    State(std::string ownerName, std::shared_ptr<thread::ThreadPool> threadPool)
        : owner(std::move(ownerName)), pool(std::move(threadPool)) {}

    std::string owner;
    std::weak_ptr<thread::ThreadPool> pool; // Задачи в очереди пула не продлевают жизнь пула
    std::mutex mutex;
    std::condition_variable idle;
    std::map<std::string, Handle> handles; // Живые задачи по id
    std::map<std::string, Chain> chains;   // Есть запись = тело id в пуле или выполняется
    uint64_t nextGeneration = 0;
    size_t inFlight = 0;
};

TaskCoordinator::TaskCoordinator(std::string owner, std::shared_ptr<thread::ThreadPool> pool)
    : owner_(std::move(owner)), pool_(std::move(pool)) {
    if (!pool_) {
        throw std::invalid_argument("TaskCoordinator requires a thread pool");
    }
    state_ = std::make_shared<State>(owner_, pool_);
}

TaskCoordinator::~TaskCoordinator() {
    cancelAll();
}

TaskCoordinator::Registration TaskCoordinator::registerTask(const std::string& id) {
    Registration registration;
    std::lock_guard<std::mutex> lock(state_->mutex);
    auto existing = state_->handles.find(id);
    if (existing != state_->handles.end()) {
        existing->second.source.cancel();
        logging::getLogger("taskcoordinator")->debug("[{}] '{}' replaced, previous run canceled", owner_, id);
    }
    State::Handle handle;
    handle.generation = ++state_->nextGeneration;
    registration.generation = handle.generation;
    registration.token = handle.source.token();
    state_->handles[id] = handle;
    ++state_->inFlight;
    return registration;
}

void TaskCoordinator::submit(const std::string& id, uint64_t generation, Job job, Reject reject) {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        auto chain = state_->chains.find(id);
        if (chain != state_->chains.end()) {
            // Предыдущее тело еще не завершилось: ждем его без занятия потока пула
            chain->second.pending.push_back(State::Pending{generation, std::move(job), std::move(reject)});
            return;
        }
        state_->chains.emplace(id, State::Chain{});
    }
    dispatch(state_, id, generation, std::move(job), std::move(reject));
}

void TaskCoordinator::dispatch(const std::shared_ptr<State>& state, const std::string& id,
                               uint64_t generation, Job job, Reject reject) {
    for (;;) {
        std::string why = "thread pool destroyed";
        if (auto pool = state->pool.lock()) {
            try {
                pool->enqueue(std::move(job));
                return;
            } catch (const std::exception& e) {
                why = e.what();
            }
        }
        logging::getLogger("taskcoordinator")->error("[{}] '{}' could not be scheduled: {}", state->owner, id, why);
        finishTask(state, id, generation);
        reject();

        // Отклоненное тело не выполнялось: очередь id переходит к следующему
        std::lock_guard<std::mutex> lock(state->mutex);
        auto chain = state->chains.find(id);
        if (chain == state->chains.end()) {
            return;
        }
        if (chain->second.pending.empty()) {
            state->chains.erase(chain);
            return;
        }
        auto next = std::move(chain->second.pending.front());
        chain->second.pending.pop_front();
        generation = next.generation;
        job = std::move(next.job);
        reject = std::move(next.reject);
    }
}

void TaskCoordinator::runNext(const std::shared_ptr<State>& state, const std::string& id) {
    State::Pending next;
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        auto chain = state->chains.find(id);
        if (chain == state->chains.end()) {
            return;
        }
        if (chain->second.pending.empty()) {
            state->chains.erase(chain);
            return;
        }
        next = std::move(chain->second.pending.front());
        chain->second.pending.pop_front();
    }
    dispatch(state, id, next.generation, std::move(next.job), std::move(next.reject));
}

void TaskCoordinator::finishTask(const std::shared_ptr<State>& state, const std::string& id, uint64_t generation) {
    std::lock_guard<std::mutex> lock(state->mutex);
    auto handle = state->handles.find(id);
    if (handle != state->handles.end() && handle->second.generation == generation) {
        state->handles.erase(handle);
    }
    --state->inFlight;
    if (state->inFlight == 0) {
        state->idle.notify_all();
    }
}

void TaskCoordinator::reportOutcome(const std::shared_ptr<State>& state, const std::string& id,
                                    TaskOutcome outcome, const std::string& message) {
    auto logger = logging::getLogger("taskcoordinator");
    switch (outcome) {
    case TaskOutcome::Completed:
    case TaskOutcome::Canceled:
        logger->debug("[{}] '{}' {}", state->owner, id, toString(outcome));
        break;
    case TaskOutcome::Failed:
        logger->error("[{}] '{}' failed: {}", state->owner, id, message);
        break;
    }
}

void TaskCoordinator::cancel(const std::string& id) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    auto handle = state_->handles.find(id);
    if (handle == state_->handles.end()) {
        return;
    }
    handle->second.source.cancel();
    state_->handles.erase(handle);
    logging::getLogger("taskcoordinator")->debug("[{}] '{}' canceled", owner_, id);
}

void TaskCoordinator::cancelAll() {
    std::lock_guard<std::mutex> lock(state_->mutex);
    for (auto& entry : state_->handles) {
        entry.second.source.cancel();
    }
    if (!state_->handles.empty()) {
        logging::getLogger("taskcoordinator")->debug("[{}] canceled {} task(s)", owner_, state_->handles.size());
    }
    state_->handles.clear();
}

bool TaskCoordinator::isActive(const std::string& id) const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->handles.find(id) != state_->handles.end();
}

size_t TaskCoordinator::activeCount() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->handles.size();
}

void TaskCoordinator::waitForIdle() {
    std::unique_lock<std::mutex> lock(state_->mutex);
    state_->idle.wait(lock, [this] { return state_->inFlight == 0; });
}

} // namespace task
} // namespace core
} // namespace trainsync
