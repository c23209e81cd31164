#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include "trainsync/core/task/TaskCoordinator.hpp"

using namespace trainsync::core;
using task::CancellationToken;
using task::TaskCoordinator;

namespace {

std::shared_ptr<thread::ThreadPool> makePool(size_t minThreads = 2, size_t maxThreads = 4, size_t queueSize = 0) {
    thread::ThreadPoolConfig config;
    config.minThreads = minThreads;
    config.maxThreads = maxThreads;
    config.queueSize = queueSize;
    return std::make_shared<thread::ThreadPool>(config);
}

// Крутится до отмены, проверяя токен
int spinUntilCancelled(const CancellationToken& token) {
    for (;;) {
        token.throwIfCancelled();
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
}

void waitFor(const std::atomic<bool>& flag) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!flag.load() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    assert(flag.load());
}

} // namespace

void testCompletedTask() {
    std::cout << "Testing TaskCoordinator completion...\n";
    TaskCoordinator coordinator("test", makePool());
    auto future = coordinator.execute<int>("answer", [](const CancellationToken&) { return 42; });
    auto result = future.get();
    assert(result.has_value() && *result == 42);
    coordinator.waitForIdle();
    assert(!coordinator.isActive("answer"));
    assert(coordinator.activeCount() == 0);
    assert(coordinator.owner() == "test");
    std::cout << "[OK] TaskCoordinator completion\n";
}

void testDeduplicationCancelsPrevious() {
    std::cout << "Testing TaskCoordinator deduplication...\n";
    TaskCoordinator coordinator("test", makePool());
    std::atomic<bool> firstStarted{false};
    std::atomic<int> bodies{0};

    auto first = coordinator.execute<int>("fetch", [&](const CancellationToken& token) {
        firstStarted = true;
        ++bodies;
        return spinUntilCancelled(token);
    });
    waitFor(firstStarted);
    assert(coordinator.isActive("fetch"));

    auto second = coordinator.execute<int>("fetch", [&](const CancellationToken&) {
        ++bodies;
        return 2;
    });
    assert(!first.get().has_value()); // Отменена, без результата
    auto value = second.get();
    assert(value && *value == 2);
    assert(bodies == 2);
    coordinator.waitForIdle();
    assert(coordinator.activeCount() == 0);
    std::cout << "[OK] TaskCoordinator deduplication\n";
}

void testSameIdBodiesNeverOverlap() {
    std::cout << "Testing TaskCoordinator ordering after cancel...\n";
    TaskCoordinator coordinator("test", makePool(4, 4));
    std::atomic<bool> firstRunning{false};
    std::atomic<bool> overlap{false};

    // Первое тело игнорирует токен и работает дольше
    auto first = coordinator.execute<int>("sync", [&](const CancellationToken&) {
        firstRunning = true;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        firstRunning = false;
        return 1;
    });
    waitFor(firstRunning);
    coordinator.cancel("sync");
    assert(!coordinator.isActive("sync"));

    auto second = coordinator.execute<int>("sync", [&](const CancellationToken&) {
        if (firstRunning) {
            overlap = true;
        }
        return 2;
    });
    // Тело завершилось без проверки токена: результат возвращается
    assert(first.get() == 1);
    assert(second.get() == 2);
    assert(!overlap);
    std::cout << "[OK] TaskCoordinator ordering after cancel\n";
}

void testCancelBeforeStartSkipsBody() {
    std::cout << "Testing TaskCoordinator cancel before start...\n";
    TaskCoordinator coordinator("test", makePool(1, 1));
    std::atomic<bool> blockerStarted{false};
    std::atomic<bool> release{false};
    std::atomic<bool> bodyRan{false};

    auto blocker = coordinator.execute<int>("blocker", [&](const CancellationToken&) {
        blockerStarted = true;
        while (!release) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        return 0;
    });
    waitFor(blockerStarted);

    auto queued = coordinator.execute<int>("queued", [&](const CancellationToken&) {
        bodyRan = true;
        return 1;
    });
    coordinator.cancel("queued");
    release = true;

    assert(blocker.get() == 0);
    assert(!queued.get().has_value());
    assert(!bodyRan);
    std::cout << "[OK] TaskCoordinator cancel before start\n";
}

void testFailureIsContained() {
    std::cout << "Testing TaskCoordinator failure handling...\n";
    TaskCoordinator coordinator("test", makePool());
    auto failing = coordinator.execute<int>("broken", [](const CancellationToken&) -> int {
        throw std::runtime_error("service exploded");
    });
    assert(!failing.get().has_value());
    coordinator.waitForIdle();
    assert(!coordinator.isActive("broken"));

    // Координатор продолжает работать после ошибки
    auto next = coordinator.execute<std::string>("broken", [](const CancellationToken&) {
        return std::string("recovered");
    });
    assert(next.get() == std::string("recovered"));
    std::cout << "[OK] TaskCoordinator failure handling\n";
}

void testEmptyIdRejected() {
    std::cout << "Testing TaskCoordinator empty id...\n";
    TaskCoordinator coordinator("test", makePool());
    auto future = coordinator.execute<int>("", [](const CancellationToken&) { return 1; });
    assert(future.wait_for(std::chrono::seconds(0)) == std::future_status::ready);
    assert(!future.get().has_value());
    assert(coordinator.activeCount() == 0);
    std::cout << "[OK] TaskCoordinator empty id\n";
}

void testCancelAllReleasesOwner() {
    std::cout << "Testing TaskCoordinator cancelAll releases closures...\n";
    struct Owner {
        int value = 7;
    };
    auto owner = std::make_shared<Owner>();
    TaskCoordinator coordinator("owner", makePool(3, 3));
    std::atomic<int> started{0};

    std::vector<std::future<std::optional<int>>> futures;
    for (const char* id : {"a", "b", "c"}) {
        futures.push_back(coordinator.execute<int>(id, [owner, &started](const CancellationToken& token) {
            ++started;
            spinUntilCancelled(token);
            return owner->value;
        }));
    }
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (started < 3 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    assert(coordinator.activeCount() == 3);
    assert(owner.use_count() > 1);

    coordinator.cancelAll();
    coordinator.waitForIdle();
    // Ни одно замыкание не удерживает владельца
    assert(owner.use_count() == 1);
    for (auto& future : futures) {
        assert(!future.get().has_value());
    }
    std::cout << "[OK] TaskCoordinator cancelAll releases closures\n";
}

void testDestructorCancelsWithoutWaiting() {
    std::cout << "Testing TaskCoordinator destruction with running tasks...\n";
    auto pool = makePool();
    std::future<std::optional<int>> pending;
    std::atomic<bool> started{false};
    {
        TaskCoordinator coordinator("short-lived", pool);
        pending = coordinator.execute<int>("spin", [&started](const CancellationToken& token) {
            started = true;
            return spinUntilCancelled(token);
        });
        waitFor(started);
    }
    assert(!pending.get().has_value());
    pool->waitForCompletion();
    std::cout << "[OK] TaskCoordinator destruction with running tasks\n";
}

void testQueueFullIsReported() {
    std::cout << "Testing TaskCoordinator with a full pool queue...\n";
    auto pool = makePool(1, 1, 1);
    TaskCoordinator coordinator("test", pool);
    std::atomic<bool> started{false};
    std::atomic<bool> release{false};

    auto running = coordinator.execute<int>("running", [&](const CancellationToken&) {
        started = true;
        while (!release) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        return 1;
    });
    waitFor(started);
    auto queued = coordinator.execute<int>("queued", [](const CancellationToken&) { return 2; });
    auto rejected = coordinator.execute<int>("rejected", [](const CancellationToken&) { return 3; });
    assert(!rejected.get().has_value());
    assert(!coordinator.isActive("rejected"));

    release = true;
    assert(running.get() == 1);
    assert(queued.get() == 2);
    coordinator.waitForIdle();
    std::cout << "[OK] TaskCoordinator with a full pool queue\n";
}

void testBurstKeepsOnlyLastResult() {
    std::cout << "Testing TaskCoordinator burst of executions...\n";
    TaskCoordinator coordinator("test", makePool(4, 4));
    const int kBurst = 5;
    std::atomic<bool> firstStarted{false};
    std::atomic<int> running{0};
    std::atomic<bool> overlap{false};
    std::atomic<int> sideEffects{0};

    std::vector<std::future<std::optional<int>>> futures;
    futures.push_back(coordinator.execute<int>("refresh", [&](const CancellationToken& token) {
        firstStarted = true;
        if (++running > 1) {
            overlap = true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        --running;
        token.throwIfCancelled();
        ++sideEffects;
        return 0;
    }));
    waitFor(firstStarted);
    for (int i = 1; i < kBurst; ++i) {
        futures.push_back(coordinator.execute<int>("refresh", [&, i](const CancellationToken& token) {
            if (++running > 1) {
                overlap = true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            --running;
            token.throwIfCancelled();
            ++sideEffects;
            return i;
        }));
    }

    // Результат только у последнего, побочный эффект ровно один
    for (int i = 0; i < kBurst - 1; ++i) {
        assert(!futures[i].get().has_value());
    }
    assert(futures.back().get() == kBurst - 1);
    assert(sideEffects == 1);
    assert(!overlap);
    coordinator.waitForIdle();
    assert(coordinator.activeCount() == 0);
    std::cout << "[OK] TaskCoordinator burst of executions\n";
}

void testChainedExecutionsDoNotHoldWorkers() {
    std::cout << "Testing TaskCoordinator chained executions and other ids...\n";
    TaskCoordinator coordinator("test", makePool(2, 2));
    std::atomic<bool> firstRunning{false};
    std::atomic<bool> release{false};

    auto first = coordinator.execute<int>("sync", [&](const CancellationToken&) {
        firstRunning = true;
        while (!release) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        return 1;
    });
    waitFor(firstRunning);
    std::vector<std::future<std::optional<int>>> chained;
    for (int i = 0; i < 3; ++i) {
        chained.push_back(coordinator.execute<int>("sync", [i](const CancellationToken&) { return 10 + i; }));
    }

    // Ожидающие тела "sync" не занимают второй поток
    auto week = coordinator.execute<int>("week", [](const CancellationToken&) { return 7; });
    assert(week.wait_for(std::chrono::seconds(5)) == std::future_status::ready);
    assert(week.get() == 7);
    assert(firstRunning);

    release = true;
    assert(first.get() == 1);
    assert(!chained[0].get().has_value());
    assert(!chained[1].get().has_value());
    assert(chained[2].get() == 12);
    std::cout << "[OK] TaskCoordinator chained executions and other ids\n";
}

void testFullQueueKeepsSameIdOrdering() {
    std::cout << "Testing TaskCoordinator ordering with a full pool queue...\n";
    auto pool = makePool(2, 2, 1);
    TaskCoordinator coordinator("test", pool);
    std::atomic<bool> firstRunning{false};
    std::atomic<bool> releaseFirst{false};
    std::atomic<bool> otherStarted{false};
    std::atomic<bool> releaseOther{false};
    std::atomic<bool> thirdRan{false};
    std::atomic<bool> overlap{false};

    auto first = coordinator.execute<int>("sync", [&](const CancellationToken&) {
        firstRunning = true;
        while (!releaseFirst) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        firstRunning = false;
        return 1;
    });
    waitFor(firstRunning);
    auto other = coordinator.execute<int>("other", [&](const CancellationToken&) {
        otherStarted = true;
        while (!releaseOther) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        return 0;
    });
    waitFor(otherStarted);
    auto filler = coordinator.execute<int>("filler", [](const CancellationToken&) { return 0; });
    auto rejected = coordinator.execute<int>("rejected", [](const CancellationToken&) { return 0; });
    assert(!rejected.get().has_value());

    auto second = coordinator.execute<int>("sync", [](const CancellationToken&) { return 2; });
    releaseOther = true;
    assert(other.get() == 0);
    assert(filler.get() == 0);

    auto third = coordinator.execute<int>("sync", [&](const CancellationToken&) {
        if (firstRunning) {
            overlap = true;
        }
        thirdRan = true;
        return 3;
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    assert(!thirdRan); // Первое тело "sync" еще выполняется

    releaseFirst = true;
    assert(first.get() == 1);
    assert(!second.get().has_value());
    assert(third.get() == 3);
    assert(!overlap);
    coordinator.waitForIdle();
    std::cout << "[OK] TaskCoordinator ordering with a full pool queue\n";
}

void testSuccessorRejectedByFullQueue() {
    std::cout << "Testing TaskCoordinator successor rejected by a full queue...\n";
    auto pool = makePool(1, 1, 1);
    TaskCoordinator coordinator("test", pool);
    std::atomic<bool> started{false};
    std::atomic<bool> release{false};

    auto first = coordinator.execute<int>("sync", [&](const CancellationToken&) {
        started = true;
        while (!release) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        return 1;
    });
    waitFor(started);
    auto second = coordinator.execute<int>("sync", [](const CancellationToken&) { return 2; });
    auto filler = coordinator.execute<int>("filler", [](const CancellationToken&) { return 0; });

    // Когда первое тело завершается, очередь пула занята: преемник отклоняется
    release = true;
    assert(first.get() == 1);
    assert(!second.get().has_value());
    assert(filler.get() == 0);
    coordinator.waitForIdle();
    assert(coordinator.activeCount() == 0);

    auto again = coordinator.execute<int>("sync", [](const CancellationToken&) { return 3; });
    assert(again.get() == 3);
    std::cout << "[OK] TaskCoordinator successor rejected by a full queue\n";
}

int main() {
    try {
        testCompletedTask();
        testDeduplicationCancelsPrevious();
        testSameIdBodiesNeverOverlap();
        testCancelBeforeStartSkipsBody();
        testFailureIsContained();
        testEmptyIdRejected();
        testCancelAllReleasesOwner();
        testDestructorCancelsWithoutWaiting();
        testQueueFullIsReported();
        testBurstKeepsOnlyLastResult();
        testChainedExecutionsDoNotHoldWorkers();
        testFullQueueKeepsSameIdOrdering();
        testSuccessorRejectedByFullQueue();
        std::cout << "All TaskCoordinator tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "TaskCoordinator test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
