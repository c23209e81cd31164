#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

#include "trainsync/core/cache/entities/TrainingPlanCache.hpp"
#include "trainsync/core/cache/entities/WeeklySummaryCache.hpp"
#include "trainsync/core/cache/entities/WorkoutUploadCache.hpp"
#include "trainsync/core/cache/manager/CacheEventBus.hpp"
#include "trainsync/core/config/AppConfig.hpp"
#include "trainsync/core/logging/Logging.hpp"
#include "trainsync/core/plan/PlanSyncController.hpp"
#include "trainsync/core/storage/KeyValueStore.hpp"
#include "trainsync/core/thread/ThreadPool.hpp"

using namespace trainsync::core;

namespace {

// Сетевой транспорт в CLI не подключен: любые запросы к сервису завершаются ошибкой
class OfflinePlanService : public plan::PlanService {
public:
    model::TrainingPlanOverview fetchOverview(const task::CancellationToken&) override {
        throw plan::ServiceError(plan::ErrorKind::Transport, "offline: no plan service transport");
    }
    model::WeeklyPlan fetchPlan(const std::string& planId, const task::CancellationToken&) override {
        throw plan::ServiceError(plan::ErrorKind::Transport, "offline: cannot fetch " + planId);
    }
    void createPlan(int, const task::CancellationToken&) override {
        throw plan::ServiceError(plan::ErrorKind::Transport, "offline: cannot create plan");
    }
};

struct Runtime {
    std::shared_ptr<storage::KeyValueStore> store;
    std::shared_ptr<const time::Clock> clock;
    std::shared_ptr<cache::CacheEventBus> bus;
    std::shared_ptr<cache::TrainingPlanCache> planCache;
    std::shared_ptr<cache::WeeklySummaryCache> summaryCache;
    std::shared_ptr<cache::WorkoutUploadCache> uploadCache;
};

void printUsage() {
    std::cerr << "Usage: trainsync --config <file> <command>\n"
              << "Commands:\n"
              << "  status                                   cache registry status (JSON)\n"
              << "  invalidate <logout|manual|expired|domain:<name>>\n"
              << "  show-plan <week>                         cached weekly plan state (JSON)\n"
              << "  uploads                                  number of uploaded workouts\n";
}

Runtime buildRuntime(const config::AppConfig& appConfig) {
    Runtime rt;
    rt.store = std::make_shared<storage::FileKeyValueStore>(appConfig.cache.storagePath);
    rt.clock = std::make_shared<time::SystemClock>();
    rt.bus = std::make_shared<cache::CacheEventBus>();
    rt.planCache = std::make_shared<cache::TrainingPlanCache>(rt.store, rt.clock, appConfig.cache);
    rt.summaryCache = std::make_shared<cache::WeeklySummaryCache>(rt.store, rt.clock, appConfig.cache);
    rt.uploadCache = std::make_shared<cache::WorkoutUploadCache>(rt.store, rt.clock, appConfig.cache);
    rt.bus->registerCache(rt.planCache);
    rt.bus->registerCache(rt.summaryCache);
    rt.bus->registerCache(rt.uploadCache);
    return rt;
}

std::optional<cache::InvalidationReason> parseReason(const std::string& arg) {
    if (arg == "logout") return cache::InvalidationReason::userLogout();
    if (arg == "manual") return cache::InvalidationReason::manualClear();
    if (arg == "expired") return cache::InvalidationReason::expired();
    const std::string prefix = "domain:";
    if (arg.compare(0, prefix.size(), prefix) == 0) {
        auto domain = cache::dataDomainFromString(arg.substr(prefix.size()));
        if (domain) {
            return cache::InvalidationReason::dataChanged(*domain);
        }
    }
    return std::nullopt;
}

int runShowPlan(const Runtime& rt, const config::AppConfig& appConfig, int week) {
    plan::PlanSyncDependencies deps;
    deps.service = std::make_shared<OfflinePlanService>();
    deps.cache = rt.planCache;
    deps.bus = rt.bus;
    deps.pool = std::make_shared<thread::ThreadPool>(appConfig.threads);
    deps.clock = rt.clock;
    deps.backgroundWork = std::make_shared<plan::NullBackgroundWorkProvider>();

    auto controller = plan::PlanSyncController::create(deps);
    controller->initialize().wait();
    controller->selectWeek(week).wait();

    nlohmann::json out = controller->state().toJson();
    out["selectedWeek"] = controller->selectedWeek();
    out["currentTrainingWeek"] = controller->currentTrainingWeek();
    out["totalWeeks"] = controller->totalWeeks();
    out["availableWeeks"] = controller->availableWeeks();
    if (auto error = controller->lastSyncError()) {
        out["lastSyncError"] = error->toJson();
    }
    controller->shutdown();
    std::cout << out.dump(2) << std::endl;
    return controller->state().status == plan::PlanStatus::Ready ? 0 : 2;
}

} // namespace

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    std::string configPath;
    std::vector<std::string> positional;
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--config" && i + 1 < args.size()) {
            configPath = args[++i];
        } else if (args[i] == "--help" || args[i] == "-h") {
            printUsage();
            return 0;
        } else {
            positional.push_back(args[i]);
        }
    }
    if (configPath.empty() || positional.empty()) {
        printUsage();
        return 1;
    }

    try {
        auto appConfig = config::loadConfig(configPath);
        logging::initializeLogging(appConfig.logging);
        auto log = logging::getLogger("cli");
        log->info("=== trainsync {} ===", positional[0]);

        auto rt = buildRuntime(appConfig);
        const std::string& command = positional[0];
        int rc = 0;
        if (command == "status") {
            std::cout << rt.bus->status().toJson().dump(2) << std::endl;
        } else if (command == "invalidate" && positional.size() == 2) {
            auto reason = parseReason(positional[1]);
            if (!reason) {
                log->error("Unknown invalidation reason '{}'", positional[1]);
                printUsage();
                rc = 1;
            } else {
                auto cleared = rt.bus->invalidate(*reason);
                std::cout << "cleared " << cleared << " cache(s) for " << reason->toString() << std::endl;
            }
        } else if (command == "show-plan" && positional.size() == 2) {
            rc = runShowPlan(rt, appConfig, std::stoi(positional[1]));
        } else if (command == "uploads") {
            std::cout << rt.uploadCache->uploadedCount() << " workout(s) uploaded" << std::endl;
        } else {
            printUsage();
            rc = 1;
        }
        logging::flushAll();
        return rc;
    } catch (const config::ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        logging::flushAll();
        return 1;
    }
}
