#include "runtime/Manager.hpp"
#include "concurrency/AsyncService.hpp"
#include "health/Monitor.hpp"
#include "log/Registry.hpp"
#include "services/AutoUpdateService.hpp"
#include "services/CounterFlushService.hpp"
#include "services/LogPollService.hpp"
#include "services/UsageRefreshService.hpp"
#include "stats/Counters.hpp"
#include "status/Queries.hpp"
#include "tail/StatsTracker.hpp"
#include "update/AutoUpdater.hpp"
#include "update/IdleGate.hpp"
#include "update/UpdateProcedure.hpp"
#include "update/VersionSource.hpp"
#include "usage/Reconciler.hpp"
#include "usage/Transport.hpp"
#include "util/Clock.hpp"

#include <chrono>
#include <vector>

namespace pw::runtime {

Manager::Manager(config::Config cfg)
    : cfg_(std::move(cfg)),
      clock_(std::make_shared<util::SystemClock>()),
      cache_(clock_),
      settings_(cfg_)
{
    transport_ = std::make_unique<usage::CurlTransport>();

    tracker_ = std::make_unique<tail::StatsTracker>(cfg_.proxy.log_path,
                                                    cfg_.storage.logCursorPath(),
                                                    tail::LineClassifier(cfg_.proxy.excluded_paths),
                                                    clock_);

    counters_ = std::make_unique<stats::CountersStore>(cfg_.storage.countersPath(), clock_);

    reconciler_ = std::make_unique<usage::Reconciler>(cfg_.management, cfg_.storage.usageSnapshotPath(),
                                                      cache_, *transport_);

    localVersion_ = std::make_unique<update::LocalVersionSource>(cfg_.proxy.dir);
    remoteVersion_ = std::make_unique<update::ReleaseVersionSource>(cfg_.auto_update.release_url, *transport_);
    procedure_ = std::make_unique<update::CommandUpdateProcedure>(cfg_.auto_update);

    idle_ = std::make_unique<update::IdleGate>([this] { return tracker_->poll().lastTime; }, settings_, clock_);

    updater_ = std::make_unique<update::AutoUpdater>(*localVersion_, *remoteVersion_, *procedure_, *idle_,
                                                     settings_, cache_, cfg_.storage.updateHistoryPath(), clock_);

    health_ = std::make_unique<health::Monitor>(cfg_, *reconciler_, cache_);

    queries_ = std::make_unique<status::Queries>(
        status::Queries::Deps{*tracker_, *reconciler_, *counters_, *updater_, *idle_, *health_, settings_, cache_},
        cfg_.proxy, clock_);

    services_["CounterFlushService"] = std::make_shared<services::CounterFlushService>(
        *counters_, std::chrono::seconds(cfg_.storage.counters_flush_interval_seconds));
    services_["UsageRefreshService"] = std::make_shared<services::UsageRefreshService>(
        *reconciler_, std::chrono::seconds(cfg_.management.refresh_interval_seconds));
    services_["LogPollService"] = std::make_shared<services::LogPollService>(
        *queries_, *health_, std::chrono::seconds(cfg_.health.poll_interval_seconds));
    services_["AutoUpdateService"] = std::make_shared<services::AutoUpdateService>(*updater_, settings_);
}

Manager::~Manager() {
    if (!stopped_.load()) stopAll();
}

void Manager::restoreState() {
    counters_->load();
    counters_->save(true);

    tracker_->load();
    const auto counts = tracker_->poll();
    tracker_->persist(true);

    log::Registry::proxywatch()->info("[ServiceManager] Restored state: {} logged requests, {} recorded",
                                      counts.count, counters_->snapshot().totalRequests);
}

void Manager::startAll() {
    log::Registry::proxywatch()->debug("[ServiceManager] Starting all services...");
    restoreState();
    {
        std::scoped_lock lock(mutex_);
        for (const auto& [name, svc] : services_) tryStart(name, svc);
    }
    stopped_.store(false);
    log::Registry::proxywatch()->debug("[ServiceManager] All services started.");

    startWatchdog();
}

void Manager::stopAll() {
    log::Registry::proxywatch()->debug("[ServiceManager] Stopping all services...");
    stopWatchdog();
    {
        std::scoped_lock lock(mutex_);
        for (const auto& [name, svc] : services_) stopService(name, svc);
    }

    tracker_->persist(true);
    counters_->save(true);
    stopped_.store(true);

    log::Registry::proxywatch()->debug("[ServiceManager] All services stopped.");
}

void Manager::restartService(const std::string& name) {
    std::scoped_lock lock(mutex_);

    const auto it = services_.find(name);
    if (it == services_.end() || !it->second) return;

    log::Registry::proxywatch()->warn("[ServiceManager] Restarting service: {}", name);
    stopService(name, it->second);
    tryStart(name, it->second);
}

bool Manager::allRunning() const {
    std::scoped_lock lock(mutex_);
    for (const auto& [_, svc] : services_)
        if (!svc || !svc->isRunning()) return false;
    return true;
}

void Manager::tryStart(const std::string& name, const std::shared_ptr<concurrency::AsyncService>& svc) {
    if (!svc) return;
    log::Registry::proxywatch()->debug("[ServiceManager] Starting service: {}", name);
    try {
        svc->start();
    } catch (const std::exception& e) {
        log::Registry::proxywatch()->error("[ServiceManager] Failed to start {}: {}", name, e.what());
    }
}

void Manager::stopService(const std::string& name, const std::shared_ptr<concurrency::AsyncService>& svc) {
    if (!svc || !svc->isRunning()) return;

    log::Registry::proxywatch()->debug("[ServiceManager] Stopping service: {}", name);
    try {
        svc->stop();
    } catch (const std::exception& e) {
        log::Registry::proxywatch()->error("[ServiceManager] Failed to stop {} gracefully: {}", name, e.what());
    }
}

void Manager::startWatchdog() {
    if (watchdogRunning_.exchange(true)) return;
    watchdogThread_ = std::thread([this]() {
        log::Registry::proxywatch()->info("[ServiceManager] Watchdog started.");
        while (watchdogRunning_) {
            std::vector<std::string> down;
            {
                std::scoped_lock lock(mutex_);
                for (const auto& [name, svc] : services_)
                    if (svc && !svc->isRunning()) down.push_back(name);
            }
            for (const auto& name : down) {
                if (!watchdogRunning_) break;
                log::Registry::proxywatch()->warn("[Watchdog] {} is down, restarting...", name);
                restartService(name);
            }
            std::this_thread::sleep_for(WATCHDOG_INTERVAL);
        }
        log::Registry::proxywatch()->info("[ServiceManager] Watchdog stopped.");
    });
}

void Manager::stopWatchdog() {
    if (!watchdogRunning_.exchange(false)) return;
    if (watchdogThread_.joinable()) watchdogThread_.join();
}

}
