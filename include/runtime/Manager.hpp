#pragma once

#include "cache/TTLCache.hpp"
#include "config/Config.hpp"
#include "config/Settings.hpp"

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace pw::concurrency { class AsyncService; }
namespace pw::tail { class StatsTracker; }
namespace pw::stats { class CountersStore; }
namespace pw::usage { class Transport; class Reconciler; }
namespace pw::update { class VersionSource; class UpdateProcedure; class IdleGate; class AutoUpdater; }
namespace pw::health { class Monitor; }
namespace pw::status { class Queries; }
namespace pw::util { class Clock; }

namespace pw::runtime {

// Owns one of every component and the background services that drive them.
class Manager {
public:
    static constexpr auto WATCHDOG_INTERVAL = std::chrono::seconds(2);

    explicit Manager(config::Config cfg);
    ~Manager();

    Manager(const Manager&) = delete;
    Manager& operator=(const Manager&) = delete;

    // Restores persisted state, then starts every service and the watchdog.
    void startAll();

    // Stops services and performs the final forced saves.
    void stopAll();

    void restartService(const std::string& name);

    [[nodiscard]] bool allRunning() const;

    [[nodiscard]] status::Queries& queries() { return *queries_; }
    [[nodiscard]] config::Settings& settings() { return settings_; }
    [[nodiscard]] update::AutoUpdater& updater() { return *updater_; }

private:
    config::Config cfg_;
    std::shared_ptr<const util::Clock> clock_;
    cache::JsonCache cache_;
    config::Settings settings_;

    std::unique_ptr<usage::Transport> transport_;
    std::unique_ptr<tail::StatsTracker> tracker_;
    std::unique_ptr<stats::CountersStore> counters_;
    std::unique_ptr<usage::Reconciler> reconciler_;
    std::unique_ptr<update::VersionSource> localVersion_;
    std::unique_ptr<update::VersionSource> remoteVersion_;
    std::unique_ptr<update::UpdateProcedure> procedure_;
    std::unique_ptr<update::IdleGate> idle_;
    std::unique_ptr<update::AutoUpdater> updater_;
    std::unique_ptr<health::Monitor> health_;
    std::unique_ptr<status::Queries> queries_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<concurrency::AsyncService>> services_;

    std::thread watchdogThread_;
    std::atomic<bool> watchdogRunning_{false};
    std::atomic<bool> stopped_{true};

    void restoreState();

    void tryStart(const std::string& name, const std::shared_ptr<concurrency::AsyncService>& svc);
    static void stopService(const std::string& name, const std::shared_ptr<concurrency::AsyncService>& svc);

    void startWatchdog();
    void stopWatchdog();
};

}
