#pragma once

#include "cache/TTLCache.hpp"
#include "config/Settings.hpp"
#include "update/IdleGate.hpp"
#include "update/UpdateProcedure.hpp"
#include "update/VersionSource.hpp"
#include "util/Clock.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace pw::update {

struct UpdateCheck {
    bool available = false;
    std::optional<std::string> current;
    std::optional<std::string> latest;
};

void to_json(nlohmann::json& j, const UpdateCheck& c);
void from_json(const nlohmann::json& j, UpdateCheck& c);

class AutoUpdater {
public:
    static constexpr auto UPDATE_CHECK_MAX_AGE = std::chrono::seconds(60);
    static constexpr auto LATEST_VERSION_MAX_AGE = std::chrono::seconds(300);
    static constexpr auto LOCAL_VERSION_MAX_AGE = std::chrono::seconds(30);
    static constexpr std::size_t MAX_HISTORY = 50;
    static constexpr std::size_t HISTORY_PAGE = 10;

    AutoUpdater(VersionSource& local,
                VersionSource& remote,
                UpdateProcedure& procedure,
                const IdleGate& idle,
                const config::Settings& settings,
                cache::JsonCache& cache,
                std::filesystem::path historyPath,
                std::shared_ptr<const util::Clock> clock = std::make_shared<util::SystemClock>());

    // Available only when both versions are known and differ.
    UpdateCheck checkForUpdates(bool useCache = true);

    // One pass of the periodic duty. Returns true when an update ran.
    bool tick();

    // Operator-triggered update. Refused while requests are flowing unless forced.
    UpdateOutcome requestUpdate(bool force = false);

    [[nodiscard]] bool inProgress() const { return inProgress_.load(std::memory_order_acquire); }
    [[nodiscard]] std::optional<UpdateOutcome> lastResult() const;

    // Most recent entries of the history file, each annotated with hours_ago.
    [[nodiscard]] nlohmann::json history() const;

    [[nodiscard]] nlohmann::json status() const;

private:
    VersionSource& local_;
    VersionSource& remote_;
    UpdateProcedure& procedure_;
    const IdleGate& idle_;
    const config::Settings& settings_;
    cache::JsonCache& cache_;
    std::filesystem::path historyPath_;
    std::shared_ptr<const util::Clock> clock_;

    std::atomic<bool> inProgress_{false};

    mutable std::mutex stateMutex_;
    std::optional<UpdateOutcome> lastResult_;
    UpdateCheck lastCheck_;

    std::optional<std::string> cachedVersion(VersionSource& src, const char* key, std::chrono::seconds maxAge);

    // nullopt when another update already holds the in-progress flag.
    std::optional<UpdateOutcome> perform();

    bool recordHistory(const std::string& version, bool success) const;
    [[nodiscard]] nlohmann::json readHistory() const;
};

}
