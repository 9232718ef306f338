#pragma once

#include "cache/TTLCache.hpp"
#include "config/Config.hpp"
#include "config/Settings.hpp"
#include "health/Monitor.hpp"
#include "stats/Counters.hpp"
#include "tail/StatsTracker.hpp"
#include "update/AutoUpdater.hpp"
#include "update/IdleGate.hpp"
#include "usage/Aggregate.hpp"
#include "usage/Reconciler.hpp"
#include "util/Clock.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

namespace pw::status {

// Read side handed to the route handlers. Every method returns a small JSON document and
// degrades to zero values instead of throwing.
class Queries {
public:
    static constexpr auto REQUEST_COUNT_MAX_AGE = std::chrono::seconds(2);
    static constexpr auto REQUEST_LOGS_MAX_AGE = std::chrono::seconds(2);
    static constexpr std::size_t MAX_RETURNED_LOGS = 50;
    static constexpr std::size_t MAX_MESSAGE_BYTES = 500;
    static constexpr std::size_t STATS_RECENT_REQUESTS = 20;

    struct Deps {
        tail::StatsTracker& tracker;
        usage::Reconciler& reconciler;
        stats::CountersStore& counters;
        update::AutoUpdater& updater;
        const update::IdleGate& idle;
        health::Monitor& health;
        const config::Settings& settings;
        cache::JsonCache& cache;
    };

    Queries(Deps deps, config::ProxyConfig proxy,
            std::shared_ptr<const util::Clock> clock = std::make_shared<util::SystemClock>());

    nlohmann::json requestCounts(bool useCache = true);
    nlohmann::json usage(bool useCache = true);
    nlohmann::json status();
    nlohmann::json recentLogs(long maxLines = 100) const;
    nlohmann::json requestLogs(long maxLines = 300, bool useCache = true);
    nlohmann::json recordRequest(const std::string& model, bool success);
    nlohmann::json stats() const;
    nlohmann::json clearStats();
    nlohmann::json updateHistory() const;
    nlohmann::json cacheStats() const;

private:
    Deps deps_;
    config::ProxyConfig proxy_;
    std::shared_ptr<const util::Clock> clock_;

    struct UsageView {
        usage::UsageSummary summary;
        usage::UsageCost cost;
        config::PricingConfig pricing;
    };

    UsageView usageView(bool useCache);
};

}
