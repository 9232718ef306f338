#pragma once

#include "cache/TTLCache.hpp"
#include "config/Config.hpp"
#include "usage/Transport.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace pw::usage {

// Pulls the proxy's usage snapshot from its management API, keeping a disk copy of the
// last good answer for when the proxy is down or restarting.
class Reconciler {
public:
    static constexpr auto CACHE_MAX_AGE = std::chrono::seconds(2);
    static constexpr auto USAGE_ENDPOINT = "/v0/management/usage";
    static constexpr auto IMPORT_ENDPOINT = "/v0/management/usage/import";

    Reconciler(config::ManagementConfig cfg,
               std::filesystem::path snapshotPath,
               cache::JsonCache& cache,
               Transport& transport);

    // Remote snapshot, or the disk copy when the remote is unavailable. Never throws.
    std::optional<nlohmann::json> fetchSnapshot(bool useCache = true);

    bool importSnapshot(const nlohmann::json& snapshot);

    [[nodiscard]] std::optional<nlohmann::json> loadFromDisk() const;
    bool saveToDisk(const nlohmann::json& snapshot) const;

    // Outcome of the most recent remote fetch, for health reporting.
    [[nodiscard]] bool lastFetchOk() const { return lastFetchOk_.load(std::memory_order_acquire); }
    [[nodiscard]] bool attempted() const { return attempted_.load(std::memory_order_acquire); }

    [[nodiscard]] std::string usageUrl() const;
    [[nodiscard]] std::string importUrl() const;

private:
    config::ManagementConfig cfg_;
    std::filesystem::path snapshotPath_;
    cache::JsonCache& cache_;
    Transport& transport_;

    std::atomic<bool> lastFetchOk_{false};
    std::atomic<bool> attempted_{false};

    [[nodiscard]] std::vector<std::string> headers() const;
    std::optional<nlohmann::json> fallback(const std::string& reason);
};

}
