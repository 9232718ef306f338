#pragma once

#include "util/Clock.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace pw::stats {

struct RecentRequest {
    std::string time;
    std::string model;
    bool success = false;
};

// Process-wide request and token totals. Only grows, except through CountersStore::reset().
struct CumulativeCounters {
    uint64_t totalRequests = 0;
    uint64_t successfulRequests = 0;
    uint64_t failedRequests = 0;
    uint64_t inputTokens = 0;
    uint64_t outputTokens = 0;
    uint64_t cachedTokens = 0;
    std::map<std::string, uint64_t> modelUsage;
    std::deque<RecentRequest> recentRequests;
    std::optional<std::string> savedAt;

    [[nodiscard]] double successRate() const;
};

class CountersStore {
public:
    static constexpr auto SAVE_INTERVAL = std::chrono::seconds(10);
    static constexpr std::size_t MAX_RECENT_REQUESTS = 100;

    explicit CountersStore(std::filesystem::path path,
                           std::shared_ptr<const util::Clock> clock = std::make_shared<util::SystemClock>());

    // Missing file starts from zero; a malformed one is logged and ignored.
    bool load();

    // Rate limited to one write per SAVE_INTERVAL unless forced.
    bool save(bool force = false);

    void recordRequest(const std::string& model, bool success);

    // Raises token totals to the observed values. Lower observations are ignored.
    void observeTokens(uint64_t input, uint64_t output, uint64_t cached);

    void reset();

    [[nodiscard]] CumulativeCounters snapshot() const;
    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    std::shared_ptr<const util::Clock> clock_;

    mutable std::mutex countersMutex_;
    CumulativeCounters counters_;

    std::mutex writerMutex_;
    std::optional<util::Clock::time_point> lastSavedAt_;
};

void to_json(nlohmann::json& j, const RecentRequest& r);
void from_json(const nlohmann::json& j, RecentRequest& r);

void to_json(nlohmann::json& j, const CumulativeCounters& c);
void from_json(const nlohmann::json& j, CumulativeCounters& c);

}
