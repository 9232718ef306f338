#include "stats/Counters.hpp"
#include "util/files.hpp"
#include "util/timestamp.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <nlohmann/json.hpp>

using namespace pw::stats;
using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

uint64_t countField(const json& j, const char* key) {
    const auto it = j.find(key);
    if (it == j.end()) return 0;
    if (it->is_number_unsigned()) return it->get<uint64_t>();
    if (it->is_number_integer()) return static_cast<uint64_t>(std::max<int64_t>(0, it->get<int64_t>()));
    if (it->is_number_float()) return static_cast<uint64_t>(std::max(0.0, it->get<double>()));
    return 0;
}

}

double CumulativeCounters::successRate() const {
    if (totalRequests == 0) return 0.0;
    return static_cast<double>(successfulRequests) / static_cast<double>(totalRequests) * 100.0;
}

CountersStore::CountersStore(fs::path path, std::shared_ptr<const util::Clock> clock)
    : path_(std::move(path)), clock_(std::move(clock)) {}

bool CountersStore::load() {
    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        log::Registry::stats()->info("[Counters] No saved counters at {}, starting from zero", path_.string());
        return false;
    }

    try {
        const auto j = json::parse(util::readFileToString(path_), nullptr, false);
        if (j.is_discarded() || !j.is_object()) {
            log::Registry::stats()->warn("[Counters] Ignoring malformed counters file {}", path_.string());
            return false;
        }
        auto loaded = j.get<CumulativeCounters>();
        std::scoped_lock lk(countersMutex_);
        counters_ = std::move(loaded);
    } catch (const std::exception& e) {
        log::Registry::stats()->warn("[Counters] Failed to load {}: {}", path_.string(), e.what());
        return false;
    }

    log::Registry::stats()->info("[Counters] Restored counters from {}", path_.string());
    return true;
}

bool CountersStore::save(const bool force) {
    std::scoped_lock writer(writerMutex_);

    const auto now = clock_->now();
    if (!force && lastSavedAt_ && now - *lastSavedAt_ < SAVE_INTERVAL) return false;

    CumulativeCounters copy;
    {
        std::scoped_lock lk(countersMutex_);
        counters_.savedAt = util::nowIso8601(now);
        copy = counters_;
    }

    try {
        const json j = copy;
        util::writeFileAtomic(path_, j.dump(2, ' ', false, json::error_handler_t::replace));
    } catch (const std::exception& e) {
        log::Registry::stats()->warn("[Counters] Failed to save {}: {}", path_.string(), e.what());
        return false;
    }

    lastSavedAt_ = now;
    return true;
}

void CountersStore::recordRequest(const std::string& model, const bool success) {
    std::scoped_lock lk(countersMutex_);
    ++counters_.totalRequests;
    if (success) ++counters_.successfulRequests;
    else ++counters_.failedRequests;

    if (!model.empty()) ++counters_.modelUsage[model];

    counters_.recentRequests.push_back({util::nowIso8601(clock_->now()), model, success});
    while (counters_.recentRequests.size() > MAX_RECENT_REQUESTS) counters_.recentRequests.pop_front();
}

void CountersStore::observeTokens(const uint64_t input, const uint64_t output, const uint64_t cached) {
    std::scoped_lock lk(countersMutex_);
    counters_.inputTokens = std::max(counters_.inputTokens, input);
    counters_.outputTokens = std::max(counters_.outputTokens, output);
    counters_.cachedTokens = std::max(counters_.cachedTokens, cached);
}

void CountersStore::reset() {
    {
        std::scoped_lock lk(countersMutex_);
        counters_ = CumulativeCounters{};
    }
    save(true);
    log::Registry::stats()->info("[Counters] Counters reset");
}

CumulativeCounters CountersStore::snapshot() const {
    std::scoped_lock lk(countersMutex_);
    return counters_;
}

namespace pw::stats {

void to_json(json& j, const RecentRequest& r) {
    j = {
        {"time", r.time},
        {"model", r.model},
        {"success", r.success}
    };
}

void from_json(const json& j, RecentRequest& r) {
    r.time = j.value("time", std::string{});
    r.model = j.value("model", std::string{});
    r.success = j.value("success", false);
}

void to_json(json& j, const CumulativeCounters& c) {
    j = {
        {"total_requests", c.totalRequests},
        {"successful_requests", c.successfulRequests},
        {"failed_requests", c.failedRequests},
        {"total_input_tokens", c.inputTokens},
        {"total_output_tokens", c.outputTokens},
        {"total_cached_tokens", c.cachedTokens},
        {"model_usage", c.modelUsage},
        {"recent_requests", c.recentRequests}
    };
    if (c.savedAt) j["saved_at"] = *c.savedAt;
    else j["saved_at"] = nullptr;
}

void from_json(const json& j, CumulativeCounters& c) {
    c.totalRequests = countField(j, "total_requests");
    c.successfulRequests = countField(j, "successful_requests");
    c.failedRequests = countField(j, "failed_requests");
    c.inputTokens = countField(j, "total_input_tokens");
    c.outputTokens = countField(j, "total_output_tokens");
    c.cachedTokens = countField(j, "total_cached_tokens");

    c.modelUsage.clear();
    if (const auto it = j.find("model_usage"); it != j.end() && it->is_object())
        for (const auto& [model, _] : it->items()) c.modelUsage[model] = countField(*it, model.c_str());

    c.recentRequests.clear();
    if (const auto it = j.find("recent_requests"); it != j.end() && it->is_array())
        for (const auto& r : *it)
            if (r.is_object()) c.recentRequests.push_back(r.get<RecentRequest>());
    while (c.recentRequests.size() > CountersStore::MAX_RECENT_REQUESTS) c.recentRequests.pop_front();

    if (const auto it = j.find("saved_at"); it != j.end() && it->is_string()) c.savedAt = it->get<std::string>();
    else c.savedAt.reset();
}

}
