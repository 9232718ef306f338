#include "status/Queries.hpp"
#include "tail/LogLine.hpp"
#include "tail/TailReader.hpp"
#include "util/files.hpp"
#include "util/timestamp.hpp"
#include "log/Registry.hpp"

#include <fstream>

using namespace pw::status;
using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

std::string stripWhitespace(const std::string& s) {
    const auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return {};
    const auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

}

Queries::Queries(Deps deps, config::ProxyConfig proxy, std::shared_ptr<const util::Clock> clock)
    : deps_(deps), proxy_(std::move(proxy)), clock_(std::move(clock)) {}

json Queries::requestCounts(const bool useCache) {
    if (useCache)
        if (auto hit = deps_.cache.get(cache::keys::REQUEST_COUNT_LOGS, REQUEST_COUNT_MAX_AGE)) return *hit;

    json j;
    try {
        j = deps_.tracker.poll();
    } catch (const std::exception& e) {
        log::Registry::tail()->error("[Queries] Request count poll failed: {}", e.what());
        j = tail::PollResult{};
    }

    deps_.cache.set(cache::keys::REQUEST_COUNT_LOGS, j);
    return j;
}

Queries::UsageView Queries::usageView(const bool useCache) {
    UsageView v;
    v.pricing = deps_.settings.pricing();

    if (const auto snapshot = deps_.reconciler.fetchSnapshot(useCache)) v.summary = usage::aggregate(*snapshot);
    v.cost = usage::computeCost(v.summary.tokens, v.pricing);

    const auto& t = v.summary.tokens;
    deps_.counters.observeTokens(t.input, t.output, t.cached);
    deps_.counters.save();
    return v;
}

json Queries::usage(const bool useCache) {
    const auto v = usageView(useCache);
    return {
        {"tokens", v.summary.tokens},
        {"requests", v.summary.requests},
        {"usage_costs", v.cost},
        {"pricing", v.pricing}
    };
}

json Queries::status() {
    const auto counts = requestCounts(true).get<tail::PollResult>();
    const auto v = usageView(true);
    const auto& reqs = v.summary.requests;
    const auto& tokens = v.summary.tokens;

    update::UpdateCheck check;
    try {
        check = deps_.updater.checkForUpdates(true);
    } catch (const std::exception& e) {
        log::Registry::update()->warn("[Queries] Update check failed: {}", e.what());
    }

    json requests = {
        {"count", reqs.total ? reqs.total : counts.count},
        {"last_time", counts.lastTime ? json(*counts.lastTime) : json(nullptr)},
        {"success", reqs.success ? reqs.success : counts.success},
        {"failed", reqs.failure ? reqs.failure : counts.failed},
        {"is_idle", update::IdleGate::isIdleAt(counts.lastTime, clock_->now(), deps_.settings.idleThreshold())},
        {"input_tokens", tokens.input},
        {"output_tokens", tokens.output},
        {"cached_tokens", tokens.cached},
        {"total_tokens", tokens.total}
    };

    const auto verdict = deps_.health.lastVerdict();

    return {
        {"version", check},
        {"requests", requests},
        {"update", deps_.updater.status()},
        {"config", deps_.settings},
        {"pricing", v.pricing},
        {"usage_costs", v.cost},
        {"paths", {
            {"proxy_dir", proxy_.dir.string()},
            {"log_file", proxy_.log_path.string()},
            {"auth_dir", proxy_.auth_dir.string()}
        }},
        {"health", verdict ? json(*verdict) : json("unknown")}
    };
}

json Queries::recentLogs(const long maxLines) const {
    json logs = json::array();

    for (const auto& raw : tail::readTail(proxy_.log_path, maxLines)) {
        const auto line = stripWhitespace(raw);
        if (line.empty()) continue;

        std::string time;
        if (const auto stamp = tail::LineClassifier::extractTimestamp(line))
            time = util::timestampToString(util::parseLogTimestamp(*stamp));
        else
            time = util::nowIso8601(clock_->now());

        logs.push_back({
            {"time", time},
            {"message", util::sanitizeUtf8(std::string_view(line).substr(0, MAX_MESSAGE_BYTES))}
        });
    }

    if (logs.size() > MAX_RETURNED_LOGS)
        logs.erase(logs.begin(), logs.begin() + static_cast<std::ptrdiff_t>(logs.size() - MAX_RETURNED_LOGS));

    return {{"logs", logs}, {"count", logs.size()}};
}

json Queries::requestLogs(const long maxLines, const bool useCache) {
    if (useCache)
        if (auto hit = deps_.cache.get(cache::keys::REQUEST_LOGS, REQUEST_LOGS_MAX_AGE)) return *hit;

    std::vector<tail::RequestRecord> records;
    for (const auto& line : tail::readTail(proxy_.log_path, maxLines))
        if (auto r = tail::parseRequestLine(line)) records.push_back(std::move(*r));

    uint64_t success = 0;
    for (const auto& r : records)
        if (r.status < 400) ++success;

    json logs = json::array();
    const auto first = records.size() > MAX_RETURNED_LOGS ? records.size() - MAX_RETURNED_LOGS : 0;
    for (std::size_t i = first; i < records.size(); ++i) logs.push_back(records[i]);

    json j = {
        {"logs", logs},
        {"count", logs.size()},
        {"stats", {
            {"total", records.size()},
            {"success", success},
            {"failed", records.size() - success}
        }}
    };

    deps_.cache.set(cache::keys::REQUEST_LOGS, j);
    return j;
}

json Queries::recordRequest(const std::string& model, const bool success) {
    deps_.counters.recordRequest(model.empty() ? "unknown" : model, success);
    deps_.counters.save();
    return {{"success", true}};
}

json Queries::stats() const {
    const auto c = deps_.counters.snapshot();

    json recent = json::array();
    const auto first = c.recentRequests.size() > STATS_RECENT_REQUESTS
                           ? c.recentRequests.size() - STATS_RECENT_REQUESTS : 0;
    for (std::size_t i = first; i < c.recentRequests.size(); ++i) recent.push_back(c.recentRequests[i]);

    return {
        {"total_requests", c.totalRequests},
        {"successful_requests", c.successfulRequests},
        {"failed_requests", c.failedRequests},
        {"success_rate", c.successRate()},
        {"model_usage", c.modelUsage},
        {"input_tokens", c.inputTokens},
        {"output_tokens", c.outputTokens},
        {"cached_tokens", c.cachedTokens},
        {"request_log", recent}
    };
}

json Queries::clearStats() {
    deps_.counters.reset();

    const auto& logPath = proxy_.log_path;
    std::string failure;
    try {
        std::error_code ec;
        if (fs::exists(logPath, ec)) {
            auto backup = logPath;
            backup += ".bak";
            fs::copy_file(logPath, backup, fs::copy_options::overwrite_existing);

            std::ofstream truncate(logPath, std::ios::trunc);
            if (!truncate) throw std::runtime_error("cannot truncate " + logPath.string());
        }
    } catch (const std::exception& e) {
        failure = e.what();
        log::Registry::stats()->error("[Queries] Failed to clear proxy log: {}", failure);
    }

    deps_.tracker.reset();
    deps_.cache.invalidate(cache::keys::REQUEST_COUNT_LOGS);
    deps_.cache.invalidate(cache::keys::REQUEST_LOGS);

    if (!failure.empty()) return {{"success", false}, {"message", "Counters cleared, log not cleared: " + failure}};

    log::Registry::stats()->info("[Queries] Statistics cleared");
    return {{"success", true}, {"message", "Statistics cleared"}};
}

json Queries::updateHistory() const {
    return {{"success", true}, {"history", deps_.updater.history()}};
}

json Queries::cacheStats() const {
    return deps_.cache.stats();
}
