#include "update/AutoUpdater.hpp"
#include "util/files.hpp"
#include "util/timestamp.hpp"
#include "log/Registry.hpp"

#include <cmath>

using namespace pw::update;
using json = nlohmann::json;

namespace {

// Clears the in-progress flag however perform() exits.
struct InProgressGuard {
    std::atomic<bool>& flag;
    ~InProgressGuard() { flag.store(false, std::memory_order_release); }
};

}

AutoUpdater::AutoUpdater(VersionSource& local, VersionSource& remote, UpdateProcedure& procedure,
                         const IdleGate& idle, const config::Settings& settings, cache::JsonCache& cache,
                         std::filesystem::path historyPath, std::shared_ptr<const util::Clock> clock)
    : local_(local),
      remote_(remote),
      procedure_(procedure),
      idle_(idle),
      settings_(settings),
      cache_(cache),
      historyPath_(std::move(historyPath)),
      clock_(std::move(clock)) {}

std::optional<std::string> AutoUpdater::cachedVersion(VersionSource& src, const char* key,
                                                      const std::chrono::seconds maxAge) {
    if (const auto hit = cache_.get(key, maxAge); hit && hit->is_string()) return hit->get<std::string>();

    auto v = src.version();
    if (v) cache_.set(key, *v);
    return v;
}

UpdateCheck AutoUpdater::checkForUpdates(const bool useCache) {
    if (useCache)
        if (const auto hit = cache_.get(cache::keys::UPDATE_CHECK, UPDATE_CHECK_MAX_AGE); hit && hit->is_object())
            return hit->get<UpdateCheck>();

    UpdateCheck c;
    c.current = cachedVersion(local_, cache::keys::LOCAL_VERSION, LOCAL_VERSION_MAX_AGE);
    c.latest = cachedVersion(remote_, cache::keys::LATEST_VERSION, LATEST_VERSION_MAX_AGE);
    c.available = c.current && c.latest && *c.current != *c.latest;

    {
        std::scoped_lock lk(stateMutex_);
        lastCheck_ = c;
    }
    cache_.set(cache::keys::UPDATE_CHECK, json(c));
    return c;
}

bool AutoUpdater::tick() {
    if (!settings_.autoUpdateEnabled() || inProgress()) return false;

    try {
        const auto check = checkForUpdates();
        if (!check.available) return false;

        if (!idle_.isIdle()) {
            log::Registry::update()->debug("[AutoUpdater] Update {} pending, proxy busy", *check.latest);
            return false;
        }

        log::Registry::update()->info("[AutoUpdater] Update {} -> {} detected and proxy idle, updating",
                                      *check.current, *check.latest);
        return perform().has_value();
    } catch (const std::exception& e) {
        log::Registry::update()->error("[AutoUpdater] Auto-update pass failed: {}", e.what());
        return false;
    }
}

UpdateOutcome AutoUpdater::requestUpdate(const bool force) {
    if (!force && !idle_.isIdle()) {
        UpdateOutcome refused;
        refused.message = "Proxy has active requests; wait for idle or force the update";
        refused.finishedAt = util::nowIso8601(clock_->now());
        return refused;
    }

    if (auto outcome = perform()) return *outcome;

    UpdateOutcome busy;
    busy.message = "Update already in progress";
    busy.finishedAt = util::nowIso8601(clock_->now());
    return busy;
}

std::optional<UpdateOutcome> AutoUpdater::perform() {
    if (inProgress_.exchange(true, std::memory_order_acq_rel)) return std::nullopt;
    InProgressGuard guard{inProgress_};

    UpdateOutcome outcome;
    try {
        outcome = procedure_.run();
    } catch (const std::exception& e) {
        outcome.success = false;
        outcome.message = std::string("Update error: ") + e.what();
        outcome.finishedAt = util::nowIso8601(clock_->now());
    }

    if (outcome.success) {
        cache_.invalidate(cache::keys::LOCAL_VERSION);
        cache_.invalidate(cache::keys::LATEST_VERSION);
        cache_.invalidate(cache::keys::UPDATE_CHECK);

        const auto version = local_.version();
        recordHistory(version.value_or("unknown"), true);
        log::Registry::update()->info("[AutoUpdater] Update finished, now at {}", version.value_or("unknown"));
    } else {
        log::Registry::update()->error("[AutoUpdater] Update failed: {}", outcome.message);
    }

    std::scoped_lock lk(stateMutex_);
    lastResult_ = outcome;
    return outcome;
}

std::optional<UpdateOutcome> AutoUpdater::lastResult() const {
    std::scoped_lock lk(stateMutex_);
    return lastResult_;
}

json AutoUpdater::readHistory() const {
    std::error_code ec;
    if (!std::filesystem::exists(historyPath_, ec)) return json::array();

    try {
        auto j = json::parse(util::readFileToString(historyPath_), nullptr, false);
        if (j.is_discarded() || !j.is_array()) return json::array();
        return j;
    } catch (const std::exception& e) {
        log::Registry::update()->warn("[AutoUpdater] Failed to read {}: {}", historyPath_.string(), e.what());
        return json::array();
    }
}

bool AutoUpdater::recordHistory(const std::string& version, const bool success) const {
    auto entries = readHistory();
    entries.push_back({
        {"version", version},
        {"time", util::toLogTimestamp(std::chrono::system_clock::to_time_t(clock_->now()))},
        {"success", success}
    });

    if (entries.size() > MAX_HISTORY)
        entries.erase(entries.begin(), entries.begin() + static_cast<std::ptrdiff_t>(entries.size() - MAX_HISTORY));

    try {
        util::writeFileAtomic(historyPath_, entries.dump(2, ' ', false, json::error_handler_t::replace));
        return true;
    } catch (const std::exception& e) {
        log::Registry::update()->warn("[AutoUpdater] Failed to record update history: {}", e.what());
        return false;
    }
}

json AutoUpdater::history() const {
    auto entries = readHistory();
    const auto now = clock_->now();

    json out = json::array();
    const auto first = entries.size() > HISTORY_PAGE ? entries.size() - HISTORY_PAGE : 0;
    for (std::size_t i = first; i < entries.size(); ++i) {
        auto entry = entries[i];
        if (!entry.is_object()) continue;

        entry["hours_ago"] = nullptr;
        if (const auto it = entry.find("time"); it != entry.end() && it->is_string())
            if (const auto ts = util::tryParseLogTimestamp(it->get<std::string>())) {
                const auto secs = std::chrono::duration<double>(now - std::chrono::system_clock::from_time_t(*ts)).count();
                entry["hours_ago"] = std::round(secs / 3600.0 * 10.0) / 10.0;
            }
        out.push_back(std::move(entry));
    }
    return out;
}

json AutoUpdater::status() const {
    std::scoped_lock lk(stateMutex_);
    json j = {
        {"auto_update_enabled", settings_.autoUpdateEnabled()},
        {"update_in_progress", inProgress()},
        {"check", lastCheck_},
        {"last_result", nullptr}
    };
    if (lastResult_) j["last_result"] = *lastResult_;
    return j;
}

namespace pw::update {

void to_json(json& j, const UpdateCheck& c) {
    j = {
        {"has_update", c.available},
        {"current_version", c.current ? json(*c.current) : json(nullptr)},
        {"latest_version", c.latest ? json(*c.latest) : json(nullptr)}
    };
}

void from_json(const json& j, UpdateCheck& c) {
    c.available = j.value("has_update", false);
    c.current.reset();
    c.latest.reset();
    if (const auto it = j.find("current_version"); it != j.end() && it->is_string()) c.current = it->get<std::string>();
    if (const auto it = j.find("latest_version"); it != j.end() && it->is_string()) c.latest = it->get<std::string>();
}

}
