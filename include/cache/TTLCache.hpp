#pragma once

#include "stats/CacheStats.hpp"
#include "util/Clock.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace pw::cache {

// Key -> (value, storedAt). Staleness is judged on read only; nothing is expired proactively.
// The lock covers a single map operation and is never held across caller I/O.
template <typename Value>
class TTLCache {
public:
    explicit TTLCache(std::shared_ptr<const util::Clock> clock = std::make_shared<util::SystemClock>())
        : clock_(std::move(clock)) {}

    template <class Rep, class Period>
    [[nodiscard]] std::optional<Value> get(const std::string& key,
                                           const std::chrono::duration<Rep, Period>& maxAge) const {
        const auto now = clock_->now();
        std::scoped_lock lk(mutex_);

        const auto it = entries_.find(key);
        if (it == entries_.end()) {
            stats_.record_miss();
            return std::nullopt;
        }

        if (now - it->second.storedAt >= maxAge) {
            stats_.record_miss(true);
            return std::nullopt;
        }

        stats_.record_hit();
        return it->second.value;
    }

    void set(const std::string& key, Value value) {
        const auto now = clock_->now();
        std::scoped_lock lk(mutex_);
        entries_.insert_or_assign(key, Entry{std::move(value), now});
        stats_.record_insert();
        stats_.set_entries(entries_.size());
    }

    void invalidate(const std::string& key) {
        std::scoped_lock lk(mutex_);
        if (entries_.erase(key)) stats_.record_invalidation();
        stats_.set_entries(entries_.size());
    }

    void invalidateAll() {
        std::scoped_lock lk(mutex_);
        stats_.record_invalidation(entries_.size());
        entries_.clear();
        stats_.set_entries(0);
    }

    [[nodiscard]] stats::CacheStatsSnapshot stats() const noexcept { return stats_.snapshot(); }

private:
    struct Entry {
        Value value;
        util::Clock::time_point storedAt;
    };

    std::shared_ptr<const util::Clock> clock_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
    mutable stats::CacheStats stats_;
};

using JsonCache = TTLCache<nlohmann::json>;

namespace keys {
inline constexpr auto REQUEST_COUNT_LOGS = "request_count_logs";
inline constexpr auto USAGE_SNAPSHOT     = "usage_snapshot";
inline constexpr auto REQUEST_LOGS       = "request_logs";
inline constexpr auto HEALTH_CHECK       = "health_check";
inline constexpr auto UPDATE_CHECK       = "update_check";
inline constexpr auto LATEST_VERSION     = "latest_version";
inline constexpr auto LOCAL_VERSION      = "local_version";
}

}
