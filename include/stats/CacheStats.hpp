#pragma once

#include <atomic>
#include <cstdint>

#include <nlohmann/json_fwd.hpp>

namespace pw::stats {

// 64-byte cache line padding helper to avoid false sharing.
constexpr std::size_t kCacheLine = 64;

template <typename T>
struct alignas(kCacheLine) PaddedAtomic {
    std::atomic<T> v{0};
};

struct CacheStatsSnapshot {
    uint64_t hits{};
    uint64_t misses{};
    uint64_t stale{};
    uint64_t inserts{};
    uint64_t invalidations{};
    uint64_t entries{};
};

struct CacheStats {
    PaddedAtomic<uint64_t> hits;
    PaddedAtomic<uint64_t> misses;
    PaddedAtomic<uint64_t> stale;       // subset of misses: key present but too old
    PaddedAtomic<uint64_t> inserts;
    PaddedAtomic<uint64_t> invalidations;
    PaddedAtomic<uint64_t> entries;

    void record_hit() noexcept;
    void record_miss(bool wasStale = false) noexcept;
    void record_insert() noexcept;
    void record_invalidation(uint64_t count = 1) noexcept;
    void set_entries(uint64_t n) noexcept;

    [[nodiscard]] CacheStatsSnapshot snapshot() const noexcept;

    static double hit_rate(const CacheStatsSnapshot& s) noexcept;
};

void to_json(nlohmann::json& j, const CacheStatsSnapshot& s);

} // namespace pw::stats
