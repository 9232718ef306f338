#include "stats/CacheStats.hpp"

#include <nlohmann/json.hpp>

using namespace pw::stats;

void CacheStats::record_hit() noexcept {
    hits.v.fetch_add(1, std::memory_order_relaxed);
}

void CacheStats::record_miss(const bool wasStale) noexcept {
    misses.v.fetch_add(1, std::memory_order_relaxed);
    if (wasStale) stale.v.fetch_add(1, std::memory_order_relaxed);
}

void CacheStats::record_insert() noexcept {
    inserts.v.fetch_add(1, std::memory_order_relaxed);
}

void CacheStats::record_invalidation(const uint64_t count) noexcept {
    invalidations.v.fetch_add(count, std::memory_order_relaxed);
}

void CacheStats::set_entries(const uint64_t n) noexcept {
    entries.v.store(n, std::memory_order_relaxed);
}

CacheStatsSnapshot CacheStats::snapshot() const noexcept {
    CacheStatsSnapshot s;
    s.hits = hits.v.load(std::memory_order_relaxed);
    s.misses = misses.v.load(std::memory_order_relaxed);
    s.stale = stale.v.load(std::memory_order_relaxed);
    s.inserts = inserts.v.load(std::memory_order_relaxed);
    s.invalidations = invalidations.v.load(std::memory_order_relaxed);
    s.entries = entries.v.load(std::memory_order_relaxed);
    return s;
}

double CacheStats::hit_rate(const CacheStatsSnapshot& s) noexcept {
    const auto denom = s.hits + s.misses;
    return denom ? static_cast<double>(s.hits) / static_cast<double>(denom) : 0.0;
}

void pw::stats::to_json(nlohmann::json& j, const CacheStatsSnapshot& s) {
    j = nlohmann::json{
        {"hits", s.hits},
        {"misses", s.misses},
        {"stale", s.stale},
        {"inserts", s.inserts},
        {"invalidations", s.invalidations},
        {"entries", s.entries},
        {"hit_rate", CacheStats::hit_rate(s)},
    };
}
