#include "usage/Reconciler.hpp"
#include "util/files.hpp"
#include "log/Registry.hpp"

using namespace pw::usage;
using json = nlohmann::json;

Reconciler::Reconciler(config::ManagementConfig cfg, std::filesystem::path snapshotPath,
                       cache::JsonCache& cache, Transport& transport)
    : cfg_(std::move(cfg)),
      snapshotPath_(std::move(snapshotPath)),
      cache_(cache),
      transport_(transport) {}

std::string Reconciler::usageUrl() const { return cfg_.baseUrl() + USAGE_ENDPOINT; }

std::string Reconciler::importUrl() const { return cfg_.baseUrl() + IMPORT_ENDPOINT; }

std::vector<std::string> Reconciler::headers() const {
    std::vector<std::string> h{"Content-Type: application/json"};
    if (!cfg_.secret.empty()) h.push_back("X-Management-Key: " + cfg_.secret);
    return h;
}

std::optional<json> Reconciler::fetchSnapshot(const bool useCache) {
    if (useCache)
        if (auto cached = cache_.get(cache::keys::USAGE_SNAPSHOT, CACHE_MAX_AGE)) return cached;

    attempted_.store(true, std::memory_order_release);

    util::HttpResponse res;
    try {
        res = transport_.get(usageUrl(), headers(), std::chrono::seconds(cfg_.fetch_timeout_seconds));
    } catch (const std::exception& e) {
        return fallback(e.what());
    }

    if (!res.ok()) return fallback(res.error());

    auto snapshot = json::parse(res.body, nullptr, false);
    if (snapshot.is_discarded() || !snapshot.is_object()) return fallback("malformed usage body");

    lastFetchOk_.store(true, std::memory_order_release);
    cache_.set(cache::keys::USAGE_SNAPSHOT, snapshot);
    saveToDisk(snapshot);
    return snapshot;
}

std::optional<json> Reconciler::fallback(const std::string& reason) {
    lastFetchOk_.store(false, std::memory_order_release);
    log::Registry::usage()->warn("[UsageReconciler] Fetch from {} failed ({}), using disk copy", usageUrl(), reason);

    auto snapshot = loadFromDisk();
    if (snapshot) cache_.set(cache::keys::USAGE_SNAPSHOT, *snapshot);
    return snapshot;
}

bool Reconciler::importSnapshot(const json& snapshot) {
    if (!snapshot.is_object() || snapshot.empty()) return false;

    try {
        const auto res = transport_.post(importUrl(),
                                         snapshot.dump(-1, ' ', false, json::error_handler_t::replace),
                                         headers(),
                                         std::chrono::seconds(cfg_.import_timeout_seconds));
        if (!res.ok()) {
            log::Registry::usage()->warn("[UsageReconciler] Usage import failed: {}", res.error());
            return false;
        }
    } catch (const std::exception& e) {
        log::Registry::usage()->warn("[UsageReconciler] Usage import failed: {}", e.what());
        return false;
    }

    log::Registry::usage()->info("[UsageReconciler] Re-seeded proxy usage from saved snapshot");
    return true;
}

std::optional<json> Reconciler::loadFromDisk() const {
    std::error_code ec;
    if (!std::filesystem::exists(snapshotPath_, ec)) return std::nullopt;

    try {
        auto j = json::parse(util::readFileToString(snapshotPath_), nullptr, false);
        if (j.is_discarded() || !j.is_object()) {
            log::Registry::usage()->warn("[UsageReconciler] Ignoring malformed snapshot {}", snapshotPath_.string());
            return std::nullopt;
        }
        return j;
    } catch (const std::exception& e) {
        log::Registry::usage()->warn("[UsageReconciler] Failed to read {}: {}", snapshotPath_.string(), e.what());
        return std::nullopt;
    }
}

bool Reconciler::saveToDisk(const json& snapshot) const {
    try {
        util::writeFileAtomic(snapshotPath_, snapshot.dump(2, ' ', false, json::error_handler_t::replace));
        return true;
    } catch (const std::exception& e) {
        log::Registry::usage()->warn("[UsageReconciler] Failed to save {}: {}", snapshotPath_.string(), e.what());
        return false;
    }
}
