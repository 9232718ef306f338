#include "services/UsageRefreshService.hpp"
#include "usage/Reconciler.hpp"
#include "log/Registry.hpp"

using namespace pw::services;

UsageRefreshService::UsageRefreshService(usage::Reconciler& reconciler, const std::chrono::seconds interval)
    : AsyncService("UsageRefreshService"), reconciler_(reconciler), interval_(interval) {}

UsageRefreshService::~UsageRefreshService() { stop(); }

void UsageRefreshService::runLoop() {
    if (!imported_) {
        imported_ = true;
        if (const auto saved = reconciler_.loadFromDisk()) reconciler_.importSnapshot(*saved);
    }

    while (!shouldStop()) {
        log::Registry::usage()->debug("[UsageRefreshService] Refreshing usage snapshot...");
        reconciler_.fetchSnapshot(false);
        lazySleep(interval_);
    }
}
