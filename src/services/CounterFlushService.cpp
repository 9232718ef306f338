#include "services/CounterFlushService.hpp"
#include "stats/Counters.hpp"
#include "log/Registry.hpp"

#include <algorithm>

using namespace pw::services;

CounterFlushService::CounterFlushService(stats::CountersStore& counters, const std::chrono::seconds interval)
    : AsyncService("CounterFlushService"),
      counters_(counters),
      interval_(std::max(interval, stats::CountersStore::SAVE_INTERVAL)) {}

CounterFlushService::~CounterFlushService() { stop(); }

void CounterFlushService::runLoop() {
    while (!shouldStop()) {
        lazySleep(interval_);
        if (shouldStop()) break;
        log::Registry::stats()->debug("[CounterFlushService] Flushing counters...");
        counters_.save();
    }
}
