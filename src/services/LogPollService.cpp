#include "services/LogPollService.hpp"
#include "status/Queries.hpp"
#include "health/Monitor.hpp"
#include "log/Registry.hpp"

using namespace pw::services;

LogPollService::LogPollService(status::Queries& queries, health::Monitor& health, const std::chrono::seconds interval)
    : AsyncService("LogPollService"), queries_(queries), health_(health), interval_(interval) {}

LogPollService::~LogPollService() { stop(); }

void LogPollService::runLoop() {
    while (!shouldStop()) {
        try {
            health_.check(false);
            queries_.requestCounts(false);
        } catch (const std::exception& e) {
            log::Registry::health()->error("[LogPollService] Background poll failed: {}", e.what());
        }
        lazySleep(interval_);
    }
}
