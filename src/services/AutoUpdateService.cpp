#include "services/AutoUpdateService.hpp"
#include "update/AutoUpdater.hpp"
#include "config/Settings.hpp"
#include "log/Registry.hpp"

using namespace pw::services;

AutoUpdateService::AutoUpdateService(update::AutoUpdater& updater, const config::Settings& settings)
    : AsyncService("AutoUpdateService"), updater_(updater), settings_(settings) {}

AutoUpdateService::~AutoUpdateService() { stop(); }

void AutoUpdateService::runLoop() {
    while (!shouldStop()) {
        lazySleep(settings_.checkInterval());
        if (shouldStop()) break;
        log::Registry::update()->debug("[AutoUpdateService] Checking for proxy updates...");
        updater_.tick();
    }
}
