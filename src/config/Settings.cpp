#include "config/Settings.hpp"

#include <stdexcept>
#include <nlohmann/json.hpp>

using namespace pw::config;

namespace {

void validatePricing(const PricingConfig& p) {
    if (p.input < 0.0 || p.output < 0.0 || p.cache < 0.0)
        throw std::invalid_argument("Pricing must be non-negative");
}

}

Settings::Settings(const Config& cfg)
    : idleThresholdSeconds_(cfg.idle.threshold_seconds),
      checkIntervalSeconds_(cfg.auto_update.check_interval_seconds),
      autoUpdate_(cfg.auto_update.enabled),
      pricing_(cfg.pricing) {
    if (idleThresholdSeconds_.load() < MIN_IDLE_THRESHOLD_SECONDS) idleThresholdSeconds_ = MIN_IDLE_THRESHOLD_SECONDS;
    if (checkIntervalSeconds_.load() < MIN_CHECK_INTERVAL_SECONDS) checkIntervalSeconds_ = MIN_CHECK_INTERVAL_SECONDS;
    validatePricing(pricing_);
}

std::chrono::seconds Settings::idleThreshold() const {
    return std::chrono::seconds(idleThresholdSeconds_.load(std::memory_order_acquire));
}

void Settings::setIdleThreshold(const std::chrono::seconds threshold) {
    if (threshold.count() < MIN_IDLE_THRESHOLD_SECONDS)
        throw std::invalid_argument("Idle threshold must be an integer >= 10 seconds");
    idleThresholdSeconds_.store(threshold.count(), std::memory_order_release);
}

std::chrono::seconds Settings::checkInterval() const {
    return std::chrono::seconds(checkIntervalSeconds_.load(std::memory_order_acquire));
}

void Settings::setCheckInterval(const std::chrono::seconds interval) {
    if (interval.count() < MIN_CHECK_INTERVAL_SECONDS)
        throw std::invalid_argument("Check interval must be >= 60 seconds");
    checkIntervalSeconds_.store(interval.count(), std::memory_order_release);
}

PricingConfig Settings::pricing() const {
    std::scoped_lock lk(pricingMutex_);
    return pricing_;
}

void Settings::setPricing(const PricingConfig& pricing) {
    validatePricing(pricing);
    std::scoped_lock lk(pricingMutex_);
    pricing_ = pricing;
}

void pw::config::to_json(nlohmann::json& j, const Settings& s) {
    j = {
        {"idle_threshold", s.idleThreshold().count()},
        {"check_interval", s.checkInterval().count()},
        {"auto_update_enabled", s.autoUpdateEnabled()},
        {"pricing", s.pricing()}
    };
}
