#pragma once

#include "config/Config.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <nlohmann/json_fwd.hpp>

namespace pw::config {

// Operator-tunable knobs that may change while the daemon runs.
class Settings {
public:
    static constexpr unsigned int MIN_IDLE_THRESHOLD_SECONDS = 10;
    static constexpr unsigned int MIN_CHECK_INTERVAL_SECONDS = 60;

    explicit Settings(const Config& cfg);

    [[nodiscard]] std::chrono::seconds idleThreshold() const;
    void setIdleThreshold(std::chrono::seconds threshold);

    [[nodiscard]] std::chrono::seconds checkInterval() const;
    void setCheckInterval(std::chrono::seconds interval);

    [[nodiscard]] bool autoUpdateEnabled() const { return autoUpdate_.load(std::memory_order_acquire); }
    void setAutoUpdateEnabled(bool enabled) { autoUpdate_.store(enabled, std::memory_order_release); }

    [[nodiscard]] PricingConfig pricing() const;
    void setPricing(const PricingConfig& pricing);

private:
    std::atomic<long long> idleThresholdSeconds_;
    std::atomic<long long> checkIntervalSeconds_;
    std::atomic<bool> autoUpdate_;

    mutable std::mutex pricingMutex_;
    PricingConfig pricing_;
};

void to_json(nlohmann::json& j, const Settings& s);

}
