#pragma once

#include "config/Settings.hpp"
#include "util/Clock.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace pw::update {

// Decides whether the proxy is quiet enough to be restarted.
class IdleGate {
public:
    using LastRequestFn = std::function<std::optional<std::string>()>;

    IdleGate(LastRequestFn lastRequestAt,
             const config::Settings& settings,
             std::shared_ptr<const util::Clock> clock = std::make_shared<util::SystemClock>());

    [[nodiscard]] bool isIdle() const;

    [[nodiscard]] std::optional<std::chrono::seconds> idleFor() const;

    // Idle when nothing was ever seen, when the stamp is unreadable, or when it is older than threshold.
    [[nodiscard]] static bool isIdleAt(const std::optional<std::string>& lastRequestAt,
                                       util::Clock::time_point now,
                                       std::chrono::seconds threshold);

private:
    LastRequestFn lastRequestAt_;
    const config::Settings& settings_;
    std::shared_ptr<const util::Clock> clock_;
};

}
