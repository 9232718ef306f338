#include "update/IdleGate.hpp"
#include "util/timestamp.hpp"

using namespace pw::update;
using namespace std::chrono;

IdleGate::IdleGate(LastRequestFn lastRequestAt, const config::Settings& settings,
                   std::shared_ptr<const util::Clock> clock)
    : lastRequestAt_(std::move(lastRequestAt)), settings_(settings), clock_(std::move(clock)) {}

bool IdleGate::isIdle() const {
    return isIdleAt(lastRequestAt_(), clock_->now(), settings_.idleThreshold());
}

std::optional<seconds> IdleGate::idleFor() const {
    const auto last = lastRequestAt_();
    if (!last) return std::nullopt;

    const auto ts = util::tryParseLogTimestamp(*last);
    if (!ts) return std::nullopt;

    return duration_cast<seconds>(clock_->now() - system_clock::from_time_t(*ts));
}

bool IdleGate::isIdleAt(const std::optional<std::string>& lastRequestAt,
                        const util::Clock::time_point now,
                        const seconds threshold) {
    if (!lastRequestAt) return true;

    const auto ts = util::tryParseLogTimestamp(*lastRequestAt);
    if (!ts) return true;

    return now - system_clock::from_time_t(*ts) > threshold;
}
