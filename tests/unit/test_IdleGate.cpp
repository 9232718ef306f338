#include <gtest/gtest.h>
#include "update/IdleGate.hpp"
#include "util/timestamp.hpp"
#include "TestSupport.hpp"

using namespace pw::update;
using namespace std::chrono_literals;

namespace {
const auto kNow = std::chrono::system_clock::from_time_t(pw::util::parseLogTimestamp("2026-01-18 12:00:00"));
}

TEST(IdleGateTest, NeverSeenIsIdle) {
    EXPECT_TRUE(IdleGate::isIdleAt(std::nullopt, kNow, 1800s));
}

TEST(IdleGateTest, UnparseableStampIsIdle) {
    EXPECT_TRUE(IdleGate::isIdleAt(std::string("yesterday-ish"), kNow, 1800s));
}

TEST(IdleGateTest, RecentRequestIsBusy) {
    EXPECT_FALSE(IdleGate::isIdleAt(std::string("2026-01-18 11:59:00"), kNow, 1800s));
}

TEST(IdleGateTest, ThresholdIsStrict) {
    EXPECT_FALSE(IdleGate::isIdleAt(std::string("2026-01-18 11:30:00"), kNow, 1800s));
    EXPECT_TRUE(IdleGate::isIdleAt(std::string("2026-01-18 11:29:59"), kNow, 1800s));
}

TEST(IdleGateTest, UsesLiveSettingsAndClock) {
    pw::config::Config cfg;
    cfg.idle.threshold_seconds = 60;
    pw::config::Settings settings(cfg);

    auto clock = std::make_shared<pw::test::ManualClock>(kNow);
    std::optional<std::string> last = "2026-01-18 11:59:30";
    IdleGate gate([&] { return last; }, settings, clock);

    EXPECT_FALSE(gate.isIdle());
    EXPECT_EQ(gate.idleFor(), 30s);

    clock->advance(31s);
    EXPECT_TRUE(gate.isIdle());

    settings.setIdleThreshold(600s);
    EXPECT_FALSE(gate.isIdle());

    last.reset();
    EXPECT_TRUE(gate.isIdle());
    EXPECT_FALSE(gate.idleFor().has_value());
}
