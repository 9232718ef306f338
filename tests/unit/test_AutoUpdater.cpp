#include <gtest/gtest.h>
#include "update/AutoUpdater.hpp"
#include "util/timestamp.hpp"
#include "TestSupport.hpp"

#include <atomic>
#include <functional>
#include <thread>

using namespace pw::update;
using namespace std::chrono_literals;

namespace {

class FakeVersion final : public VersionSource {
public:
    explicit FakeVersion(std::optional<std::string> v) : value(std::move(v)) {}
    std::optional<std::string> version() override { ++calls; return value; }

    std::optional<std::string> value;
    int calls = 0;
};

class FakeProcedure final : public UpdateProcedure {
public:
    UpdateOutcome run() override {
        ++runs;
        if (onRun) onRun();
        UpdateOutcome o;
        o.success = succeed;
        o.message = succeed ? "Update successful" : "boom";
        return o;
    }

    std::atomic<int> runs{0};
    bool succeed = true;
    std::function<void()> onRun;
};

}

class AutoUpdaterTest : public ::testing::Test {
protected:
    pw::test::TempDir dir;
    std::shared_ptr<pw::test::ManualClock> clock = std::make_shared<pw::test::ManualClock>();
    pw::cache::JsonCache cache{clock};
    pw::config::Config cfg;
    pw::config::Settings settings{cfg};

    FakeVersion local{std::string("v1.0.0")};
    FakeVersion remote{std::string("v1.1.0")};
    FakeProcedure procedure;

    std::optional<std::string> lastRequest;
    IdleGate idle{[this] { return lastRequest; }, settings, clock};

    std::filesystem::path historyFile = dir / "update_history.json";
    AutoUpdater updater{local, remote, procedure, idle, settings, cache, historyFile, clock};

    void makeBusy() {
        lastRequest = pw::util::toLogTimestamp(std::chrono::system_clock::to_time_t(clock->now()));
    }
};

TEST_F(AutoUpdaterTest, DetectsDifferingVersions) {
    const auto c = updater.checkForUpdates(false);
    EXPECT_TRUE(c.available);
    EXPECT_EQ(c.current, "v1.0.0");
    EXPECT_EQ(c.latest, "v1.1.0");
}

TEST_F(AutoUpdaterTest, UnknownVersionIsNeverAnUpdate) {
    remote.value.reset();
    EXPECT_FALSE(updater.checkForUpdates(false).available);

    remote.value = "v1.1.0";
    local.value.reset();
    cache.invalidateAll();
    EXPECT_FALSE(updater.checkForUpdates(false).available);
}

TEST_F(AutoUpdaterTest, ChecksAreCached) {
    updater.checkForUpdates();
    updater.checkForUpdates();
    EXPECT_EQ(remote.calls, 1);

    clock->advance(AutoUpdater::UPDATE_CHECK_MAX_AGE);
    updater.checkForUpdates();
    EXPECT_EQ(remote.calls, 1) << "release lookups have their own longer bound";
    EXPECT_EQ(local.calls, 2);
}

TEST_F(AutoUpdaterTest, TickUpdatesWhenIdle) {
    EXPECT_TRUE(updater.tick());
    EXPECT_EQ(procedure.runs.load(), 1);
    ASSERT_TRUE(updater.lastResult().has_value());
    EXPECT_TRUE(updater.lastResult()->success);
    EXPECT_FALSE(updater.inProgress());
}

TEST_F(AutoUpdaterTest, TickSkipsWhenBusy) {
    makeBusy();
    EXPECT_FALSE(updater.tick());
    EXPECT_EQ(procedure.runs.load(), 0);
}

TEST_F(AutoUpdaterTest, TickSkipsWhenDisabled) {
    settings.setAutoUpdateEnabled(false);
    EXPECT_FALSE(updater.tick());
    EXPECT_EQ(procedure.runs.load(), 0);
    EXPECT_EQ(remote.calls, 0);
}

TEST_F(AutoUpdaterTest, TickSkipsWhenUpToDate) {
    remote.value = "v1.0.0";
    EXPECT_FALSE(updater.tick());
    EXPECT_EQ(procedure.runs.load(), 0);
}

TEST_F(AutoUpdaterTest, ManualRequestRefusedWhenBusyUnlessForced) {
    makeBusy();
    EXPECT_FALSE(updater.requestUpdate(false).success);
    EXPECT_EQ(procedure.runs.load(), 0);

    EXPECT_TRUE(updater.requestUpdate(true).success);
    EXPECT_EQ(procedure.runs.load(), 1);
}

TEST_F(AutoUpdaterTest, OnlyOneUpdateAtATime) {
    std::atomic<bool> release{false};
    std::atomic<bool> entered{false};
    procedure.onRun = [&] {
        entered = true;
        while (!release) std::this_thread::sleep_for(1ms);
    };

    std::thread first([&] { updater.requestUpdate(true); });
    while (!entered) std::this_thread::sleep_for(1ms);

    EXPECT_TRUE(updater.inProgress());
    const auto second = updater.requestUpdate(true);
    EXPECT_FALSE(second.success);
    EXPECT_EQ(second.message, "Update already in progress");
    EXPECT_FALSE(updater.tick());

    release = true;
    first.join();

    EXPECT_EQ(procedure.runs.load(), 1);
    EXPECT_FALSE(updater.inProgress());
}

TEST_F(AutoUpdaterTest, SuccessfulUpdateIsRecordedInHistory) {
    updater.requestUpdate(true);

    const auto saved = pw::test::readJson(historyFile);
    ASSERT_EQ(saved.size(), 1u);
    EXPECT_EQ(saved[0]["version"], "v1.0.0");
    EXPECT_EQ(saved[0]["success"], true);

    clock->advance(3h);
    const auto h = updater.history();
    ASSERT_EQ(h.size(), 1u);
    EXPECT_DOUBLE_EQ(h[0]["hours_ago"].get<double>(), 3.0);
}

TEST_F(AutoUpdaterTest, FailedUpdateIsNotRecorded) {
    procedure.succeed = false;
    EXPECT_FALSE(updater.requestUpdate(true).success);
    EXPECT_FALSE(std::filesystem::exists(historyFile));
}

TEST_F(AutoUpdaterTest, HistoryKeepsLastFifty) {
    for (std::size_t i = 0; i < AutoUpdater::MAX_HISTORY + 5; ++i) updater.requestUpdate(true);

    EXPECT_EQ(pw::test::readJson(historyFile).size(), AutoUpdater::MAX_HISTORY);
    EXPECT_EQ(updater.history().size(), AutoUpdater::HISTORY_PAGE);
}

TEST_F(AutoUpdaterTest, SuccessInvalidatesVersionCache) {
    updater.checkForUpdates();
    ASSERT_TRUE(cache.get(pw::cache::keys::UPDATE_CHECK, 60s).has_value());

    updater.requestUpdate(true);
    EXPECT_FALSE(cache.get(pw::cache::keys::UPDATE_CHECK, 60s).has_value());
    EXPECT_FALSE(cache.get(pw::cache::keys::LATEST_VERSION, 300s).has_value());
}
