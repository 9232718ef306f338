#include <gtest/gtest.h>
#include "tail/StatsTracker.hpp"
#include "config/Config.hpp"
#include "TestSupport.hpp"

#include <nlohmann/json.hpp>

using namespace pw::tail;
using namespace std::chrono_literals;
using pw::test::requestLine;

class StatsTrackerTest : public ::testing::Test {
protected:
    pw::test::TempDir dir;
    std::filesystem::path log = dir / "main.log";
    std::filesystem::path state = dir / "state" / "log_stats.json";
    std::shared_ptr<pw::test::ManualClock> clock = std::make_shared<pw::test::ManualClock>();

    std::unique_ptr<StatsTracker> makeTracker() {
        return std::make_unique<StatsTracker>(log, state, LineClassifier(pw::config::ProxyConfig{}.excluded_paths), clock);
    }
};

TEST_F(StatsTrackerTest, CountsSuccessFailureAndSkipsExcluded) {
    pw::test::writeFile(log,
        requestLine("2026-01-17 05:21:01", 200, "POST", "/v1/chat/completions") +
        requestLine("2026-01-17 05:21:02", 200, "POST", "/v1/messages") +
        requestLine("2026-01-17 05:21:03", 404, "GET", "/v1/unknown") +
        requestLine("2026-01-17 05:21:04", 200, "GET", "/v0/management/usage"));

    const auto tracker = makeTracker();
    const auto r = tracker->poll();

    EXPECT_EQ(r.count, 3u);
    EXPECT_EQ(r.success, 2u);
    EXPECT_EQ(r.failed, 1u);
    EXPECT_EQ(r.lastTime, "2026-01-17 05:21:03");
}

TEST_F(StatsTrackerTest, RePollWithoutGrowthIsIdempotent) {
    pw::test::writeFile(log, requestLine("2026-01-17 05:21:01", 200, "POST", "/v1/chat/completions"));

    const auto tracker = makeTracker();
    const auto first = tracker->poll();
    const auto second = tracker->poll();

    EXPECT_EQ(first.count, 1u);
    EXPECT_EQ(second.count, 1u);
    EXPECT_EQ(second.success, 1u);
    EXPECT_EQ(tracker->cursor().offset, std::filesystem::file_size(log));
}

TEST_F(StatsTrackerTest, CountsOnlyAppendedLines) {
    pw::test::writeFile(log, requestLine("2026-01-17 05:21:01", 200, "POST", "/v1/chat/completions"));
    const auto tracker = makeTracker();
    EXPECT_EQ(tracker->poll().count, 1u);

    pw::test::appendFile(log, requestLine("2026-01-17 05:22:00", 500, "POST", "/v1/chat/completions"));
    const auto r = tracker->poll();
    EXPECT_EQ(r.count, 2u);
    EXPECT_EQ(r.failed, 1u);
    EXPECT_EQ(r.lastTime, "2026-01-17 05:22:00");
}

TEST_F(StatsTrackerTest, PartialLineIsCarriedUntilComplete) {
    const auto line = requestLine("2026-01-17 05:21:01", 200, "POST", "/v1/chat/completions");
    const auto half = line.size() / 2;

    pw::test::writeFile(log, line.substr(0, half));
    const auto tracker = makeTracker();
    EXPECT_EQ(tracker->poll().count, 0u);
    EXPECT_EQ(tracker->cursor().carry, line.substr(0, half));

    pw::test::appendFile(log, line.substr(half));
    EXPECT_EQ(tracker->poll().count, 1u);
    EXPECT_TRUE(tracker->cursor().carry.empty());

    EXPECT_EQ(tracker->poll().count, 1u);
}

TEST_F(StatsTrackerTest, TruncationFoldsWindowExactlyOnce) {
    pw::test::writeFile(log,
        requestLine("2026-01-17 05:21:01", 200, "POST", "/v1/chat/completions") +
        requestLine("2026-01-17 05:21:02", 200, "POST", "/v1/chat/completions"));
    const auto tracker = makeTracker();
    EXPECT_EQ(tracker->poll().count, 2u);

    pw::test::writeFile(log, requestLine("2026-01-17 06:00:00", 429, "POST", "/v1/chat/completions"));
    auto r = tracker->poll();
    EXPECT_EQ(r.count, 3u);
    EXPECT_EQ(r.success, 2u);
    EXPECT_EQ(r.failed, 1u);
    EXPECT_EQ(r.lastTime, "2026-01-17 06:00:00");

    r = tracker->poll();
    EXPECT_EQ(r.count, 3u);

    const auto c = tracker->cursor();
    EXPECT_EQ(c.base.total, 2u);
    EXPECT_EQ(c.window.total, 1u);
}

TEST_F(StatsTrackerTest, TruncationToZeroKeepsBase) {
    pw::test::writeFile(log, requestLine("2026-01-17 05:21:01", 200, "POST", "/v1/chat/completions"));
    const auto tracker = makeTracker();
    EXPECT_EQ(tracker->poll().count, 1u);

    pw::test::writeFile(log, "");
    auto r = tracker->poll();
    EXPECT_EQ(r.count, 1u);
    EXPECT_FALSE(r.lastTime.has_value());

    pw::test::appendFile(log, requestLine("2026-01-17 07:00:00", 200, "POST", "/v1/chat/completions"));
    r = tracker->poll();
    EXPECT_EQ(r.count, 2u);
    EXPECT_EQ(r.success, 2u);
}

TEST_F(StatsTrackerTest, AbsentFileReturnsBaseCounts) {
    const auto tracker = makeTracker();
    const auto r = tracker->poll();
    EXPECT_EQ(r.count, 0u);
    EXPECT_FALSE(r.lastTime.has_value());
    EXPECT_FALSE(std::filesystem::exists(state));
}

TEST_F(StatsTrackerTest, UnparseableTimestampStillCounts) {
    pw::test::writeFile(log, requestLine("2026-99-99 05:21:01", 200, "POST", "/v1/chat/completions"));
    const auto tracker = makeTracker();
    const auto r = tracker->poll();
    EXPECT_EQ(r.count, 1u);
    EXPECT_FALSE(r.lastTime.has_value());
}

TEST_F(StatsTrackerTest, FirstPollCreatesCursorFile) {
    pw::test::writeFile(log, requestLine("2026-01-17 05:21:01", 200, "POST", "/v1/chat/completions"));
    const auto tracker = makeTracker();
    tracker->poll();
    ASSERT_TRUE(std::filesystem::exists(state));
}

TEST_F(StatsTrackerTest, OpportunisticSaveIsRateLimited) {
    pw::test::writeFile(log, requestLine("2026-01-17 05:21:01", 200, "POST", "/v1/chat/completions"));
    const auto tracker = makeTracker();
    tracker->poll();

    pw::test::appendFile(log, requestLine("2026-01-17 05:21:02", 200, "POST", "/v1/chat/completions"));
    tracker->poll();

    auto saved = pw::test::readJson(state);
    EXPECT_EQ(saved["total"], 1);

    clock->advance(StatsTracker::PERSIST_INTERVAL);
    pw::test::appendFile(log, requestLine("2026-01-17 05:21:03", 200, "POST", "/v1/chat/completions"));
    tracker->poll();

    saved = pw::test::readJson(state);
    EXPECT_EQ(saved["total"], 3);
}

TEST_F(StatsTrackerTest, RestoredCursorResumesWithoutRecounting) {
    const auto line = requestLine("2026-01-17 05:21:01", 200, "POST", "/v1/chat/completions");
    pw::test::writeFile(log, line + line.substr(0, 20));
    {
        const auto tracker = makeTracker();
        EXPECT_EQ(tracker->poll().count, 1u);
        tracker->persist(true);
    }

    pw::test::appendFile(log, line.substr(20));

    const auto restored = makeTracker();
    ASSERT_TRUE(restored->load());
    const auto r = restored->poll();
    EXPECT_EQ(r.count, 2u);
    EXPECT_EQ(r.success, 2u);
}

TEST_F(StatsTrackerTest, MalformedCursorFileIsIgnored) {
    std::filesystem::create_directories(state.parent_path());
    pw::test::writeFile(state, "{not json");
    const auto tracker = makeTracker();
    EXPECT_FALSE(tracker->load());
    EXPECT_FALSE(tracker->cursor().initialized);
}

TEST_F(StatsTrackerTest, ResetForgetsEverything) {
    pw::test::writeFile(log, requestLine("2026-01-17 05:21:01", 200, "POST", "/v1/chat/completions"));
    const auto tracker = makeTracker();
    EXPECT_EQ(tracker->poll().count, 1u);

    pw::test::writeFile(log, "");
    tracker->reset();

    const auto saved = pw::test::readJson(state);
    EXPECT_EQ(saved["initialized"], false);
    EXPECT_EQ(tracker->poll().count, 0u);
}

TEST_F(StatsTrackerTest, OlderMtimeFoldsWindowEvenWhenFileGrew) {
    pw::test::writeFile(log,
        requestLine("2026-01-17 05:21:01", 200, "POST", "/v1/chat/completions") +
        requestLine("2026-01-17 05:21:02", 200, "POST", "/v1/chat/completions"));
    const auto tracker = makeTracker();
    EXPECT_EQ(tracker->poll().count, 2u);

    const auto before = std::filesystem::last_write_time(log);
    pw::test::writeFile(log,
        requestLine("2026-01-17 04:00:01", 200, "POST", "/v1/chat/completions") +
        requestLine("2026-01-17 04:00:02", 500, "POST", "/v1/chat/completions") +
        requestLine("2026-01-17 04:00:03", 200, "POST", "/v1/chat/completions"));
    std::filesystem::last_write_time(log, before - std::chrono::hours(1));

    auto r = tracker->poll();
    EXPECT_EQ(r.count, 5u);
    EXPECT_EQ(r.success, 4u);
    EXPECT_EQ(r.failed, 1u);

    r = tracker->poll();
    EXPECT_EQ(r.count, 5u);

    const auto c = tracker->cursor();
    EXPECT_EQ(c.base.total, 2u);
    EXPECT_EQ(c.window.total, 3u);
}

TEST_F(StatsTrackerTest, OffsetPastEndRestartsFromBeginning) {
    pw::test::writeFile(log,
        requestLine("2026-01-17 05:21:01", 200, "POST", "/v1/chat/completions") +
        requestLine("2026-01-17 05:21:02", 500, "POST", "/v1/chat/completions"));
    const auto size = std::filesystem::file_size(log);

    std::filesystem::create_directories(state.parent_path());
    const nlohmann::json saved = {
        {"initialized", true},
        {"offset", size + 500},
        {"last_size", size},
        {"last_mtime_ns", nullptr},
        {"total", 1}, {"success", 1}, {"failed", 0},
        {"base_total", 4}, {"base_success", 3}, {"base_failed", 1},
        {"last_time", "2026-01-16 23:00:00"},
        {"buffer", ""}
    };
    pw::test::writeFile(state, saved.dump());

    const auto tracker = makeTracker();
    ASSERT_TRUE(tracker->load());

    auto r = tracker->poll();
    EXPECT_EQ(r.count, 7u);
    EXPECT_EQ(r.success, 5u);
    EXPECT_EQ(r.failed, 2u);
    EXPECT_EQ(r.lastTime, "2026-01-17 05:21:02");
    EXPECT_EQ(tracker->cursor().offset, size);

    r = tracker->poll();
    EXPECT_EQ(r.count, 7u);
    EXPECT_EQ(tracker->cursor().base.total, 5u);
}

TEST_F(StatsTrackerTest, CountsRequestWithHugeUrl) {
    const auto huge = "/v1/chat/completions?q=" + std::string(100'000, 'a');
    pw::test::writeFile(log,
        requestLine("2026-01-17 05:21:01", 200, "POST", huge) +
        requestLine("2026-01-17 05:21:02", 502, "POST", "/v1/messages"));

    const auto tracker = makeTracker();
    const auto r = tracker->poll();
    EXPECT_EQ(r.count, 2u);
    EXPECT_EQ(r.success, 1u);
    EXPECT_EQ(r.failed, 1u);
}
