#include <gtest/gtest.h>
#include "concurrency/AsyncService.hpp"
#include "services/CounterFlushService.hpp"
#include "stats/Counters.hpp"
#include "TestSupport.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

using namespace pw;
using namespace std::chrono_literals;

namespace {

// Sleeps far longer than any test runs, so only an interrupt can end the loop.
class LongSleeper final : public concurrency::AsyncService {
public:
    LongSleeper() : AsyncService("LongSleeper") {}

    void runLoop() override {
        while (!shouldStop()) {
            ++iterations;
            lazySleep(1h);
        }
    }

    std::atomic<int> iterations{0};
};

template <class Pred>
bool waitFor(Pred pred, const std::chrono::milliseconds timeout = 2s) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(5ms);
    }
    return pred();
}

}

TEST(AsyncServiceTest, StopInterruptsLazySleep) {
    LongSleeper svc;
    svc.start();
    ASSERT_TRUE(waitFor([&] { return svc.iterations.load() > 0; }));

    const auto t0 = std::chrono::steady_clock::now();
    svc.stop();
    EXPECT_LT(std::chrono::steady_clock::now() - t0, 5s);
    EXPECT_FALSE(svc.isRunning());
}

TEST(AsyncServiceTest, DestructorInterruptsLazySleep) {
    auto svc = std::make_unique<LongSleeper>();
    svc->start();
    ASSERT_TRUE(waitFor([&] { return svc->iterations.load() > 0; }));

    const auto t0 = std::chrono::steady_clock::now();
    svc.reset();
    EXPECT_LT(std::chrono::steady_clock::now() - t0, 5s);
}

TEST(AsyncServiceTest, RestartRunsLoopAgain) {
    LongSleeper svc;
    svc.start();
    ASSERT_TRUE(waitFor([&] { return svc.iterations.load() == 1; }));

    svc.restart();
    EXPECT_TRUE(waitFor([&] { return svc.iterations.load() == 2; }));
    EXPECT_TRUE(svc.isRunning());
    svc.stop();
}

TEST(CounterFlushServiceTest, IntervalNeverBelowSaveWindow) {
    test::TempDir dir;
    stats::CountersStore store(dir / "persistent_stats.json", std::make_shared<test::ManualClock>());

    const services::CounterFlushService fast(store, 1s);
    EXPECT_EQ(fast.interval(), stats::CountersStore::SAVE_INTERVAL);

    const services::CounterFlushService slow(store, 30s);
    EXPECT_EQ(slow.interval(), 30s);
}
