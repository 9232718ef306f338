#include <gtest/gtest.h>
#include "cache/TTLCache.hpp"
#include "TestSupport.hpp"

using namespace pw::cache;
using namespace std::chrono_literals;

class TTLCacheTest : public ::testing::Test {
protected:
    std::shared_ptr<pw::test::ManualClock> clock = std::make_shared<pw::test::ManualClock>();
    JsonCache cache{clock};
};

TEST_F(TTLCacheTest, MissOnAbsentKey) {
    EXPECT_FALSE(cache.get("nope", 10s).has_value());
    EXPECT_EQ(cache.stats().misses, 1u);
}

TEST_F(TTLCacheTest, HitWithinBound) {
    cache.set(keys::USAGE_SNAPSHOT, nlohmann::json{{"total", 3}});
    clock->advance(1500ms);

    const auto hit = cache.get(keys::USAGE_SNAPSHOT, 2s);
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ((*hit)["total"], 3);
    EXPECT_EQ(cache.stats().hits, 1u);
}

TEST_F(TTLCacheTest, StaleAtExactlyMaxAge) {
    cache.set("k", 1);
    clock->advance(2s);
    EXPECT_FALSE(cache.get("k", 2s).has_value());

    const auto s = cache.stats();
    EXPECT_EQ(s.misses, 1u);
    EXPECT_EQ(s.stale, 1u);
}

TEST_F(TTLCacheTest, StalenessDependsOnReaderBound) {
    cache.set("k", "v");
    clock->advance(5s);
    EXPECT_FALSE(cache.get("k", 2s).has_value());
    EXPECT_TRUE(cache.get("k", 10s).has_value());
}

TEST_F(TTLCacheTest, LastSetWinsAndRefreshesAge) {
    cache.set("k", 1);
    clock->advance(3s);
    cache.set("k", 2);
    clock->advance(1s);

    const auto hit = cache.get("k", 2s);
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(*hit, 2);
}

TEST_F(TTLCacheTest, InvalidateDropsSingleKey) {
    cache.set("a", 1);
    cache.set("b", 2);
    cache.invalidate("a");

    EXPECT_FALSE(cache.get("a", 10s).has_value());
    EXPECT_TRUE(cache.get("b", 10s).has_value());
    EXPECT_EQ(cache.stats().entries, 1u);
}

TEST_F(TTLCacheTest, InvalidateAllClearsEverything) {
    cache.set("a", 1);
    cache.set("b", 2);
    cache.invalidateAll();

    EXPECT_FALSE(cache.get("a", 10s).has_value());
    EXPECT_FALSE(cache.get("b", 10s).has_value());

    const auto s = cache.stats();
    EXPECT_EQ(s.entries, 0u);
    EXPECT_EQ(s.invalidations, 2u);
}
