#include <gtest/gtest.h>
#include "usage/Aggregate.hpp"
#include "usage/Fields.hpp"

#include <nlohmann/json.hpp>

using namespace pw::usage;
using json = nlohmann::json;

TEST(UsageFieldsTest, ToCountHandlesScalarShapes) {
    EXPECT_EQ(fields::toCount(json(42)), 42u);
    EXPECT_EQ(fields::toCount(json(-7)), 0u);
    EXPECT_EQ(fields::toCount(json(3.9)), 3u);
    EXPECT_EQ(fields::toCount(json("128")), 128u);
    EXPECT_EQ(fields::toCount(json("12abc")), 0u);
    EXPECT_EQ(fields::toCount(json(true)), 0u);
    EXPECT_EQ(fields::toCount(json(nullptr)), 0u);
    EXPECT_EQ(fields::toCount(json::object()), 0u);
}

TEST(UsageFieldsTest, FirstPresentKeyWinsEvenWhenZero) {
    const json rec = {{"input", 0}, {"prompt_tokens", 99}};
    EXPECT_EQ(fields::readCount(rec, fields::INPUT_TOKENS), 0u);

    const json alt = {{"prompt_tokens", 99}};
    EXPECT_EQ(fields::readCount(alt, fields::INPUT_TOKENS), 99u);
}

TEST(UsageAggregateTest, EmptyOrNonObjectSnapshotIsZero) {
    for (const auto& s : {json(nullptr), json::array(), json::object(), json("x")}) {
        const auto out = aggregate(s);
        EXPECT_EQ(out.tokens.total, 0u);
        EXPECT_EQ(out.requests.total, 0u);
    }
}

TEST(UsageAggregateTest, NestedProvidersWithDetails) {
    const json snapshot = {
        {"usage", {
            {"total_requests", 12},
            {"success_count", 10},
            {"failed_requests", 2},
            {"apis", {
                {"openai", {
                    {"total_requests", 999},
                    {"models", {
                        {"gpt-5", {{"details", json::array({
                            {{"tokens", {{"input_tokens", 100}, {"output_tokens", 40}, {"cached_tokens", 10}, {"total_tokens", 150}}}},
                            {{"tokens", {{"prompt_tokens", 5}, {"completion_tokens", 5}}}}
                        })}}}
                    }}
                }},
                {"anthropic", {
                    {"models", json::array({
                        {{"input", 1000}, {"output", 500}, {"cache", 0}}
                    })}
                }}
            }}
        }}
    };

    const auto out = aggregate(snapshot);
    EXPECT_EQ(out.requests.total, 12u);
    EXPECT_EQ(out.requests.success, 10u);
    EXPECT_EQ(out.requests.failure, 2u);

    EXPECT_EQ(out.tokens.input, 1105u);
    EXPECT_EQ(out.tokens.output, 545u);
    EXPECT_EQ(out.tokens.cached, 10u);
    EXPECT_EQ(out.tokens.total, 150u + 10u + 1500u);
}

TEST(UsageAggregateTest, RequestTotalsSummedOverApisWithoutTopLevel) {
    const json snapshot = {
        {"apis", json::array({
            {{"requests", 3}, {"success", 2}, {"failure", 1}},
            {{"total", 4}, {"successful_requests", 4}}
        })}
    };

    const auto out = aggregate(snapshot);
    EXPECT_EQ(out.requests.total, 7u);
    EXPECT_EQ(out.requests.success, 6u);
    EXPECT_EQ(out.requests.failure, 1u);
}

TEST(UsageAggregateTest, TotalIdentityWhenTotalsAbsent) {
    const json snapshot = {
        {"apis", {{"p", {{"models", {{"m", {{"usage", {{"input_tokens", 7}, {"output_tokens", 3}, {"cached_tokens", 2}}}}}}}}}}}
    };

    const auto out = aggregate(snapshot);
    EXPECT_EQ(out.tokens.total, out.tokens.input + out.tokens.output + out.tokens.cached);
    EXPECT_EQ(out.tokens.total, 12u);
}

TEST(UsageAggregateTest, OwnerTotalUsedWhenRecordHasNone) {
    const json snapshot = {
        {"apis", {{"p", {{"models", {{"m", {{"total_tokens", 77}, {"tokens", {{"input_tokens", 1}}}}}}}}}}}
    };
    EXPECT_EQ(aggregate(snapshot).tokens.total, 77u);
}

TEST(UsageAggregateTest, EmptyTokenObjectFallsBackToRecord) {
    const json snapshot = {
        {"apis", {{"p", {{"models", {{"m", {{"tokens", json::object()}, {"input_tokens", 9}}}}}}}}}
    };
    EXPECT_EQ(aggregate(snapshot).tokens.input, 9u);
}

TEST(UsageAggregateTest, ContainerTotalUsedWhenNothingCounted) {
    const json snapshot = {{"usage", {{"total_tokens", 5000}, {"apis", json::array()}}}};
    EXPECT_EQ(aggregate(snapshot).tokens.total, 5000u);
}

TEST(UsageAggregateTest, MalformedEntriesAreSkipped) {
    const json snapshot = {
        {"apis", json::array({"oops", 3, {{"models", "nope"}}, {{"models", json::array({nullptr, {{"input_tokens", "bad"}}})}}})}
    };
    const auto out = aggregate(snapshot);
    EXPECT_EQ(out.tokens.input, 0u);
    EXPECT_EQ(out.tokens.total, 0u);
}

TEST(UsageCostTest, PerMillionPricing) {
    TokenTotals t;
    t.input = 2'000'000;
    t.output = 500'000;
    t.cached = 1'000'000;

    pw::config::PricingConfig p;
    p.input = 3.0;
    p.output = 15.0;
    p.cache = 0.3;

    const auto c = computeCost(t, p);
    EXPECT_DOUBLE_EQ(c.input, 6.0);
    EXPECT_DOUBLE_EQ(c.output, 7.5);
    EXPECT_DOUBLE_EQ(c.cache, 0.3);
    EXPECT_DOUBLE_EQ(c.total, 13.8);
}

TEST(UsageCostTest, ZeroPricingIsFree) {
    TokenTotals t;
    t.input = 123456;
    const auto c = computeCost(t, pw::config::PricingConfig{});
    EXPECT_DOUBLE_EQ(c.total, 0.0);
}
