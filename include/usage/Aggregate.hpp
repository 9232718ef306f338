#pragma once

#include "config/Config.hpp"

#include <cstdint>
#include <nlohmann/json_fwd.hpp>

namespace pw::usage {

struct TokenTotals {
    uint64_t input = 0;
    uint64_t output = 0;
    uint64_t cached = 0;
    uint64_t total = 0;
};

struct RequestTotals {
    uint64_t total = 0;
    uint64_t success = 0;
    uint64_t failure = 0;
};

struct UsageCost {
    double input = 0.0;
    double output = 0.0;
    double cache = 0.0;
    double total = 0.0;
};

struct UsageSummary {
    TokenTotals tokens;
    RequestTotals requests;
};

// Folds a management usage snapshot of any known shape into flat totals. Never throws.
UsageSummary aggregate(const nlohmann::json& snapshot);

UsageCost computeCost(const TokenTotals& tokens, const config::PricingConfig& pricing);

void to_json(nlohmann::json& j, const TokenTotals& t);
void to_json(nlohmann::json& j, const RequestTotals& r);
void to_json(nlohmann::json& j, const UsageCost& c);

}
