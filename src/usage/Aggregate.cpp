#include "usage/Aggregate.hpp"
#include "usage/Fields.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace pw::usage {

namespace {

const json& tokenRecord(const json& owner) {
    for (const auto* key : fields::TOKEN_RECORD)
        if (const auto it = owner.find(key); it != owner.end() && it->is_object() && !it->empty()) return *it;
    return owner;
}

TokenTotals extractTokens(const json& owner) {
    TokenTotals t;
    if (!owner.is_object()) return t;

    const auto& rec = tokenRecord(owner);
    t.input = fields::readCount(rec, fields::INPUT_TOKENS);
    t.output = fields::readCount(rec, fields::OUTPUT_TOKENS);
    t.cached = fields::readCount(rec, fields::CACHED_TOKENS);

    if (const auto* total = fields::firstPresent(rec, fields::TOTAL_TOKENS)) t.total = fields::toCount(*total);
    else if (const auto it = owner.find(fields::TOKEN_TOTAL_FALLBACK); it != owner.end()) t.total = fields::toCount(*it);

    if (t.total == 0) t.total = t.input + t.output + t.cached;
    return t;
}

void add(TokenTotals& into, const TokenTotals& t) {
    into.input += t.input;
    into.output += t.output;
    into.cached += t.cached;
    into.total += t.total;
}

}

UsageSummary aggregate(const json& snapshot) {
    UsageSummary out;
    if (!snapshot.is_object()) return out;

    const json* container = &snapshot;
    if (const auto it = snapshot.find(fields::USAGE_CONTAINER); it != snapshot.end() && it->is_object())
        container = &*it;

    const bool topLevelRequests = fields::anyPresent(*container, fields::TOP_LEVEL_TOTAL)
                                  || fields::anyPresent(*container, fields::SUCCESS)
                                  || fields::anyPresent(*container, fields::FAILURE);

    if (topLevelRequests) {
        out.requests.total = fields::readCount(*container, fields::TOP_LEVEL_TOTAL);
        out.requests.success = fields::readCount(*container, fields::SUCCESS);
        out.requests.failure = fields::readCount(*container, fields::FAILURE);
    }

    for (const auto* api : fields::listOrMapValues(*container, fields::APIS)) {
        if (!api->is_object()) continue;

        if (!topLevelRequests) {
            out.requests.total += fields::readCount(*api, fields::API_TOTAL);
            out.requests.success += fields::readCount(*api, fields::SUCCESS);
            out.requests.failure += fields::readCount(*api, fields::FAILURE);
        }

        for (const auto* model : fields::listOrMapValues(*api, fields::MODELS)) {
            if (!model->is_object()) continue;

            const auto details = model->find(fields::DETAILS);
            if (details != model->end() && details->is_array() && !details->empty()) {
                for (const auto& detail : *details) add(out.tokens, extractTokens(detail));
            } else {
                add(out.tokens, extractTokens(*model));
            }
        }
    }

    if (out.tokens.total == 0)
        if (const auto it = container->find(fields::TOKEN_TOTAL_FALLBACK); it != container->end())
            out.tokens.total = fields::toCount(*it);

    return out;
}

UsageCost computeCost(const TokenTotals& tokens, const config::PricingConfig& pricing) {
    constexpr double PER_MILLION = 1'000'000.0;

    UsageCost c;
    c.input = static_cast<double>(tokens.input) / PER_MILLION * pricing.input;
    c.output = static_cast<double>(tokens.output) / PER_MILLION * pricing.output;
    c.cache = static_cast<double>(tokens.cached) / PER_MILLION * pricing.cache;
    c.total = c.input + c.output + c.cache;
    return c;
}

void to_json(json& j, const TokenTotals& t) {
    j = {
        {"input_tokens", t.input},
        {"output_tokens", t.output},
        {"cached_tokens", t.cached},
        {"total_tokens", t.total}
    };
}

void to_json(json& j, const RequestTotals& r) {
    j = {
        {"total_requests", r.total},
        {"success", r.success},
        {"failure", r.failure}
    };
}

void to_json(json& j, const UsageCost& c) {
    j = {
        {"input", c.input},
        {"output", c.output},
        {"cache", c.cache},
        {"total", c.total}
    };
}

}
