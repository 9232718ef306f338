#pragma once

#include <array>
#include <cstdint>
#include <vector>
#include <nlohmann/json.hpp>

// Field-name precedence tables for usage snapshots. Upstream has renamed these keys across
// releases, so every lookup walks its table and the first key present wins.
namespace pw::usage::fields {

inline constexpr auto USAGE_CONTAINER = "usage";
inline constexpr auto APIS = "apis";
inline constexpr auto MODELS = "models";
inline constexpr auto DETAILS = "details";
inline constexpr auto TOKEN_TOTAL_FALLBACK = "total_tokens";

inline constexpr std::array<const char*, 2> TOP_LEVEL_TOTAL = {"total_requests", "total"};
inline constexpr std::array<const char*, 3> API_TOTAL = {"total_requests", "total", "requests"};
inline constexpr std::array<const char*, 3> SUCCESS = {"success", "successful_requests", "success_count"};
inline constexpr std::array<const char*, 3> FAILURE = {"failure", "failed_requests", "failure_count"};

inline constexpr std::array<const char*, 2> TOKEN_RECORD = {"tokens", "usage"};
inline constexpr std::array<const char*, 3> INPUT_TOKENS = {"input_tokens", "input", "prompt_tokens"};
inline constexpr std::array<const char*, 3> OUTPUT_TOKENS = {"output_tokens", "output", "completion_tokens"};
inline constexpr std::array<const char*, 2> CACHED_TOKENS = {"cached_tokens", "cache"};
inline constexpr std::array<const char*, 2> TOTAL_TOKENS = {"total_tokens", "total"};

// Integer value of a JSON scalar: integers as-is, floats truncated, decimal strings parsed.
// Anything else, and negatives, read as 0.
uint64_t toCount(const nlohmann::json& value);

template <std::size_t N>
const nlohmann::json* firstPresent(const nlohmann::json& obj, const std::array<const char*, N>& keys) {
    if (!obj.is_object()) return nullptr;
    for (const auto* key : keys)
        if (const auto it = obj.find(key); it != obj.end()) return &*it;
    return nullptr;
}

template <std::size_t N>
bool anyPresent(const nlohmann::json& obj, const std::array<const char*, N>& keys) {
    return firstPresent(obj, keys) != nullptr;
}

template <std::size_t N>
uint64_t readCount(const nlohmann::json& obj, const std::array<const char*, N>& keys) {
    const auto* v = firstPresent(obj, keys);
    return v ? toCount(*v) : 0;
}

// List values as-is, map values in iteration order, anything else empty.
std::vector<const nlohmann::json*> listOrMapValues(const nlohmann::json& obj, const char* key);

}
