#include "tail/Cursor.hpp"

#include <nlohmann/json.hpp>

using namespace pw::tail;

namespace {

uint64_t safeU64(const nlohmann::json& j, const char* key) {
    const auto it = j.find(key);
    if (it == j.end()) return 0;
    if (it->is_number_unsigned()) return it->get<uint64_t>();
    if (it->is_number_integer()) {
        const auto v = it->get<int64_t>();
        return v > 0 ? static_cast<uint64_t>(v) : 0;
    }
    if (it->is_number_float()) {
        const auto v = it->get<double>();
        return v > 0 ? static_cast<uint64_t>(v) : 0;
    }
    return 0;
}

std::optional<std::string> optString(const nlohmann::json& j, const char* key) {
    const auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

}

void pw::tail::to_json(nlohmann::json& j, const LogCursor& c) {
    j = {
        {"initialized", c.initialized},
        {"offset", c.offset},
        {"last_size", c.lastSize},
        {"last_mtime_ns", c.lastModifiedNs ? nlohmann::json(*c.lastModifiedNs) : nlohmann::json(nullptr)},
        {"total", c.window.total},
        {"success", c.window.success},
        {"failed", c.window.failed},
        {"last_time", c.lastSeenRequestAt ? nlohmann::json(*c.lastSeenRequestAt) : nlohmann::json(nullptr)},
        {"base_total", c.base.total},
        {"base_success", c.base.success},
        {"base_failed", c.base.failed},
        {"buffer", c.carry}
    };
}

void pw::tail::from_json(const nlohmann::json& j, LogCursor& c) {
    c = LogCursor{};
    if (!j.is_object()) return;

    if (const auto it = j.find("initialized"); it != j.end() && it->is_boolean()) c.initialized = it->get<bool>();
    c.offset = safeU64(j, "offset");
    c.lastSize = safeU64(j, "last_size");
    if (const auto it = j.find("last_mtime_ns"); it != j.end() && it->is_number_integer())
        c.lastModifiedNs = it->get<int64_t>();
    c.window = {safeU64(j, "total"), safeU64(j, "success"), safeU64(j, "failed")};
    c.base = {safeU64(j, "base_total"), safeU64(j, "base_success"), safeU64(j, "base_failed")};
    c.lastSeenRequestAt = optString(j, "last_time");
    c.carry = optString(j, "buffer").value_or("");

    // A carry buffer is only meaningful with the offset it was cut at.
    if (!c.initialized) c.carry.clear();
}

void pw::tail::to_json(nlohmann::json& j, const PollResult& r) {
    j = {
        {"count", r.count},
        {"last_time", r.lastTime ? nlohmann::json(*r.lastTime) : nlohmann::json(nullptr)},
        {"success", r.success},
        {"failed", r.failed}
    };
}

void pw::tail::from_json(const nlohmann::json& j, PollResult& r) {
    r = PollResult{};
    r.count = safeU64(j, "count");
    r.success = safeU64(j, "success");
    r.failed = safeU64(j, "failed");
    r.lastTime = optString(j, "last_time");
}
