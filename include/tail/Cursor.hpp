#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace pw::tail {

struct Counts {
    uint64_t total = 0;
    uint64_t success = 0;
    uint64_t failed = 0;

    Counts& operator+=(const Counts& o) {
        total += o.total;
        success += o.success;
        failed += o.failed;
        return *this;
    }

    bool operator==(const Counts&) const = default;
};

// Durable position of the tracker inside the proxy log plus everything counted so far.
// `base` holds prior file incarnations, `window` the current one since offset was last reset.
struct LogCursor {
    bool initialized = false;
    uint64_t offset = 0;
    uint64_t lastSize = 0;
    std::optional<int64_t> lastModifiedNs;
    std::string carry;
    Counts window;
    Counts base;
    std::optional<std::string> lastSeenRequestAt;
};

struct PollResult {
    uint64_t count = 0;
    std::optional<std::string> lastTime;
    uint64_t success = 0;
    uint64_t failed = 0;
};

void to_json(nlohmann::json& j, const LogCursor& c);
void from_json(const nlohmann::json& j, LogCursor& c);

void to_json(nlohmann::json& j, const PollResult& r);
void from_json(const nlohmann::json& j, PollResult& r);

}
