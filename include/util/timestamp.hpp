#pragma once

#include <chrono>
#include <ctime>
#include <optional>
#include <string>

namespace pw::util {

// Log stamp format used by the proxy: "YYYY-MM-DD HH:MM:SS", always UTC.
std::time_t parseLogTimestamp(const std::string& timestampStr);
std::optional<std::time_t> tryParseLogTimestamp(const std::string& timestampStr);

std::string toLogTimestamp(std::time_t ts);

// ISO 8601 UTC, e.g. "2026-01-18T23:56:20Z"
std::string timestampToString(std::time_t ts);

std::string nowIso8601(std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

}
