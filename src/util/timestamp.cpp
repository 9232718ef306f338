#include "util/timestamp.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace pw::util {

std::time_t parseLogTimestamp(const std::string& timestampStr) {
    if (timestampStr.size() < 19) throw std::runtime_error("Failed to parse timestamp: " + timestampStr);

    std::tm tm = {};
    std::istringstream ss(timestampStr.substr(0, 19));
    ss >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
    if (ss.fail()) throw std::runtime_error("Failed to parse timestamp: " + timestampStr);

    if (tm.tm_mon < 0 || tm.tm_mon > 11 || tm.tm_mday < 1 || tm.tm_mday > 31 ||
        tm.tm_hour > 23 || tm.tm_min > 59 || tm.tm_sec > 60)
        throw std::runtime_error("Timestamp out of range: " + timestampStr);

    return timegm(&tm);
}

std::optional<std::time_t> tryParseLogTimestamp(const std::string& timestampStr) {
    try {
        return parseLogTimestamp(timestampStr);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string toLogTimestamp(const std::time_t ts) {
    std::tm tm{};
    gmtime_r(&ts, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

std::string timestampToString(const std::time_t ts) {
    std::tm tm{};
    gmtime_r(&ts, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::string nowIso8601(const std::chrono::system_clock::time_point now) {
    return timestampToString(std::chrono::system_clock::to_time_t(now));
}

}
