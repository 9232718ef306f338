#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace pw::tail {

// Access-log line written by the proxy, e.g.
// [2026-01-17 05:21:09] [--------] [info ] [gin_logger.go:92] 200 |   0s |  127.0.0.1 | GET     "/v1/models"
struct RequestRecord {
    std::string time;
    int status = 0;
    std::string duration;
    std::string client;
    std::string method;
    std::string path;
};

class LineClassifier {
public:
    explicit LineClassifier(std::vector<std::string> excludedPaths);

    [[nodiscard]] static bool isRequestLine(const std::string& line);
    [[nodiscard]] bool isExcluded(std::string_view line) const;

    // Bracketed "YYYY-MM-DD HH:MM:SS" stamp, only when it is a real calendar time.
    [[nodiscard]] static std::optional<std::string> extractTimestamp(const std::string& line);

    // First standalone three-digit token.
    [[nodiscard]] static std::optional<int> extractStatus(const std::string& line);

    [[nodiscard]] const std::vector<std::string>& excludedPaths() const { return excludedPaths_; }

private:
    std::vector<std::string> excludedPaths_;
};

std::optional<RequestRecord> parseRequestLine(const std::string& line);

void to_json(nlohmann::json& j, const RequestRecord& r);

}
