#include "tail/LogLine.hpp"
#include "util/timestamp.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <regex>
#include <string_view>
#include <nlohmann/json.hpp>

using namespace pw::tail;

namespace {

const std::regex& timestampRx() {
    static const std::regex rx(R"(\[(\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2})\])");
    return rx;
}

const std::regex& statusRx() {
    static const std::regex rx(R"(\s(\d{3})\s)");
    return rx;
}

constexpr std::string_view GIN_MARKER = "[gin_logger.go:";
constexpr std::array<std::string_view, 7> HTTP_METHODS = {"GET", "POST", "PUT", "PATCH", "DELETE", "HEAD", "OPTIONS"};

bool isSpace(const char c) { return c == ' ' || c == '\t'; }
bool isDigit(const char c) { return c >= '0' && c <= '9'; }

// Forward-only cursor over one access-log line. Every step is linear in the line length.
struct Scanner {
    std::string_view s;
    std::size_t pos = 0;

    [[nodiscard]] bool done() const { return pos >= s.size(); }
    [[nodiscard]] char peek() const { return done() ? '\0' : s[pos]; }

    std::size_t skipSpaces() {
        const auto start = pos;
        while (!done() && isSpace(s[pos])) ++pos;
        return pos - start;
    }

    bool consume(const char c) {
        if (peek() != c) return false;
        ++pos;
        return true;
    }

    template <class Pred>
    std::string_view takeWhile(Pred pred) {
        const auto start = pos;
        while (!done() && pred(s[pos])) ++pos;
        return s.substr(start, pos - start);
    }
};

// Position just past "[gin_logger.go:NN]", or npos.
std::size_t afterMarker(const std::string_view line) {
    const auto at = line.find(GIN_MARKER);
    if (at == std::string_view::npos) return std::string_view::npos;

    Scanner sc{line, at + GIN_MARKER.size()};
    if (sc.takeWhile(isDigit).empty() || !sc.consume(']')) return std::string_view::npos;
    return sc.pos;
}

bool isMethod(const std::string_view word) {
    return std::find(HTTP_METHODS.begin(), HTTP_METHODS.end(), word) != HTTP_METHODS.end();
}

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t");
    if (first == std::string::npos) return {};
    const auto last = s.find_last_not_of(" \t");
    return s.substr(first, last - first + 1);
}

}

LineClassifier::LineClassifier(std::vector<std::string> excludedPaths)
    : excludedPaths_(std::move(excludedPaths)) {}

bool LineClassifier::isRequestLine(const std::string& line) {
    const std::string_view view(line);
    const auto start = afterMarker(view);
    if (start == std::string_view::npos) return false;

    // Some '|' after the marker must be followed by a method and an opening quote
    for (auto bar = view.find('|', start); bar != std::string_view::npos; bar = view.find('|', bar + 1)) {
        Scanner sc{view, bar + 1};
        sc.skipSpaces();
        const auto method = sc.takeWhile([](const char c) { return c >= 'A' && c <= 'Z'; });
        if (!isMethod(method)) continue;
        if (sc.skipSpaces() == 0) continue;
        if (sc.peek() == '"') return true;
    }
    return false;
}

bool LineClassifier::isExcluded(const std::string_view line) const {
    for (const auto& p : excludedPaths_)
        if (!p.empty() && line.find(p) != std::string_view::npos) return true;
    return false;
}

std::optional<std::string> LineClassifier::extractTimestamp(const std::string& line) {
    std::smatch m;
    if (!std::regex_search(line, m, timestampRx())) return std::nullopt;
    auto stamp = m[1].str();
    if (!pw::util::tryParseLogTimestamp(stamp)) return std::nullopt;
    return stamp;
}

std::optional<int> LineClassifier::extractStatus(const std::string& line) {
    std::smatch m;
    if (!std::regex_search(line, m, statusRx())) return std::nullopt;
    return std::stoi(m[1].str());
}

std::optional<RequestRecord> pw::tail::parseRequestLine(const std::string& line) {
    const std::string_view view(line);
    const auto start = afterMarker(view);
    if (start == std::string_view::npos) return std::nullopt;

    std::smatch m;
    const std::string prefix(view.substr(0, start));
    if (!std::regex_search(prefix, m, timestampRx())) return std::nullopt;

    RequestRecord r;
    r.time = m[1].str();

    Scanner sc{view, start};
    if (sc.skipSpaces() == 0) return std::nullopt;

    const auto status = sc.takeWhile(isDigit);
    if (status.empty() || status.size() > 3) return std::nullopt;
    r.status = std::stoi(std::string(status));

    if (sc.skipSpaces() == 0 || !sc.consume('|') || sc.skipSpaces() == 0) return std::nullopt;

    const auto duration = sc.takeWhile([](const char c) { return !isSpace(c); });
    if (duration.empty()) return std::nullopt;
    r.duration = std::string(duration);

    if (sc.skipSpaces() == 0 || !sc.consume('|')) return std::nullopt;

    const auto client = sc.takeWhile([](const char c) {
        return isDigit(c) || isSpace(c) || c == '.' || c == ':' || c == '[' || c == ']' ||
               (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
    });
    if (client.empty() || !sc.consume('|') || sc.skipSpaces() == 0) return std::nullopt;
    r.client = trim(std::string(client));

    const auto method = sc.takeWhile([](const char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
    });
    if (method.empty() || sc.skipSpaces() == 0 || !sc.consume('"')) return std::nullopt;
    r.method = std::string(method);

    const auto path = sc.takeWhile([](const char c) { return c != '"'; });
    if (path.empty() || !sc.consume('"')) return std::nullopt;
    r.path = std::string(path);
    return r;
}

void pw::tail::to_json(nlohmann::json& j, const RequestRecord& r) {
    j = {
        {"time", r.time},
        {"status", r.status},
        {"duration", r.duration},
        {"client", r.client},
        {"method", r.method},
        {"path", r.path},
        {"message", r.method + " " + r.path + " - " + std::to_string(r.status) + " (" + r.duration + ")"}
    };
}
