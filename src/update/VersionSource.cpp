#include "update/VersionSource.hpp"
#include "util/command.hpp"
#include "log/Registry.hpp"

#include <fstream>
#include <nlohmann/json.hpp>

using namespace pw::update;

namespace {

std::string trim(const std::string& s) {
    const auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return {};
    const auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

std::optional<std::string> firstLineOf(const pw::util::ExecResult& res) {
    if (!res.ok()) return std::nullopt;
    auto line = trim(res.output.substr(0, res.output.find('\n')));
    if (line.empty()) return std::nullopt;
    return line;
}

}

LocalVersionSource::LocalVersionSource(std::filesystem::path proxyDir) : dir_(std::move(proxyDir)) {}

std::optional<std::string> LocalVersionSource::version() {
    const auto versionFile = dir_ / "VERSION";
    if (std::ifstream in(versionFile); in) {
        std::string line;
        std::getline(in, line);
        if (auto v = trim(line); !v.empty()) return v;
    }

    std::error_code ec;
    if (!std::filesystem::exists(dir_ / ".git", ec)) return std::nullopt;

    const auto dir = dir_.string();
    if (auto tag = firstLineOf(util::runCommand({"git", "-C", dir, "describe", "--tags", "--abbrev=0"},
                                                std::chrono::seconds(10))))
        return tag;

    return firstLineOf(util::runCommand({"git", "-C", dir, "rev-parse", "--short", "HEAD"},
                                        std::chrono::seconds(10)));
}

ReleaseVersionSource::ReleaseVersionSource(std::string releaseUrl, usage::Transport& transport)
    : url_(std::move(releaseUrl)), transport_(transport) {}

std::optional<std::string> ReleaseVersionSource::version() {
    try {
        const auto res = transport_.get(url_, {"Accept: application/vnd.github+json"}, TIMEOUT);
        if (!res.ok()) {
            log::Registry::update()->warn("[ReleaseVersion] {} returned {}", url_, res.error());
            return std::nullopt;
        }

        const auto j = nlohmann::json::parse(res.body, nullptr, false);
        if (j.is_discarded() || !j.is_object()) return std::nullopt;

        const auto it = j.find("tag_name");
        if (it == j.end() || !it->is_string()) return std::nullopt;

        auto tag = trim(it->get<std::string>());
        if (tag.empty()) return std::nullopt;
        return tag;
    } catch (const std::exception& e) {
        log::Registry::update()->warn("[ReleaseVersion] Lookup failed: {}", e.what());
        return std::nullopt;
    }
}
