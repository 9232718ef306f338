#pragma once

#include "usage/Transport.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace pw::update {

class VersionSource {
public:
    virtual ~VersionSource() = default;

    // nullopt when the version cannot be determined right now.
    virtual std::optional<std::string> version() = 0;
};

// Installed proxy: first line of <dir>/VERSION, else the nearest git tag, else the short commit.
class LocalVersionSource final : public VersionSource {
public:
    explicit LocalVersionSource(std::filesystem::path proxyDir);

    std::optional<std::string> version() override;

private:
    std::filesystem::path dir_;
};

// Latest published release, read from a GitHub-style "releases/latest" document.
class ReleaseVersionSource final : public VersionSource {
public:
    static constexpr auto TIMEOUT = std::chrono::seconds(10);

    ReleaseVersionSource(std::string releaseUrl, usage::Transport& transport);

    std::optional<std::string> version() override;

private:
    std::string url_;
    usage::Transport& transport_;
};

}
