#pragma once

#include "cache/TTLCache.hpp"
#include "config/Config.hpp"
#include "usage/Reconciler.hpp"

#include <chrono>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace pw::health {

enum class CheckStatus { Pass, Warn, Fail, Unknown };

std::string to_string(CheckStatus s);

struct CheckResult {
    std::string key;
    std::string name;
    CheckStatus status = CheckStatus::Unknown;
    std::string message;
    nlohmann::json details = nullptr;
};

void to_json(nlohmann::json& j, const CheckResult& r);

// "unhealthy" if anything failed, "degraded" if anything warned, else "healthy".
std::string overall(const std::vector<CheckResult>& checks);

CheckResult checkLogFile(const std::filesystem::path& logPath);
CheckResult checkUsageEndpoint(const usage::Reconciler& reconciler);
CheckResult checkDisk(const std::filesystem::path& path, double warnPercent);
CheckResult checkMemory(const std::filesystem::path& meminfo, double warnPercent);
CheckResult checkAuthDir(const std::filesystem::path& dir);
CheckResult checkPort(const std::string& host, uint16_t port, std::chrono::milliseconds timeout);

// "http://127.0.0.1:8080/x" -> "127.0.0.1"
std::string hostFromUrl(const std::string& url);

class Monitor {
public:
    static constexpr auto CACHE_MAX_AGE = std::chrono::seconds(10);
    static constexpr auto PORT_TIMEOUT = std::chrono::milliseconds(2000);
    static constexpr auto MEMINFO_PATH = "/proc/meminfo";

    Monitor(const config::Config& cfg, const usage::Reconciler& reconciler, cache::JsonCache& cache);

    nlohmann::json check(bool useCache = true);

    // Verdict of the most recent full check, if one has run.
    [[nodiscard]] std::optional<std::string> lastVerdict() const;

private:
    config::ProxyConfig proxy_;
    config::ManagementConfig management_;
    config::HealthConfig health_;
    const usage::Reconciler& reconciler_;
    cache::JsonCache& cache_;

    mutable std::mutex mutex_;
    std::optional<std::string> lastVerdict_;
};

}
