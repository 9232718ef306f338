#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include <nlohmann/json_fwd.hpp>

namespace pw::config {

struct ProxyConfig {
    std::filesystem::path dir = "/opt/CLIProxyAPI";
    std::filesystem::path log_path = "/opt/CLIProxyAPI/logs/main.log";
    std::filesystem::path auth_dir = "/opt/CLIProxyAPI/data";
    // Administrative traffic that must not count as proxied requests
    std::vector<std::string> excluded_paths = {
        "\"/v0/management/usage\"",
        "\"/v0/management/",
        "\"/v1/models\"",
    };
};

struct ManagementConfig {
    std::string base_url = "http://127.0.0.1";
    uint16_t port = 8317;
    std::string secret;
    unsigned int fetch_timeout_seconds = 5;
    unsigned int import_timeout_seconds = 8;
    unsigned int refresh_interval_seconds = 60;

    [[nodiscard]] std::string baseUrl() const;
};

struct StorageConfig {
    std::filesystem::path data_dir = "/var/lib/proxywatch";
    unsigned int counters_flush_interval_seconds = 30;

    [[nodiscard]] std::filesystem::path usageSnapshotPath() const { return data_dir / "usage_snapshot.json"; }
    [[nodiscard]] std::filesystem::path logCursorPath() const { return data_dir / "log_stats.json"; }
    [[nodiscard]] std::filesystem::path countersPath() const { return data_dir / "persistent_stats.json"; }
    [[nodiscard]] std::filesystem::path updateHistoryPath() const { return data_dir / "update_history.json"; }
};

struct IdleConfig {
    unsigned int threshold_seconds = 1800;
};

struct PricingConfig {
    // USD per million tokens
    double input = 0.0;
    double output = 0.0;
    double cache = 0.0;
};

struct AutoUpdateConfig {
    bool enabled = true;
    unsigned int check_interval_seconds = 300;
    std::string release_url = "https://api.github.com/repos/router-for-me/CLIProxyAPI/releases/latest";
    std::vector<std::string> command = {"/opt/proxywatch/bin/update-proxy"};
    unsigned int command_timeout_seconds = 600;
};

struct HealthConfig {
    std::filesystem::path disk_path = "/";
    unsigned int poll_interval_seconds = 60;
    double disk_warn_percent = 90.0;
    double memory_warn_percent = 90.0;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum proxywatch = spdlog::level::info;   // Startup, shutdown, service lifecycle
    spdlog::level::level_enum tail       = spdlog::level::warn;   // Rotation events and unreadable logs
    spdlog::level::level_enum usage      = spdlog::level::warn;   // Remote fetch failures and fallbacks
    spdlog::level::level_enum stats      = spdlog::level::warn;   // Persistence failures
    spdlog::level::level_enum update     = spdlog::level::info;   // Every update attempt is worth a line
    spdlog::level::level_enum health     = spdlog::level::warn;
    spdlog::level::level_enum config     = spdlog::level::info;
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::info;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir = "/var/log/proxywatch";
    bool file_enabled = true;
    LogLevelsConfig levels;
};

struct Config {
    ProxyConfig proxy;
    ManagementConfig management;
    StorageConfig storage;
    IdleConfig idle;
    PricingConfig pricing;
    AutoUpdateConfig auto_update;
    HealthConfig health;
    LoggingConfig logging;
};

inline constexpr auto ENV_PREFIX = "PROXYWATCH_";

// Missing file yields defaults; a file that fails to parse throws std::runtime_error.
Config loadConfig(const std::filesystem::path& path);

// Applies PROXYWATCH_<KEY> overrides from the process environment.
void applyEnvOverrides(Config& cfg);

bool parseBool(const std::string& value, bool fallback = false);

void to_json(nlohmann::json& j, const Config& c);
void to_json(nlohmann::json& j, const ProxyConfig& c);
void to_json(nlohmann::json& j, const ManagementConfig& c);
void to_json(nlohmann::json& j, const StorageConfig& c);
void to_json(nlohmann::json& j, const IdleConfig& c);
void to_json(nlohmann::json& j, const PricingConfig& c);
void from_json(const nlohmann::json& j, PricingConfig& c);
void to_json(nlohmann::json& j, const AutoUpdateConfig& c);
void to_json(nlohmann::json& j, const HealthConfig& c);
void to_json(nlohmann::json& j, const LoggingConfig& c);

} // namespace pw::config
