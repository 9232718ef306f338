#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace pw::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

static spdlog::level::level_enum levelOr(const Node& node, const spdlog::level::level_enum def) {
    if (!node) return def;
    return spdlog::level::from_str(node.as<std::string>());
}

template<>
struct convert<ProxyConfig> {
    static Node encode(const ProxyConfig& rhs) {
        Node node;
        node["dir"] = rhs.dir.string();
        node["log_path"] = rhs.log_path.string();
        node["auth_dir"] = rhs.auth_dir.string();
        node["excluded_paths"] = rhs.excluded_paths;
        return node;
    }

    static bool decode(const Node& node, ProxyConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.dir = node["dir"].as<std::string>(rhs.dir.string());
        rhs.log_path = node["log_path"].as<std::string>((rhs.dir / "logs" / "main.log").string());
        rhs.auth_dir = node["auth_dir"].as<std::string>((rhs.dir / "data").string());
        if (node["excluded_paths"]) rhs.excluded_paths = node["excluded_paths"].as<std::vector<std::string>>();
        return true;
    }
};

template<>
struct convert<ManagementConfig> {
    static Node encode(const ManagementConfig& rhs) {
        Node node;
        node["base_url"] = rhs.base_url;
        node["port"] = rhs.port;
        node["secret"] = rhs.secret;
        node["fetch_timeout_seconds"] = rhs.fetch_timeout_seconds;
        node["import_timeout_seconds"] = rhs.import_timeout_seconds;
        node["refresh_interval_seconds"] = rhs.refresh_interval_seconds;
        return node;
    }

    static bool decode(const Node& node, ManagementConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.base_url = node["base_url"].as<std::string>("http://127.0.0.1");
        rhs.port = node["port"].as<uint16_t>(8317);
        rhs.secret = node["secret"].as<std::string>("");
        rhs.fetch_timeout_seconds = node["fetch_timeout_seconds"].as<unsigned int>(5);
        rhs.import_timeout_seconds = node["import_timeout_seconds"].as<unsigned int>(8);
        rhs.refresh_interval_seconds = node["refresh_interval_seconds"].as<unsigned int>(60);
        return true;
    }
};

template<>
struct convert<StorageConfig> {
    static Node encode(const StorageConfig& rhs) {
        Node node;
        node["data_dir"] = rhs.data_dir.string();
        node["counters_flush_interval_seconds"] = rhs.counters_flush_interval_seconds;
        return node;
    }

    static bool decode(const Node& node, StorageConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.data_dir = node["data_dir"].as<std::string>("/var/lib/proxywatch");
        rhs.counters_flush_interval_seconds = node["counters_flush_interval_seconds"].as<unsigned int>(30);
        return true;
    }
};

template<>
struct convert<IdleConfig> {
    static Node encode(const IdleConfig& rhs) {
        Node node;
        node["threshold_seconds"] = rhs.threshold_seconds;
        return node;
    }

    static bool decode(const Node& node, IdleConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.threshold_seconds = node["threshold_seconds"].as<unsigned int>(1800);
        return true;
    }
};

template<>
struct convert<PricingConfig> {
    static Node encode(const PricingConfig& rhs) {
        Node node;
        node["input"] = rhs.input;
        node["output"] = rhs.output;
        node["cache"] = rhs.cache;
        return node;
    }

    static bool decode(const Node& node, PricingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.input = node["input"].as<double>(0.0);
        rhs.output = node["output"].as<double>(0.0);
        rhs.cache = node["cache"].as<double>(0.0);
        return true;
    }
};

template<>
struct convert<AutoUpdateConfig> {
    static Node encode(const AutoUpdateConfig& rhs) {
        Node node;
        node["enabled"] = rhs.enabled;
        node["check_interval_seconds"] = rhs.check_interval_seconds;
        node["release_url"] = rhs.release_url;
        node["command"] = rhs.command;
        node["command_timeout_seconds"] = rhs.command_timeout_seconds;
        return node;
    }

    static bool decode(const Node& node, AutoUpdateConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.enabled = node["enabled"].as<bool>(true);
        rhs.check_interval_seconds = node["check_interval_seconds"].as<unsigned int>(300);
        rhs.release_url = node["release_url"].as<std::string>(rhs.release_url);
        if (node["command"]) rhs.command = node["command"].as<std::vector<std::string>>();
        rhs.command_timeout_seconds = node["command_timeout_seconds"].as<unsigned int>(600);
        return true;
    }
};

template<>
struct convert<HealthConfig> {
    static Node encode(const HealthConfig& rhs) {
        Node node;
        node["disk_path"] = rhs.disk_path.string();
        node["poll_interval_seconds"] = rhs.poll_interval_seconds;
        node["disk_warn_percent"] = rhs.disk_warn_percent;
        node["memory_warn_percent"] = rhs.memory_warn_percent;
        return node;
    }

    static bool decode(const Node& node, HealthConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.disk_path = node["disk_path"].as<std::string>("/");
        rhs.poll_interval_seconds = node["poll_interval_seconds"].as<unsigned int>(60);
        rhs.disk_warn_percent = node["disk_warn_percent"].as<double>(90.0);
        rhs.memory_warn_percent = node["memory_warn_percent"].as<double>(90.0);
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["proxywatch"] = to_std_string(spdlog::level::to_string_view(rhs.proxywatch));
        node["tail"]       = to_std_string(spdlog::level::to_string_view(rhs.tail));
        node["usage"]      = to_std_string(spdlog::level::to_string_view(rhs.usage));
        node["stats"]      = to_std_string(spdlog::level::to_string_view(rhs.stats));
        node["update"]     = to_std_string(spdlog::level::to_string_view(rhs.update));
        node["health"]     = to_std_string(spdlog::level::to_string_view(rhs.health));
        node["config"]     = to_std_string(spdlog::level::to_string_view(rhs.config));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.proxywatch = levelOr(node["proxywatch"], spdlog::level::info);
        rhs.tail = levelOr(node["tail"], spdlog::level::warn);
        rhs.usage = levelOr(node["usage"], spdlog::level::warn);
        rhs.stats = levelOr(node["stats"], spdlog::level::warn);
        rhs.update = levelOr(node["update"], spdlog::level::info);
        rhs.health = levelOr(node["health"], spdlog::level::warn);
        rhs.config = levelOr(node["config"], spdlog::level::info);
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = levelOr(node["console_log_level"], spdlog::level::info);
        rhs.file_log_level = levelOr(node["file_log_level"], spdlog::level::info);
        if (node["subsystem_levels"]) rhs.subsystem_levels = node["subsystem_levels"].as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["file_enabled"] = rhs.file_enabled;
        node["log_levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("/var/log/proxywatch");
        rhs.file_enabled = node["file_enabled"].as<bool>(true);
        if (node["log_levels"]) rhs.levels = node["log_levels"].as<LogLevelsConfig>();
        return true;
    }
};

}
