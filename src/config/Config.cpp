#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <functional>
#include <stdexcept>
#include <utility>
#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>

namespace pw::config {

namespace {

unsigned long toUnsigned(const std::string& key, const std::string& value) {
    try {
        size_t pos = 0;
        const auto v = std::stoul(value, &pos);
        if (pos != value.size()) throw std::invalid_argument(value);
        return v;
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid integer for " + std::string(ENV_PREFIX) + key + ": " + value);
    }
}

double toDouble(const std::string& key, const std::string& value) {
    try {
        size_t pos = 0;
        const auto v = std::stod(value, &pos);
        if (pos != value.size()) throw std::invalid_argument(value);
        return v;
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid number for " + std::string(ENV_PREFIX) + key + ": " + value);
    }
}

using Setter = std::function<void(Config&, const std::string& key, const std::string& value)>;

const std::vector<std::pair<std::string, Setter>>& envTable() {
    static const std::vector<std::pair<std::string, Setter>> table = {
        {"PROXY_DIR", [](Config& c, const auto&, const auto& v) { c.proxy.dir = v; }},
        {"PROXY_LOG", [](Config& c, const auto&, const auto& v) { c.proxy.log_path = v; }},
        {"AUTH_DIR", [](Config& c, const auto&, const auto& v) { c.proxy.auth_dir = v; }},
        {"MANAGEMENT_BASE_URL", [](Config& c, const auto&, const auto& v) { c.management.base_url = v; }},
        {"MANAGEMENT_PORT", [](Config& c, const auto& k, const auto& v) {
            c.management.port = static_cast<uint16_t>(toUnsigned(k, v));
        }},
        {"MANAGEMENT_KEY", [](Config& c, const auto&, const auto& v) { c.management.secret = v; }},
        {"DATA_DIR", [](Config& c, const auto&, const auto& v) { c.storage.data_dir = v; }},
        {"IDLE_THRESHOLD_SECONDS", [](Config& c, const auto& k, const auto& v) {
            c.idle.threshold_seconds = static_cast<unsigned int>(toUnsigned(k, v));
        }},
        {"AUTO_UPDATE_ENABLED", [](Config& c, const auto&, const auto& v) {
            c.auto_update.enabled = parseBool(v, c.auto_update.enabled);
        }},
        {"AUTO_UPDATE_CHECK_INTERVAL", [](Config& c, const auto& k, const auto& v) {
            c.auto_update.check_interval_seconds = static_cast<unsigned int>(toUnsigned(k, v));
        }},
        {"PRICING_INPUT", [](Config& c, const auto& k, const auto& v) { c.pricing.input = toDouble(k, v); }},
        {"PRICING_OUTPUT", [](Config& c, const auto& k, const auto& v) { c.pricing.output = toDouble(k, v); }},
        {"PRICING_CACHE", [](Config& c, const auto& k, const auto& v) { c.pricing.cache = toDouble(k, v); }},
        {"DISK_PATH", [](Config& c, const auto&, const auto& v) { c.health.disk_path = v; }},
        {"LOG_DIR", [](Config& c, const auto&, const auto& v) { c.logging.log_dir = v; }},
    };
    return table;
}

}

std::string ManagementConfig::baseUrl() const {
    auto url = base_url;
    while (!url.empty() && url.back() == '/') url.pop_back();
    if (port) url += ":" + std::to_string(port);
    return url;
}

bool parseBool(const std::string& value, const bool fallback) {
    std::string v;
    v.reserve(value.size());
    for (const auto ch : value)
        if (!std::isspace(static_cast<unsigned char>(ch))) v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));

    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    return fallback;
}

void applyEnvOverrides(Config& cfg) {
    for (const auto& [key, setter] : envTable()) {
        const auto envKey = std::string(ENV_PREFIX) + key;
        if (const char* raw = std::getenv(envKey.c_str())) setter(cfg, key, raw);
    }
}

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;

    if (std::filesystem::exists(path)) {
        YAML::Node root;
        try {
            root = YAML::LoadFile(path.string());
        } catch (const YAML::Exception& e) {
            throw std::runtime_error("Failed to parse config " + path.string() + ": " + e.what());
        }

        if (auto node = root["proxy"]) YAML::convert<ProxyConfig>::decode(node, cfg.proxy);
        if (auto node = root["management"]) YAML::convert<ManagementConfig>::decode(node, cfg.management);
        if (auto node = root["storage"]) YAML::convert<StorageConfig>::decode(node, cfg.storage);
        if (auto node = root["idle"]) YAML::convert<IdleConfig>::decode(node, cfg.idle);
        if (auto node = root["pricing"]) YAML::convert<PricingConfig>::decode(node, cfg.pricing);
        if (auto node = root["auto_update"]) YAML::convert<AutoUpdateConfig>::decode(node, cfg.auto_update);
        if (auto node = root["health"]) YAML::convert<HealthConfig>::decode(node, cfg.health);
        if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);
    }

    applyEnvOverrides(cfg);
    return cfg;
}

void to_json(nlohmann::json& j, const Config& c) {
    j = {
        {"proxy", c.proxy},
        {"management", c.management},
        {"storage", c.storage},
        {"idle", c.idle},
        {"pricing", c.pricing},
        {"auto_update", c.auto_update},
        {"health", c.health},
        {"logging", c.logging}
    };
}

void to_json(nlohmann::json& j, const ProxyConfig& c) {
    j = {
        {"dir", c.dir.string()},
        {"log_path", c.log_path.string()},
        {"auth_dir", c.auth_dir.string()},
        {"excluded_paths", c.excluded_paths}
    };
}

// The shared secret is never echoed back, only whether one is configured.
void to_json(nlohmann::json& j, const ManagementConfig& c) {
    j = {
        {"base_url", c.baseUrl()},
        {"secret_configured", !c.secret.empty()},
        {"fetch_timeout_seconds", c.fetch_timeout_seconds},
        {"refresh_interval_seconds", c.refresh_interval_seconds}
    };
}

void to_json(nlohmann::json& j, const StorageConfig& c) {
    j = {
        {"data_dir", c.data_dir.string()},
        {"counters", c.countersPath().string()},
        {"log_cursor", c.logCursorPath().string()},
        {"usage_snapshot", c.usageSnapshotPath().string()}
    };
}

void to_json(nlohmann::json& j, const IdleConfig& c) {
    j = {{"threshold_seconds", c.threshold_seconds}};
}

void to_json(nlohmann::json& j, const PricingConfig& c) {
    j = {
        {"input", c.input},
        {"output", c.output},
        {"cache", c.cache}
    };
}

void from_json(const nlohmann::json& j, PricingConfig& c) {
    const auto num = [&](const char* key, const double def) {
        const auto it = j.find(key);
        if (it == j.end() || !it->is_number()) return def;
        return it->get<double>();
    };
    c.input = num("input", c.input);
    c.output = num("output", c.output);
    c.cache = num("cache", c.cache);
}

void to_json(nlohmann::json& j, const AutoUpdateConfig& c) {
    j = {
        {"enabled", c.enabled},
        {"check_interval_seconds", c.check_interval_seconds},
        {"release_url", c.release_url}
    };
}

void to_json(nlohmann::json& j, const HealthConfig& c) {
    j = {
        {"disk_path", c.disk_path.string()},
        {"poll_interval_seconds", c.poll_interval_seconds},
        {"disk_warn_percent", c.disk_warn_percent},
        {"memory_warn_percent", c.memory_warn_percent}
    };
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    j = {
        {"log_dir", c.log_dir.string()},
        {"file_enabled", c.file_enabled},
        {"console_log_level", spdlog::level::to_string_view(c.levels.console_log_level).data()},
        {"file_log_level", spdlog::level::to_string_view(c.levels.file_log_level).data()}
    };
}

} // namespace pw::config
