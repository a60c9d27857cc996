#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace lw::config;

template<>
struct convert<HttpConfig> {
    static bool decode(const Node& node, HttpConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.enabled = node["enabled"].as<bool>(true);
        rhs.host = node["host"].as<std::string>("0.0.0.0");
        rhs.port = node["port"].as<uint16_t>(33480);
        rhs.threads = node["threads"].as<unsigned int>(4);
        rhs.max_body_bytes = node["max_body_bytes"].as<unsigned int>(8192);
        return true;
    }
};

template<>
struct convert<DatabaseConfig> {
    static bool decode(const Node& node, DatabaseConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.host = node["host"].as<std::string>("localhost");
        rhs.port = node["port"].as<uint16_t>(5432);
        rhs.name = node["name"].as<std::string>("bakewind");
        rhs.user = node["user"].as<std::string>("lockwright");
        rhs.password_env = node["password_env"].as<std::string>("LOCKWRIGHT_DB_PASSWORD");
        rhs.pool_size = node["pool_size"].as<unsigned int>(8);
        rhs.acquire_timeout = std::chrono::milliseconds(node["acquire_timeout_ms"].as<unsigned int>(2000));
        rhs.statement_timeout = std::chrono::milliseconds(node["statement_timeout_ms"].as<unsigned int>(3000));
        return true;
    }
};

template<>
struct convert<StoreConfig> {
    static bool decode(const Node& node, StoreConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.backend = storeBackendFromString(node["backend"].as<std::string>("postgres"));
        return true;
    }
};

template<>
struct convert<LocksConfig> {
    static bool decode(const Node& node, LocksConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.default_ttl = std::chrono::seconds(node["default_ttl_seconds"].as<unsigned int>(300));
        rhs.max_ttl = std::chrono::seconds(node["max_ttl_seconds"].as<unsigned int>(3600));
        rhs.verify_resources = node["verify_resources"].as<bool>(true);
        rhs.resolve_user_names = node["resolve_user_names"].as<bool>(true);
        return true;
    }
};

template<>
struct convert<JanitorConfig> {
    static bool decode(const Node& node, JanitorConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.enabled = node["enabled"].as<bool>(true);
        rhs.sweep_interval = std::chrono::seconds(node["sweep_interval_seconds"].as<unsigned int>(300));
        if (const auto grace = node["grace_seconds"]) rhs.grace = std::chrono::seconds(grace.as<unsigned int>());
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.lockwright = spdlog::level::from_str(node["lockwright"].as<std::string>("info"));
        rhs.locks = spdlog::level::from_str(node["locks"].as<std::string>("info"));
        rhs.db = spdlog::level::from_str(node["db"].as<std::string>("error"));
        rhs.http = spdlog::level::from_str(node["http"].as<std::string>("warning"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("warning"));
        if (const auto sub = node["subsystem_levels"])
            convert<SubsystemLogLevelsConfig>::decode(sub, rhs.subsystem_levels);
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("/var/log/lockwright");
        if (const auto levels = node["log_levels"]) convert<LogLevelsConfig>::decode(levels, rhs.levels);
        return true;
    }
};

}
