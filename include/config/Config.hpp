#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>

namespace lw::config {

struct HttpConfig {
    bool enabled = true;
    std::string host = "0.0.0.0";
    uint16_t port = 33480;
    unsigned int threads = 4;
    unsigned int max_body_bytes = 8192;
};

struct DatabaseConfig {
    std::string host = "localhost";
    uint16_t port = 5432;
    std::string name = "bakewind";
    std::string user = "lockwright";
    std::string password_env = "LOCKWRIGHT_DB_PASSWORD"; // read from the environment, never from disk
    unsigned int pool_size = 8;
    std::chrono::milliseconds acquire_timeout{2000};
    std::chrono::milliseconds statement_timeout{3000};
};

enum class StoreBackend { Postgres, Memory };

std::string to_string(StoreBackend backend);
StoreBackend storeBackendFromString(const std::string& str);

struct StoreConfig {
    StoreBackend backend = StoreBackend::Postgres;
};

struct LocksConfig {
    std::chrono::seconds default_ttl{300};
    std::chrono::seconds max_ttl{3600};
    bool verify_resources = true;
    bool resolve_user_names = true;
};

struct JanitorConfig {
    bool enabled = true;
    std::chrono::seconds sweep_interval{300};
    std::chrono::seconds grace{300}; // loadConfig() defaults it to locks.default_ttl
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum lockwright = spdlog::level::info;  // startup/shutdown, service lifecycle
    spdlog::level::level_enum locks      = spdlog::level::info;  // grants, conflicts, releases
    spdlog::level::level_enum db         = spdlog::level::err;   // only if DB is unreachable or a tx fails
    spdlog::level::level_enum http       = spdlog::level::warn;  // 5xx, malformed requests
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::warn;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir = "/var/log/lockwright";
    LogLevelsConfig levels;
};

struct Config {
    HttpConfig http;
    DatabaseConfig database;
    StoreConfig store;
    LocksConfig locks;
    JanitorConfig janitor;
    LoggingConfig logging;
};

Config loadConfig(const std::filesystem::path& path);

// Throws std::invalid_argument when the values cannot work together.
void validate(const Config& cfg);

} // namespace lw::config
