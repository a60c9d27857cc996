#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <stdexcept>
#include <unordered_map>
#include <yaml-cpp/yaml.h>

namespace lw::config {

std::string to_string(const StoreBackend backend) {
    switch (backend) {
        case StoreBackend::Postgres: return "postgres";
        case StoreBackend::Memory: return "memory";
        default: throw std::invalid_argument("Unknown StoreBackend enum value");
    }
}

StoreBackend storeBackendFromString(const std::string& str) {
    static const std::unordered_map<std::string, StoreBackend> mapping = {
        {"postgres", StoreBackend::Postgres},
        {"postgresql", StoreBackend::Postgres},
        {"memory", StoreBackend::Memory}
    };
    if (const auto it = mapping.find(str); it != mapping.end()) return it->second;
    throw std::invalid_argument("Invalid store backend: " + str);
}

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;
    const YAML::Node root = YAML::LoadFile(path.string());

    if (auto node = root["http"]) YAML::convert<HttpConfig>::decode(node, cfg.http);
    if (auto node = root["database"]) YAML::convert<DatabaseConfig>::decode(node, cfg.database);
    if (auto node = root["store"]) YAML::convert<StoreConfig>::decode(node, cfg.store);
    if (auto node = root["locks"]) YAML::convert<LocksConfig>::decode(node, cfg.locks);
    if (auto node = root["janitor"]) YAML::convert<JanitorConfig>::decode(node, cfg.janitor);
    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);

    // grace follows the configured default TTL unless set explicitly
    if (!root["janitor"] || !root["janitor"]["grace_seconds"]) cfg.janitor.grace = cfg.locks.default_ttl;

    validate(cfg);
    return cfg;
}

void validate(const Config& cfg) {
    if (cfg.locks.default_ttl.count() <= 0)
        throw std::invalid_argument("locks.default_ttl_seconds must be positive");
    if (cfg.locks.max_ttl < cfg.locks.default_ttl)
        throw std::invalid_argument("locks.max_ttl_seconds must not be below locks.default_ttl_seconds");
    if (cfg.janitor.sweep_interval.count() <= 0)
        throw std::invalid_argument("janitor.sweep_interval_seconds must be positive");
    if (cfg.http.threads == 0)
        throw std::invalid_argument("http.threads must be at least 1");
    if (cfg.store.backend == StoreBackend::Postgres && cfg.database.pool_size == 0)
        throw std::invalid_argument("database.pool_size must be at least 1");
}

} // namespace lw::config
