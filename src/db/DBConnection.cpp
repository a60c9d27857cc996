#include "db/DBConnection.hpp"
#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <stdexcept>

using namespace lw::log;

namespace lw::db {

static std::string escape_uri_component(const std::string& value) {
    static constexpr char hex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size());
    for (const unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') out.push_back(static_cast<char>(c));
        else {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0xF]);
        }
    }
    return out;
}

std::string DBConnection::connectionStringFromConfig(const config::DatabaseConfig& cfg) {
    std::string password;
    if (const char* env = std::getenv(cfg.password_env.c_str()); env && *env) password = env;
    else Registry::db()->warn("[DBConnection] {} is not set, connecting without a password", cfg.password_env);

    const auto connectTimeout = std::max<long long>(
        1, std::chrono::duration_cast<std::chrono::seconds>(cfg.acquire_timeout).count());

    std::string str = "postgresql://" + escape_uri_component(cfg.user);
    if (!password.empty()) str += ":" + escape_uri_component(password);
    str += "@" + cfg.host + ":" + std::to_string(cfg.port) + "/" + cfg.name
           + "?connect_timeout=" + std::to_string(connectTimeout);
    return str;
}

DBConnection::DBConnection(std::string connStr) : connStr_(std::move(connStr)) { connect(); }

DBConnection::~DBConnection() { if (conn_ && conn_->is_open()) conn_->close(); }

void DBConnection::connect() {
    conn_.reset();
    auto conn = std::make_unique<pqxx::connection>(connStr_);

    // milliseconds
    const auto timeout = config::ConfigRegistry::get().database.statement_timeout;
    conn->set_session_var("statement_timeout", std::to_string(timeout.count()));

    conn_ = std::move(conn);
}

pqxx::connection& DBConnection::get() const { return *conn_; }

void DBConnection::ensureOpen() {
    if (conn_ && conn_->is_open()) return;

    Registry::db()->warn("[DBConnection] Connection lost, reconnecting");
    connect();
    if (wantPrepared_) prepareAll();
}

void DBConnection::initPrepared() {
    wantPrepared_ = true;
    prepareAll();
}

void DBConnection::prepareAll() {
    if (!conn_ || !conn_->is_open()) throw std::runtime_error("Database connection is not open");

    try {
        initPreparedLocks();
        if (const auto& locks = config::ConfigRegistry::get().locks; locks.verify_resources || locks.resolve_user_names)
            initPreparedDirectories();
    } catch (...) {
        // a half-prepared session is dropped so the next ensureOpen() starts over
        conn_.reset();
        throw;
    }
}

}
