#pragma once

#include <memory>
#include <string>
#include <pqxx/connection>

namespace lw::config { struct DatabaseConfig; }

namespace lw::db {

class DBConnection {
  public:
    explicit DBConnection(std::string connStr);
    ~DBConnection();

    [[nodiscard]] pqxx::connection& get() const;

    // Reconnects (and re-prepares) when the server dropped the session.
    void ensureOpen();

    // Prepares now and after every later reconnect.
    void initPrepared();

    static std::string connectionStringFromConfig(const config::DatabaseConfig& cfg);

  private:
    std::string connStr_;
    std::unique_ptr<pqxx::connection> conn_;
    bool wantPrepared_ = false;

    void connect();
    void prepareAll();

    void initPreparedLocks() const;
    void initPreparedDirectories() const;
};

}
