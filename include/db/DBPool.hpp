#pragma once

#include "db/DBConnection.hpp"

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>

namespace lw::db {

class PoolTimeout : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class DBPool {
  public:
    DBPool(const std::size_t size, const std::chrono::milliseconds acquireTimeout, const std::string& connStr)
        : acquireTimeout_(acquireTimeout) {
        for (std::size_t i = 0; i < size; ++i) pool_.push(std::make_unique<DBConnection>(connStr));
    }

    std::unique_ptr<DBConnection> acquire() {
        std::unique_lock lock(mtx_);
        if (!cv_.wait_for(lock, acquireTimeout_, [&]() { return !pool_.empty(); }))
            throw PoolTimeout("No database connection available within "
                              + std::to_string(acquireTimeout_.count()) + "ms");
        auto conn = std::move(pool_.front());
        pool_.pop();
        return conn;
    }

    void release(std::unique_ptr<DBConnection> conn) {
        {
            std::lock_guard lock(mtx_);
            pool_.push(std::move(conn));
        }
        cv_.notify_one();
    }

    void initPreparedStatements() {
        std::lock_guard lock(mtx_);
        const auto n = pool_.size();
        for (std::size_t i = 0; i < n; ++i) {
            auto conn = std::move(pool_.front());
            pool_.pop();
            conn->initPrepared();
            pool_.push(std::move(conn));
        }
    }

  private:
    std::queue<std::unique_ptr<DBConnection>> pool_;
    std::mutex mtx_;
    std::condition_variable cv_;
    std::chrono::milliseconds acquireTimeout_;
};

} // namespace lw::db
