#pragma once

#include "db/DBPool.hpp"
#include "log/Registry.hpp"

#include <memory>
#include <pqxx/pqxx>
#include <string>
#include <type_traits>
#include <utility>

namespace lw::db {

class Transactions {
  public:
    static inline std::shared_ptr<DBPool> dbPool_;

    static void init(std::shared_ptr<DBPool> pool) { dbPool_ = std::move(pool); }

    template <typename Func>
    static auto exec(const std::string& ctx, Func&& func) -> decltype(func(std::declval<pqxx::work&>())) {
        using Result = decltype(func(std::declval<pqxx::work&>()));

        if (!dbPool_) throw std::runtime_error("Transactions not initialized!");

        log::Registry::db()->trace("[Transactions::exec] Starting transaction: {}", ctx);
        auto conn = dbPool_->acquire();

        try {
            conn->ensureOpen();

            // txn must be gone before the connection goes back to the pool
            if constexpr (std::is_void_v<Result>) {
                {
                    pqxx::work txn(conn->get());
                    func(txn);
                    txn.commit();
                }
                log::Registry::db()->trace("[Transactions::exec] Transaction committed: {}", ctx);
                dbPool_->release(std::move(conn));
            } else {
                auto result = [&] {
                    pqxx::work txn(conn->get());
                    auto r = func(txn);
                    txn.commit();
                    return r;
                }();
                log::Registry::db()->trace("[Transactions::exec] Transaction committed: {}", ctx);
                dbPool_->release(std::move(conn));
                return result;
            }
        } catch (...) {
            log::Registry::db()->error("[Transactions::exec] Exception in transaction context '{}', rolling back", ctx);
            if (conn) dbPool_->release(std::move(conn));
            throw;
        }

        if constexpr (!std::is_void_v<Result>) {
            // Compiler satisfaction token
            throw std::logic_error("Unreachable path in Transactions::exec");
        }
    }
};

}
