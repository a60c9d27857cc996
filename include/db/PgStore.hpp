#pragma once

#include "lock/Store.hpp"
#include "lock/Directory.hpp"

namespace lw::db {

// order_locks table through the shared connection pool.
class PgStore final : public lock::Store {
public:
    lock::AcquireAttempt tryAcquire(const lock::model::Lock& candidate, lock::model::Timestamp now) override;

    std::optional<lock::model::Lock> renew(const std::string& resourceId, const std::string& sessionId,
                                           lock::model::Timestamp now, lock::model::Timestamp expiresAt) override;

    lock::ReleaseAttempt release(const std::string& resourceId, const std::string& sessionId) override;

    std::optional<lock::model::Lock> find(const std::string& resourceId) override;

    std::size_t purgeExpired(lock::model::Timestamp cutoff) override;
};

class PgOrderDirectory final : public lock::OrderDirectory {
public:
    [[nodiscard]] bool exists(lock::model::ResourceKind kind, const std::string& resourceId) const override;
};

class PgUserDirectory final : public lock::UserDirectory {
public:
    [[nodiscard]] std::optional<std::string> displayName(const std::string& userId) const override;
};

}
