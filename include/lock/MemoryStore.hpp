#pragma once

#include "lock/Store.hpp"

#include <mutex>
#include <unordered_map>

namespace lw::lock {

// Process-local lock table for single-node deployments and tests.
class MemoryStore final : public Store {
public:
    AcquireAttempt tryAcquire(const model::Lock& candidate, model::Timestamp now) override;

    std::optional<model::Lock> renew(const std::string& resourceId, const std::string& sessionId,
                                     model::Timestamp now, model::Timestamp expiresAt) override;

    ReleaseAttempt release(const std::string& resourceId, const std::string& sessionId) override;

    std::optional<model::Lock> find(const std::string& resourceId) override;

    std::size_t purgeExpired(model::Timestamp cutoff) override;

    [[nodiscard]] std::size_t size() const;

private:
    mutable std::mutex mtx_;
    std::unordered_map<std::string, model::Lock> rows_;
};

}
