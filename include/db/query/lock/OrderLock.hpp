#pragma once

#include "lock/Store.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace lw::db::query::lock {

class OrderLock {
    using L = lw::lock::model::Lock;
    using Timestamp = lw::lock::model::Timestamp;

public:
    static lw::lock::AcquireAttempt tryAcquire(const L& candidate, Timestamp now);
    static std::optional<L> renew(const std::string& resourceId, const std::string& sessionId,
                                  Timestamp now, Timestamp expiresAt);
    static lw::lock::ReleaseAttempt release(const std::string& resourceId, const std::string& sessionId);
    static std::optional<L> get(const std::string& resourceId);
    static std::size_t purgeExpired(Timestamp cutoff);
};

}
