#pragma once

#include "lock/model/Lock.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace lw::lock {

struct AcquireAttempt {
    bool granted{false};
    model::Lock lock; // the row after the write when granted, otherwise the live holder's row
};

struct ReleaseAttempt {
    bool deleted{false};
    std::optional<model::Lock> remaining; // row left in place when nothing was deleted
};

/**
 * Authoritative lock table. Every method is a single atomic operation against
 * the backing store; implementations throw lock::Unavailable when the store
 * cannot be reached.
 */
class Store {
public:
    virtual ~Store() = default;

    /**
     * Inserts `candidate`, or replaces an existing row whose expires_at is before
     * `now`, or extends the live row when it already belongs to the candidate's
     * user, session and kind. Any other live row is reported back untouched.
     */
    virtual AcquireAttempt tryAcquire(const model::Lock& candidate, model::Timestamp now) = 0;

    // Extends a live row held by `sessionId`; std::nullopt when there is none.
    virtual std::optional<model::Lock> renew(const std::string& resourceId, const std::string& sessionId,
                                             model::Timestamp now, model::Timestamp expiresAt) = 0;

    virtual ReleaseAttempt release(const std::string& resourceId, const std::string& sessionId) = 0;

    virtual std::optional<model::Lock> find(const std::string& resourceId) = 0;

    // Deletes rows with expires_at < cutoff, returns how many.
    virtual std::size_t purgeExpired(model::Timestamp cutoff) = 0;
};

}
