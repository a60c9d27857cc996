#include "lock/Coordinator.hpp"
#include "lock/Store.hpp"
#include "lock/Clock.hpp"
#include "lock/Directory.hpp"
#include "lock/Listener.hpp"
#include "lock/errors.hpp"
#include "config/Config.hpp"
#include "log/Registry.hpp"
#include "util/timestamp.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

using namespace lw::lock;
using namespace lw::log;

namespace {

constexpr std::size_t MAX_ID_LENGTH = 255;

bool isResourceIdChar(const unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == ':';
}

void validateIdentity(const std::string& value, const char* what) {
    if (value.empty()) throw std::invalid_argument(std::string(what) + " must not be empty");
    if (value.size() > MAX_ID_LENGTH)
        throw std::invalid_argument(std::string(what) + " exceeds " + std::to_string(MAX_ID_LENGTH) + " characters");
    if (std::ranges::any_of(value, [](const unsigned char c) { return std::iscntrl(c); }))
        throw std::invalid_argument(std::string(what) + " contains control characters");
}

std::string newLockId() {
    thread_local boost::uuids::random_generator gen;
    return boost::uuids::to_string(gen());
}

}

CoordinatorOptions CoordinatorOptions::fromConfig(const config::Config& cfg) {
    return {
        .default_ttl = cfg.locks.default_ttl,
        .max_ttl = cfg.locks.max_ttl,
        .sweep_grace = cfg.janitor.grace
    };
}

Coordinator::Coordinator(std::shared_ptr<Store> store, std::shared_ptr<Clock> clock, CoordinatorOptions opts)
    : store_(std::move(store)), clock_(std::move(clock)), opts_(opts) {
    if (!store_) throw std::invalid_argument("Coordinator requires a store");
    if (!clock_) throw std::invalid_argument("Coordinator requires a clock");
    if (opts_.default_ttl.count() <= 0) throw std::invalid_argument("default TTL must be positive");
    if (opts_.max_ttl < opts_.default_ttl) throw std::invalid_argument("max TTL must not be below default TTL");
    if (opts_.sweep_grace.count() < 0) throw std::invalid_argument("sweep grace must not be negative");
}

void Coordinator::setOrderDirectory(std::shared_ptr<OrderDirectory> orders) { orders_ = std::move(orders); }

void Coordinator::addListener(std::shared_ptr<Listener> listener) {
    if (listener) listeners_.push_back(std::move(listener));
}

void Coordinator::validateResourceId(const std::string& resourceId) {
    if (resourceId.empty()) throw std::invalid_argument("resource id must not be empty");
    if (resourceId.size() > MAX_ID_LENGTH)
        throw std::invalid_argument("resource id exceeds " + std::to_string(MAX_ID_LENGTH) + " characters");
    if (!std::ranges::all_of(resourceId, [](const unsigned char c) { return isResourceIdChar(c); }))
        throw std::invalid_argument("resource id contains invalid characters: " + resourceId);
}

std::chrono::seconds Coordinator::resolveTtl(const std::optional<std::chrono::seconds>& ttl) const {
    if (!ttl) return opts_.default_ttl;
    if (ttl->count() <= 0) throw std::invalid_argument("ttl must be positive");
    if (*ttl > opts_.max_ttl)
        throw std::invalid_argument("ttl exceeds maximum of " + std::to_string(opts_.max_ttl.count()) + " seconds");
    return *ttl;
}

AcquireOutcome Coordinator::acquire(const AcquireRequest& req) {
    validateResourceId(req.resource_id);
    validateIdentity(req.holder_user_id, "holder user id");
    validateIdentity(req.holder_session_id, "holder session id");
    const auto ttl = resolveTtl(req.ttl);

    if (orders_ && !orders_->exists(req.resource_kind, req.resource_id))
        throw ResourceNotFound(model::to_string(req.resource_kind) + " order not found: " + req.resource_id);

    const auto now = clock_->now();

    model::Lock candidate;
    candidate.id = newLockId();
    candidate.resource_kind = req.resource_kind;
    candidate.resource_id = req.resource_id;
    candidate.holder_user_id = req.holder_user_id;
    candidate.holder_session_id = req.holder_session_id;
    candidate.acquired_at = now;
    candidate.expires_at = now + ttl;
    candidate.last_activity_at = now;

    auto attempt = store_->tryAcquire(candidate, now);

    if (attempt.granted) {
        LockGrant grant{std::move(attempt.lock), false};
        grant.renewed = grant.lock.id != candidate.id;

        if (grant.renewed) {
            Registry::locks()->debug("[Coordinator] Re-acquire renewed {}", model::to_string(grant.lock));
        } else {
            Registry::locks()->info("[Coordinator] Granted {}", model::to_string(grant.lock));
            notifyLocked(grant.lock);
        }
        return grant;
    }

    const auto& holder = attempt.lock;
    // Only the store can tell that this session already holds the order under
    // the other kind, so this check runs after the write attempt left it untouched.
    if (holder.isHeldBy(req.holder_user_id, req.holder_session_id))
        throw std::invalid_argument("resource " + req.resource_id + " is locked as a "
                                    + model::to_string(holder.resource_kind) + " order");

    Registry::locks()->info("[Coordinator] Conflict on {} requested by {}: {}",
                            req.resource_id, req.holder_user_id, model::to_string(holder));

    return Conflict{
        .resource_id = holder.resource_id,
        .resource_kind = holder.resource_kind,
        .holder_user_id = holder.holder_user_id,
        .expires_at = holder.expires_at
    };
}

RenewOutcome Coordinator::renew(const std::string& resourceId, const std::string& sessionId,
                                const std::optional<std::chrono::seconds> ttl) {
    validateResourceId(resourceId);
    validateIdentity(sessionId, "holder session id");
    const auto resolved = resolveTtl(ttl);

    const auto now = clock_->now();
    auto renewed = store_->renew(resourceId, sessionId, now, now + resolved);
    if (!renewed) {
        Registry::locks()->debug("[Coordinator] Renew of {} rejected, not held by session", resourceId);
        return NotHeld{.resource_id = resourceId};
    }

    Registry::locks()->debug("[Coordinator] Renewed {}", model::to_string(*renewed));
    return LockGrant{std::move(*renewed), true};
}

ReleaseOutcome Coordinator::release(const std::string& resourceId, const std::string& sessionId) {
    validateResourceId(resourceId);
    validateIdentity(sessionId, "holder session id");

    const auto attempt = store_->release(resourceId, sessionId);
    if (attempt.deleted) {
        Registry::locks()->info("[Coordinator] Released {}", resourceId);
        notifyUnlocked(resourceId);
        return Released{resourceId};
    }

    const auto now = clock_->now();
    if (attempt.remaining && !attempt.remaining->isExpiredAt(now)) {
        Registry::locks()->warn("[Coordinator] Release of {} refused, held by another session of user {}",
                                resourceId, attempt.remaining->holder_user_id);
        return NotHeld{.resource_id = resourceId, .held_by_other = true};
    }

    return NotHeld{.resource_id = resourceId, .held_by_other = false};
}

LockStatus Coordinator::inspect(const std::string& resourceId) const {
    validateResourceId(resourceId);

    const auto lock = store_->find(resourceId);
    const auto now = clock_->now();
    if (!lock || lock->isExpiredAt(now)) return Unlocked{resourceId};

    return LockedBy{
        .resource_id = lock->resource_id,
        .resource_kind = lock->resource_kind,
        .holder_user_id = lock->holder_user_id,
        .acquired_at = lock->acquired_at,
        .expires_at = lock->expires_at
    };
}

std::size_t Coordinator::sweep() {
    const auto cutoff = clock_->now() - opts_.sweep_grace;
    const auto purged = store_->purgeExpired(cutoff);
    if (purged > 0)
        Registry::locks()->info("[Coordinator] Swept {} lock(s) expired before {}", purged, util::timestampToIso(cutoff));
    return purged;
}

void Coordinator::notifyLocked(const model::Lock& lock) const {
    for (const auto& l : listeners_) {
        try {
            l->onLocked(lock);
        } catch (const std::exception& e) {
            Registry::locks()->warn("[Coordinator] Lock listener failed for {}: {}", lock.resource_id, e.what());
        }
    }
}

void Coordinator::notifyUnlocked(const std::string& resourceId) const {
    for (const auto& l : listeners_) {
        try {
            l->onUnlocked(resourceId);
        } catch (const std::exception& e) {
            Registry::locks()->warn("[Coordinator] Unlock listener failed for {}: {}", resourceId, e.what());
        }
    }
}
