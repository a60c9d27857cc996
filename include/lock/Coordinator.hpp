#pragma once

#include "lock/Outcome.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace lw::config { struct Config; }

namespace lw::lock {

class Store;
class Clock;
class OrderDirectory;
class Listener;

struct CoordinatorOptions {
    std::chrono::seconds default_ttl{300};
    std::chrono::seconds max_ttl{3600};
    std::chrono::seconds sweep_grace{300};

    static CoordinatorOptions fromConfig(const config::Config& cfg);
};

struct AcquireRequest {
    model::ResourceKind resource_kind{model::ResourceKind::CustomerOrder};
    std::string resource_id;
    std::string holder_user_id;
    std::string holder_session_id;
    std::optional<std::chrono::seconds> ttl;
};

/**
 * Exclusive, expiring edit locks on orders.
 *
 * Holds no lock state of its own: every call is answered by exactly one atomic
 * store operation, so any number of instances may share one store. Expiry is
 * always evaluated against the clock at call time, never trusted to the sweep.
 *
 * Expected outcomes (Conflict, NotHeld) are returned as variants. Malformed
 * input throws std::invalid_argument before the store is touched; an
 * unreachable store throws lock::Unavailable.
 */
class Coordinator {
public:
    Coordinator(std::shared_ptr<Store> store, std::shared_ptr<Clock> clock, CoordinatorOptions opts = {});

    // Wiring only; not safe once requests are being served.
    void setOrderDirectory(std::shared_ptr<OrderDirectory> orders);
    void addListener(std::shared_ptr<Listener> listener);

    AcquireOutcome acquire(const AcquireRequest& req);

    RenewOutcome renew(const std::string& resourceId, const std::string& sessionId,
                       std::optional<std::chrono::seconds> ttl = std::nullopt);

    ReleaseOutcome release(const std::string& resourceId, const std::string& sessionId);

    [[nodiscard]] LockStatus inspect(const std::string& resourceId) const;

    // Deletes rows that expired more than one grace period ago.
    std::size_t sweep();

    [[nodiscard]] const CoordinatorOptions& options() const { return opts_; }

    static void validateResourceId(const std::string& resourceId);

private:
    std::shared_ptr<Store> store_;
    std::shared_ptr<Clock> clock_;
    std::shared_ptr<OrderDirectory> orders_;
    std::vector<std::shared_ptr<Listener>> listeners_;
    CoordinatorOptions opts_;

    [[nodiscard]] std::chrono::seconds resolveTtl(const std::optional<std::chrono::seconds>& ttl) const;

    void notifyLocked(const model::Lock& lock) const;
    void notifyUnlocked(const std::string& resourceId) const;
};

}
