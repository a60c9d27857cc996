#pragma once

#include "lock/model/Lock.hpp"

#include <string>
#include <variant>
#include <nlohmann/json_fwd.hpp>

namespace lw::lock {

struct LockGrant {
    model::Lock lock;
    bool renewed{false}; // true when an existing live lock of the same session was extended
};

struct Conflict {
    std::string resource_id;
    model::ResourceKind resource_kind{model::ResourceKind::CustomerOrder};
    std::string holder_user_id;
    model::Timestamp expires_at{};
};

struct NotHeld {
    std::string resource_id;
    bool held_by_other{false}; // set by release only
};

struct Released {
    std::string resource_id;
};

struct Unlocked {
    std::string resource_id;
};

struct LockedBy {
    std::string resource_id;
    model::ResourceKind resource_kind{model::ResourceKind::CustomerOrder};
    std::string holder_user_id;
    model::Timestamp acquired_at{};
    model::Timestamp expires_at{};
};

using AcquireOutcome = std::variant<LockGrant, Conflict>;
using RenewOutcome = std::variant<LockGrant, NotHeld>;
using ReleaseOutcome = std::variant<Released, NotHeld>;
using LockStatus = std::variant<Unlocked, LockedBy>;

void to_json(nlohmann::json& j, const LockGrant& grant);
void to_json(nlohmann::json& j, const Conflict& conflict);
void to_json(nlohmann::json& j, const LockedBy& status);
void to_json(nlohmann::json& j, const Unlocked& status);

}
