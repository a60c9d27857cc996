#include "lock/Outcome.hpp"
#include "util/timestamp.hpp"

#include <nlohmann/json.hpp>

void lw::lock::to_json(nlohmann::json& j, const LockGrant& grant) {
    j = grant.lock;
    j["renewed"] = grant.renewed;
}

void lw::lock::to_json(nlohmann::json& j, const Conflict& conflict) {
    j = {
        {"order_id", conflict.resource_id},
        {"order_type", model::to_string(conflict.resource_kind)},
        {"locked_by_user_id", conflict.holder_user_id},
        {"expires_at", util::timestampToIso(conflict.expires_at)}
    };
}

void lw::lock::to_json(nlohmann::json& j, const LockedBy& status) {
    j = {
        {"order_id", status.resource_id},
        {"locked", true},
        {"order_type", model::to_string(status.resource_kind)},
        {"locked_by_user_id", status.holder_user_id},
        {"locked_at", util::timestampToIso(status.acquired_at)},
        {"expires_at", util::timestampToIso(status.expires_at)}
    };
}

void lw::lock::to_json(nlohmann::json& j, const Unlocked& status) {
    j = {
        {"order_id", status.resource_id},
        {"locked", false}
    };
}
