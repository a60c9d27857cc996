#include "lock/model/Lock.hpp"
#include "util/timestamp.hpp"

#include <stdexcept>
#include <unordered_map>
#include <pqxx/row>
#include <nlohmann/json.hpp>

using namespace lw::lock::model;

std::string lw::lock::model::to_string(const ResourceKind kind) {
    switch (kind) {
        case ResourceKind::CustomerOrder: return "customer";
        case ResourceKind::InternalOrder: return "internal";
        default: throw std::invalid_argument("Unknown ResourceKind enum value");
    }
}

ResourceKind lw::lock::model::resourceKindFromString(const std::string& str) {
    static const std::unordered_map<std::string, ResourceKind> mapping = {
        {"customer", ResourceKind::CustomerOrder},
        {"internal", ResourceKind::InternalOrder}
    };
    if (const auto it = mapping.find(str); it != mapping.end()) return it->second;
    throw std::invalid_argument("Invalid resource kind: " + str);
}

Lock::Lock(const pqxx::row& row)
    : id(row["id"].as<std::string>()),
      resource_kind(resourceKindFromString(row["order_type"].as<std::string>())),
      resource_id(row["resource_id"].as<std::string>()),
      holder_user_id(row["holder_user_id"].as<std::string>()),
      holder_session_id(row["holder_session_id"].as<std::string>()),
      acquired_at(util::fromEpochMicros(row["acquired_at_us"].as<int64_t>())),
      expires_at(util::fromEpochMicros(row["expires_at_us"].as<int64_t>())),
      last_activity_at(util::fromEpochMicros(row["last_activity_at_us"].as<int64_t>())) {}

void lw::lock::model::to_json(nlohmann::json& j, const Lock& lock) {
    j = {
        {"id", lock.id},
        {"order_type", to_string(lock.resource_kind)},
        {"order_id", lock.resource_id},
        {"locked_by_user_id", lock.holder_user_id},
        {"locked_at", util::timestampToIso(lock.acquired_at)},
        {"expires_at", util::timestampToIso(lock.expires_at)},
        {"last_activity_at", util::timestampToIso(lock.last_activity_at)}
    };
}

std::string lw::lock::model::to_string(const Lock& lock) {
    return to_string(lock.resource_kind) + " order " + lock.resource_id + " held by " + lock.holder_user_id
           + " until " + util::timestampToIso(lock.expires_at);
}
