#pragma once

#include <chrono>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace pqxx { class row; }

namespace lw::lock::model {

using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::microseconds>;

// Both order families share one lock namespace keyed by resource_id.
enum class ResourceKind { CustomerOrder, InternalOrder };

std::string to_string(ResourceKind kind);
ResourceKind resourceKindFromString(const std::string& str);

struct Lock {
    std::string id;
    ResourceKind resource_kind{ResourceKind::CustomerOrder};
    std::string resource_id;
    std::string holder_user_id;
    std::string holder_session_id;
    Timestamp acquired_at{};
    Timestamp expires_at{};
    Timestamp last_activity_at{};

    Lock() = default;
    explicit Lock(const pqxx::row& row);

    [[nodiscard]] bool isExpiredAt(const Timestamp now) const { return now > expires_at; }

    [[nodiscard]] bool isHeldBy(const std::string& userId, const std::string& sessionId) const {
        return holder_user_id == userId && holder_session_id == sessionId;
    }
};

// Never serializes holder_session_id.
void to_json(nlohmann::json& j, const Lock& lock);

std::string to_string(const Lock& lock);

}
