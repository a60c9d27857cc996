#pragma once

#include "lock/model/Lock.hpp"

#include <optional>
#include <string>

namespace lw::db::query::identities {

class Directory {
public:
    static bool orderExists(lw::lock::model::ResourceKind kind, const std::string& orderId);
    static std::optional<std::string> getUserDisplayName(const std::string& userId);
};

}
