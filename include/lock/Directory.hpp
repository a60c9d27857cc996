#pragma once

#include "lock/model/Lock.hpp"

#include <optional>
#include <string>

namespace lw::lock {

// Answers whether an order of the given family exists.
class OrderDirectory {
public:
    virtual ~OrderDirectory() = default;
    [[nodiscard]] virtual bool exists(model::ResourceKind kind, const std::string& resourceId) const = 0;
};

class UserDirectory {
public:
    virtual ~UserDirectory() = default;
    [[nodiscard]] virtual std::optional<std::string> displayName(const std::string& userId) const = 0;
};

}
