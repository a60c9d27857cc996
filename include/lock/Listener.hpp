#pragma once

#include "lock/model/Lock.hpp"

#include <string>

namespace lw::lock {

class Listener {
public:
    virtual ~Listener() = default;

    // A fresh lock was granted (not fired for renewals).
    virtual void onLocked(const model::Lock& lock) = 0;
    virtual void onUnlocked(const std::string& resourceId) = 0;
};

// Writes order:locked / order:unlocked events to the audit log.
class AuditListener final : public Listener {
public:
    void onLocked(const model::Lock& lock) override;
    void onUnlocked(const std::string& resourceId) override;
};

}
