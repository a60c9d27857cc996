#include "lock/Listener.hpp"
#include "log/Registry.hpp"

#include <nlohmann/json.hpp>

using namespace lw::lock;

void AuditListener::onLocked(const model::Lock& lock) {
    const nlohmann::json payload = lock;
    log::Registry::audit()->info("order:locked {}", payload.dump());
}

void AuditListener::onUnlocked(const std::string& resourceId) {
    const nlohmann::json payload = {{"order_id", resourceId}};
    log::Registry::audit()->info("order:unlocked {}", payload.dump());
}
