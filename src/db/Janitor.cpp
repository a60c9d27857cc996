#include "db/Janitor.hpp"
#include "lock/Coordinator.hpp"
#include "log/Registry.hpp"

using namespace lw::db;

Janitor::Janitor(std::shared_ptr<lock::Coordinator> coordinator, const std::chrono::seconds sweepInterval)
    : AsyncService("LockJanitor"),
      coordinator_(std::move(coordinator)),
      sweep_interval_(sweepInterval) {}

Janitor::~Janitor() { stop(); }

void Janitor::runLoop() {
    while (!shouldStop()) {
        try {
            coordinator_->sweep();
        } catch (const std::exception& e) {
            log::Registry::lockwright()->warn("[LockJanitor] Failed to sweep expired locks: {}", e.what());
        }
        ++sweeps_;

        lazySleep(sweep_interval_);
    }
}
