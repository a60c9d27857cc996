#pragma once

#include "concurrency/AsyncService.hpp"

#include <atomic>
#include <chrono>
#include <memory>

namespace lw::lock { class Coordinator; }

namespace lw::db {

// Periodically deletes long-expired lock rows. Storage hygiene only.
class Janitor final : public concurrency::AsyncService {
public:
    Janitor(std::shared_ptr<lock::Coordinator> coordinator, std::chrono::seconds sweepInterval);
    ~Janitor() override;

    [[nodiscard]] std::size_t sweeps() const { return sweeps_.load(); }

protected:
    void runLoop() override;

private:
    std::shared_ptr<lock::Coordinator> coordinator_;
    std::chrono::seconds sweep_interval_;
    std::atomic<std::size_t> sweeps_{0};
};

}
