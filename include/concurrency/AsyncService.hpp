#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

namespace lw::concurrency {

class AsyncService {
public:
    explicit AsyncService(const std::string& serviceName);

    virtual ~AsyncService();

    virtual void start();

    virtual void stop();

    [[nodiscard]] bool isRunning() const { return running_.load(std::memory_order_acquire); }

    [[nodiscard]] const std::string& name() const { return serviceName_; }

protected:
    std::string serviceName_;
    std::atomic<bool> running_{false};
    std::atomic<bool> interruptFlag_{false};
    std::thread worker_;

    [[nodiscard]] bool shouldStop() const { return interruptFlag_.load(std::memory_order_acquire); }

    // Sleeps for up to `d`, returning early once stop() is requested.
    template <typename Rep, typename Period>
    void lazySleep(const std::chrono::duration<Rep, Period>& d) {
        std::unique_lock lk(sleepMtx_);
        sleepCv_.wait_for(lk, d, [this] { return shouldStop(); });
    }

    virtual void runLoop() = 0;

private:
    std::mutex sleepMtx_;
    std::condition_variable sleepCv_;
};

}
