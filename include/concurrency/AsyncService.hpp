#pragma once

#include <atomic>
#include <string>
#include <thread>

namespace tally::concurrency {

// A named background loop on its own thread.
class AsyncService {
public:
    explicit AsyncService(std::string serviceName);

    virtual ~AsyncService();

    AsyncService(const AsyncService&) = delete;
    AsyncService& operator=(const AsyncService&) = delete;

    virtual void start();

    // Idempotent. Subclasses that block in runLoop() must wake it first.
    virtual void stop();

    [[nodiscard]] bool isRunning() const { return running_.load(std::memory_order_acquire); }

    [[nodiscard]] const std::string& name() const { return serviceName_; }

protected:
    std::string serviceName_;
    std::atomic<bool> running_{false};
    std::atomic<bool> interruptFlag_{false};
    std::thread worker_;

    virtual void runLoop() = 0;
};

}
