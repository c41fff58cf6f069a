#pragma once

#include "concurrency/AsyncService.hpp"
#include "sync/Agent.hpp"

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace tally::sync {

// Admits one sync at a time and drives the periodic timer.
//
// trigger() never waits: when another run holds the gate it returns Skipped.
// The timer fires every interval after startPeriodic(), never immediately.
class Scheduler final : public concurrency::AsyncService {
public:
    enum class State { Idle, Running, Disabled };

    explicit Scheduler(Agent& agent);
    ~Scheduler() override;

    SyncResult trigger();

    // Logout: triggers become no-ops until enable().
    void disable();
    void enable();

    [[nodiscard]] State state() const;

    void startPeriodic(std::chrono::milliseconds interval);

    // Idempotent; safe to call when the timer never started.
    void stopPeriodic();

    [[nodiscard]] SyncResult lastResult() const;

protected:
    void runLoop() override;

private:
    Agent& agent_;

    std::mutex gate_;
    std::atomic<bool> disabled_{false};
    std::atomic<bool> inFlight_{false};
    std::atomic<SyncResult> lastResult_{SyncResult::Skipped};

    std::mutex timerMutex_;
    std::condition_variable timerCv_;
    std::chrono::milliseconds interval_{0};
};

const char* to_string(Scheduler::State s);

}
