#include "sync/Scheduler.hpp"
#include "log/Registry.hpp"

#include <stdexcept>

using namespace tally::sync;

const char* tally::sync::to_string(const Scheduler::State s) {
    switch (s) {
        case Scheduler::State::Idle: return "idle";
        case Scheduler::State::Running: return "running";
        case Scheduler::State::Disabled: return "disabled";
    }
    return "unknown";
}

Scheduler::Scheduler(Agent& agent)
    : AsyncService("SyncScheduler"), agent_(agent) {}

Scheduler::~Scheduler() {
    stopPeriodic();
}

SyncResult Scheduler::trigger() {
    if (disabled_.load()) {
        log::Registry::sync()->debug("[Scheduler] Sync disabled, trigger ignored");
        return SyncResult::Skipped;
    }

    std::unique_lock lock(gate_, std::try_to_lock);
    if (!lock.owns_lock()) {
        log::Registry::sync()->debug("[Scheduler] Sync already running, trigger ignored");
        return SyncResult::Skipped;
    }

    inFlight_.store(true);
    const auto result = agent_.sync();
    inFlight_.store(false);

    lastResult_.store(result);
    return result;
}

void Scheduler::disable() {
    disabled_.store(true);
    log::Registry::sync()->info("[Scheduler] Sync disabled");
}

void Scheduler::enable() {
    disabled_.store(false);
    log::Registry::sync()->info("[Scheduler] Sync enabled");
}

Scheduler::State Scheduler::state() const {
    if (disabled_.load() || lastResult_.load() == SyncResult::NotAuthenticated) return State::Disabled;
    return inFlight_.load() ? State::Running : State::Idle;
}

SyncResult Scheduler::lastResult() const {
    return lastResult_.load();
}

void Scheduler::startPeriodic(const std::chrono::milliseconds interval) {
    if (interval.count() <= 0) throw std::invalid_argument("Sync interval must be positive");
    if (isRunning()) return;

    {
        std::scoped_lock lock(timerMutex_);
        interval_ = interval;
    }
    start();
    log::Registry::sync()->info("[Scheduler] Periodic sync every {}ms", interval.count());
}

void Scheduler::stopPeriodic() {
    {
        std::scoped_lock lock(timerMutex_);
        interruptFlag_.store(true);
    }
    timerCv_.notify_all();
    stop();
}

void Scheduler::runLoop() {
    std::unique_lock lock(timerMutex_);

    while (!interruptFlag_.load()) {
        // no initial tick: always wait a full interval first
        if (timerCv_.wait_for(lock, interval_, [this] { return interruptFlag_.load(); })) break;

        lock.unlock();
        const auto result = trigger();
        log::Registry::sync()->debug("[Scheduler] Periodic sync: {}", to_string(result));
        lock.lock();
    }
}
