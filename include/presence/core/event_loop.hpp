#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <presence/core/scheduler.hpp>

namespace presence::core {

// Single-threaded loop: Run() executes posted tasks and due timers until Stop().
class EventLoop final : public Scheduler {
public:
    EventLoop() = default;
    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    void Run();
    void Stop() noexcept;
    bool Running() const noexcept { return running_.load(std::memory_order_acquire); }

    void Post(Task task) override;
    TimerId ScheduleAfter(std::chrono::milliseconds delay, Task task) override;
    TimerId ScheduleEvery(std::chrono::milliseconds period, Task task) override;
    bool Cancel(TimerId id) override;
    WallClock::time_point Now() const override { return WallClock::now(); }

private:
    using SteadyClock = std::chrono::steady_clock;

    struct Timer {
        SteadyClock::time_point due;
        std::chrono::milliseconds period{0};  // zero => one-shot
        Task task;
    };

    TimerId AddTimer(std::chrono::milliseconds delay, std::chrono::milliseconds period, Task task);
    // Caller holds mu_. Returns timers_.end() when nothing is due.
    std::map<TimerId, Timer>::iterator NextDueNoLock_(SteadyClock::time_point now);

    mutable std::mutex mu_;
    std::condition_variable cv_;
    std::deque<Task> tasks_;
    std::map<TimerId, Timer> timers_;
    TimerId next_id_{kNoTimer};
    std::atomic<bool> running_{false};
    bool stop_requested_{false};
};

} // namespace presence::core
