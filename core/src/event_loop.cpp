#include <presence/core/event_loop.hpp>
#include <utility>

namespace presence::core {

void EventLoop::Post(Task task) {
    {
        std::lock_guard<std::mutex> lock(mu_);
        tasks_.push_back(std::move(task));
    }
    cv_.notify_one();
}

TimerId EventLoop::ScheduleAfter(std::chrono::milliseconds delay, Task task) {
    return AddTimer(delay, std::chrono::milliseconds{0}, std::move(task));
}

TimerId EventLoop::ScheduleEvery(std::chrono::milliseconds period, Task task) {
    if (period.count() <= 0) period = std::chrono::milliseconds{1};
    return AddTimer(period, period, std::move(task));
}

TimerId EventLoop::AddTimer(std::chrono::milliseconds delay,
                            std::chrono::milliseconds period, Task task) {
    TimerId id;
    {
        std::lock_guard<std::mutex> lock(mu_);
        id = ++next_id_;
        timers_.emplace(id, Timer{SteadyClock::now() + delay, period, std::move(task)});
    }
    cv_.notify_one();
    return id;
}

bool EventLoop::Cancel(TimerId id) {
    std::lock_guard<std::mutex> lock(mu_);
    return timers_.erase(id) > 0;
}

void EventLoop::Stop() noexcept {
    {
        std::lock_guard<std::mutex> lock(mu_);
        stop_requested_ = true;
    }
    cv_.notify_all();
}

std::map<TimerId, EventLoop::Timer>::iterator
EventLoop::NextDueNoLock_(SteadyClock::time_point now) {
    auto best = timers_.end();
    for (auto it = timers_.begin(); it != timers_.end(); ++it) {
        if (it->second.due > now) continue;
        // Earliest deadline first; ties resolve by id, i.e. scheduling order
        if (best == timers_.end() || it->second.due < best->second.due) best = it;
    }
    return best;
}

void EventLoop::Run() {
    running_.store(true, std::memory_order_release);
    std::unique_lock<std::mutex> lock(mu_);

    while (!stop_requested_) {
        if (!tasks_.empty()) {
            Task t = std::move(tasks_.front());
            tasks_.pop_front();
            lock.unlock();
            if (t) t();
            lock.lock();
            continue;
        }

        const auto now = SteadyClock::now();
        auto due = NextDueNoLock_(now);
        if (due != timers_.end()) {
            Task t;
            if (due->second.period.count() > 0) {
                t = due->second.task;  // keep the original for the next period
                due->second.due = now + due->second.period;
            } else {
                t = std::move(due->second.task);
                timers_.erase(due);
            }
            lock.unlock();
            if (t) t();
            lock.lock();
            continue;
        }

        if (timers_.empty()) {
            cv_.wait(lock);
        } else {
            auto earliest = timers_.begin()->second.due;
            for (const auto& [id, timer] : timers_) {
                if (timer.due < earliest) earliest = timer.due;
            }
            cv_.wait_until(lock, earliest);
        }
    }

    running_.store(false, std::memory_order_release);
}

} // namespace presence::core
