#pragma once
#include <algorithm>
#include <chrono>
#include <deque>
#include <map>
#include <vector>
#include <presence/core/scheduler.hpp>

namespace presence::test {

// Virtual-time scheduler. Nothing runs until the test calls RunPosted() or
// Advance(); timers fire in due order, ties in creation order.
class ManualScheduler final : public core::Scheduler {
public:
    explicit ManualScheduler(core::WallClock::time_point start =
                                 core::WallClock::time_point(std::chrono::hours(24 * 365 * 50)))
        : now_(start) {}

    void Post(core::Task task) override { posted_.push_back(std::move(task)); }

    core::TimerId ScheduleAfter(std::chrono::milliseconds delay, core::Task task) override {
        return Add(delay, std::chrono::milliseconds(0), std::move(task));
    }
    core::TimerId ScheduleEvery(std::chrono::milliseconds period, core::Task task) override {
        return Add(period, period, std::move(task));
    }
    bool Cancel(core::TimerId id) override {
        ++cancel_calls_;
        return timers_.erase(id) > 0;
    }
    core::WallClock::time_point Now() const override { return now_; }

    // Drains the posted queue, including tasks posted while draining.
    void RunPosted() {
        while (!posted_.empty()) {
            auto t = std::move(posted_.front());
            posted_.pop_front();
            if (t) t();
        }
    }

    // Moves virtual time forward, firing every timer due on the way.
    void Advance(std::chrono::milliseconds d) {
        const auto until = now_ + d;
        RunPosted();
        for (;;) {
            auto it = NextDue(until);
            if (it == timers_.end()) break;
            now_ = it->second.due;
            auto task = it->second.task;
            if (it->second.period.count() > 0) it->second.due += it->second.period;
            else timers_.erase(it);
            task();
            RunPosted();
        }
        now_ = until;
    }

    // Fires the next pending timer regardless of its delay.
    bool FireNext() {
        if (timers_.empty()) return false;
        auto it = NextDue(core::WallClock::time_point::max());
        Advance(std::chrono::duration_cast<std::chrono::milliseconds>(it->second.due - now_));
        return true;
    }

    std::size_t PendingTimers() const { return timers_.size(); }
    std::size_t PostedTasks() const { return posted_.size(); }
    int CancelCalls() const { return cancel_calls_; }

    // Delays of the timers currently armed, in creation order.
    std::vector<std::chrono::milliseconds> PendingDelays() const {
        std::vector<std::chrono::milliseconds> out;
        for (const auto& [id, t] : timers_) out.push_back(t.delay);
        return out;
    }

private:
    struct Timer {
        core::WallClock::time_point due;
        std::chrono::milliseconds delay{0};
        std::chrono::milliseconds period{0};
        core::Task task;
    };

    core::TimerId Add(std::chrono::milliseconds delay, std::chrono::milliseconds period, core::Task task) {
        const auto id = ++next_id_;
        timers_.emplace(id, Timer{now_ + delay, delay, period, std::move(task)});
        return id;
    }

    std::map<core::TimerId, Timer>::iterator NextDue(core::WallClock::time_point until) {
        auto best = timers_.end();
        for (auto it = timers_.begin(); it != timers_.end(); ++it) {
            if (it->second.due > until) continue;
            if (best == timers_.end() || it->second.due < best->second.due) best = it;
        }
        return best;
    }

    core::WallClock::time_point now_;
    std::deque<core::Task> posted_;
    std::map<core::TimerId, Timer> timers_;
    core::TimerId next_id_{core::kNoTimer};
    int cancel_calls_{0};
};

} // namespace presence::test
