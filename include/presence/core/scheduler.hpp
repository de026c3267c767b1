#pragma once
#include <chrono>
#include <cstdint>
#include <functional>

namespace presence::core {

using TimerId   = std::uint64_t;
using WallClock = std::chrono::system_clock;
using Task      = std::function<void()>;

inline constexpr TimerId kNoTimer = 0;

// Cooperative scheduling surface injected into the supervisor, the store and
// the watchdog. Every callback runs on the scheduler's own thread, one at a
// time, in the order it became due. Post() is the only call that may be made
// from a foreign thread.
class Scheduler {
public:
    virtual ~Scheduler() = default;

    virtual void Post(Task task) = 0;
    virtual TimerId ScheduleAfter(std::chrono::milliseconds delay, Task task) = 0;
    virtual TimerId ScheduleEvery(std::chrono::milliseconds period, Task task) = 0;
    // Returns false when the id is unknown or already fired (one-shot).
    virtual bool Cancel(TimerId id) = 0;

    virtual WallClock::time_point Now() const = 0;
};

} // namespace presence::core
