#pragma once
#include <chrono>
#include <functional>
#include <optional>
#include <log.hpp>
#include <presence/core/scheduler.hpp>

namespace presence::phm {

// Periodic liveness check on the time since the last inbound event.
// Only reports; never touches the connection.
class HealthWatchdog {
public:
    struct Config {
        std::chrono::milliseconds interval{60 * 1000};
        std::chrono::milliseconds stale_after{24 * 60 * 60 * 1000};
    };

    using LastEventFn   = std::function<std::optional<core::WallClock::time_point>()>;
    using StaleCallback = std::function<void(std::chrono::milliseconds age)>;

    HealthWatchdog(core::Scheduler& scheduler, Config cfg, LastEventFn last_event);
    ~HealthWatchdog();

    HealthWatchdog(const HealthWatchdog&) = delete;
    HealthWatchdog& operator=(const HealthWatchdog&) = delete;

    void Start();  // no-op when already running
    void Stop();
    bool Running() const noexcept { return timer_ != core::kNoTimer; }

    void SetStaleCallback(StaleCallback cb) { on_stale_ = std::move(cb); }

    // One check; also what the periodic timer runs.
    void MaintenanceTick();

private:
    core::Scheduler& scheduler_;
    Config cfg_;
    LastEventFn last_event_;
    StaleCallback on_stale_{};
    core::TimerId timer_{core::kNoTimer};
    log::Logger log_;
};

} // namespace presence::phm
