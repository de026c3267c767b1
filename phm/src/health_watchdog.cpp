#include <phm/health_watchdog.hpp>
#include <iomanip>
#include <sstream>

namespace presence::phm {

HealthWatchdog::HealthWatchdog(core::Scheduler& scheduler, Config cfg, LastEventFn last_event)
    : scheduler_(scheduler), cfg_(cfg), last_event_(std::move(last_event)),
      log_(log::Logger::CreateLogger("PHM")) {}

HealthWatchdog::~HealthWatchdog() {
    Stop();
}

void HealthWatchdog::Start() {
    if (Running()) return;
    timer_ = scheduler_.ScheduleEvery(cfg_.interval, [this] { MaintenanceTick(); });
    PRESENCE_LOGDEBUG(log_, "Watchdog started (interval {} ms, stale after {} ms)",
                      cfg_.interval.count(), cfg_.stale_after.count());
}

void HealthWatchdog::Stop() {
    if (!Running()) return;
    scheduler_.Cancel(timer_);
    timer_ = core::kNoTimer;
}

void HealthWatchdog::MaintenanceTick() {
    if (!last_event_) return;
    const auto last = last_event_();
    if (!last) return;  // nothing received yet

    const auto age = std::chrono::duration_cast<std::chrono::milliseconds>(scheduler_.Now() - *last);
    if (age <= cfg_.stale_after) return;

    std::ostringstream hours;
    hours << std::fixed << std::setprecision(1) << (static_cast<double>(age.count()) / 3'600'000.0);
    PRESENCE_LOGWARN(log_, "No events received for {} hours, feed may be stale", hours.str());

    if (on_stale_) on_stale_(age);
}

} // namespace presence::phm
