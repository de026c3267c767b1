#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <log.hpp>
#include <phm/health_watchdog.hpp>
#include <presence/core/scheduler.hpp>
#include <supervisor/backoff_policy.hpp>
#include <supervisor/event_source.hpp>

namespace presence::supervisor {

enum class ConnectionState : std::uint8_t { kConnecting, kConnected, kReconnecting, kStopped };

inline constexpr const char* ToString(ConnectionState s) {
    switch (s) {
        case ConnectionState::kConnecting:   return "connecting";
        case ConnectionState::kConnected:    return "connected";
        case ConnectionState::kReconnecting: return "reconnecting";
        default:                             return "stopped";
    }
}

// Case-insensitive match on "authentication", "login", "unauthorized", "401".
bool IsAuthenticationError(std::string_view message);

// The connection passed to OnConnected stays usable until the next
// OnDisconnected (or until the supervisor stops). Do not keep it longer.
class ConnectionObserver {
public:
    virtual ~ConnectionObserver() = default;
    virtual void OnConnected(Connection& connection) = 0;
    virtual void OnDisconnected() = 0;
};

// Keeps one subscription to the event source alive until Stop().
//
// Runs entirely on the scheduler thread. State(), LastEventTime() and
// Attempts() may also be read from other threads.
class ConnectionSupervisor {
public:
    struct Config {
        BackoffPolicy::Config backoff{};
        std::chrono::milliseconds auth_cooldown{30 * 60 * 1000};
        phm::HealthWatchdog::Config health{};
    };

    ConnectionSupervisor(core::Scheduler& scheduler, EventSource& source,
                         Credentials credentials, Config cfg, JitterSource jitter = {});
    ~ConnectionSupervisor();

    ConnectionSupervisor(const ConnectionSupervisor&) = delete;
    ConnectionSupervisor& operator=(const ConnectionSupervisor&) = delete;

    // Makes the first connect attempt immediately.
    void Start(ConnectionObserver& observer);
    // Idempotent. Does not call OnDisconnected.
    void Stop();

    // Close/error signal from the live connection.
    void HandleDisconnect(const std::string& reason);

    // Called for every inbound presence event, valid or not.
    void RecordEvent();

    ConnectionState State() const noexcept { return state_.load(std::memory_order_acquire); }
    std::optional<core::WallClock::time_point> LastEventTime() const noexcept;
    std::uint32_t Attempts() const noexcept { return attempts_.load(std::memory_order_acquire); }

    // Scheduler thread only.
    std::shared_ptr<Connection> Live() const { return live_; }
    bool ReconnectPending() const noexcept { return reconnect_pending_; }
    phm::HealthWatchdog& Watchdog() noexcept { return watchdog_; }

private:
    void Connect();
    void ScheduleReconnect(std::chrono::milliseconds delay);
    void TearDownLive();

    core::Scheduler& scheduler_;
    EventSource& source_;
    Credentials credentials_;
    Config cfg_;
    BackoffPolicy backoff_;
    FixedCooldown auth_cooldown_;
    phm::HealthWatchdog watchdog_;
    ConnectionObserver* observer_{nullptr};

    std::shared_ptr<Connection> live_;
    core::TimerId reconnect_timer_{core::kNoTimer};
    bool reconnect_pending_{false};

    static constexpr std::int64_t kNoEvent = std::numeric_limits<std::int64_t>::min();
    std::atomic<ConnectionState> state_{ConnectionState::kConnecting};
    std::atomic<std::uint32_t> attempts_{0};
    std::atomic<std::int64_t> last_event_ms_{kNoEvent};

    log::Logger log_;
};

} // namespace presence::supervisor
