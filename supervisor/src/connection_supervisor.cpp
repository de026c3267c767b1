#include <supervisor/connection_supervisor.hpp>
#include <algorithm>
#include <array>
#include <cctype>

namespace presence::supervisor {

namespace {

constexpr std::array<EventKind, 5> kAllKinds{
    EventKind::kLocation, EventKind::kOnline, EventKind::kOffline,
    EventKind::kClose, EventKind::kError};

std::string ToLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

double ToSeconds(std::chrono::milliseconds d) {
    return static_cast<double>(d.count()) / 1000.0;
}

} // namespace

bool IsAuthenticationError(std::string_view message) {
    const std::string m = ToLower(message);
    for (const char* needle : {"authentication", "login", "unauthorized", "401"}) {
        if (m.find(needle) != std::string::npos) return true;
    }
    return false;
}

ConnectionSupervisor::ConnectionSupervisor(core::Scheduler& scheduler, EventSource& source,
                                           Credentials credentials, Config cfg, JitterSource jitter)
    : scheduler_(scheduler), source_(source), credentials_(std::move(credentials)), cfg_(cfg),
      backoff_(cfg.backoff, std::move(jitter)), auth_cooldown_(cfg.auth_cooldown),
      watchdog_(scheduler, cfg.health, [this] { return LastEventTime(); }),
      log_(log::Logger::CreateLogger("MON")) {}

ConnectionSupervisor::~ConnectionSupervisor() {
    Stop();
}

void ConnectionSupervisor::Start(ConnectionObserver& observer) {
    PRESENCE_LOGINFO(log_, "Starting connection supervisor");
    observer_ = &observer;
    Connect();
}

void ConnectionSupervisor::Stop() {
    if (State() == ConnectionState::kStopped) return;

    PRESENCE_LOGINFO(log_, "Stopping connection supervisor");
    state_.store(ConnectionState::kStopped, std::memory_order_release);

    if (reconnect_timer_ != core::kNoTimer) {
        scheduler_.Cancel(reconnect_timer_);
        reconnect_timer_ = core::kNoTimer;
    }
    reconnect_pending_ = false;
    watchdog_.Stop();
    TearDownLive();
}

void ConnectionSupervisor::RecordEvent() {
    const auto now = scheduler_.Now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
    last_event_ms_.store(ms, std::memory_order_release);
}

std::optional<core::WallClock::time_point> ConnectionSupervisor::LastEventTime() const noexcept {
    const auto ms = last_event_ms_.load(std::memory_order_acquire);
    if (ms == kNoEvent) return std::nullopt;
    return core::WallClock::time_point(std::chrono::milliseconds(ms));
}

void ConnectionSupervisor::Connect() {
    if (State() == ConnectionState::kStopped) return;

    state_.store(ConnectionState::kConnecting, std::memory_order_release);
    TearDownLive();

    PRESENCE_LOGINFO(log_, "Connecting to event source (attempt {})", Attempts());
    auto result = source_.Connect(credentials_);

    // Stop() may have run from a nested callback while we were blocked
    if (State() == ConnectionState::kStopped) {
        if (result.HasValue() && result.Value()) result.Value()->Close();
        return;
    }

    if (!result.HasValue() || !result.Value()) {
        const std::string reason = result.HasValue() ? "event source returned no connection"
                                                     : result.Error().Describe();
        PRESENCE_LOGERROR(log_, "Failed to connect: {}", reason);

        if (IsAuthenticationError(reason)) {
            const auto delay = auth_cooldown_.ComputeDelay(Attempts());
            PRESENCE_LOGERROR(log_, "Authentication error detected, cooling down for {} minutes",
                              delay.count() / 60000);
            ScheduleReconnect(delay);
        } else {
            ScheduleReconnect(backoff_.ComputeDelay(Attempts()));
        }
        return;
    }

    live_ = std::move(result.Value());
    live_->On(EventKind::kClose, [this](const std::string& reason) {
        PRESENCE_LOGWARN(log_, "Connection closed: {}", reason);
        HandleDisconnect(reason);
    });
    live_->On(EventKind::kError, [this](const std::string& reason) {
        PRESENCE_LOGERROR(log_, "Connection error: {}", reason);
        HandleDisconnect(reason);
    });

    state_.store(ConnectionState::kConnected, std::memory_order_release);
    attempts_.store(0, std::memory_order_release);
    PRESENCE_LOGINFO(log_, "Connected to event source");

    if (observer_) observer_->OnConnected(*live_);
    if (State() == ConnectionState::kConnected) watchdog_.Start();
}

void ConnectionSupervisor::HandleDisconnect(const std::string& reason) {
    if (State() == ConnectionState::kStopped) return;
    if (reconnect_pending_) {
        PRESENCE_LOGWARN(log_, "Reconnect already in progress, ignoring '{}'", reason);
        return;
    }

    PRESENCE_LOGWARN(log_, "Handling disconnect");
    TearDownLive();
    if (observer_) observer_->OnDisconnected();
    if (State() == ConnectionState::kStopped) return;

    ScheduleReconnect(backoff_.ComputeDelay(Attempts()));
}

void ConnectionSupervisor::ScheduleReconnect(std::chrono::milliseconds delay) {
    if (reconnect_pending_) {
        PRESENCE_LOGWARN(log_, "Reconnect already in progress, skipping");
        return;
    }
    reconnect_pending_ = true;
    state_.store(ConnectionState::kReconnecting, std::memory_order_release);

    const auto attempt = attempts_.fetch_add(1, std::memory_order_acq_rel) + 1;
    PRESENCE_LOGINFO(log_, "Scheduling reconnect attempt #{} in {} seconds", attempt, ToSeconds(delay));

    if (reconnect_timer_ != core::kNoTimer) scheduler_.Cancel(reconnect_timer_);
    reconnect_timer_ = scheduler_.ScheduleAfter(delay, [this] {
        reconnect_timer_ = core::kNoTimer;
        reconnect_pending_ = false;
        Connect();
    });
}

void ConnectionSupervisor::TearDownLive() {
    if (!live_) return;
    for (auto kind : kAllKinds) live_->RemoveAllListeners(kind);
    live_->Close();
    // Released on a later turn; we may be inside one of its listeners.
    scheduler_.Post([retired = std::move(live_)] {});
    live_.reset();
}

} // namespace presence::supervisor
