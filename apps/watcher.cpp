#include "watcher.hpp"
#include <algorithm>
#include <sstream>

using presence::supervisor::EventKind;

namespace presence::app {

namespace {

std::string Describe(const std::optional<std::string>& state) {
  return state ? *state : std::string("offline");
}

std::string Join(const std::vector<std::string>& items) {
  std::ostringstream oss;
  for (size_t i = 0; i < items.size(); ++i) {
    if (i) oss << ", ";
    oss << items[i];
  }
  return oss.str();
}

} // namespace

Watcher::Watcher(std::vector<std::string> target_ids, persistency::StateStore& store,
                 NotificationSink& sink, EventHook on_event)
  : targets_(std::move(target_ids)), store_(store), sink_(sink),
    on_event_(std::move(on_event)), log_(log::Logger::CreateLogger("MAIN")) {}

bool Watcher::IsTarget(const std::string& id) const {
  return std::find(targets_.begin(), targets_.end(), id) != targets_.end();
}

void Watcher::OnConnected(supervisor::Connection& connection) {
  PRESENCE_LOGINFO(log_, "Connected, initializing...");
  connection_ = &connection;

  ValidateTargets(connection);
  ReconcileInitialState(connection);
  AttachListeners(connection);

  PRESENCE_LOGINFO(log_, "Listening for presence events");
}

void Watcher::OnDisconnected() {
  PRESENCE_LOGWARN(log_, "Disconnected");
  connection_ = nullptr;
}

void Watcher::ValidateTargets(supervisor::Connection& connection) {
  std::vector<std::string> not_watchable;
  for (const auto& id : targets_) {
    auto r = connection.IsWatchable(id);
    if (!r.HasValue()) {
      PRESENCE_LOGWARN(log_, "Could not check whether {} is watchable: {}", id, r.Error().Describe());
      continue;
    }
    if (!r.Value()) not_watchable.push_back(id);
  }

  if (!not_watchable.empty()) {
    PRESENCE_LOGWARN(log_, "Not watchable, no events until that changes: {}", Join(not_watchable));
  } else {
    PRESENCE_LOGINFO(log_, "All {} target(s) are watchable", targets_.size());
  }
}

void Watcher::ReconcileInitialState(supervisor::Connection& connection) {
  PRESENCE_LOGINFO(log_, "Fetching initial state...");

  for (const auto& id : targets_) {
    auto snap = connection.FetchEntity(id);
    if (!snap.HasValue()) {
      PRESENCE_LOGWARN(log_, "Failed to fetch {}: {}", id, snap.Error().Describe());
      continue;
    }
    const auto& entity = snap.Value();
    const auto previous = store_.GetRecord(id);

    store_.SetInitial(id, entity.display_name, entity.location);

    if (previous && previous->state != entity.location) {
      PRESENCE_LOGINFO(log_, "Changed while down: {} ({}) {} -> {}", entity.display_name, id,
                       Describe(previous->state), Describe(entity.location));
      const auto kind = entity.location ? NotificationKind::kLocationChange : NotificationKind::kOffline;
      sink_.NotifyTransition(kind, id, entity.display_name, previous->state, entity.location, std::nullopt);
    }

    PRESENCE_LOGINFO(log_, "Initial state: {} ({}) @ {}", entity.display_name, id, Describe(entity.location));
  }
}

void Watcher::AttachListeners(supervisor::Connection& connection) {
  for (auto kind : {EventKind::kLocation, EventKind::kOnline, EventKind::kOffline}) {
    connection.RemoveAllListeners(kind);
    connection.On(kind, [this, kind](const std::string& payload) { HandlePayload(kind, payload); });
  }
}

void Watcher::HandlePayload(EventKind kind, const std::string& payload) {
  if (on_event_) on_event_();

  auto ev = DecodePresenceEvent(kind, payload);
  if (!ev) {
    PRESENCE_LOGERROR(log_, "Invalid {} event: {}", supervisor::ToString(kind), payload);
    return;
  }
  std::visit([this](const auto& e) { Handle(e); }, *ev);
}

void Watcher::Handle(const LocationEvent& ev) {
  if (!IsTarget(ev.entity_id)) return;
  PRESENCE_LOGINFO(log_, "Location: {} ({}) -> {}", ev.display_name, ev.entity_id, ev.location);

  const auto t = store_.Update(ev.entity_id, ev.display_name, ev.location);
  if (!t.changed) return;

  std::optional<NotificationContext> ctx;
  if (ev.world) ctx = NotificationContext{ev.world->name, ev.world->thumbnail_url};
  sink_.NotifyTransition(NotificationKind::kLocationChange, ev.entity_id, ev.display_name,
                         t.previous, t.current, ctx);
}

void Watcher::Handle(const OnlineEvent& ev) {
  if (!IsTarget(ev.entity_id)) return;
  PRESENCE_LOGINFO(log_, "Online: {} ({})", ev.display_name, ev.entity_id);

  store_.UpdateDisplayName(ev.entity_id, ev.display_name);
  sink_.NotifyTransition(NotificationKind::kOnline, ev.entity_id, ev.display_name,
                         std::nullopt, std::nullopt, std::nullopt);
}

void Watcher::Handle(const OfflineEvent& ev) {
  if (!IsTarget(ev.entity_id)) return;
  const std::string name = store_.GetDisplayName(ev.entity_id).value_or(ev.entity_id);
  PRESENCE_LOGINFO(log_, "Offline: {} ({})", name, ev.entity_id);

  const auto t = store_.Update(ev.entity_id, name, std::nullopt);
  if (!t.changed) return;
  sink_.NotifyTransition(NotificationKind::kOffline, ev.entity_id, name,
                         t.previous, t.current, std::nullopt);
}

} // namespace presence::app
