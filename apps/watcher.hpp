#pragma once
#include <functional>
#include <string>
#include <vector>
#include <log.hpp>
#include <persistency/state_store.hpp>
#include <supervisor/connection_supervisor.hpp>
#include "notification_sink.hpp"
#include "presence_events.hpp"

namespace presence::app {

// Wires the live connection to the store and the notification sink.
// Everything runs on the scheduler thread.
class Watcher final : public supervisor::ConnectionObserver {
public:
  using EventHook = std::function<void()>;

  // on_event is invoked for every inbound presence payload, valid or not.
  Watcher(std::vector<std::string> target_ids, persistency::StateStore& store,
          NotificationSink& sink, EventHook on_event);

  void OnConnected(supervisor::Connection& connection) override;
  void OnDisconnected() override;

  void HandlePayload(supervisor::EventKind kind, const std::string& payload);

  bool IsTarget(const std::string& id) const;
  bool Attached() const noexcept { return connection_ != nullptr; }

private:
  void ValidateTargets(supervisor::Connection& connection);
  void ReconcileInitialState(supervisor::Connection& connection);
  void AttachListeners(supervisor::Connection& connection);

  void Handle(const LocationEvent& ev);
  void Handle(const OnlineEvent& ev);
  void Handle(const OfflineEvent& ev);

  std::vector<std::string> targets_;
  persistency::StateStore& store_;
  NotificationSink& sink_;
  EventHook on_event_;
  supervisor::Connection* connection_{nullptr};  // borrowed until OnDisconnected
  log::Logger log_;
};

} // namespace presence::app
