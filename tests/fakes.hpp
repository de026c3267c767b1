#pragma once
#include <deque>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "log.hpp"
#include <supervisor/connection_supervisor.hpp>
#include "apps/notification_sink.hpp"

namespace presence::test {

// -------- Captures log records --------
struct CaptureSink : log::ISink {
  std::vector<log::LogRecord> records;
  void write(const log::LogRecord& r) noexcept override { records.push_back(r); }

  bool Contains(log::LogLevel lvl, const std::string& text) const {
    for (const auto& r : records)
      if (r.level == lvl && r.message.find(text) != std::string::npos) return true;
    return false;
  }
};

// Fresh directory under the system temp dir, removed on destruction
class TempDir {
public:
  explicit TempDir(const std::string& name)
    : path_(std::filesystem::temp_directory_path() / name) {
    std::filesystem::remove_all(path_);
    std::filesystem::create_directories(path_);
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }
  const std::filesystem::path& path() const { return path_; }
  std::string file(const std::string& name) const { return (path_ / name).string(); }

private:
  std::filesystem::path path_;
};

// -------- Scripted event source --------
class FakeConnection final : public supervisor::Connection {
public:
  void On(supervisor::EventKind kind, supervisor::Listener listener) override {
    listeners_[kind].push_back(std::move(listener));
  }
  void RemoveAllListeners(supervisor::EventKind kind) override { listeners_.erase(kind); }
  void Close() override { ++close_calls; }

  core::Result<supervisor::EntitySnapshot> FetchEntity(const std::string& id) override {
    auto it = entities.find(id);
    if (it == entities.end()) return core::ErrorCode(core::Errc::kNotFound, "no entity " + id);
    return it->second;
  }
  core::Result<bool> IsWatchable(const std::string& id) override {
    return watchable.count(id) == 0 || watchable[id];
  }

  // Dispatches from a copy, as real connections do
  void Emit(supervisor::EventKind kind, const std::string& payload) {
    auto it = listeners_.find(kind);
    if (it == listeners_.end()) return;
    const auto snapshot = it->second;
    for (const auto& l : snapshot) l(payload);
  }

  std::size_t ListenerCount(supervisor::EventKind kind) const {
    auto it = listeners_.find(kind);
    return it == listeners_.end() ? 0 : it->second.size();
  }

  std::map<std::string, supervisor::EntitySnapshot> entities;
  std::map<std::string, bool> watchable;
  int close_calls{0};

private:
  std::map<supervisor::EventKind, std::vector<supervisor::Listener>> listeners_;
};

class FakeEventSource final : public supervisor::EventSource {
public:
  core::Result<std::shared_ptr<supervisor::Connection>>
  Connect(const supervisor::Credentials& credentials) override {
    ++connect_calls;
    last_credentials = credentials;
    if (script_.empty()) return core::ErrorCode(core::Errc::kTransportError, "ECONNREFUSED");
    auto next = std::move(script_.front());
    script_.pop_front();
    return next;
  }

  std::shared_ptr<FakeConnection> PushSuccess() {
    auto c = std::make_shared<FakeConnection>();
    script_.emplace_back(std::shared_ptr<supervisor::Connection>(c));
    return c;
  }
  void PushFailure(core::Errc code, const std::string& message) {
    script_.emplace_back(core::ErrorCode(code, message));
  }

  int connect_calls{0};
  std::optional<supervisor::Credentials> last_credentials;

private:
  std::deque<core::Result<std::shared_ptr<supervisor::Connection>>> script_;
};

// -------- Records transitions instead of sending them --------
struct Notification {
  app::NotificationKind kind;
  std::string entity_id;
  std::string display_name;
  std::optional<std::string> previous;
  std::optional<std::string> current;
  std::optional<app::NotificationContext> context;
};

class CapturingNotificationSink final : public app::NotificationSink {
public:
  void NotifyTransition(app::NotificationKind kind, const std::string& entity_id,
                        const std::string& display_name,
                        const std::optional<std::string>& previous,
                        const std::optional<std::string>& current,
                        const std::optional<app::NotificationContext>& context) override {
    sent.push_back(Notification{kind, entity_id, display_name, previous, current, context});
  }

  std::vector<Notification> sent;
};

} // namespace presence::test
