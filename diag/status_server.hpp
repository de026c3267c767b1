// diag/status_server.hpp
#pragma once
#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <log.hpp>
#include <presence/core/result.hpp>
#include <presence/core/scheduler.hpp>

namespace presence::diag {

struct HealthSnapshot {
  std::string connection_state;
  bool healthy{false};
  std::optional<core::WallClock::time_point> last_event;
  std::uint32_t attempts{0};
  std::size_t entities{0};
};

struct HttpReply {
  int status{404};
  std::string content_type{"text/plain"};
  std::string body{"Not Found"};
};

// Tiny HTTP/1.1 listener serving GET /health, one request per connection.
class StatusServer {
public:
  // Called on the server thread; must only read thread-safe state.
  using SnapshotFn = std::function<HealthSnapshot()>;

  explicit StatusServer(SnapshotFn snapshot);
  ~StatusServer();

  StatusServer(const StatusServer&) = delete;
  StatusServer& operator=(const StatusServer&) = delete;

  // Binds and starts the accept thread. Port 0 picks a free port.
  core::Result<void> Start(const std::string& bind_addr, std::uint16_t port);
  void Stop();

  std::uint16_t Port() const noexcept { return port_; }

  // Request line in, reply out ("GET /health HTTP/1.1")
  HttpReply Handle(const std::string& request_line) const;

private:
  void Serve();

  SnapshotFn snapshot_;
  int listen_fd_{-1};
  std::uint16_t port_{0};
  std::atomic<bool> running_{false};
  std::thread thread_;
  log::Logger log_;
};

} // namespace presence::diag
