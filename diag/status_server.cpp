// diag/status_server.cpp
#include "status_server.hpp"
#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <sstream>
#include <nlohmann/json.hpp>
#include <presence/core/iso_time.hpp>

namespace {

inline const char* reason_phrase(int status) {
  switch (status) {
    case 200: return "OK";
    case 400: return "Bad Request";
    case 404: return "Not Found";
    case 405: return "Method Not Allowed";
    case 503: return "Service Unavailable";
    default:  return "Error";
  }
}

inline std::string encode_reply(const presence::diag::HttpReply& r) {
  std::ostringstream out;
  out << "HTTP/1.1 " << r.status << ' ' << reason_phrase(r.status) << "\r\n"
      << "Content-Type: " << r.content_type << "\r\n"
      << "Content-Length: " << r.body.size() << "\r\n"
      << "Connection: close\r\n\r\n"
      << r.body;
  return out.str();
}

inline void write_all(int fd, const std::string& data) {
  size_t off = 0;
  while (off < data.size()) {
    ssize_t n = ::write(fd, data.data() + off, data.size() - off);
    if (n <= 0) return;
    off += static_cast<size_t>(n);
  }
}

} // namespace

namespace presence::diag {

StatusServer::StatusServer(SnapshotFn snapshot)
  : snapshot_(std::move(snapshot)), log_(log::Logger::CreateLogger("HEALTH")) {}

StatusServer::~StatusServer() {
  Stop();
}

core::Result<void> StatusServer::Start(const std::string& bind_addr, std::uint16_t port) {
  if (running_.load()) return {};

  int s = ::socket(AF_INET, SOCK_STREAM, 0);
  if (s < 0) return core::ErrorCode(core::Errc::kTransportError, std::strerror(errno));
  int opt = 1; ::setsockopt(s, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

  sockaddr_in addr{}; addr.sin_family = AF_INET; addr.sin_port = htons(port);
  if (::inet_pton(AF_INET, bind_addr.c_str(), &addr.sin_addr) != 1) {
    ::close(s);
    return core::ErrorCode(core::Errc::kInvalidArgument, "bad bind address " + bind_addr);
  }
  if (::bind(s, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0 || ::listen(s, 8) < 0) {
    const std::string why = std::strerror(errno);
    ::close(s);
    return core::ErrorCode(core::Errc::kTransportError, why);
  }

  sockaddr_in bound{}; socklen_t len = sizeof(bound);
  ::getsockname(s, reinterpret_cast<sockaddr*>(&bound), &len);
  port_ = ntohs(bound.sin_port);

  listen_fd_ = s;
  running_.store(true);
  thread_ = std::thread([this] { Serve(); });
  PRESENCE_LOGINFO(log_, "Health endpoint listening on http://{}:{}/health", bind_addr, port_);
  return {};
}

void StatusServer::Stop() {
  if (!running_.exchange(false)) return;
  if (thread_.joinable()) thread_.join();
  ::close(listen_fd_);
  listen_fd_ = -1;
  PRESENCE_LOGINFO(log_, "Health endpoint stopped");
}

HttpReply StatusServer::Handle(const std::string& request_line) const {
  std::istringstream iss(request_line);
  std::string method, target;
  iss >> method >> target;
  if (method.empty() || target.empty()) return HttpReply{400, "text/plain", "Bad Request"};
  if (target != "/health") return HttpReply{};
  if (method != "GET") return HttpReply{405, "text/plain", "Method Not Allowed"};

  const HealthSnapshot snap = snapshot_ ? snapshot_() : HealthSnapshot{};
  nlohmann::json body{
    {"status", snap.healthy ? "healthy" : "unhealthy"},
    {"connectionState", snap.connection_state},
    {"lastEventTime", snap.last_event ? nlohmann::json(core::FormatIso8601(*snap.last_event))
                                      : nlohmann::json(nullptr)},
    {"attempts", snap.attempts},
    {"entities", snap.entities},
    {"timestamp", core::FormatIso8601(core::WallClock::now())},
  };
  return HttpReply{snap.healthy ? 200 : 503, "application/json", body.dump(2)};
}

void StatusServer::Serve() {
  // accept-loop: poll so Stop() is noticed within one timeout
  while (running_.load()) {
    pollfd pfd{listen_fd_, POLLIN, 0};
    const int ready = ::poll(&pfd, 1, 200);
    if (ready <= 0) continue;

    int c = ::accept(listen_fd_, nullptr, nullptr);
    if (c < 0) { PRESENCE_LOGWARN(log_, "accept: {}", std::strerror(errno)); continue; }

    timeval tv{2, 0};
    ::setsockopt(c, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    std::string req;
    char buf[1024];
    while (req.find("\r\n") == std::string::npos && req.size() < 8192) {
      ssize_t n = ::read(c, buf, sizeof(buf));
      if (n <= 0) break;
      req.append(buf, static_cast<size_t>(n));
    }

    const auto eol = req.find("\r\n");
    const HttpReply reply = (eol == std::string::npos) ? HttpReply{400, "text/plain", "Bad Request"}
                                                       : Handle(req.substr(0, eol));
    write_all(c, encode_reply(reply));
    ::close(c);
  }
}

} // namespace presence::diag
