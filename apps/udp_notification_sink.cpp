#include "udp_notification_sink.hpp"
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <thread>
#include <presence/core/iso_time.hpp>

using nlohmann::json;

namespace presence::app {

namespace {

json OptionalString(const std::optional<std::string>& v) {
  return v ? json(*v) : json(nullptr);
}

} // namespace

UdpNotificationSink::UdpNotificationSink(Config cfg)
  : cfg_(std::move(cfg)), log_(log::Logger::CreateLogger("NOTIFY")) {}

json UdpNotificationSink::BuildMessage(NotificationKind kind,
                                       const std::string& entity_id,
                                       const std::string& display_name,
                                       const std::optional<std::string>& previous,
                                       const std::optional<std::string>& current,
                                       const std::optional<NotificationContext>& context) {
  json msg{
    {"kind", ToString(kind)},
    {"entityId", entity_id},
    {"displayName", display_name},
    {"previous", OptionalString(previous)},
    {"current", OptionalString(current)},
    {"timestamp", core::FormatIso8601(core::WallClock::now())},
  };
  if (context) {
    if (context->world_name)    msg["worldName"] = *context->world_name;
    if (context->thumbnail_url) msg["thumbnailUrl"] = *context->thumbnail_url;
  }
  return msg;
}

void UdpNotificationSink::NotifyTransition(NotificationKind kind,
                                           const std::string& entity_id,
                                           const std::string& display_name,
                                           const std::optional<std::string>& previous,
                                           const std::optional<std::string>& current,
                                           const std::optional<NotificationContext>& context) {
  const std::string datagram =
    BuildMessage(kind, entity_id, display_name, previous, current, context).dump();

  for (int attempt = 1; attempt <= cfg_.max_attempts; ++attempt) {
    if (SendOnce(datagram)) {
      PRESENCE_LOGDEBUG(log_, "Sent {} notification for {}", ToString(kind), entity_id);
      return;
    }
    if (attempt < cfg_.max_attempts) std::this_thread::sleep_for(cfg_.retry_delay);
  }
  PRESENCE_LOGERROR(log_, "Failed to send {} notification for {} after {} attempt(s)",
                    ToString(kind), entity_id, cfg_.max_attempts);
}

bool UdpNotificationSink::SendOnce(const std::string& datagram) {
  int s = ::socket(AF_INET, SOCK_DGRAM, 0);
  if (s < 0) {
    PRESENCE_LOGWARN(log_, "socket: {}", std::strerror(errno));
    return false;
  }

  sockaddr_in dst{};
  dst.sin_family = AF_INET;
  dst.sin_port = htons(cfg_.port);
  if (::inet_pton(AF_INET, cfg_.host.c_str(), &dst.sin_addr) != 1) {
    PRESENCE_LOGWARN(log_, "Invalid notify host '{}'", cfg_.host);
    ::close(s);
    return false;
  }

  const ssize_t n = ::sendto(s, datagram.data(), datagram.size(), 0,
                             reinterpret_cast<sockaddr*>(&dst), sizeof(dst));
  const int err = errno;
  ::close(s);
  if (n < 0 || static_cast<size_t>(n) != datagram.size()) {
    PRESENCE_LOGWARN(log_, "sendto {}:{} failed: {}", cfg_.host, cfg_.port, std::strerror(err));
    return false;
  }
  return true;
}

} // namespace presence::app
