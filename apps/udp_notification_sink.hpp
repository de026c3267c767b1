#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <log.hpp>
#include <nlohmann/json.hpp>
#include "notification_sink.hpp"

namespace presence::app {

// One JSON datagram per notification.
class UdpNotificationSink final : public NotificationSink {
public:
  struct Config {
    std::string host{"127.0.0.1"};
    std::uint16_t port{19000};
    int max_attempts{3};
    std::chrono::milliseconds retry_delay{100};
  };

  explicit UdpNotificationSink(Config cfg);

  void NotifyTransition(NotificationKind kind,
                        const std::string& entity_id,
                        const std::string& display_name,
                        const std::optional<std::string>& previous,
                        const std::optional<std::string>& current,
                        const std::optional<NotificationContext>& context) override;

  static nlohmann::json BuildMessage(NotificationKind kind,
                                     const std::string& entity_id,
                                     const std::string& display_name,
                                     const std::optional<std::string>& previous,
                                     const std::optional<std::string>& current,
                                     const std::optional<NotificationContext>& context);

private:
  bool SendOnce(const std::string& datagram);

  Config cfg_;
  log::Logger log_;
};

} // namespace presence::app
