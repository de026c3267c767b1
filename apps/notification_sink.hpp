#pragma once
#include <optional>
#include <string>

namespace presence::app {

enum class NotificationKind { kLocationChange, kOnline, kOffline };

inline constexpr const char* ToString(NotificationKind k) {
  switch (k) {
    case NotificationKind::kLocationChange: return "location-change";
    case NotificationKind::kOnline:         return "online";
    default:                                return "offline";
  }
}

struct NotificationContext {
  std::optional<std::string> world_name;
  std::optional<std::string> thumbnail_url;
};

// Fire-and-forget from the caller's side; retries and failures stay inside.
class NotificationSink {
public:
  virtual ~NotificationSink() = default;
  virtual void NotifyTransition(NotificationKind kind,
                                const std::string& entity_id,
                                const std::string& display_name,
                                const std::optional<std::string>& previous,
                                const std::optional<std::string>& current,
                                const std::optional<NotificationContext>& context) = 0;
};

} // namespace presence::app
