#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <presence/core/result.hpp>

namespace presence::supervisor {

enum class EventKind : std::uint8_t { kLocation, kOnline, kOffline, kClose, kError };

inline constexpr const char* ToString(EventKind k) {
    switch (k) {
        case EventKind::kLocation: return "location";
        case EventKind::kOnline:   return "online";
        case EventKind::kOffline:  return "offline";
        case EventKind::kClose:    return "close";
        default:                   return "error";
    }
}

// Presence kinds carry the raw JSON payload; kClose/kError carry a reason.
using Listener = std::function<void(const std::string& payload)>;

struct Credentials {
    std::string username;
    std::string password;
    std::optional<std::string> totp_secret;
};

struct EntitySnapshot {
    std::string id;
    std::string display_name;
    std::optional<std::string> location;  // nullopt => offline
};

// A live subscription. Listeners are invoked on the scheduler thread, from a
// copy of the listener list, so a listener may remove listeners or Close().
class Connection {
public:
    virtual ~Connection() = default;

    virtual void On(EventKind kind, Listener listener) = 0;
    virtual void RemoveAllListeners(EventKind kind) = 0;
    virtual void Close() = 0;

    virtual core::Result<EntitySnapshot> FetchEntity(const std::string& id) = 0;
    virtual core::Result<bool> IsWatchable(const std::string& id) = 0;
};

class EventSource {
public:
    virtual ~EventSource() = default;
    // The error message is what the supervisor classifies (auth vs transient).
    virtual core::Result<std::shared_ptr<Connection>> Connect(const Credentials& credentials) = 0;
};

} // namespace presence::supervisor
