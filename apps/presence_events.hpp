#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <nlohmann/json.hpp>
#include <supervisor/event_source.hpp>

namespace presence::app {

struct WorldInfo {
  std::string id;
  std::string name;
  std::optional<std::string> thumbnail_url;
};

struct LocationEvent {
  std::string entity_id;
  std::string display_name;
  std::string location;
  std::optional<WorldInfo> world;
};

struct OnlineEvent {
  std::string entity_id;
  std::string display_name;
};

struct OfflineEvent {
  std::string entity_id;
};

using PresenceEvent = std::variant<LocationEvent, OnlineEvent, OfflineEvent>;

namespace detail {

inline bool IsString(const nlohmann::json& j, const char* key) {
  return j.contains(key) && j[key].is_string();
}

// {"userId", "user":{"id","displayName"}}
inline bool ReadUser(const nlohmann::json& j, std::string& id, std::string& name) {
  if (!IsString(j, "userId")) return false;
  if (!j.contains("user") || !j["user"].is_object()) return false;
  const auto& user = j["user"];
  if (!IsString(user, "id") || !IsString(user, "displayName")) return false;
  id = j["userId"].get<std::string>();
  name = user["displayName"].get<std::string>();
  return true;
}

// A malformed world block is dropped, not the whole event
inline std::optional<WorldInfo> ReadWorld(const nlohmann::json& j) {
  if (!j.contains("world") || !j["world"].is_object()) return std::nullopt;
  const auto& w = j["world"];
  if (!IsString(w, "id") || !IsString(w, "name")) return std::nullopt;
  WorldInfo out{w["id"].get<std::string>(), w["name"].get<std::string>(), std::nullopt};
  if (IsString(w, "thumbnailImageUrl")) out.thumbnail_url = w["thumbnailImageUrl"].get<std::string>();
  return out;
}

} // namespace detail

// Decodes one payload of the given kind. nullopt means "malformed, drop it".
inline std::optional<PresenceEvent> DecodePresenceEvent(supervisor::EventKind kind,
                                                        std::string_view payload) {
  const auto j = nlohmann::json::parse(payload.begin(), payload.end(), nullptr,
                                       /*allow_exceptions*/ false);
  if (j.is_discarded() || !j.is_object()) return std::nullopt;

  switch (kind) {
    case supervisor::EventKind::kLocation: {
      LocationEvent ev;
      if (!detail::ReadUser(j, ev.entity_id, ev.display_name)) return std::nullopt;
      if (!detail::IsString(j, "location")) return std::nullopt;
      ev.location = j["location"].get<std::string>();
      ev.world = detail::ReadWorld(j);
      return PresenceEvent{std::move(ev)};
    }
    case supervisor::EventKind::kOnline: {
      OnlineEvent ev;
      if (!detail::ReadUser(j, ev.entity_id, ev.display_name)) return std::nullopt;
      return PresenceEvent{std::move(ev)};
    }
    case supervisor::EventKind::kOffline: {
      if (!detail::IsString(j, "userId")) return std::nullopt;
      return PresenceEvent{OfflineEvent{j["userId"].get<std::string>()}};
    }
    default:
      return std::nullopt;
  }
}

} // namespace presence::app
