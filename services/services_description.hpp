// services/services_description.hpp: presence feed interface
#pragma once
#include <presence/com/core.hpp>
#include <nlohmann/json.hpp>
#include <functional>
#include <string>

namespace presence::com {

// JSON bodies on the wire; parse failures are reported, not thrown
template<> inline std::string Codec<nlohmann::json>::serialize(const nlohmann::json& v) {
  return v.dump();
}
template<> inline bool Codec<nlohmann::json>::deserialize(const std::string& s, nlohmann::json& out) {
  out = nlohmann::json::parse(s, nullptr, /*allow_exceptions*/ false);
  return !out.is_discarded();
}

} // namespace presence::com

struct PresenceFeedDesc {
  static constexpr presence::com::ServiceId  kServiceId     = 0x5701;
  static constexpr presence::com::InstanceId kInstanceId    = 0x0001;
  static constexpr const char*               kDefaultClient = "presence_watchd";
  static constexpr const char*               kDefaultServer = "presence_feed_stub";

  static constexpr presence::com::EventGroupId kPresenceGroup = 0x0001;

  // Event payloads are JSON text, decoded by the watcher
  template<presence::com::EventId Id>
  struct PresenceEvent {
    using Payload  = std::string;
    using Callback = std::function<void(const std::string&)>;
    static constexpr presence::com::EventId      kId    = Id;
    static constexpr presence::com::EventGroupId kGroup = kPresenceGroup;
  };
  using LocationEvent = PresenceEvent<0x8001>;
  using OnlineEvent   = PresenceEvent<0x8002>;
  using OfflineEvent  = PresenceEvent<0x8003>;

  // Every response is {"ok":true,...} or {"ok":false,"error":"..."}
  template<presence::com::MethodId Id>
  struct JsonMethod {
    using Request  = nlohmann::json;
    using Response = nlohmann::json;
    static constexpr presence::com::MethodId kId = Id;
  };
  using Login         = JsonMethod<0x0001>;  // {"username","password","totp"?} -> {"session"}
  using ResumeSession = JsonMethod<0x0002>;  // {"session"} -> {}
  using GetEntity     = JsonMethod<0x0003>;  // {"session","id"} -> {"entity":{"id","displayName","location"}}
  using IsWatchable   = JsonMethod<0x0004>;  // {"session","id"} -> {"watchable":bool}
};
