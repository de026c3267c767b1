// Simulated presence feed: offers the feed service and publishes random
// presence changes for a few fake entities.
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <map>
#include <mutex>
#include <random>
#include <set>
#include <sstream>
#include <string>
#include <thread>

#include "log.hpp"
#include "sinks_console.hpp"

#include <nlohmann/json.hpp>
#include <presence/com/core.hpp>
#include <presence/com/someip_adapter.hpp>
#include <services_description.hpp>

using nlohmann::json;
using namespace presence;

// graceful shutdown flag
static std::atomic<bool> running{true};
static void on_sig(int) { running.store(false, std::memory_order_relaxed); }

static std::string env_or(const char* name, const char* fallback) {
  const char* v = std::getenv(name);
  return (v && *v) ? std::string(v) : std::string(fallback);
}

namespace {

struct Entity {
  std::string display_name;
  std::string location;  // "offline" when not online
};

class FeedState {
public:
  FeedState(std::string user, std::string password, const std::string& ids)
    : user_(std::move(user)), password_(std::move(password)) {
    std::istringstream iss(ids);
    std::string id;
    while (std::getline(iss, id, ',')) {
      if (!id.empty()) entities_[id] = Entity{"Display " + id, "offline"};
    }
  }

  std::string Handle(presence::com::MethodId method, const std::string& payload) {
    const json req = json::parse(payload, nullptr, false);
    if (req.is_discarded() || !req.is_object()) return Reject("malformed request");

    std::lock_guard lk(mu_);
    switch (method) {
      case PresenceFeedDesc::Login::kId: {
        if (req.value("username", "") != user_ || req.value("password", "") != password_)
          return Reject("401 Unauthorized: invalid username or password");
        const std::string token = "sess-" + std::to_string(++next_session_);
        sessions_.insert(token);
        return json{{"ok", true}, {"session", token}}.dump();
      }
      case PresenceFeedDesc::ResumeSession::kId:
        if (!sessions_.count(req.value("session", ""))) return Reject("session expired");
        return json{{"ok", true}}.dump();
      case PresenceFeedDesc::GetEntity::kId: {
        if (!sessions_.count(req.value("session", ""))) return Reject("401 Unauthorized");
        auto it = entities_.find(req.value("id", ""));
        if (it == entities_.end()) return Reject("no such entity");
        return json{{"ok", true},
                    {"entity", {{"id", it->first},
                                {"displayName", it->second.display_name},
                                {"location", it->second.location}}}}.dump();
      }
      case PresenceFeedDesc::IsWatchable::kId: {
        if (!sessions_.count(req.value("session", ""))) return Reject("401 Unauthorized");
        return json{{"ok", true}, {"watchable", entities_.count(req.value("id", "")) > 0}}.dump();
      }
      default:
        return Reject("unknown method");
    }
  }

  // Picks an entity and moves it; returns the event id and payload to publish
  std::pair<presence::com::EventId, std::string> Step(std::mt19937& rng) {
    std::lock_guard lk(mu_);
    std::uniform_int_distribution<size_t> pick(0, entities_.size() - 1);
    auto it = std::next(entities_.begin(), static_cast<long>(pick(rng)));
    auto& [id, e] = *it;
    json user{{"id", id}, {"displayName", e.display_name}};

    std::uniform_int_distribution<int> world(1, 4);
    if (e.location == "offline") {
      e.location = "wrld_" + std::to_string(world(rng)) + ":1234";
      return {PresenceFeedDesc::OnlineEvent::kId, json{{"userId", id}, {"user", user}}.dump()};
    }
    if (world(rng) == 1) {
      e.location = "offline";
      return {PresenceFeedDesc::OfflineEvent::kId, json{{"userId", id}}.dump()};
    }
    const int w = world(rng);
    e.location = "wrld_" + std::to_string(w) + ":1234";
    json ev{{"userId", id}, {"user", user}, {"location", e.location},
            {"world", {{"id", "wrld_" + std::to_string(w)}, {"name", "World " + std::to_string(w)}}}};
    return {PresenceFeedDesc::LocationEvent::kId, ev.dump()};
  }

  bool Empty() const { return entities_.empty(); }

private:
  static std::string Reject(const std::string& why) {
    return json{{"ok", false}, {"error", why}}.dump();
  }

  std::mutex mu_;
  std::string user_, password_;
  std::map<std::string, Entity> entities_;
  std::set<std::string> sessions_;
  unsigned next_session_{0};
};

} // namespace

int main() {
  std::signal(SIGINT,  on_sig);
  std::signal(SIGTERM, on_sig);

  // Logging
  auto &LM = log::LogManager::Instance();
  LM.SetAppId("PFEED");
  LM.SetDefaultLevel(log::LogLevel::kInfo);
  LM.AddSink(std::make_shared<log::ConsoleSink>());
  auto lg = log::Logger::CreateLogger("FEED");

  FeedState state(env_or("FEED_USERNAME", "watcher"), env_or("FEED_PASSWORD", "password"),
                  env_or("STUB_ENTITY_IDS", "usr_alice,usr_bob"));
  if (state.Empty()) {
    PRESENCE_LOGERROR(lg, "STUB_ENTITY_IDS lists no entities");
    return 1;
  }

  com::SomeipAdapter adapter;
  com::Runtime rt(adapter);
  com::Skeleton<PresenceFeedDesc> skel(rt);
  skel.HandleRequests([&state](com::MethodId m, const std::string& payload) {
    return state.Handle(m, payload);
  });
  skel.Offer();

  using namespace std::chrono_literals;
  const auto period = std::chrono::milliseconds(std::atoi(env_or("STUB_PERIOD_MS", "5000").c_str()));
  std::mt19937 rng(std::random_device{}());
  auto next = std::chrono::steady_clock::now() + period;

  while (running.load(std::memory_order_relaxed)) {
    std::this_thread::sleep_for(100ms);
    if (std::chrono::steady_clock::now() < next) continue;
    next += period;

    auto [event_id, payload] = state.Step(rng);
    com::Errc ec = com::Errc::kInvalidArg;
    switch (event_id) {
      case PresenceFeedDesc::LocationEvent::kId: ec = skel.Notify<PresenceFeedDesc::LocationEvent>(payload); break;
      case PresenceFeedDesc::OnlineEvent::kId:   ec = skel.Notify<PresenceFeedDesc::OnlineEvent>(payload); break;
      case PresenceFeedDesc::OfflineEvent::kId:  ec = skel.Notify<PresenceFeedDesc::OfflineEvent>(payload); break;
    }
    if (ec != com::Errc::kOk) {
      PRESENCE_LOGWARN(lg, "Notify failed: {}", com::ToString(ec));
    } else {
      PRESENCE_LOGINFO(lg, "Published {}", payload);
    }
  }

  skel.Stop();
  rt.adapter().shutdown();
  PRESENCE_LOGINFO(lg, "Shutdown");
  return 0;
}
