#include <gtest/gtest.h>
#include <chrono>
#include <functional>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <presence/com/feed_event_source.hpp>
#include <presence/com/totp.hpp>
#include <supervisor/connection_supervisor.hpp>
#include "fakes.hpp"
#include "manual_scheduler.hpp"

using namespace std::chrono_literals;
using namespace presence;
using nlohmann::json;
using supervisor::EventKind;

namespace {

// In-process adapter: requests are answered synchronously by per-method handlers.
class LoopbackAdapter final : public com::IAdapter {
public:
  using Handler = std::function<json(const json&)>;

  com::Errc init(const std::string& app) override { app_name = app; return com::Errc::kOk; }
  void shutdown() override {}

  com::Errc request_service(com::ServiceId, com::InstanceId) override { return com::Errc::kOk; }
  void release_service(com::ServiceId, com::InstanceId) override {}

  com::Errc send_request(com::ServiceId s, com::InstanceId i, com::MethodId m,
                         const std::string& payload, Resp cb) override {
    EXPECT_EQ(s, PresenceFeedDesc::kServiceId);
    EXPECT_EQ(i, PresenceFeedDesc::kInstanceId);
    requests.emplace_back(m, json::parse(payload));
    auto it = handlers.find(m);
    if (it == handlers.end()) return com::Errc::kOk;  // never answered
    cb(com::Errc::kOk, it->second(requests.back().second).dump());
    return com::Errc::kOk;
  }

  com::SubscriptionToken subscribe_event(com::ServiceId, com::InstanceId, com::EventGroupId g,
                                         com::EventId e, EventCb cb) override {
    EXPECT_EQ(g, PresenceFeedDesc::kPresenceGroup);
    const auto t = ++next_token_;
    events[t] = {e, std::move(cb)};
    return com::SubscriptionToken{t};
  }
  void unsubscribe_event(com::SubscriptionToken t) override { events.erase(t.value); }

  com::Errc offer_service(com::ServiceId, com::InstanceId) override { return com::Errc::kOk; }
  void stop_offer_service(com::ServiceId, com::InstanceId) override {}
  com::Errc send_notification(com::ServiceId, com::InstanceId, com::EventId,
                              const std::string&) override { return com::Errc::kOk; }
  void set_request_handler(com::ServiceId, com::InstanceId, RequestHandler) override {}

  com::SubscriptionToken on_availability(com::ServiceId, com::InstanceId, AvCb cb) override {
    const auto t = ++next_token_;
    if (availability != com::Availability::kUnknown) cb(availability);
    av_handlers[t] = std::move(cb);
    return com::SubscriptionToken{t};
  }
  void remove_availability_handler(com::SubscriptionToken t) override { av_handlers.erase(t.value); }

  // Transport-side helpers
  void Publish(com::EventId id, const std::string& payload) {
    const auto copy = events;
    for (const auto& [t, sub] : copy)
      if (sub.first == id) sub.second(payload);
  }
  void SetAvailability(com::Availability a) {
    availability = a;
    const auto copy = av_handlers;
    for (const auto& [t, cb] : copy) cb(a);
  }
  int Calls(com::MethodId m) const {
    int n = 0;
    for (const auto& r : requests) if (r.first == m) ++n;
    return n;
  }

  std::string app_name;
  com::Availability availability{com::Availability::kAvailable};
  std::map<com::MethodId, Handler> handlers;
  std::vector<std::pair<com::MethodId, json>> requests;
  std::map<std::uint64_t, std::pair<com::EventId, EventCb>> events;
  std::map<std::uint64_t, AvCb> av_handlers;

private:
  std::uint64_t next_token_{0};
};

class FeedSourceTest : public ::testing::Test {
protected:
  FeedSourceTest()
    : dir("presence_feed_source_test"), cache(dir.file("session")), rt(adapter),
      source(rt, sched, cache, com::FeedEventSource::Config{50ms}) {}

  void AcceptLogin(const std::string& session = "sess-1") {
    adapter.handlers[PresenceFeedDesc::Login::kId] = [session](const json&) {
      return json{{"ok", true}, {"session", session}};
    };
  }

  supervisor::Credentials creds{"watcher", "pw", std::nullopt};
  test::TempDir dir;
  persistency::KeyValueStorageBackend cache;
  test::ManualScheduler sched;
  LoopbackAdapter adapter;
  com::Runtime rt;
  com::FeedEventSource source;
};

} // namespace

TEST_F(FeedSourceTest, LoginCachesSession) {
  AcceptLogin("sess-9");

  auto r = source.Connect(creds);

  ASSERT_TRUE(r.HasValue()) << r.Error().Describe();
  EXPECT_EQ(adapter.app_name, PresenceFeedDesc::kDefaultClient);
  ASSERT_EQ(adapter.Calls(PresenceFeedDesc::Login::kId), 1);
  const json& login = adapter.requests.back().second;
  EXPECT_EQ(login["username"], "watcher");
  EXPECT_EQ(login["password"], "pw");
  EXPECT_FALSE(login.contains("totp"));
  EXPECT_EQ(cache.GetValue("session").Value(), "sess-9");
  EXPECT_EQ(adapter.events.size(), 3u);
}

TEST_F(FeedSourceTest, TwoFactorCodeIsSentWithLogin) {
  AcceptLogin();
  creds.totp_secret = "GEZDGNBVGY3TQOJQGEZDGNBVGY3TQOJQ";

  ASSERT_TRUE(source.Connect(creds).HasValue());

  const json& login = adapter.requests.back().second;
  ASSERT_TRUE(login.contains("totp"));
  EXPECT_EQ(login["totp"], *com::GenerateTotp(*creds.totp_secret, sched.Now()));
}

TEST_F(FeedSourceTest, BadTwoFactorSecretIsAnAuthenticationError) {
  AcceptLogin();
  creds.totp_secret = "not base32!";

  auto r = source.Connect(creds);

  ASSERT_FALSE(r.HasValue());
  EXPECT_TRUE(supervisor::IsAuthenticationError(r.Error().Describe()));
  EXPECT_EQ(adapter.Calls(PresenceFeedDesc::Login::kId), 0);
}

TEST_F(FeedSourceTest, RejectedLoginCarriesUpstreamText) {
  adapter.handlers[PresenceFeedDesc::Login::kId] = [](const json&) {
    return json{{"ok", false}, {"error", "401 Unauthorized: invalid username or password"}};
  };

  auto r = source.Connect(creds);

  ASSERT_FALSE(r.HasValue());
  EXPECT_EQ(r.Error().value, core::Errc::kRejected);
  EXPECT_TRUE(supervisor::IsAuthenticationError(r.Error().Describe()));
  EXPECT_FALSE(cache.HasKey("session").Value());
}

TEST_F(FeedSourceTest, CachedSessionIsResumed) {
  ASSERT_TRUE(cache.SetValue("session", "sess-old").HasValue());
  adapter.handlers[PresenceFeedDesc::ResumeSession::kId] = [](const json& req) {
    return json{{"ok", req.value("session", "") == "sess-old"}};
  };

  ASSERT_TRUE(source.Connect(creds).HasValue());

  EXPECT_EQ(adapter.Calls(PresenceFeedDesc::ResumeSession::kId), 1);
  EXPECT_EQ(adapter.Calls(PresenceFeedDesc::Login::kId), 0);
}

TEST_F(FeedSourceTest, ExpiredSessionFallsBackToLogin) {
  ASSERT_TRUE(cache.SetValue("session", "sess-old").HasValue());
  adapter.handlers[PresenceFeedDesc::ResumeSession::kId] = [](const json&) {
    return json{{"ok", false}, {"error", "session expired"}};
  };
  AcceptLogin("sess-new");

  ASSERT_TRUE(source.Connect(creds).HasValue());

  EXPECT_EQ(adapter.Calls(PresenceFeedDesc::Login::kId), 1);
  EXPECT_EQ(cache.GetValue("session").Value(), "sess-new");
}

TEST_F(FeedSourceTest, UnavailableServiceTimesOut) {
  adapter.availability = com::Availability::kNotAvailable;
  AcceptLogin();

  auto r = source.Connect(creds);

  ASSERT_FALSE(r.HasValue());
  EXPECT_EQ(r.Error().value, core::Errc::kTimeout);
  EXPECT_FALSE(supervisor::IsAuthenticationError(r.Error().Describe()));
  EXPECT_TRUE(adapter.av_handlers.empty());
}

TEST_F(FeedSourceTest, UnansweredRequestTimesOut) {
  auto r = source.Connect(creds);  // no Login handler
  ASSERT_FALSE(r.HasValue());
  EXPECT_EQ(r.Error().value, core::Errc::kTimeout);
}

TEST_F(FeedSourceTest, EventsArriveOnTheSchedulerThread) {
  AcceptLogin();
  auto r = source.Connect(creds);
  ASSERT_TRUE(r.HasValue());
  auto conn = r.Value();

  std::vector<std::string> got;
  conn->On(EventKind::kLocation, [&](const std::string& p) { got.push_back(p); });
  adapter.Publish(PresenceFeedDesc::LocationEvent::kId, R"({"userId":"usr_a"})");
  adapter.Publish(PresenceFeedDesc::OfflineEvent::kId, R"({"userId":"usr_b"})");

  EXPECT_TRUE(got.empty());
  EXPECT_EQ(sched.PostedTasks(), 2u);

  sched.RunPosted();
  ASSERT_EQ(got.size(), 1u);
  EXPECT_EQ(got[0], R"({"userId":"usr_a"})");
}

TEST_F(FeedSourceTest, LosingTheServiceClosesTheConnection) {
  AcceptLogin();
  auto conn = source.Connect(creds).Value();

  std::string reason;
  conn->On(EventKind::kClose, [&](const std::string& why) { reason = why; });
  adapter.SetAvailability(com::Availability::kNotAvailable);
  sched.RunPosted();

  EXPECT_EQ(reason, "presence feed became unavailable");
}

TEST_F(FeedSourceTest, CloseDropsSubscriptionsAndPendingEvents) {
  AcceptLogin();
  auto conn = source.Connect(creds).Value();
  int calls = 0;
  conn->On(EventKind::kOnline, [&](const std::string&) { ++calls; });

  adapter.Publish(PresenceFeedDesc::OnlineEvent::kId, "{}");
  conn->Close();
  sched.RunPosted();

  EXPECT_EQ(calls, 0);
  EXPECT_TRUE(adapter.events.empty());
  EXPECT_TRUE(adapter.av_handlers.empty());
}

TEST_F(FeedSourceTest, EventsAfterReleaseAreDropped) {
  AcceptLogin();
  auto conn = source.Connect(creds).Value();
  conn->On(EventKind::kOnline, [](const std::string&) { FAIL() << "released connection delivered"; });

  adapter.Publish(PresenceFeedDesc::OnlineEvent::kId, "{}");
  conn.reset();
  sched.RunPosted();
}

TEST_F(FeedSourceTest, FetchEntityMapsOfflineToNoState) {
  AcceptLogin("sess-7");
  adapter.handlers[PresenceFeedDesc::GetEntity::kId] = [](const json& req) {
    const std::string id = req.value("id", "");
    const std::string where = id == "usr_a" ? "wrld_1:1" : "offline";
    return json{{"ok", true}, {"entity", {{"id", id}, {"displayName", "Name " + id}, {"location", where}}}};
  };
  auto conn = source.Connect(creds).Value();

  auto a = conn->FetchEntity("usr_a");
  ASSERT_TRUE(a.HasValue());
  EXPECT_EQ(a.Value().display_name, "Name usr_a");
  EXPECT_EQ(a.Value().location, std::optional<std::string>("wrld_1:1"));
  EXPECT_EQ(adapter.requests.back().second["session"], "sess-7");

  auto b = conn->FetchEntity("usr_b");
  ASSERT_TRUE(b.HasValue());
  EXPECT_FALSE(b.Value().location.has_value());
}

TEST_F(FeedSourceTest, FetchEntityRejectsIncompleteBodies) {
  AcceptLogin();
  adapter.handlers[PresenceFeedDesc::GetEntity::kId] = [](const json&) {
    return json{{"ok", true}, {"entity", {{"id", "usr_a"}}}};
  };
  auto conn = source.Connect(creds).Value();

  auto r = conn->FetchEntity("usr_a");
  ASSERT_FALSE(r.HasValue());
  EXPECT_EQ(r.Error().value, core::Errc::kCorruption);
}

TEST_F(FeedSourceTest, IsWatchableReadsFlag) {
  AcceptLogin();
  adapter.handlers[PresenceFeedDesc::IsWatchable::kId] = [](const json& req) {
    return json{{"ok", true}, {"watchable", req.value("id", "") != "usr_hidden"}};
  };
  auto conn = source.Connect(creds).Value();

  EXPECT_TRUE(conn->IsWatchable("usr_a").Value());
  EXPECT_FALSE(conn->IsWatchable("usr_hidden").Value());
}
