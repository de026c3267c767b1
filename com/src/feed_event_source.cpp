#include <presence/com/feed_event_source.hpp>
#include <presence/com/totp.hpp>
#include <map>
#include <vector>

using nlohmann::json;
using presence::supervisor::EventKind;

namespace presence::com {

namespace {

class FeedConnection final : public supervisor::Connection,
                             public std::enable_shared_from_this<FeedConnection> {
public:
    FeedConnection(FeedEventSource& source, std::string session)
        : source_(source), session_(std::move(session)),
          log_(log::Logger::CreateLogger("SOMEIP")) {}

    ~FeedConnection() override { Close(); }

    // Separate from the constructor: the transport callbacks need weak_from_this()
    void Attach() {
        auto& proxy = source_.FeedProxy();
        subs_.push_back(proxy.Subscribe<PresenceFeedDesc::LocationEvent>(Forward(EventKind::kLocation)));
        subs_.push_back(proxy.Subscribe<PresenceFeedDesc::OnlineEvent>(Forward(EventKind::kOnline)));
        subs_.push_back(proxy.Subscribe<PresenceFeedDesc::OfflineEvent>(Forward(EventKind::kOffline)));

        avail_ = proxy.OnAvailability(
            [&scheduler = source_.GetScheduler(), weak = weak_from_this()](Availability a) {
                if (a != Availability::kNotAvailable) return;
                Post(scheduler, weak, EventKind::kClose, "presence feed became unavailable");
            });
    }

    void On(EventKind kind, supervisor::Listener listener) override {
        listeners_[kind].push_back(std::move(listener));
    }

    void RemoveAllListeners(EventKind kind) override {
        listeners_.erase(kind);
    }

    void Close() override {
        if (closed_) return;
        closed_ = true;
        auto& proxy = source_.FeedProxy();
        for (auto t : subs_) proxy.Unsubscribe(t);
        subs_.clear();
        if (avail_.value != 0) proxy.RemoveAvailabilityHandler(avail_);
        avail_ = SubscriptionToken{};
        PRESENCE_LOGDEBUG(log_, "Feed connection closed");
    }

    core::Result<supervisor::EntitySnapshot> FetchEntity(const std::string& id) override {
        auto r = source_.Invoke<PresenceFeedDesc::GetEntity>(json{{"session", session_}, {"id", id}});
        if (!r.HasValue()) return r.Error();

        const json& body = r.Value();
        if (!body.contains("entity") || !body["entity"].is_object()) {
            return core::ErrorCode(core::Errc::kCorruption, "entity missing in response");
        }
        const json& e = body["entity"];
        if (!e.contains("displayName") || !e["displayName"].is_string()) {
            return core::ErrorCode(core::Errc::kCorruption, "entity without displayName");
        }

        supervisor::EntitySnapshot snap;
        snap.id = e.value("id", id);
        snap.display_name = e["displayName"].get<std::string>();
        if (e.contains("location") && e["location"].is_string()) {
            auto loc = e["location"].get<std::string>();
            if (!loc.empty() && loc != "offline") snap.location = std::move(loc);
        }
        return snap;
    }

    core::Result<bool> IsWatchable(const std::string& id) override {
        auto r = source_.Invoke<PresenceFeedDesc::IsWatchable>(json{{"session", session_}, {"id", id}});
        if (!r.HasValue()) return r.Error();
        const json& body = r.Value();
        if (!body.contains("watchable") || !body["watchable"].is_boolean()) {
            return core::ErrorCode(core::Errc::kCorruption, "watchable missing in response");
        }
        return body["watchable"].get<bool>();
    }

private:
    // Transport thread -> scheduler thread
    static void Post(core::Scheduler& scheduler, std::weak_ptr<FeedConnection> weak,
                     EventKind kind, std::string payload) {
        scheduler.Post([weak = std::move(weak), kind, payload = std::move(payload)] {
            if (auto self = weak.lock()) self->Emit(kind, payload);
        });
    }

    std::function<void(const std::string&)> Forward(EventKind kind) {
        return [&scheduler = source_.GetScheduler(), weak = weak_from_this(), kind](const std::string& payload) {
            Post(scheduler, weak, kind, payload);
        };
    }

    void Emit(EventKind kind, const std::string& payload) {
        if (closed_) return;
        auto it = listeners_.find(kind);
        if (it == listeners_.end()) return;
        const auto snapshot = it->second;
        for (const auto& l : snapshot) {
            if (l) l(payload);
        }
    }

    FeedEventSource& source_;
    std::string session_;
    std::map<EventKind, std::vector<supervisor::Listener>> listeners_;
    std::vector<SubscriptionToken> subs_;
    SubscriptionToken avail_{};
    bool closed_{false};
    log::Logger log_;
};

} // namespace

FeedEventSource::FeedEventSource(Runtime& rt, core::Scheduler& scheduler,
                                 persistency::KeyValueStorageBackend& session_cache, Config cfg,
                                 std::string app_name)
    : proxy_(rt, std::move(app_name)), scheduler_(scheduler), session_cache_(session_cache), cfg_(cfg),
      log_(log::Logger::CreateLogger("SOMEIP")) {}

core::Result<void> FeedEventSource::WaitUntilAvailable() {
    if (!proxy_.RequestService()) {
        return core::ErrorCode(core::Errc::kTransportError, "request_service failed");
    }

    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();
    auto fired = std::make_shared<std::once_flag>();
    const auto token = proxy_.OnAvailability([promise, fired](Availability a) {
        if (a == Availability::kAvailable) std::call_once(*fired, [&] { promise->set_value(); });
    });

    const bool ready = future.wait_for(cfg_.connect_timeout) == std::future_status::ready;
    proxy_.RemoveAvailabilityHandler(token);
    if (!ready) {
        return core::ErrorCode(core::Errc::kTimeout,
                               "presence feed not available within " +
                               std::to_string(cfg_.connect_timeout.count()) + " ms");
    }
    return {};
}

core::Result<std::string> FeedEventSource::Authenticate(const supervisor::Credentials& credentials) {
    auto cached = session_cache_.GetValue(kSessionKey);
    if (cached.HasValue() && !cached.Value().empty()) {
        auto resumed = Invoke<PresenceFeedDesc::ResumeSession>(json{{"session", cached.Value()}});
        if (resumed.HasValue()) {
            PRESENCE_LOGINFO(log_, "Resumed cached session");
            return cached.Value();
        }
        if (resumed.Error().value != core::Errc::kRejected) return resumed.Error();
        PRESENCE_LOGINFO(log_, "Cached session refused ({}), logging in", resumed.Error().message);
        auto removed = session_cache_.RemoveKey(kSessionKey);
        if (!removed.HasValue()) {
            PRESENCE_LOGWARN(log_, "Could not drop cached session: {}", removed.Error().Describe());
        }
    }

    json req{{"username", credentials.username}, {"password", credentials.password}};
    if (credentials.totp_secret) {
        auto code = GenerateTotp(*credentials.totp_secret, scheduler_.Now());
        if (!code) {
            return core::ErrorCode(core::Errc::kInvalidArgument,
                                   "authentication: two-factor secret is not valid base32");
        }
        req["totp"] = *code;
    }

    auto login = Invoke<PresenceFeedDesc::Login>(req);
    if (!login.HasValue()) return login.Error();

    const json& body = login.Value();
    if (!body.contains("session") || !body["session"].is_string()) {
        return core::ErrorCode(core::Errc::kCorruption, "login response without session");
    }
    std::string session = body["session"].get<std::string>();

    auto saved = session_cache_.SetValue(kSessionKey, session);
    if (!saved.HasValue()) {
        PRESENCE_LOGWARN(log_, "Could not cache session: {}", saved.Error().Describe());
    }
    PRESENCE_LOGINFO(log_, "Logged in as {}", credentials.username);
    return session;
}

core::Result<std::shared_ptr<supervisor::Connection>>
FeedEventSource::Connect(const supervisor::Credentials& credentials) {
    auto available = WaitUntilAvailable();
    if (!available.HasValue()) return available.Error();

    auto session = Authenticate(credentials);
    if (!session.HasValue()) return session.Error();

    auto conn = std::make_shared<FeedConnection>(*this, std::move(session.Value()));
    conn->Attach();
    return std::shared_ptr<supervisor::Connection>(std::move(conn));
}

} // namespace presence::com
