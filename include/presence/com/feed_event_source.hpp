#pragma once
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <log.hpp>
#include <nlohmann/json.hpp>
#include <persistency/key_value_storage_backend.hpp>
#include <presence/com/core.hpp>
#include <presence/core/result.hpp>
#include <presence/core/scheduler.hpp>
#include <services_description.hpp>
#include <supervisor/event_source.hpp>

namespace presence::com {

// Event source backed by the presence feed service, over whatever transport
// the runtime's adapter speaks. Connect() blocks the calling thread for at
// most a few multiples of connect_timeout.
class FeedEventSource final : public supervisor::EventSource {
public:
    struct Config {
        std::chrono::milliseconds connect_timeout{30 * 1000};
    };

    FeedEventSource(Runtime& rt, core::Scheduler& scheduler,
                    persistency::KeyValueStorageBackend& session_cache, Config cfg,
                    std::string app_name = PresenceFeedDesc::kDefaultClient);

    core::Result<std::shared_ptr<supervisor::Connection>>
    Connect(const supervisor::Credentials& credentials) override;

    // Synchronous RPC with the connect deadline. A response with "ok":false
    // is returned as kRejected carrying the upstream "error" text.
    template<typename M>
    core::Result<nlohmann::json> Invoke(const nlohmann::json& request);

    Proxy<PresenceFeedDesc>& FeedProxy() noexcept { return proxy_; }
    core::Scheduler& GetScheduler() noexcept { return scheduler_; }

    static constexpr const char* kSessionKey = "session";

private:
    core::Result<void> WaitUntilAvailable();
    core::Result<std::string> Authenticate(const supervisor::Credentials& credentials);

    Proxy<PresenceFeedDesc> proxy_;
    core::Scheduler& scheduler_;
    persistency::KeyValueStorageBackend& session_cache_;
    Config cfg_;
    log::Logger log_;
};

template<typename M>
core::Result<nlohmann::json> FeedEventSource::Invoke(const nlohmann::json& request) {
    using Reply = std::pair<Errc, nlohmann::json>;
    auto promise = std::make_shared<std::promise<Reply>>();
    auto future = promise->get_future();

    const Errc sent = proxy_.template Call<M>(request, [promise](Errc ec, nlohmann::json resp) {
        promise->set_value(Reply{ec, std::move(resp)});
    });
    if (sent != Errc::kOk) {
        return core::ErrorCode(core::Errc::kTransportError, ToString(sent));
    }
    if (future.wait_for(cfg_.connect_timeout) != std::future_status::ready) {
        return core::ErrorCode(core::Errc::kTimeout,
                               "no response within " + std::to_string(cfg_.connect_timeout.count()) + " ms");
    }

    Reply reply = future.get();
    if (reply.first != Errc::kOk) {
        return core::ErrorCode(core::Errc::kTransportError, ToString(reply.first));
    }
    const auto& body = reply.second;
    if (!body.is_object()) {
        return core::ErrorCode(core::Errc::kCorruption, "response is not a JSON object");
    }
    if (!body.value("ok", false)) {
        std::string why = "request rejected";
        if (body.contains("error") && body["error"].is_string()) why = body["error"].get<std::string>();
        return core::ErrorCode(core::Errc::kRejected, why);
    }
    return std::move(reply.second);
}

} // namespace presence::com
