// com/src/someip_adapter.cpp: the only file that touches vsomeip
#include <presence/com/someip_adapter.hpp>
#include <vsomeip/vsomeip.hpp>
#include <log.hpp>
#include <atomic>
#include <cstdio>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <thread>
#include <tuple>
#include <unordered_map>
#include <vector>

namespace presence::com {

namespace {

std::string PayloadOf(const std::shared_ptr<vsomeip::message>& msg) {
  std::string out;
  if (auto pl = msg->get_payload()) {
    const auto len = pl->get_length();
    if (len) out.assign(reinterpret_cast<const char*>(pl->get_data()), len);
  }
  return out;
}

std::string Hex(std::uint16_t v) {
  char buf[8];
  std::snprintf(buf, sizeof(buf), "0x%04x", v);
  return buf;
}

std::shared_ptr<vsomeip::payload> MakePayload(const std::string& bytes) {
  auto p = vsomeip::runtime::get()->create_payload();
  std::vector<vsomeip::byte_t> data(bytes.begin(), bytes.end());
  p->set_data(data);
  return p;
}

} // namespace

struct SomeipAdapter::Impl {
  using Key = std::tuple<ServiceId, InstanceId, EventId>;
  using Endpoint = std::pair<ServiceId, InstanceId>;
  struct SubMeta { ServiceId s; InstanceId i; EventGroupId g; EventId e; };
  struct AvEntry { ServiceId s; InstanceId i; AvCb cb; };

  std::shared_ptr<vsomeip::application> app;
  std::thread dispatch_thread;
  std::once_flag once;
  Errc init_result{Errc::kOk};
  log::Logger log{log::Logger::CreateLogger("SOMEIP")};

  std::mutex mu;
  std::atomic_uint64_t next_token{0};
  std::map<Key, std::map<std::uint64_t, EventCb>> subs;
  std::unordered_map<std::uint64_t, SubMeta> token_meta;
  std::map<vsomeip::session_t, Resp> pending;
  std::map<Endpoint, RequestHandler> request_handlers;
  std::unordered_map<std::uint64_t, AvEntry> av_handlers;
  std::map<Endpoint, bool> av_state;
  std::set<Key> offered_events;

  void OnMessage(const std::shared_ptr<vsomeip::message>& msg);
  void OnAvailability(ServiceId s, InstanceId i, bool up);
};

void SomeipAdapter::Impl::OnMessage(const std::shared_ptr<vsomeip::message>& msg) {
  const auto type = msg->get_message_type();
  const std::string payload = PayloadOf(msg);

  if (type == vsomeip::message_type_e::MT_NOTIFICATION) {
    std::vector<EventCb> cbs;
    {
      std::lock_guard lk(mu);
      auto it = subs.find(Key{msg->get_service(), msg->get_instance(), msg->get_method()});
      if (it == subs.end()) return;  // nobody subscribed to this event
      for (auto& [_, cb] : it->second) cbs.push_back(cb);
    }
    for (auto& cb : cbs) if (cb) cb(payload);
    return;
  }

  if (type == vsomeip::message_type_e::MT_REQUEST) {
    RequestHandler handler;
    {
      std::lock_guard lk(mu);
      auto it = request_handlers.find(Endpoint{msg->get_service(), msg->get_instance()});
      if (it != request_handlers.end()) handler = it->second;
    }
    if (!handler) {
      PRESENCE_LOGWARN(log, "No handler for request {}", Hex(msg->get_method()));
      return;
    }
    auto resp = vsomeip::runtime::get()->create_response(msg);
    resp->set_payload(MakePayload(handler(msg->get_method(), payload)));
    app->send(resp);
    return;
  }

  if (type == vsomeip::message_type_e::MT_RESPONSE || type == vsomeip::message_type_e::MT_ERROR) {
    Resp cb;
    {
      std::lock_guard lk(mu);
      auto it = pending.find(msg->get_session());
      if (it == pending.end()) return;  // late reply after shutdown or unknown session
      cb = std::move(it->second);
      pending.erase(it);
    }
    const bool ok = type == vsomeip::message_type_e::MT_RESPONSE
                 && msg->get_return_code() == vsomeip::return_code_e::E_OK;
    if (cb) cb(ok ? Errc::kOk : Errc::kTransportError, payload);
  }
}

void SomeipAdapter::Impl::OnAvailability(ServiceId s, InstanceId i, bool up) {
  std::vector<AvCb> cbs;
  {
    std::lock_guard lk(mu);
    av_state[Endpoint{s, i}] = up;
    for (auto& [_, entry] : av_handlers) {
      if (entry.s == s && entry.i == i) cbs.push_back(entry.cb);
    }
  }
  PRESENCE_LOGINFO(log, "Service {}:{} {}", Hex(s), Hex(i), up ? "available" : "not available");
  const auto av = up ? Availability::kAvailable : Availability::kNotAvailable;
  for (auto& cb : cbs) if (cb) cb(av);
}

SomeipAdapter::SomeipAdapter() : impl_(std::make_unique<Impl>()) {}

SomeipAdapter::~SomeipAdapter() {
  shutdown();
}

Errc SomeipAdapter::init(const std::string& app_name) {
  std::call_once(impl_->once, [&] {
    auto& d = *impl_;
    d.app = vsomeip::runtime::get()->create_application(app_name);
    if (!d.app || !d.app->init()) {
      PRESENCE_LOGERROR(d.log, "Failed to initialize vsomeip application '{}'", app_name);
      d.app.reset();
      d.init_result = Errc::kTransportError;
      return;
    }

    d.app->register_message_handler(
      vsomeip::ANY_SERVICE, vsomeip::ANY_INSTANCE, vsomeip::ANY_METHOD,
      [&d](const std::shared_ptr<vsomeip::message>& msg) { d.OnMessage(msg); });

    d.app->register_availability_handler(
      vsomeip::ANY_SERVICE, vsomeip::ANY_INSTANCE,
      [&d](vsomeip::service_t s, vsomeip::instance_t i, bool up) { d.OnAvailability(s, i, up); });

    d.dispatch_thread = std::thread([app = d.app] { app->start(); });
    PRESENCE_LOGINFO(d.log, "vsomeip application '{}' started", app_name);
  });
  return impl_->init_result;
}

void SomeipAdapter::shutdown() {
  auto& d = *impl_;
  if (!d.app) return;
  d.app->clear_all_handler();
  d.app->stop();
  if (d.dispatch_thread.joinable()) d.dispatch_thread.join();

  std::map<vsomeip::session_t, Resp> orphaned;
  {
    std::lock_guard lk(d.mu);
    orphaned.swap(d.pending);
  }
  for (auto& [_, cb] : orphaned) if (cb) cb(Errc::kTransportError, {});
  d.app.reset();
}

// ---- Discovery / attach ----------------------------------------------------

Errc SomeipAdapter::request_service(ServiceId s, InstanceId i) {
  if (!impl_->app) return Errc::kTransportError;
  impl_->app->request_service(s, i);
  PRESENCE_LOGDEBUG(impl_->log, "Requesting service {}:{}", Hex(s), Hex(i));
  return Errc::kOk;
}

void SomeipAdapter::release_service(ServiceId s, InstanceId i) {
  if (impl_->app) impl_->app->release_service(s, i);
}

// ---- RPC -------------------------------------------------------------------

Errc SomeipAdapter::send_request(ServiceId s, InstanceId i, MethodId m,
                                 const std::string& payload, Resp cb) {
  auto& d = *impl_;
  if (!d.app) return Errc::kTransportError;

  auto req = vsomeip::runtime::get()->create_request(true);
  req->set_service(s);
  req->set_instance(i);
  req->set_method(m);
  req->set_payload(MakePayload(payload));

  // Held across send() so the reply cannot be matched before it is registered
  std::lock_guard lk(d.mu);
  d.app->send(req);
  d.pending[req->get_session()] = std::move(cb);
  return Errc::kOk;
}

// ---- Events (client) -------------------------------------------------------

SubscriptionToken SomeipAdapter::subscribe_event(ServiceId s, InstanceId i,
                                                 EventGroupId g, EventId e, EventCb cb) {
  auto& d = *impl_;
  const auto token = SubscriptionToken{++d.next_token};
  {
    std::lock_guard lk(d.mu);
    d.subs[Impl::Key{s, i, e}][token.value] = std::move(cb);
    d.token_meta[token.value] = Impl::SubMeta{s, i, g, e};
  }
  if (d.app) {
    // Request the single event first; a bare subscribe() delivers the whole group
    d.app->request_event(s, i, e, {g}, vsomeip::event_type_e::ET_EVENT,
                         vsomeip::reliability_type_e::RT_RELIABLE);
    d.app->subscribe(s, i, g);
  }
  return token;
}

void SomeipAdapter::unsubscribe_event(SubscriptionToken t) {
  auto& d = *impl_;
  Impl::SubMeta meta{};
  bool last = false;
  {
    std::lock_guard lk(d.mu);
    auto it_meta = d.token_meta.find(t.value);
    if (it_meta == d.token_meta.end()) return;
    meta = it_meta->second;
    d.token_meta.erase(it_meta);

    auto it = d.subs.find(Impl::Key{meta.s, meta.i, meta.e});
    if (it != d.subs.end()) {
      it->second.erase(t.value);
      if (it->second.empty()) {
        d.subs.erase(it);
        last = true;
      }
    }
  }
  if (last && d.app) {
    d.app->unsubscribe(meta.s, meta.i, meta.g);
    d.app->release_event(meta.s, meta.i, meta.e);
  }
}

// ---- Server side -----------------------------------------------------------

Errc SomeipAdapter::offer_service(ServiceId s, InstanceId i) {
  if (!impl_->app) return Errc::kTransportError;
  impl_->app->offer_service(s, i);
  PRESENCE_LOGINFO(impl_->log, "Offered service {}:{}", Hex(s), Hex(i));
  return Errc::kOk;
}

void SomeipAdapter::stop_offer_service(ServiceId s, InstanceId i) {
  if (impl_->app) impl_->app->stop_offer_service(s, i);
}

Errc SomeipAdapter::send_notification(ServiceId s, InstanceId i, EventId e,
                                      const std::string& payload) {
  auto& d = *impl_;
  if (!d.app) return Errc::kTransportError;
  {
    // Offer lazily, once per event, in the presence group
    std::lock_guard lk(d.mu);
    if (d.offered_events.insert(Impl::Key{s, i, e}).second) {
      std::set<vsomeip::eventgroup_t> groups{0x0001};
      d.app->offer_event(s, i, e, groups, vsomeip::event_type_e::ET_EVENT,
                         std::chrono::milliseconds::zero(), false, true);
    }
  }
  d.app->notify(s, i, e, MakePayload(payload), true);
  PRESENCE_LOGDEBUG(d.log, "Sent notification {}: {}", Hex(e), payload);
  return Errc::kOk;
}

void SomeipAdapter::set_request_handler(ServiceId s, InstanceId i, RequestHandler h) {
  std::lock_guard lk(impl_->mu);
  impl_->request_handlers[Impl::Endpoint{s, i}] = std::move(h);
}

// ---- Availability bridge ---------------------------------------------------

SubscriptionToken SomeipAdapter::on_availability(ServiceId s, InstanceId i, AvCb cb) {
  auto& d = *impl_;
  const auto id = ++d.next_token;
  std::optional<bool> known;
  {
    std::lock_guard lk(d.mu);
    d.av_handlers[id] = Impl::AvEntry{s, i, cb};
    auto it = d.av_state.find(Impl::Endpoint{s, i});
    if (it != d.av_state.end()) known = it->second;
  }
  if (known && cb) cb(*known ? Availability::kAvailable : Availability::kNotAvailable);
  return SubscriptionToken{id};
}

void SomeipAdapter::remove_availability_handler(SubscriptionToken t) {
  std::lock_guard lk(impl_->mu);
  impl_->av_handlers.erase(t.value);
}

} // namespace presence::com
