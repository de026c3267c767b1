#pragma once
#include <memory>
#include <presence/com/core.hpp>

namespace presence::com {

// IAdapter over one vsomeip application. init() creates the application and
// starts its dispatch thread; later init() calls are ignored.
class SomeipAdapter final : public IAdapter {
public:
  SomeipAdapter();
  ~SomeipAdapter() override;

  SomeipAdapter(const SomeipAdapter&) = delete;
  SomeipAdapter& operator=(const SomeipAdapter&) = delete;

  Errc init(const std::string& app) override;
  void shutdown() override;

  Errc request_service(ServiceId s, InstanceId i) override;
  void release_service(ServiceId s, InstanceId i) override;

  Errc send_request(ServiceId s, InstanceId i, MethodId m,
                    const std::string& payload, Resp cb) override;

  SubscriptionToken subscribe_event(ServiceId s, InstanceId i,
                                    EventGroupId g, EventId e, EventCb cb) override;
  void unsubscribe_event(SubscriptionToken t) override;

  Errc offer_service(ServiceId s, InstanceId i) override;
  void stop_offer_service(ServiceId s, InstanceId i) override;
  Errc send_notification(ServiceId s, InstanceId i, EventId e,
                         const std::string& payload) override;

  void set_request_handler(ServiceId s, InstanceId i, RequestHandler h) override;

  SubscriptionToken on_availability(ServiceId s, InstanceId i, AvCb cb) override;
  void remove_availability_handler(SubscriptionToken t) override;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace presence::com
