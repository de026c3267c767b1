#include <atomic>
#include <chrono>
#include <csignal>
#include <memory>
#include <string>

#include "log.hpp"
#include "sinks_console.hpp"

#include <presence/com/core.hpp>
#include <presence/com/feed_event_source.hpp>
#include <presence/com/someip_adapter.hpp>
#include <presence/core/event_loop.hpp>
#include <presence/per/document_storage.hpp>
#include <persistency/key_value_storage_backend.hpp>
#include <persistency/state_store.hpp>
#include <supervisor/connection_supervisor.hpp>

#include "config.hpp"
#include "udp_notification_sink.hpp"
#include "watcher.hpp"
#include "diag/status_server.hpp"

using namespace presence;

// graceful shutdown flag
static std::atomic<bool> running{true};
static void on_sig(int) { running.store(false, std::memory_order_relaxed); }

int main() {
  std::signal(SIGINT,  on_sig);
  std::signal(SIGTERM, on_sig);

  // Logging
  auto &LM = log::LogManager::Instance();
  LM.SetAppId("PWATCH");
  LM.AddSink(std::make_shared<log::ConsoleSink>());

  auto loaded = app::LoadConfig(app::ProcessEnvironment());
  if (!loaded.HasValue()) return 1;
  const app::AppConfig cfg = loaded.Value();
  LM.SetDefaultLevel(cfg.log_level);
  for (const auto& [ctx, lvl] : cfg.context_levels) LM.SetContextLevel(ctx, lvl);
  auto lg = log::Logger::CreateLogger("MAIN");
  PRESENCE_LOGINFO(lg, "Starting presence watcher");

  core::EventLoop loop;

  // Transport-agnostic runtime backed by SOME/IP adapter
  com::SomeipAdapter adapter;
  com::Runtime rt(adapter);
  persistency::KeyValueStorageBackend session_cache(cfg.session_cache_dir);
  com::FeedEventSource source(rt, loop, session_cache,
                              com::FeedEventSource::Config{cfg.connect_timeout}, cfg.app_name);
  if (rt.adapter().init(cfg.app_name) != com::Errc::kOk) {
    PRESENCE_LOGERROR(lg, "Transport could not be initialized, exiting");
    return 1;
  }

  per::DocumentStorage document(cfg.location_file);
  persistency::StateStore store(document, loop, persistency::StateStore::Config{cfg.store_debounce});

  app::UdpNotificationSink sink(app::UdpNotificationSink::Config{cfg.notify_host, cfg.notify_port});

  supervisor::ConnectionSupervisor monitor(loop, source, cfg.credentials, cfg.supervisor);
  app::Watcher watcher(cfg.target_ids, store, sink, [&monitor] { monitor.RecordEvent(); });

  // Store size is published from the loop; the endpoint thread only reads atomics
  std::atomic<std::size_t> entity_count{store.Size()};
  diag::StatusServer status([&] {
    diag::HealthSnapshot s;
    const auto state = monitor.State();
    s.connection_state = supervisor::ToString(state);
    s.healthy = state == supervisor::ConnectionState::kConnected;
    s.last_event = monitor.LastEventTime();
    s.attempts = monitor.Attempts();
    s.entities = entity_count.load(std::memory_order_relaxed);
    return s;
  });
  if (auto r = status.Start(cfg.health_host, cfg.health_port); !r.HasValue()) {
    PRESENCE_LOGERROR(lg, "Health endpoint unavailable: {}", r.Error().Describe());
  }

  loop.Post([&] { monitor.Start(watcher); });

  using namespace std::chrono_literals;
  bool shutting_down = false;
  loop.ScheduleEvery(200ms, [&] {
    entity_count.store(store.Size(), std::memory_order_relaxed);
    if (running.load(std::memory_order_relaxed) || shutting_down) return;
    shutting_down = true;

    PRESENCE_LOGINFO(lg, "Shutting down...");
    store.Flush();
    monitor.Stop();
    status.Stop();
    loop.Stop();
  });

  loop.Run();

  rt.adapter().shutdown();
  PRESENCE_LOGINFO(lg, "Goodbye");
  return 0;
}
