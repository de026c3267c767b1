#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <log.hpp>
#include <presence/core/result.hpp>
#include <supervisor/connection_supervisor.hpp>

namespace presence::app {

struct AppConfig {
  supervisor::Credentials credentials;
  std::vector<std::string> target_ids;

  std::string notify_host{"127.0.0.1"};
  std::uint16_t notify_port{19000};
  std::string health_host{"127.0.0.1"};
  std::uint16_t health_port{3000};

  std::string location_file{"data/entity-states.json"};
  std::string session_cache_dir{"data/session"};
  log::LogLevel log_level{log::LogLevel::kInfo};
  std::map<std::string, log::LogLevel> context_levels;  // LOG_LEVEL="info,STORE=debug"

  // Tunables, overridable through the PRESENCE_MANIFEST file
  std::string app_name{"presence_watchd"};
  supervisor::ConnectionSupervisor::Config supervisor{};
  std::chrono::milliseconds store_debounce{1000};
  std::chrono::milliseconds connect_timeout{30 * 1000};
};

using EnvLookup = std::function<std::optional<std::string>(const std::string& name)>;

EnvLookup ProcessEnvironment();

// Validates everything before giving up; each problem is logged and the
// returned error lists all of them.
core::Result<AppConfig> LoadConfig(const EnvLookup& env);

// Applies a manifest document on top of cfg. Appends problems to errors.
void ApplyManifest(const std::string& json_text, AppConfig& cfg, std::vector<std::string>& errors);

} // namespace presence::app
