#include "config.hpp"
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

using nlohmann::json;

namespace presence::app {

namespace {

std::string Trim(const std::string& s) {
  const auto b = s.find_first_not_of(" \t\r\n");
  if (b == std::string::npos) return {};
  const auto e = s.find_last_not_of(" \t\r\n");
  return s.substr(b, e - b + 1);
}

std::vector<std::string> SplitIds(const std::string& csv) {
  std::vector<std::string> out;
  std::istringstream iss(csv);
  std::string tok;
  while (std::getline(iss, tok, ',')) {
    tok = Trim(tok);
    if (!tok.empty()) out.push_back(tok);
  }
  return out;
}

std::optional<std::uint16_t> ParsePort(const std::string& s) {
  if (s.empty()) return std::nullopt;
  char* end = nullptr;
  const unsigned long v = std::strtoul(s.c_str(), &end, 10);
  if (*end != '\0' || v == 0 || v > 65535) return std::nullopt;
  return static_cast<std::uint16_t>(v);
}

// Reads a positive millisecond value at obj[key] when present
void ReadMillis(const json& obj, const char* key, const std::string& path,
                std::chrono::milliseconds& out, std::vector<std::string>& errors) {
  if (!obj.contains(key)) return;
  const auto& v = obj[key];
  if (!v.is_number_integer() || v.get<std::int64_t>() <= 0) {
    errors.push_back("manifest: " + path + " must be a positive integer");
    return;
  }
  out = std::chrono::milliseconds(v.get<std::int64_t>());
}

// "info" or "info,STORE=debug,SOMEIP=verbose"; the bare entry sets the default
void ParseLogLevels(const std::string& value, AppConfig& cfg, std::vector<std::string>& errors) {
  std::istringstream iss(value);
  std::string tok;
  while (std::getline(iss, tok, ',')) {
    tok = Trim(tok);
    if (tok.empty()) continue;
    const auto eq = tok.find('=');
    const std::string name = eq == std::string::npos ? tok : Trim(tok.substr(eq + 1));
    const auto lvl = log::ParseLevel(name);
    if (!lvl) {
      errors.push_back("LOG_LEVEL must be one of error|warn|info|debug|verbose, got '" + name + "'");
      continue;
    }
    if (eq == std::string::npos) {
      cfg.log_level = *lvl;
      continue;
    }
    const std::string ctx = Trim(tok.substr(0, eq));
    if (ctx.empty()) errors.push_back("LOG_LEVEL entry '" + tok + "' names no context");
    else cfg.context_levels[ctx] = *lvl;
  }
}

} // namespace

EnvLookup ProcessEnvironment() {
  return [](const std::string& name) -> std::optional<std::string> {
    const char* v = std::getenv(name.c_str());
    if (!v) return std::nullopt;
    return std::string(v);
  };
}

void ApplyManifest(const std::string& json_text, AppConfig& cfg, std::vector<std::string>& errors) {
  const json doc = json::parse(json_text, nullptr, /*allow_exceptions*/ false);
  if (doc.is_discarded() || !doc.is_object()) {
    errors.push_back("manifest: not a JSON object");
    return;
  }

  if (doc.contains("app_name")) {
    if (doc["app_name"].is_string() && !doc["app_name"].get<std::string>().empty())
      cfg.app_name = doc["app_name"].get<std::string>();
    else
      errors.push_back("manifest: app_name must be a non-empty string");
  }

  if (doc.contains("backoff") && doc["backoff"].is_object()) {
    const auto& b = doc["backoff"];
    ReadMillis(b, "base_ms", "backoff.base_ms", cfg.supervisor.backoff.base, errors);
    ReadMillis(b, "max_ms", "backoff.max_ms", cfg.supervisor.backoff.max_delay, errors);
    if (b.contains("cap_exponent")) {
      const auto& c = b["cap_exponent"];
      if (c.is_number_unsigned() && c.get<std::uint32_t>() <= 30)
        cfg.supervisor.backoff.cap_exponent = c.get<std::uint32_t>();
      else
        errors.push_back("manifest: backoff.cap_exponent must be an integer in [0, 30]");
    }
  }

  ReadMillis(doc, "auth_cooldown_ms", "auth_cooldown_ms", cfg.supervisor.auth_cooldown, errors);

  if (doc.contains("health") && doc["health"].is_object()) {
    const auto& h = doc["health"];
    ReadMillis(h, "interval_ms", "health.interval_ms", cfg.supervisor.health.interval, errors);
    ReadMillis(h, "stale_after_ms", "health.stale_after_ms", cfg.supervisor.health.stale_after, errors);
  }

  if (doc.contains("store") && doc["store"].is_object()) {
    ReadMillis(doc["store"], "debounce_ms", "store.debounce_ms", cfg.store_debounce, errors);
  }

  ReadMillis(doc, "connect_timeout_ms", "connect_timeout_ms", cfg.connect_timeout, errors);
}

core::Result<AppConfig> LoadConfig(const EnvLookup& env) {
  auto lg = log::Logger::CreateLogger("CONFIG");
  std::vector<std::string> errors;
  AppConfig cfg;

  auto get = [&](const char* name) -> std::optional<std::string> {
    auto v = env(name);
    if (v && v->empty()) return std::nullopt;
    return v;
  };

  for (const char* required : {"FEED_USERNAME", "FEED_PASSWORD", "TARGET_USER_IDS"}) {
    if (!get(required)) errors.push_back(std::string("Missing required environment variable: ") + required);
  }

  if (auto v = get("FEED_USERNAME")) cfg.credentials.username = *v;
  if (auto v = get("FEED_PASSWORD")) cfg.credentials.password = *v;
  if (auto v = get("FEED_TOTP_SECRET")) cfg.credentials.totp_secret = *v;

  if (auto v = get("TARGET_USER_IDS")) {
    cfg.target_ids = SplitIds(*v);
    if (cfg.target_ids.empty()) errors.push_back("TARGET_USER_IDS must contain at least one id");
  }

  if (auto v = get("NOTIFY_HOST")) cfg.notify_host = *v;
  if (auto v = get("NOTIFY_PORT")) {
    if (auto p = ParsePort(*v)) cfg.notify_port = *p;
    else errors.push_back("NOTIFY_PORT must be a port number, got '" + *v + "'");
  }
  if (auto v = get("HEALTH_HOST")) cfg.health_host = *v;
  if (auto v = get("HEALTH_PORT")) {
    if (auto p = ParsePort(*v)) cfg.health_port = *p;
    else errors.push_back("HEALTH_PORT must be a port number, got '" + *v + "'");
  }

  if (auto v = get("LOCATION_FILE_PATH")) cfg.location_file = *v;
  if (auto v = get("SESSION_CACHE_DIR")) cfg.session_cache_dir = *v;

  if (auto v = get("LOG_LEVEL")) ParseLogLevels(*v, cfg, errors);

  if (auto v = get("PRESENCE_MANIFEST")) {
    std::ifstream in(*v, std::ios::binary);
    if (!in) {
      errors.push_back("Cannot open manifest " + *v);
    } else {
      std::ostringstream ss;
      ss << in.rdbuf();
      ApplyManifest(ss.str(), cfg, errors);
    }
  }

  if (!errors.empty()) {
    std::string joined;
    for (const auto& e : errors) {
      PRESENCE_LOGERROR(lg, "{}", e);
      if (!joined.empty()) joined += "; ";
      joined += e;
    }
    return core::ErrorCode(core::Errc::kInvalidArgument, joined);
  }

  PRESENCE_LOGINFO(lg, "Watching {} target(s)", cfg.target_ids.size());
  return cfg;
}

} // namespace presence::app
