// logging/include/log.hpp
#pragma once
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <presence/core/scheduler.hpp>

namespace presence::log {

enum class LogLevel : uint8_t { kOff, kFatal, kError, kWarn, kInfo, kDebug, kVerbose };

inline constexpr std::string_view ToString(LogLevel lvl) {
  switch (lvl) {
    case LogLevel::kFatal:   return "FATAL";
    case LogLevel::kError:   return "ERROR";
    case LogLevel::kWarn:    return "WARN";
    case LogLevel::kInfo:    return "INFO";
    case LogLevel::kDebug:   return "DEBUG";
    case LogLevel::kVerbose: return "VERBOSE";
    default:                 return "OFF";
  }
}

// Lower-case LOG_LEVEL spellings only.
inline std::optional<LogLevel> ParseLevel(std::string_view s) {
  static constexpr std::pair<std::string_view, LogLevel> kNames[] = {
    {"off", LogLevel::kOff},   {"fatal", LogLevel::kFatal}, {"error", LogLevel::kError},
    {"warn", LogLevel::kWarn}, {"info", LogLevel::kInfo},   {"debug", LogLevel::kDebug},
    {"verbose", LogLevel::kVerbose},
  };
  for (const auto& [name, lvl] : kNames) {
    if (name == s) return lvl;
  }
  return std::nullopt;
}

struct LogRecord {
  std::string app_id;  // "PWATCH", "PFEED"
  std::string ctx_id;  // "MON", "STORE", ...
  LogLevel    level{LogLevel::kInfo};
  std::string message;
  core::WallClock::time_point time;
  const char* file = nullptr;
  uint32_t    line = 0;
};

struct ISink {
  virtual ~ISink() = default;
  virtual void write(const LogRecord& rec) noexcept = 0;
};

using SinkPtr = std::shared_ptr<ISink>;

namespace detail {

// Each "{}" takes the next argument through operator<<; surplus braces stay.
inline void FormatTo(std::ostringstream& oss, std::string_view fmt) { oss << fmt; }

template <typename T, typename... Rest>
void FormatTo(std::ostringstream& oss, std::string_view fmt, T&& value, Rest&&... rest) {
  const auto pos = fmt.find("{}");
  if (pos == std::string_view::npos) {
    oss << fmt;
    return;
  }
  oss << fmt.substr(0, pos) << std::forward<T>(value);
  FormatTo(oss, fmt.substr(pos + 2), std::forward<Rest>(rest)...);
}

} // namespace detail

// Process-wide ids, levels and sinks. Loggers copy what they need when created.
class LogManager {
public:
  struct Settings {
    std::string app_id;
    LogLevel level;
    std::vector<SinkPtr> sinks;
  };

  static LogManager& Instance() {
    static LogManager g;
    return g;
  }

  void SetAppId(std::string app) {
    std::scoped_lock lk(mu_);
    app_id_ = std::move(app);
  }

  void SetDefaultLevel(LogLevel lvl) {
    std::scoped_lock lk(mu_);
    default_level_ = lvl;
  }

  // Overrides the default level for loggers created later under ctx
  void SetContextLevel(const std::string& ctx, LogLevel lvl) {
    std::scoped_lock lk(mu_);
    context_levels_[ctx] = lvl;
  }

  void ClearContextLevels() {
    std::scoped_lock lk(mu_);
    context_levels_.clear();
  }

  void AddSink(SinkPtr s) {
    std::scoped_lock lk(mu_);
    sinks_.push_back(std::move(s));
  }

  void ClearSinks() {
    std::scoped_lock lk(mu_);
    sinks_.clear();
  }

  Settings SettingsFor(const std::string& ctx) const {
    std::scoped_lock lk(mu_);
    auto it = context_levels_.find(ctx);
    return Settings{app_id_, it != context_levels_.end() ? it->second : default_level_, sinks_};
  }

private:
  LogManager() = default;
  mutable std::mutex mu_;
  std::vector<SinkPtr> sinks_;
  std::map<std::string, LogLevel> context_levels_;
  std::string app_id_{"PWATCH"};
  LogLevel default_level_{LogLevel::kInfo};
};

class Logger {
public:
  // An explicit level wins over any manager-side override for ctx
  static Logger CreateLogger(std::string ctx, std::optional<LogLevel> level = std::nullopt) {
    auto s = LogManager::Instance().SettingsFor(ctx);
    return Logger(std::move(ctx), std::move(s.app_id), std::move(s.sinks), level.value_or(s.level));
  }

  LogLevel Level() const noexcept { return level_; }
  void SetLevel(LogLevel lvl) noexcept { level_ = lvl; }
  const std::string& ContextId() const noexcept { return ctx_id_; }

  bool Enabled(LogLevel lvl) const noexcept {
    return level_ != LogLevel::kOff && lvl != LogLevel::kOff
        && static_cast<uint8_t>(lvl) <= static_cast<uint8_t>(level_);
  }

  void Log(LogLevel lvl, std::string_view msg, const char* file = nullptr, uint32_t line = 0) const {
    if (!Enabled(lvl)) return;
    LogRecord r;
    r.app_id = app_id_;
    r.ctx_id = ctx_id_;
    r.level = lvl;
    r.message = std::string(msg);
    r.time = core::WallClock::now();
    r.file = file;
    r.line = line;
    for (const auto& s : sinks_) {
      if (s) s->write(r);
    }
  }

  template <typename... Args>
  void LogF(LogLevel lvl, const char* file, uint32_t line, std::string_view fmt, Args&&... args) const {
    if (!Enabled(lvl)) return;
    std::ostringstream oss;
    detail::FormatTo(oss, fmt, std::forward<Args>(args)...);
    Log(lvl, oss.str(), file, line);
  }

private:
  Logger(std::string ctx, std::string app, std::vector<SinkPtr> sinks, LogLevel lvl)
      : ctx_id_(std::move(ctx)), app_id_(std::move(app)), sinks_(std::move(sinks)), level_(lvl) {}

  std::string ctx_id_;
  std::string app_id_;
  std::vector<SinkPtr> sinks_;
  LogLevel level_;
};

#define PRESENCE_LOGERROR(lg, fmt, ...)   (lg).LogF(::presence::log::LogLevel::kError,   __FILE__, __LINE__, (fmt), ##__VA_ARGS__)
#define PRESENCE_LOGWARN(lg, fmt, ...)    (lg).LogF(::presence::log::LogLevel::kWarn,    __FILE__, __LINE__, (fmt), ##__VA_ARGS__)
#define PRESENCE_LOGINFO(lg, fmt, ...)    (lg).LogF(::presence::log::LogLevel::kInfo,    __FILE__, __LINE__, (fmt), ##__VA_ARGS__)
#define PRESENCE_LOGDEBUG(lg, fmt, ...)   (lg).LogF(::presence::log::LogLevel::kDebug,   __FILE__, __LINE__, (fmt), ##__VA_ARGS__)
#define PRESENCE_LOGVERBOSE(lg, fmt, ...) (lg).LogF(::presence::log::LogLevel::kVerbose, __FILE__, __LINE__, (fmt), ##__VA_ARGS__)

} // namespace presence::log
