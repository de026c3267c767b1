#pragma once
#include "log.hpp"
#include <iostream>
#include <presence/core/iso_time.hpp>

namespace presence::log {

// Warnings and errors go to stderr, the rest to stdout.
struct ConsoleSink : ISink {
  void write(const LogRecord& r) noexcept override {
    auto& out = (r.level <= LogLevel::kWarn) ? std::cerr : std::cout;
    out << core::FormatIso8601(r.time) << " [" << ToString(r.level) << "] "
        << r.ctx_id << ": " << r.message << std::endl;
  }
};

} // namespace presence::log
