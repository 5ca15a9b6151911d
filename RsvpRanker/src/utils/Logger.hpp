#pragma once
#include <cstdint>
#include <sstream>
#include <string>
#include <spdlog/spdlog.h>   // main spdlog API (info/warn/error, set_pattern, set_level)

namespace logger {
  // Returns ms since program start (steady clock).
  uint64_t ms_since_start();

  // True if VERBOSE env var is set and not "0".
  bool verbose();

  // Per-thread label used in log lines (defaults to "main").
  extern thread_local const char* tlabel;

  // Sets spdlog pattern + level. Safe to call more than once.
  void init();

  // Formats "[ms] label: line" and hands it to spdlog at the given level.
  void write_line(spdlog::level::level_enum lvl, const std::string& line);
}

// Stream-style macros so call sites can do LOG_ALWAYS("x=" << x).
#define RSVP_LOG_AT(lvl, msg) do { \
  std::ostringstream rsvp_log_oss_; \
  rsvp_log_oss_ << msg; \
  logger::write_line((lvl), rsvp_log_oss_.str()); \
} while(0)

#define LOG_ALWAYS(msg) RSVP_LOG_AT(spdlog::level::info, msg)
#define LOG_WARN(msg)   RSVP_LOG_AT(spdlog::level::warn, msg)
#define LOG_ERR(msg)    RSVP_LOG_AT(spdlog::level::err, msg)
#define LOG_DBG(msg) do { if (logger::verbose()) RSVP_LOG_AT(spdlog::level::debug, msg); } while(0)
