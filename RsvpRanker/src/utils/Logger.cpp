#include "Logger.hpp"
#include <chrono>
#include <cstdlib>
#include <string_view>

namespace {
  const auto g_t0 = std::chrono::steady_clock::now();
}

namespace logger {
  thread_local const char* tlabel = "main";

  uint64_t ms_since_start() {
    return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - g_t0).count());
  }

  bool verbose() {
    const char* v = std::getenv("VERBOSE");
    return v && *v && std::string_view(v) != "0";
  }

  void init() {
    // Log message format ("pattern")
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    // debug lines only reach the sink when VERBOSE is on
    spdlog::set_level(verbose() ? spdlog::level::debug : spdlog::level::info);
  }

  void write_line(spdlog::level::level_enum lvl, const std::string& line) {
    // spdlog's default logger is thread-safe (mt sink), no extra mutex needed
    spdlog::log(lvl, "[{:>6} ms] {}: {}", ms_since_start(), tlabel, line);
  }
}
