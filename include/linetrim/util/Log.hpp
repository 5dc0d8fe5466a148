#pragma once

#include <atomic>
#include <cctype>
#include <cstdint>
#include <iostream>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>

namespace linetrim::log {

// stderr diagnostics with a fixed "[linetrim]" prefix. Lines are emitted whole
// under a mutex so OpenMP workers do not interleave.

enum class Level {
  Quiet = 0,
  Info = 1,
  Debug = 2,
};

inline Level parse_level(std::string s) {
  for (auto& c : s) c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
  if (s == "quiet" || s == "warn" || s == "warning") return Level::Quiet;
  if (s.empty() || s == "info") return Level::Info;
  if (s == "debug" || s == "verbose") return Level::Debug;
  throw std::runtime_error("invalid log level: '" + s + "' (use quiet|info|debug)");
}

inline std::string level_name(Level l) {
  switch (l) {
    case Level::Quiet: return "quiet";
    case Level::Info: return "info";
    case Level::Debug: return "debug";
  }
  return "info";
}

namespace detail {
inline std::atomic<int>& threshold() {
  static std::atomic<int> t{static_cast<int>(Level::Info)};
  return t;
}
inline std::mutex& sink_mutex() {
  static std::mutex m;
  return m;
}
inline void emit(const char* tag, const std::string& msg) {
  std::ostringstream oss;
  oss << "[linetrim]" << tag << " " << msg << "\n";
  std::lock_guard<std::mutex> lk(sink_mutex());
  std::cerr << oss.str();
}
} // namespace detail

inline void set_level(Level l) { detail::threshold().store(static_cast<int>(l)); }
inline Level level() { return static_cast<Level>(detail::threshold().load()); }
inline bool enabled(Level l) { return static_cast<int>(l) <= detail::threshold().load(); }

// Warnings are always printed.
inline void warn(const std::string& msg) { detail::emit(" WARNING!", msg); }
inline void info(const std::string& msg) {
  if (enabled(Level::Info)) detail::emit("", msg);
}
inline void debug(const std::string& msg) {
  if (enabled(Level::Debug)) detail::emit(" debug:", msg);
}

// Human-readable duration, e.g. "850 ms", "12.3 s", "4m 10s", "2h 5m 0s".
inline std::string format_duration_ms(std::int64_t ms) {
  if (ms < 0) ms = 0;
  if (ms < 1000) return std::to_string(ms) + " ms";

  const std::int64_t total_seconds = ms / 1000;
  if (total_seconds < 60) {
    std::ostringstream oss;
    oss.setf(std::ios::fixed);
    oss.precision(1);
    oss << (static_cast<double>(ms) / 1000.0) << " s";
    return oss.str();
  }
  const std::int64_t seconds = total_seconds % 60;
  const std::int64_t total_minutes = total_seconds / 60;
  if (total_minutes < 60) {
    return std::to_string(total_minutes) + "m " + std::to_string(seconds) + "s";
  }
  return std::to_string(total_minutes / 60) + "h " + std::to_string(total_minutes % 60) + "m " +
         std::to_string(seconds) + "s";
}

} // namespace linetrim::log
