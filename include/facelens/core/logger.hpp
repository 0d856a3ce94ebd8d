#pragma once

#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>

namespace facelens::core {

enum class LogLevel {
  Debug,
  Info,
  Warn,
  Error,
  Off,
};

/// Parses "debug", "info", "warn", "error", "off"; returns fallback for anything else.
[[nodiscard]] LogLevel parse_log_level(std::string_view name, LogLevel fallback) noexcept;

/// Thread-safe, level-filtered logger writing timestamped lines to stderr.
/// Avoid per-frame Info logging on the hot path; per-frame events go to Debug.
class Logger {
 public:
  static void set_level(LogLevel level) noexcept;
  [[nodiscard]] static LogLevel level() noexcept;
  [[nodiscard]] static bool enabled(LogLevel level) noexcept { return level >= Logger::level(); }

  static void log(LogLevel level, std::string_view message);

  template <typename... Args>
  static void debug(const Args&... args) {
    write(LogLevel::Debug, args...);
  }

  template <typename... Args>
  static void info(const Args&... args) {
    write(LogLevel::Info, args...);
  }

  template <typename... Args>
  static void warn(const Args&... args) {
    write(LogLevel::Warn, args...);
  }

  template <typename... Args>
  static void error(const Args&... args) {
    write(LogLevel::Error, args...);
  }

 private:
  template <typename... Args>
  static void write(LogLevel level, const Args&... args) {
    if (!enabled(level)) return;
    std::ostringstream ss;
    (ss << ... << args);
    log(level, ss.str());
  }

  static std::mutex mutex_;
};

}  // namespace facelens::core
