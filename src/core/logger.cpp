#include <facelens/core/logger.hpp>
#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>

namespace facelens::core {

namespace {

std::atomic<LogLevel> g_level{LogLevel::Info};

const char* level_tag(LogLevel level) {
  switch (level) {
    case LogLevel::Debug:
      return "[DEBUG]";
    case LogLevel::Info:
      return "[INFO] ";
    case LogLevel::Warn:
      return "[WARN] ";
    case LogLevel::Error:
      return "[ERROR]";
    case LogLevel::Off:
    default:
      return "";
  }
}

}  // namespace

std::mutex Logger::mutex_;

LogLevel parse_log_level(std::string_view name, LogLevel fallback) noexcept {
  if (name == "debug") return LogLevel::Debug;
  if (name == "info") return LogLevel::Info;
  if (name == "warn") return LogLevel::Warn;
  if (name == "error") return LogLevel::Error;
  if (name == "off") return LogLevel::Off;
  return fallback;
}

void Logger::set_level(LogLevel level) noexcept { g_level.store(level, std::memory_order_relaxed); }

LogLevel Logger::level() noexcept { return g_level.load(std::memory_order_relaxed); }

void Logger::log(LogLevel level, std::string_view message) {
  if (level == LogLevel::Off || !enabled(level)) return;

  const auto now = std::chrono::system_clock::now();
  const std::time_t time = std::chrono::system_clock::to_time_t(now);
  const auto ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
  std::tm local{};
  localtime_r(&time, &local);

  std::lock_guard lock(mutex_);
  std::cerr << "[" << std::put_time(&local, "%H:%M:%S") << "." << std::setfill('0')
            << std::setw(3) << ms.count() << "] " << level_tag(level) << " " << message
            << '\n';
}

}  // namespace facelens::core
