#include "tbproxy/logging.hpp"

#include <atomic>
#include <cstdio>
#include <ctime>
#include <stdexcept>

namespace tbproxy {

namespace {

std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};

const char *level_name(LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warn:
    return "WARN";
  case LogLevel::Error:
    return "ERROR";
  }
  return "?";
}

} // namespace

void set_log_level(LogLevel level) noexcept {
  g_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel log_level() noexcept {
  return static_cast<LogLevel>(g_level.load(std::memory_order_relaxed));
}

LogLevel parse_log_level(const std::string &name) {
  if (name == "debug")
    return LogLevel::Debug;
  if (name == "info")
    return LogLevel::Info;
  if (name == "warn" || name == "warning")
    return LogLevel::Warn;
  if (name == "error")
    return LogLevel::Error;
  throw std::invalid_argument("unknown log level: " + name);
}

void log_write(LogLevel level, const char *tag, const std::string &msg) {
  if (static_cast<int>(level) < g_level.load(std::memory_order_relaxed))
    return;

  char ts[32] = {0};
  const std::time_t now = std::time(nullptr);
  std::tm tm_utc{};
  gmtime_r(&now, &tm_utc);
  std::strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &tm_utc);

  std::fprintf(stderr, "%s %-5s [%s] %s\n", ts, level_name(level), tag,
               msg.c_str());
  std::fflush(stderr);
}

} // namespace tbproxy
