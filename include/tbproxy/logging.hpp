#pragma once
#include <string>

namespace tbproxy {

enum class LogLevel { Debug = 0, Info, Warn, Error };

void set_log_level(LogLevel level) noexcept;
LogLevel log_level() noexcept;

// "debug" | "info" | "warn" | "error"; throws std::invalid_argument otherwise.
LogLevel parse_log_level(const std::string &name);

// One line on stderr: "<utc time> <LEVEL> [<tag>] <msg>".
void log_write(LogLevel level, const char *tag, const std::string &msg);

inline void log_dbg(const char *tag, const std::string &msg) {
  log_write(LogLevel::Debug, tag, msg);
}
inline void log_info(const char *tag, const std::string &msg) {
  log_write(LogLevel::Info, tag, msg);
}
inline void log_warn(const char *tag, const std::string &msg) {
  log_write(LogLevel::Warn, tag, msg);
}
inline void log_err(const char *tag, const std::string &msg) {
  log_write(LogLevel::Error, tag, msg);
}

} // namespace tbproxy
