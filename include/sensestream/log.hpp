#pragma once
#include <string>

namespace sensestream {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

// Process-wide logger: stderr plus an optional append-only file.
// Line format: "2026-01-31 12:00:00 [INFO] tag - message".
void set_log_level(LogLevel level);
LogLevel log_level();

// Returns false (and keeps logging to stderr) if the file cannot be opened.
bool open_log_file(const std::string &path);
void close_log_file();

void log_msg(LogLevel level, const char *tag, const std::string &msg);

// std::set_terminate: причина падения уходит в лог (и в файл), затем abort().
void install_terminate_handler();

inline void log_dbg(const char *tag, const std::string &msg) {
  log_msg(LogLevel::Debug, tag, msg);
}
inline void log_info(const char *tag, const std::string &msg) {
  log_msg(LogLevel::Info, tag, msg);
}
inline void log_warn(const char *tag, const std::string &msg) {
  log_msg(LogLevel::Warn, tag, msg);
}
inline void log_err(const char *tag, const std::string &msg) {
  log_msg(LogLevel::Error, tag, msg);
}

} // namespace sensestream
