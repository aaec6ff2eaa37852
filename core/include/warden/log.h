#pragma once
#include <string>

namespace warden {

enum class LogLevel { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3 };

// Parses "debug" / "info" / "warn" / "error" (case-insensitive); INFO otherwise.
LogLevel parse_log_level(const std::string& s);

// Process-wide threshold. Read from WARDEN_LOG_LEVEL on first use.
void set_log_level(LogLevel lvl);
LogLevel log_level();

// Writes "[component] message" (prefixed with [WARN]/[ERROR] for those levels)
// to stderr as one write(2), so lines from worker threads never interleave.
void log_line(LogLevel lvl, const char* component, const std::string& msg);

inline void log_debug(const char* c, const std::string& m) { log_line(LogLevel::DEBUG, c, m); }
inline void log_info(const char* c, const std::string& m)  { log_line(LogLevel::INFO, c, m); }
inline void log_warn(const char* c, const std::string& m)  { log_line(LogLevel::WARN, c, m); }
inline void log_error(const char* c, const std::string& m) { log_line(LogLevel::ERROR, c, m); }

} // namespace warden
