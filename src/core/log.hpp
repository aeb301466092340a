#pragma once

#include <string>

// Process-wide diagnostic log. Lines go to stderr and, if configured, are
// appended to a log file. Callers format messages with fmt::format.

enum class LogLevel { Debug, Info, Warn, Error };

// Parse "debug" / "info" / "warn" / "error" (case-insensitive). Unknown -> Info.
LogLevel parse_log_level(const std::string& name);
const char* log_level_name(LogLevel level);

void set_log_level(LogLevel level);
void set_log_file(const std::string& path);   // "" disables file output
void set_log_stderr(bool enabled);

void sync_log(LogLevel level, const std::string& msg);

inline void log_debug(const std::string& msg) { sync_log(LogLevel::Debug, msg); }
inline void log_info(const std::string& msg)  { sync_log(LogLevel::Info, msg); }
inline void log_warn(const std::string& msg)  { sync_log(LogLevel::Warn, msg); }
inline void log_error(const std::string& msg) { sync_log(LogLevel::Error, msg); }
