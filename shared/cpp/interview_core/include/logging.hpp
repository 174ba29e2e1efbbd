#pragma once
#include <string>

enum class LogLevel { Error = 0, Warn = 1, Info = 2, Debug = 3 };

void set_log_level(LogLevel level);
LogLevel log_level();

// Writes one "[tag] message" line; lines from different threads never interleave.
void log_line(LogLevel level, const std::string& tag, const std::string& msg);

inline void log_error(const std::string& tag, const std::string& msg) { log_line(LogLevel::Error, tag, msg); }
inline void log_warn(const std::string& tag, const std::string& msg) { log_line(LogLevel::Warn, tag, msg); }
inline void log_info(const std::string& tag, const std::string& msg) { log_line(LogLevel::Info, tag, msg); }
inline void log_debug(const std::string& tag, const std::string& msg) { log_line(LogLevel::Debug, tag, msg); }
