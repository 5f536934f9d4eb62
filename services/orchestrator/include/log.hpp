#pragma once
#include <string>

enum class LogLevel { Error = 0, Warn = 1, Info = 2, Debug = 3 };

// Threshold comes from ORCH_LOG_LEVEL on first use unless set explicitly.
void set_log_level(LogLevel level);
LogLevel log_level();
LogLevel parse_log_level(const std::string& name);

// Emits "[tag] message"; info/debug to stdout, warn/error to stderr.
void log_line(LogLevel level, const std::string& tag, const std::string& message);

inline void log_error(const std::string& tag, const std::string& msg) { log_line(LogLevel::Error, tag, msg); }
inline void log_warn(const std::string& tag, const std::string& msg) { log_line(LogLevel::Warn, tag, msg); }
inline void log_info(const std::string& tag, const std::string& msg) { log_line(LogLevel::Info, tag, msg); }
inline void log_debug(const std::string& tag, const std::string& msg) { log_line(LogLevel::Debug, tag, msg); }
