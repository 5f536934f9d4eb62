#include "../include/log.hpp"
#include "../include/util.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <mutex>

static std::mutex g_log_mutex;
static LogLevel g_level = LogLevel::Info;
static bool g_level_set = false;

LogLevel parse_log_level(const std::string& name) {
    std::string s = name;
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return (char)std::tolower(c); });
    if (s == "error") return LogLevel::Error;
    if (s == "warn" || s == "warning") return LogLevel::Warn;
    if (s == "debug") return LogLevel::Debug;
    return LogLevel::Info;
}

void set_log_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_level = level;
    g_level_set = true;
}

LogLevel log_level() {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (!g_level_set) {
        g_level = parse_log_level(getenv_or("ORCH_LOG_LEVEL", "info"));
        g_level_set = true;
    }
    return g_level;
}

void log_line(LogLevel level, const std::string& tag, const std::string& message) {
    if ((int)level > (int)log_level()) return;
    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::ostream& os = level <= LogLevel::Warn ? std::cerr : std::cout;
    os << "[" << tag << "] ";
    if (level == LogLevel::Error) os << "ERROR: ";
    else if (level == LogLevel::Warn) os << "WARN: ";
    os << message << std::endl;
}
