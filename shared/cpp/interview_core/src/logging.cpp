#include "../include/logging.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <mutex>

namespace {
std::mutex g_log_mutex;
bool g_level_set = false;
LogLevel g_level = LogLevel::Info;

LogLevel level_from_env() {
    const char* v = std::getenv("INTERVIEW_LOG_LEVEL");
    if (!v) return LogLevel::Info;
    std::string s(v);
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return (char)std::tolower(c); });
    if (s == "error") return LogLevel::Error;
    if (s == "warn" || s == "warning") return LogLevel::Warn;
    if (s == "debug") return LogLevel::Debug;
    return LogLevel::Info;
}
}

void set_log_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_level = level;
    g_level_set = true;
}

LogLevel log_level() {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (!g_level_set) {
        g_level = level_from_env();
        g_level_set = true;
    }
    return g_level;
}

void log_line(LogLevel level, const std::string& tag, const std::string& msg) {
    if ((int)level > (int)log_level()) return;
    std::string line = "[" + tag + "] " + msg + "\n";
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (level == LogLevel::Error || level == LogLevel::Warn) {
        std::cerr << line << std::flush;
    } else {
        std::cout << line << std::flush;
    }
}
