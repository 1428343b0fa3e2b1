#include "core/log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>

namespace whispercore {

namespace {
std::atomic<LogLevel> g_level{LogLevel::Info};
std::mutex g_log_mutex;

const char* level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:  return "DEBUG";
        case LogLevel::Info:   return "INFO";
        case LogLevel::Warn:   return "WARN";
        case LogLevel::Error:  return "ERROR";
        case LogLevel::Silent: return "";
    }
    return "";
}
} // namespace

void set_log_level(LogLevel level) {
    g_level.store(level);
}

LogLevel log_level() {
    return g_level.load();
}

std::optional<LogLevel> parse_log_level(const std::string& s) {
    std::string v = s;
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "debug") return LogLevel::Debug;
    if (v == "info") return LogLevel::Info;
    if (v == "warn" || v == "warning") return LogLevel::Warn;
    if (v == "error") return LogLevel::Error;
    if (v == "silent" || v == "none" || v == "off") return LogLevel::Silent;
    return std::nullopt;
}

void log_message(LogLevel level, const std::string& message) {
    if (level == LogLevel::Silent || level < g_level.load()) return;
    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::cerr << "[whispercore] " << level_tag(level) << " " << message << std::endl;
}

} // namespace whispercore
