#pragma once

#include <optional>
#include <sstream>
#include <string>

namespace whispercore {

enum class LogLevel { Debug = 0, Info, Warn, Error, Silent };

void set_log_level(LogLevel level);
LogLevel log_level();
std::optional<LogLevel> parse_log_level(const std::string& s);

// Writes "[whispercore] <LEVEL> message" to std::cerr when level passes the filter.
void log_message(LogLevel level, const std::string& message);

namespace log {

template <typename... Args>
void write(LogLevel level, const Args&... args) {
    if (level < log_level()) return;
    std::ostringstream oss;
    (oss << ... << args);
    log_message(level, oss.str());
}

template <typename... Args> void debug(const Args&... args) { write(LogLevel::Debug, args...); }
template <typename... Args> void info(const Args&... args)  { write(LogLevel::Info, args...); }
template <typename... Args> void warn(const Args&... args)  { write(LogLevel::Warn, args...); }
template <typename... Args> void error(const Args&... args) { write(LogLevel::Error, args...); }

} // namespace log

} // namespace whispercore
