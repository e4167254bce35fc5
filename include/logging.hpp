#pragma once

#include <string>

enum class LogLevel { Debug, Info, Warn, Error };

void set_debug_logging(bool enabled);
bool debug_logging_enabled();

// Writes "<time> [LEVEL] tag - message" to stdout (stderr for warnings and
// errors). Safe to call from several threads; not for real-time callbacks.
void log_message(LogLevel level, const std::string& tag, const std::string& message);

inline void log_debug(const std::string& tag, const std::string& message) {
    log_message(LogLevel::Debug, tag, message);
}
inline void log_info(const std::string& tag, const std::string& message) {
    log_message(LogLevel::Info, tag, message);
}
inline void log_warn(const std::string& tag, const std::string& message) {
    log_message(LogLevel::Warn, tag, message);
}
inline void log_error(const std::string& tag, const std::string& message) {
    log_message(LogLevel::Error, tag, message);
}
