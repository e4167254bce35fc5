#include "logging.hpp"

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace {

std::atomic<bool> g_debug{false};
std::mutex g_log_mutex;

const char* level_name(LogLevel level) {
    switch (level) {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info: return "INFO";
    case LogLevel::Warn: return "WARNING";
    case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << ',' << std::setw(3) << std::setfill('0') << ms.count();
    return oss.str();
}

} // namespace

void set_debug_logging(bool enabled) { g_debug = enabled; }

bool debug_logging_enabled() { return g_debug; }

void log_message(LogLevel level, const std::string& tag, const std::string& message) {
    if (level == LogLevel::Debug && !g_debug) return;

    std::ostringstream line;
    line << timestamp() << " [" << level_name(level) << "] " << tag << " - " << message << "\n";

    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (level == LogLevel::Warn || level == LogLevel::Error) {
        std::cerr << line.str();
    } else {
        std::cout << line.str() << std::flush;
    }
}
