#include "core/logging.hpp"
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>

namespace core {

namespace {
std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};
std::mutex g_log_mutex;

bool enabled(LogLevel level) {
    return static_cast<int>(level) >= g_level.load(std::memory_order_relaxed);
}

void write(std::ostream& os, const char* tag, const std::string& msg) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    os << tag << ' ' << msg << std::endl;
}
} // namespace

LogLevel parse_log_level(const std::string& name) {
    std::string s;
    for (unsigned char c : name) s.push_back(static_cast<char>(std::tolower(c)));
    if (s == "debug") return LogLevel::Debug;
    if (s == "warn" || s == "warning") return LogLevel::Warn;
    if (s == "error") return LogLevel::Error;
    return LogLevel::Info;
}

void set_log_level(LogLevel level) { g_level.store(static_cast<int>(level)); }
LogLevel log_level() { return static_cast<LogLevel>(g_level.load()); }

void log_debug(const std::string& msg) { if (enabled(LogLevel::Debug)) write(std::cout, "[DEBUG]", msg); }
void log_info(const std::string& msg) { if (enabled(LogLevel::Info)) write(std::cout, "[INFO]", msg); }
void log_warn(const std::string& msg) { if (enabled(LogLevel::Warn)) write(std::cerr, "[WARN]", msg); }
void log_error(const std::string& msg) { if (enabled(LogLevel::Error)) write(std::cerr, "[ERROR]", msg); }
}
