#include "metraj/logging.hpp"

#include <ctime>
#include <iostream>
#include <mutex>

namespace metraj {

namespace {

std::mutex log_mutex;
LogLevel log_threshold = LogLevel::Warn;
std::ostream* log_sink = nullptr;

std::string timestamp_now() {
    char buf[64];
    std::time_t t = std::time(nullptr);
    std::tm tmv;
#ifdef _WIN32
    localtime_s(&tmv, &t);
#else
    localtime_r(&t, &tmv);
#endif
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tmv);
    return std::string(buf);
}

void log_common(LogLevel level, const std::string& msg) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (level < log_threshold || log_threshold == LogLevel::Off) {
        return;
    }

    std::ostream* os = log_sink;
    if (os == nullptr) {
        os = (level >= LogLevel::Warn) ? &std::cerr : &std::cout;
    }
    *os << "[" << timestamp_now() << "][" << log_level_to_string(level) << "] "
        << msg << std::endl;
}

} // namespace

void set_log_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(log_mutex);
    log_threshold = level;
}

LogLevel get_log_level() {
    std::lock_guard<std::mutex> lock(log_mutex);
    return log_threshold;
}

void set_log_stream(std::ostream* stream) {
    std::lock_guard<std::mutex> lock(log_mutex);
    log_sink = stream;
}

void log_debug(const std::string& msg) { log_common(LogLevel::Debug, msg); }
void log_info(const std::string& msg) { log_common(LogLevel::Info, msg); }
void log_warn(const std::string& msg) { log_common(LogLevel::Warn, msg); }
void log_error(const std::string& msg) { log_common(LogLevel::Error, msg); }

std::string log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Off: return "OFF";
        default: return "UNKNOWN";
    }
}

} // namespace metraj
