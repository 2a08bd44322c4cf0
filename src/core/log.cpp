#include "core/log.hpp"
#include <atomic>
#include <iostream>
#include <mutex>

namespace chromadex {

namespace {

std::atomic<int> current_level{static_cast<int>(LogLevel::Info)};
std::mutex output_mutex;

const char* level_prefix(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "Debug";
        case LogLevel::Info: return "Info";
        case LogLevel::Warning: return "Warning";
        case LogLevel::Error: return "Error";
        case LogLevel::Off: break;
    }
    return "";
}

}

void set_log_level(LogLevel level) {
    current_level.store(static_cast<int>(level));
}

LogLevel log_level() {
    return static_cast<LogLevel>(current_level.load());
}

bool parse_log_level(const std::string& s, LogLevel& out) {
    if (s == "debug") out = LogLevel::Debug;
    else if (s == "info") out = LogLevel::Info;
    else if (s == "warning") out = LogLevel::Warning;
    else if (s == "error") out = LogLevel::Error;
    else if (s == "off") out = LogLevel::Off;
    else return false;
    return true;
}

void log(LogLevel level, const std::string& message) {
    if (level == LogLevel::Off || static_cast<int>(level) < current_level.load()) {
        return;
    }
    std::lock_guard<std::mutex> lock(output_mutex);
    std::cerr << level_prefix(level) << ": " << message << "\n";
}

}
