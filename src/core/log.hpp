#pragma once

#include <string>

namespace chromadex {

enum class LogLevel {
    Debug = 0,
    Info,
    Warning,
    Error,
    Off
};

void set_log_level(LogLevel level);
LogLevel log_level();
bool parse_log_level(const std::string& s, LogLevel& out);

// Writes one "<Level>: message" line to stderr. Lines from concurrent
// callers are never interleaved.
void log(LogLevel level, const std::string& message);

inline void log_debug(const std::string& message) { log(LogLevel::Debug, message); }
inline void log_info(const std::string& message) { log(LogLevel::Info, message); }
inline void log_warning(const std::string& message) { log(LogLevel::Warning, message); }
inline void log_error(const std::string& message) { log(LogLevel::Error, message); }

}
