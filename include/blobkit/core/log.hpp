#pragma once

#include <optional>
#include <string>

namespace blobkit {

enum class LogLevel {
    Debug = 0,
    Info,
    Warn,
    Error
};

/// Parse "debug", "info", "warn" or "error" (case-insensitive).
std::optional<LogLevel> parse_log_level(const std::string& name);

/// Process-wide threshold. Initialized from BLOBKIT_LOG_LEVEL, default Info.
void set_log_level(LogLevel level);
LogLevel log_level();

// printf-style helpers. debug/info go to stdout, warn/error to stderr.
void log_debug(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_info(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_warn(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_error(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

} // namespace blobkit
