#include "blobkit/core/log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <mutex>

namespace blobkit {

namespace {

LogLevel initial_level() {
    if (const char* env = std::getenv("BLOBKIT_LOG_LEVEL")) {
        if (auto level = parse_log_level(env)) {
            return *level;
        }
        fprintf(stderr, "warning: invalid BLOBKIT_LOG_LEVEL=%s, using info\n", env);
    }
    return LogLevel::Info;
}

std::atomic<int>& level_storage() {
    static std::atomic<int> level{static_cast<int>(initial_level())};
    return level;
}

// Serializes whole lines so concurrent transfers don't interleave output
std::mutex& output_mutex() {
    static std::mutex m;
    return m;
}

void vlog(LogLevel level, FILE* out, const char* tag, const char* fmt, va_list args) {
    if (static_cast<int>(level) < level_storage().load(std::memory_order_relaxed)) {
        return;
    }
    std::lock_guard<std::mutex> lock(output_mutex());
    if (tag) {
        fputs(tag, out);
    }
    vfprintf(out, fmt, args);
    fputc('\n', out);
    fflush(out);
}

}  // namespace

std::optional<LogLevel> parse_log_level(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error") return LogLevel::Error;
    return std::nullopt;
}

void set_log_level(LogLevel level) {
    level_storage().store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel log_level() {
    return static_cast<LogLevel>(level_storage().load(std::memory_order_relaxed));
}

void log_debug(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(LogLevel::Debug, stdout, "DEBUG: ", fmt, args);
    va_end(args);
}

void log_info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(LogLevel::Info, stdout, nullptr, fmt, args);
    va_end(args);
}

void log_warn(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(LogLevel::Warn, stderr, "WARNING: ", fmt, args);
    va_end(args);
}

void log_error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(LogLevel::Error, stderr, "ERROR: ", fmt, args);
    va_end(args);
}

}  // namespace blobkit
