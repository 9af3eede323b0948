#pragma once
// Log: timestamped component logging to stderr
//
// [12:04:33.118][PathRetriever] dropped malformed path (3 vertices, 1 edges)
//
// Debug lines only appear in verbose mode (--verbose or MARGA_VERBOSE=1).

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>

namespace marga {

enum class LogLevel { Debug, Info, Warn, Error };

inline std::atomic<bool>& verbose_flag() {
    static std::atomic<bool> verbose{false};
    return verbose;
}

inline void set_verbose(bool on) { verbose_flag().store(on); }
inline bool verbose() { return verbose_flag().load(); }

// Honour MARGA_VERBOSE=1 from the environment
inline void init_logging_from_env() {
    if (const char* v = std::getenv("MARGA_VERBOSE")) {
        set_verbose(std::strcmp(v, "0") != 0 && v[0] != '\0');
    }
}

inline const char* level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "";
        case LogLevel::Info:  return "";
        case LogLevel::Warn:  return "warning: ";
        case LogLevel::Error: return "error: ";
    }
    return "";
}

inline void log_write(LogLevel level, const char* component, const char* fmt, va_list args) {
    if (level == LogLevel::Debug && !verbose()) return;

    auto now = std::chrono::system_clock::now();
    auto now_time_t = std::chrono::system_clock::to_time_t(now);
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf{};
    localtime_r(&now_time_t, &tm_buf);
    char time_buf[32];
    std::strftime(time_buf, sizeof(time_buf), "%H:%M:%S", &tm_buf);

    char msg[1024];
    vsnprintf(msg, sizeof(msg), fmt, args);

    // One fputs per line so concurrent writers don't interleave mid-line
    char line[1200];
    snprintf(line, sizeof(line), "[%s.%03d][%s] %s%s\n", time_buf,
             static_cast<int>(now_ms.count()), component, level_tag(level), msg);
    std::fputs(line, stderr);
}

inline void log_debug(const char* component, const char* fmt, ...) {
    if (!verbose()) return;
    va_list args;
    va_start(args, fmt);
    log_write(LogLevel::Debug, component, fmt, args);
    va_end(args);
}

inline void log_info(const char* component, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_write(LogLevel::Info, component, fmt, args);
    va_end(args);
}

inline void log_warn(const char* component, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_write(LogLevel::Warn, component, fmt, args);
    va_end(args);
}

inline void log_error(const char* component, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_write(LogLevel::Error, component, fmt, args);
    va_end(args);
}

} // namespace marga
