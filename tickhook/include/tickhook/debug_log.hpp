#ifndef TICKHOOK_DEBUG_LOG_HPP
#define TICKHOOK_DEBUG_LOG_HPP

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <sstream>
#include <thread>

namespace tickhook {
namespace debug {

enum class LogLevel : int {
    Debug = 0,
    Warn = 1,
    Error = 2
};

inline const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "?";
}

// Callback function type for log routing
// The callback receives the level and a formatted string (no newline at end)
using LogCallback = void (*)(LogLevel level, const char* message);

// Global log callback. When null, messages go to stderr.
inline std::atomic<LogCallback> g_log_callback{nullptr};

inline void set_log_callback(LogCallback cb) {
    g_log_callback.store(cb, std::memory_order_release);
}

inline void clear_log_callback() {
    g_log_callback.store(nullptr, std::memory_order_release);
}

// Internal: format and output a message
inline void log_output(LogLevel level, const char* fmt, ...) {
    char buffer[1024];
    va_list args;
    va_start(args, fmt);
    vsnprintf(buffer, sizeof(buffer), fmt, args);
    va_end(args);

    // Add thread ID prefix
    std::ostringstream oss;
    oss << std::this_thread::get_id();

    char full_message[1100];
    snprintf(full_message, sizeof(full_message), "[%s][T%s] %s",
             log_level_name(level), oss.str().c_str(), buffer);

    LogCallback cb = g_log_callback.load(std::memory_order_acquire);
    if (cb) {
        cb(level, full_message);
    } else {
        fprintf(stderr, "%s\n", full_message);
        fflush(stderr);
    }
}

} // namespace debug
} // namespace tickhook

// Debug logging compiles away unless TICKHOOK_ENABLE_DEBUG_OUTPUT is defined.
// Warn/error logging is always routed; keep it off the per-event path.
#ifdef TICKHOOK_ENABLE_DEBUG_OUTPUT
    #define TICKHOOK_LOG_DEBUG(fmt, ...) ::tickhook::debug::log_output(::tickhook::debug::LogLevel::Debug, fmt, ##__VA_ARGS__)
#else
    #define TICKHOOK_LOG_DEBUG(fmt, ...) ((void)0)
#endif

#define TICKHOOK_LOG_WARN(fmt, ...) ::tickhook::debug::log_output(::tickhook::debug::LogLevel::Warn, fmt, ##__VA_ARGS__)
#define TICKHOOK_LOG_ERROR(fmt, ...) ::tickhook::debug::log_output(::tickhook::debug::LogLevel::Error, fmt, ##__VA_ARGS__)

#endif // TICKHOOK_DEBUG_LOG_HPP
