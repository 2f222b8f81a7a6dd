#pragma once

#include <atomic>
#include <cstdarg>
#include <cstdio>

namespace clubnet {
namespace log {

enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3 };

// Receives a fully formatted line (no trailing newline).
// When unset, messages go to stdout (Debug/Info) or stderr (Warn/Error).
using LogCallback = void (*)(Level level, const char* message);

inline std::atomic<LogCallback> g_log_callback{nullptr};
inline std::atomic<int> g_min_level{static_cast<int>(Level::Info)};

inline void setLogCallback(LogCallback cb) {
    g_log_callback.store(cb, std::memory_order_release);
}

inline void clearLogCallback() {
    g_log_callback.store(nullptr, std::memory_order_release);
}

inline void setLogLevel(Level level) {
    g_min_level.store(static_cast<int>(level), std::memory_order_release);
}

inline bool enabled(Level level) {
    return static_cast<int>(level) >= g_min_level.load(std::memory_order_acquire);
}

inline const char* levelName(Level level) {
    switch (level) {
        case Level::Debug: return "DEBUG";
        case Level::Info:  return "INFO";
        case Level::Warn:  return "WARN";
        case Level::Error: return "ERROR";
    }
    return "?";
}

inline void output(Level level, const char* fmt, ...) {
    if (!enabled(level)) return;

    char buffer[1024];
    va_list args;
    va_start(args, fmt);
    vsnprintf(buffer, sizeof(buffer), fmt, args);
    va_end(args);

    char full_message[1100];
    snprintf(full_message, sizeof(full_message), "[clubnet][%s] %s", levelName(level), buffer);

    LogCallback cb = g_log_callback.load(std::memory_order_acquire);
    if (cb) {
        cb(level, full_message);
        return;
    }
    FILE* out = (level >= Level::Warn) ? stderr : stdout;
    fprintf(out, "%s\n", full_message);
    fflush(out);
}

} // namespace log
} // namespace clubnet

#define CLUBNET_LOG_INFO(fmt, ...)  ::clubnet::log::output(::clubnet::log::Level::Info, fmt, ##__VA_ARGS__)
#define CLUBNET_LOG_WARN(fmt, ...)  ::clubnet::log::output(::clubnet::log::Level::Warn, fmt, ##__VA_ARGS__)
#define CLUBNET_LOG_ERROR(fmt, ...) ::clubnet::log::output(::clubnet::log::Level::Error, fmt, ##__VA_ARGS__)

#ifdef CLUBNET_ENABLE_DEBUG_OUTPUT
    #define CLUBNET_LOG_DEBUG(fmt, ...) ::clubnet::log::output(::clubnet::log::Level::Debug, fmt, ##__VA_ARGS__)
#else
    #define CLUBNET_LOG_DEBUG(fmt, ...) ((void)0)
#endif
