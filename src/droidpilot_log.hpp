// =============================================================================
// DroidPilot - Structured Logging
// =============================================================================
// Thread-safe, level-filtered logging with optional file output.
// Usage: DPLOG_INFO("tag", "message %s", arg);
// =============================================================================
#pragma once
#include <cstdio>
#include <cstdarg>
#include <cstring>
#include <strings.h>
#include <ctime>
#include <chrono>
#include <mutex>
#include <string>
#include <atomic>
#include <thread>
#include <functional>

namespace droidpilot::log {

enum class Level { Trace = 0, Debug, Info, Warn, Error, Fatal };

inline std::atomic<Level> g_min_level{Level::Info};
inline std::mutex g_log_mutex;
inline FILE* g_log_file = nullptr;

inline const char* levelStr(Level l) {
    switch (l) {
        case Level::Trace: return "TRACE";
        case Level::Debug: return "DEBUG";
        case Level::Info:  return "INFO ";
        case Level::Warn:  return "WARN ";
        case Level::Error: return "ERROR";
        case Level::Fatal: return "FATAL";
    }
    return "?????";
}

// "debug" / "WARN" / ... -> Level. Unknown names keep the fallback.
inline Level parseLevel(const std::string& name, Level fallback = Level::Info) {
    static const struct { const char* name; Level level; } kNames[] = {
        {"trace", Level::Trace}, {"debug", Level::Debug}, {"info", Level::Info},
        {"warn", Level::Warn},   {"warning", Level::Warn}, {"error", Level::Error},
        {"fatal", Level::Fatal},
    };
    for (const auto& n : kNames) {
        if (strcasecmp(name.c_str(), n.name) == 0) return n.level;
    }
    return fallback;
}

inline void setLogLevel(Level l) { g_min_level = l; }

inline bool openLogFile(const char* path) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (g_log_file) fclose(g_log_file);
    g_log_file = fopen(path, "w");  // overwrite mode: one log per run
    return g_log_file != nullptr;
}

inline void closeLogFile() {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (g_log_file) { fclose(g_log_file); g_log_file = nullptr; }
}

inline void write(Level level, const char* tag, const char* fmt, ...) {
    if (level < g_min_level.load(std::memory_order_relaxed)) return;
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&time_t_now, &tm_buf);
    char time_str[32];
    snprintf(time_str, sizeof(time_str), "%02d:%02d:%02d.%03d",
             tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, (int)ms.count());
    unsigned long tid = static_cast<unsigned long>(
        std::hash<std::thread::id>{}(std::this_thread::get_id()) & 0xFFFFFF);
    char msg[2048];
    va_list args;
    va_start(args, fmt);
    vsnprintf(msg, sizeof(msg), fmt, args);
    va_end(args);
    std::lock_guard<std::mutex> lock(g_log_mutex);
    fprintf(stderr, "%s [%s] [%s] (T%06lx) %s\n", time_str, levelStr(level), tag, tid, msg);
    if (g_log_file) {
        fprintf(g_log_file, "%s [%s] [%s] (T%06lx) %s\n",
                time_str, levelStr(level), tag, tid, msg);
        fflush(g_log_file);
    }
}

} // namespace droidpilot::log

#define DPLOG_TRACE(tag, fmt, ...) droidpilot::log::write(droidpilot::log::Level::Trace, tag, fmt, ##__VA_ARGS__)
#define DPLOG_DEBUG(tag, fmt, ...) droidpilot::log::write(droidpilot::log::Level::Debug, tag, fmt, ##__VA_ARGS__)
#define DPLOG_INFO(tag, fmt, ...)  droidpilot::log::write(droidpilot::log::Level::Info,  tag, fmt, ##__VA_ARGS__)
#define DPLOG_WARN(tag, fmt, ...)  droidpilot::log::write(droidpilot::log::Level::Warn,  tag, fmt, ##__VA_ARGS__)
#define DPLOG_ERROR(tag, fmt, ...) droidpilot::log::write(droidpilot::log::Level::Error, tag, fmt, ##__VA_ARGS__)
#define DPLOG_FATAL(tag, fmt, ...) droidpilot::log::write(droidpilot::log::Level::Fatal, tag, fmt, ##__VA_ARGS__)
