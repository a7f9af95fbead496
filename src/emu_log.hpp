// =============================================================================
// emu - Structured Logging
// =============================================================================
// Thread-safe, level-filtered logging with optional file output.
// Usage: ELOG_INFO("tag", "message %s", arg);
// =============================================================================
#pragma once
#include <cstdio>
#include <cstdarg>
#include <chrono>
#include <ctime>
#include <functional>
#include <mutex>
#include <string>
#include <atomic>
#include <thread>

namespace emu::log {

enum class Level { Trace = 0, Debug, Info, Warn, Error, Fatal };

inline std::atomic<Level> g_min_level{Level::Info};
inline std::mutex g_log_mutex;
inline FILE* g_log_file = nullptr;
inline bool g_log_to_stderr = true;

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

// "trace" / "debug" / "info" / "warn" / "error" / "fatal", anything else -> Info
inline Level parseLevel(const std::string& s) {
    if (s == "trace") return Level::Trace;
    if (s == "debug") return Level::Debug;
    if (s == "warn" || s == "warning") return Level::Warn;
    if (s == "error") return Level::Error;
    if (s == "fatal") return Level::Fatal;
    return Level::Info;
}

inline void setLogLevel(Level l) { g_min_level = l; }
inline Level logLevel() { return g_min_level.load(std::memory_order_relaxed); }

// A terminal UI owns stdout/stderr while it runs; it turns console output off
inline void setConsoleOutput(bool enabled) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_log_to_stderr = enabled;
}

inline bool openLogFile(const char* path) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (g_log_file) fclose(g_log_file);
    g_log_file = fopen(path, "a");
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
    auto tid = static_cast<unsigned long>(
        std::hash<std::thread::id>{}(std::this_thread::get_id()) % 100000);
    char msg[2048];
    va_list args;
    va_start(args, fmt);
    vsnprintf(msg, sizeof(msg), fmt, args);
    va_end(args);
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (g_log_to_stderr) {
        fprintf(stderr, "%s [%s] [%s] (T%lu) %s\n", time_str, levelStr(level), tag, tid, msg);
    }
    if (g_log_file) {
        fprintf(g_log_file, "%s [%s] [%s] (T%lu) %s\n",
                time_str, levelStr(level), tag, tid, msg);
        fflush(g_log_file);
    }
}

} // namespace emu::log

#define ELOG_TRACE(tag, fmt, ...) emu::log::write(emu::log::Level::Trace, tag, fmt, ##__VA_ARGS__)
#define ELOG_DEBUG(tag, fmt, ...) emu::log::write(emu::log::Level::Debug, tag, fmt, ##__VA_ARGS__)
#define ELOG_INFO(tag, fmt, ...)  emu::log::write(emu::log::Level::Info,  tag, fmt, ##__VA_ARGS__)
#define ELOG_WARN(tag, fmt, ...)  emu::log::write(emu::log::Level::Warn,  tag, fmt, ##__VA_ARGS__)
#define ELOG_ERROR(tag, fmt, ...) emu::log::write(emu::log::Level::Error, tag, fmt, ##__VA_ARGS__)
#define ELOG_FATAL(tag, fmt, ...) emu::log::write(emu::log::Level::Fatal, tag, fmt, ##__VA_ARGS__)
