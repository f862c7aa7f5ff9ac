// =============================================================================
// SimPilot - Structured Logging
// =============================================================================
// Thread-safe, level-filtered logging to stderr with optional file mirror.
// stdout is reserved for the command channel, so nothing is ever logged there.
// Usage: SPLOG_INFO("tag", "message %s", arg);
// Line:  HH:MM:SS.mmm [LEVEL] [tag] (Tn) message
// =============================================================================
#pragma once
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace simpilot::log {

enum class Level { Trace = 0, Debug, Info, Warn, Error, Fatal };

// プロセス全体で1つ
struct Sink {
    std::atomic<Level> min_level{Level::Info};
    std::mutex mutex;         // 出力の行単位の排他
    FILE* mirror = nullptr;   // 追記モード
};

inline Sink& sink() {
    static Sink instance;
    return instance;
}

// 固定幅 (5 文字)
inline const char* levelTag(Level l) {
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

// Accepts the names used by LOG_LEVEL ("DEBUG", "info", "WARNING", ...).
// Unknown names leave the fallback in place.
inline Level parseLevel(const std::string& name, Level fallback = Level::Info) {
    std::string s = name;
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (s == "trace") return Level::Trace;
    if (s == "debug") return Level::Debug;
    if (s == "info") return Level::Info;
    if (s == "warn" || s == "warning") return Level::Warn;
    if (s == "error") return Level::Error;
    if (s == "fatal" || s == "critical") return Level::Fatal;
    return fallback;
}

inline void setLogLevel(Level l) { sink().min_level.store(l); }
inline Level logLevel() { return sink().min_level.load(); }
inline bool enabled(Level l) { return l >= sink().min_level.load(std::memory_order_relaxed); }

inline bool openLogFile(const char* path) {
    Sink& s = sink();
    std::lock_guard<std::mutex> lock(s.mutex);
    if (s.mirror) fclose(s.mirror);
    s.mirror = fopen(path, "a");
    return s.mirror != nullptr;
}

inline void closeLogFile() {
    Sink& s = sink();
    std::lock_guard<std::mutex> lock(s.mutex);
    if (s.mirror) {
        fclose(s.mirror);
        s.mirror = nullptr;
    }
}

// "HH:MM:SS.mmm"
inline void formatClock(char* out, size_t size) {
    const auto now = std::chrono::system_clock::now();
    const std::time_t secs = std::chrono::system_clock::to_time_t(now);
    const int ms = static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000);
    std::tm tm_buf{};
    localtime_r(&secs, &tm_buf);
    snprintf(out, size, "%02d:%02d:%02d.%03d", tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, ms);
}

// スレッド ID は表示用に短縮
inline unsigned long shortThreadId() {
    return static_cast<unsigned long>(
        std::hash<std::thread::id>{}(std::this_thread::get_id()) % 100000);
}

inline void write(Level level, const char* tag, const char* fmt, ...) {
    if (!enabled(level)) return;

    char body[2048];
    va_list args;
    va_start(args, fmt);
    vsnprintf(body, sizeof(body), fmt, args);
    va_end(args);

    char clock[16];
    formatClock(clock, sizeof(clock));

    char line[2200];
    snprintf(line, sizeof(line), "%s [%s] [%s] (T%lu) %s\n",
             clock, levelTag(level), tag, shortThreadId(), body);

    Sink& s = sink();
    std::lock_guard<std::mutex> lock(s.mutex);
    fputs(line, stderr);
    if (s.mirror) {
        fputs(line, s.mirror);
        fflush(s.mirror);
    }
}

} // namespace simpilot::log

#define SPLOG_TRACE(tag, fmt, ...) simpilot::log::write(simpilot::log::Level::Trace, tag, fmt, ##__VA_ARGS__)
#define SPLOG_DEBUG(tag, fmt, ...) simpilot::log::write(simpilot::log::Level::Debug, tag, fmt, ##__VA_ARGS__)
#define SPLOG_INFO(tag, fmt, ...)  simpilot::log::write(simpilot::log::Level::Info,  tag, fmt, ##__VA_ARGS__)
#define SPLOG_WARN(tag, fmt, ...)  simpilot::log::write(simpilot::log::Level::Warn,  tag, fmt, ##__VA_ARGS__)
#define SPLOG_ERROR(tag, fmt, ...) simpilot::log::write(simpilot::log::Level::Error, tag, fmt, ##__VA_ARGS__)
#define SPLOG_FATAL(tag, fmt, ...) simpilot::log::write(simpilot::log::Level::Fatal, tag, fmt, ##__VA_ARGS__)
