/*
 * bctd — Logging (header)
 * - Levelled, timestamped logger; stdio mirror for the service supervisor
 * - Optional log file with size-based rotation
 * (c) 2025 bctd contributors
 */
#pragma once

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <string>

namespace bct {

/* Severity levels (ascending verbosity). */
enum class LogLevel {
    Error = 0,
    Warn  = 1,
    Info  = 2,
    Debug = 3,
    Trace = 4
};

/* Parse "error"/"warn"/"info"/"debug"/"trace" (case-insensitive). */
bool parseLogLevel(const std::string& s, LogLevel& out);

/*
 * Logger — process-wide singleton.
 * - Safe for concurrent writers; one write() emits exactly one line.
 * - Rotation: when the active file would exceed maxBytes it becomes ".1",
 *   older files shift up to ".maxFiles" and the oldest is dropped.
 */
class Logger {
public:
    static Logger& instance();

    ~Logger();

    /*
     * Reset the logger:
     *  - logFilePath: destination file (empty = stdio only).
     *  - lvl: most verbose level to emit.
     *  - mirrorToStdio: also print (Error/Warn to stderr, rest to stdout).
     */
    void init(const std::string& logFilePath, LogLevel lvl, bool mirrorToStdio);

    LogLevel level() const;

    /* Rotation policy; maxBytes == 0 disables rotation. */
    void enableRotation(size_t maxBytes, int maxFiles);

    /* Flush and close the file (idempotent). */
    void shutdown();

    void write(LogLevel lvl, const char* fmt, ...) __attribute__((format(printf, 3, 4)));
    void vwrite(LogLevel lvl, const char* fmt, va_list ap);

private:
    Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void openFileUnlocked();
    void closeFileUnlocked();
    void rotateUnlocked();
    static const char* levelTag(LogLevel lvl);

private:
    std::mutex mtx_;
    std::atomic<int> level_{static_cast<int>(LogLevel::Info)};

    std::string filePath_;
    FILE* file_{nullptr};
    bool mirror_{true};

    size_t maxBytes_{5 * 1024 * 1024};
    int    maxFiles_{5};
    size_t currentSize_{0};
};

#define LOG_ERROR(fmt, ...) ::bct::Logger::instance().write(::bct::LogLevel::Error, "[ERROR] " fmt, ##__VA_ARGS__)
#define LOG_WARN(fmt, ...)  ::bct::Logger::instance().write(::bct::LogLevel::Warn,  "[WARN] "  fmt, ##__VA_ARGS__)
#define LOG_INFO(fmt, ...)  ::bct::Logger::instance().write(::bct::LogLevel::Info,  "[INFO] "  fmt, ##__VA_ARGS__)
#define LOG_DEBUG(fmt, ...) ::bct::Logger::instance().write(::bct::LogLevel::Debug, "[DEBUG] " fmt, ##__VA_ARGS__)
#define LOG_TRACE(fmt, ...) ::bct::Logger::instance().write(::bct::LogLevel::Trace, "[TRACE] " fmt, ##__VA_ARGS__)

} // namespace bct
