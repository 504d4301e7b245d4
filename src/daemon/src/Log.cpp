/*
 * bctd — Logging (implementation)
 * (c) 2025 bctd contributors
 */

#include "include/Log.hpp"
#include "include/Utils.hpp"

#include <array>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <string>
#include <system_error>

namespace bct {

// -----------------------------------------------------------------------------
// helpers
// -----------------------------------------------------------------------------

static inline size_t fileSizeOrZero(const std::string& path) {
    std::error_code ec;
    auto sz = std::filesystem::file_size(path, ec);
    return ec ? 0u : static_cast<size_t>(sz);
}

static inline std::string makeTimestamp() {
    std::time_t t = std::time(nullptr);
    std::tm tmv{};
    localtime_r(&t, &tmv);
    std::array<char, 32> buf{};
    if (std::strftime(buf.data(), buf.size(), "%Y-%m-%d %H:%M:%S", &tmv) == 0) {
        return "1970-01-01 00:00:00";
    }
    return std::string(buf.data());
}

bool parseLogLevel(const std::string& s, LogLevel& out) {
    const std::string v = util::to_lower(util::trim(s));
    if (v == "error")                  { out = LogLevel::Error; return true; }
    if (v == "warn" || v == "warning") { out = LogLevel::Warn;  return true; }
    if (v == "info")                   { out = LogLevel::Info;  return true; }
    if (v == "debug")                  { out = LogLevel::Debug; return true; }
    if (v == "trace")                  { out = LogLevel::Trace; return true; }
    return false;
}

// -----------------------------------------------------------------------------
// Logger
// -----------------------------------------------------------------------------

Logger& Logger::instance() {
    static Logger g;
    return g;
}

Logger::~Logger() {
    std::lock_guard<std::mutex> lock(mtx_);
    closeFileUnlocked();
}

void Logger::init(const std::string& logFilePath, LogLevel lvl, bool mirrorToStdio) {
    std::lock_guard<std::mutex> lock(mtx_);

    level_.store(static_cast<int>(lvl), std::memory_order_relaxed);
    mirror_ = mirrorToStdio;

    closeFileUnlocked();
    filePath_ = logFilePath;
    currentSize_ = 0;

    if (!filePath_.empty()) {
        std::error_code ec;
        util::ensure_parent_dirs(filePath_, &ec);
        openFileUnlocked();
    }
}

LogLevel Logger::level() const {
    return static_cast<LogLevel>(level_.load(std::memory_order_relaxed));
}

void Logger::enableRotation(size_t maxBytes, int maxFiles) {
    std::lock_guard<std::mutex> lock(mtx_);
    maxBytes_ = maxBytes;
    maxFiles_ = maxFiles;
    if (!filePath_.empty() && maxBytes_ > 0 && maxFiles_ > 0) {
        currentSize_ = fileSizeOrZero(filePath_);
        if (currentSize_ >= maxBytes_) {
            rotateUnlocked();
            openFileUnlocked();
        }
    }
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(mtx_);
    closeFileUnlocked();
}

void Logger::openFileUnlocked() {
    if (file_ || filePath_.empty()) return;
    file_ = std::fopen(filePath_.c_str(), "a");
    if (!file_) {
        // Never lose messages silently: fall back to stdio.
        mirror_ = true;
        currentSize_ = 0;
        return;
    }
    currentSize_ = fileSizeOrZero(filePath_);
}

void Logger::closeFileUnlocked() {
    if (file_) {
        std::fflush(file_);
        std::fclose(file_);
        file_ = nullptr;
    }
}

const char* Logger::levelTag(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::Error: return "E";
        case LogLevel::Warn:  return "W";
        case LogLevel::Info:  return "I";
        case LogLevel::Debug: return "D";
        case LogLevel::Trace: return "T";
    }
    return "?";
}

void Logger::rotateUnlocked() {
    closeFileUnlocked();

    // Shift N-1..1 -> N..2
    for (int i = maxFiles_ - 1; i >= 1; --i) {
        const std::filesystem::path src = filePath_ + "." + std::to_string(i);
        const std::filesystem::path dst = filePath_ + "." + std::to_string(i + 1);
        std::error_code ec;
        if (std::filesystem::exists(src, ec)) {
            std::filesystem::remove(dst, ec);
            std::filesystem::rename(src, dst, ec);
        }
    }

    std::error_code ec;
    const std::filesystem::path dst = filePath_ + ".1";
    if (std::filesystem::exists(filePath_, ec)) {
        std::filesystem::remove(dst, ec);
        std::filesystem::rename(filePath_, dst, ec);
    }
    currentSize_ = 0;
}

void Logger::write(LogLevel lvl, const char* fmt, ...) {
    if (static_cast<int>(lvl) > level_.load(std::memory_order_relaxed)) return;

    va_list ap;
    va_start(ap, fmt);
    vwrite(lvl, fmt, ap);
    va_end(ap);
}

void Logger::vwrite(LogLevel lvl, const char* fmt, va_list ap) {
    if (static_cast<int>(lvl) > level_.load(std::memory_order_relaxed)) return;

    char msgBuf[2048];
    std::vsnprintf(msgBuf, sizeof(msgBuf), fmt, ap);

    // "2025-09-20 14:22:11 [I] [INFO] message\n"
    std::string line = makeTimestamp();
    line += " [";
    line += levelTag(lvl);
    line += "] ";
    line += msgBuf;
    if (line.back() != '\n') line.push_back('\n');

    std::lock_guard<std::mutex> lock(mtx_);

    if (!filePath_.empty()) {
        if (maxBytes_ > 0 && maxFiles_ > 0 && currentSize_ + line.size() > maxBytes_) {
            rotateUnlocked();
        }
        openFileUnlocked();
        if (file_) {
            std::fwrite(line.data(), 1, line.size(), file_);
            std::fflush(file_);
            currentSize_ += line.size();
        }
    }

    if (mirror_) {
        FILE* out = (lvl == LogLevel::Error || lvl == LogLevel::Warn) ? stderr : stdout;
        std::fwrite(line.data(), 1, line.size(), out);
        std::fflush(out);
    }
}

} // namespace bct
