/**
 * @file auth_logger.hpp
 * @brief Process-wide logger for authorization core components
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 *
 * Lines look like "2025-01-06 10:42:17.031 [WARN] [Prefetcher] message".
 * They go to stderr when console output is on, to <dir>/authcore.log once
 * initialize() succeeded, and always into a bounded ring of recent lines.
 */
#ifndef AUTHCORE_AUTH_LOGGER_HPP
#define AUTHCORE_AUTH_LOGGER_HPP

#include <atomic>
#include <cctype>
#include <cstdint>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <deque>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace authcore {

// LOG_ prefix keeps clear of the ERROR macro from WinGDI.h
enum class LogLevel { LOG_TRACE, LOG_DEBUG, LOG_INFO, LOG_WARNING, LOG_ERROR, LOG_FATAL };

inline const char* logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::LOG_TRACE: return "TRACE";
        case LogLevel::LOG_DEBUG: return "DEBUG";
        case LogLevel::LOG_INFO: return "INFO";
        case LogLevel::LOG_WARNING: return "WARN";
        case LogLevel::LOG_ERROR: return "ERROR";
        case LogLevel::LOG_FATAL: return "FATAL";
    }
    return "?";
}

/** @brief Case-insensitive; WARNING is accepted for WARN */
inline std::optional<LogLevel> logLevelFromString(const std::string& name) {
    std::string upper;
    for (char c : name) upper += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    if (upper == "WARNING") return LogLevel::LOG_WARNING;
    for (int i = 0; i <= static_cast<int>(LogLevel::LOG_FATAL); ++i) {
        auto level = static_cast<LogLevel>(i);
        if (upper == logLevelToString(level)) return level;
    }
    return std::nullopt;
}

class AuthLogger {
public:
    static constexpr std::size_t RECENT_CAPACITY = 512;
    static constexpr std::uintmax_t ROTATE_BYTES = 16u * 1024 * 1024;

    static AuthLogger& instance() {
        static AuthLogger logger;
        return logger;
    }

    /**
     * @brief Start appending to <dir>/authcore.log
     * @return false when the directory or the file cannot be opened
     */
    bool initialize(const std::filesystem::path& dir, LogLevel level = LogLevel::LOG_INFO) {
        std::lock_guard<std::mutex> lock(mutex_);
        level_ = level;
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec) return false;
        path_ = dir / "authcore.log";
        file_.close();
        file_.open(path_, std::ios::app);
        return file_.is_open();
    }

    void setLevel(LogLevel level) { level_ = level; }
    void setConsoleOutput(bool enabled) { console_ = enabled; }

    void log(LogLevel level, const std::string& component, const std::string& message) {
        if (level < level_.load()) return;
        std::string line = timestamp() + " [" + logLevelToString(level) + "] [" + component + "] " + message;

        std::lock_guard<std::mutex> lock(mutex_);
        if (file_.is_open()) {
            file_ << line << '\n';
            file_.flush();
            rotateIfLarge();
        }
        if (console_) std::cerr << line << '\n';
        recent_.push_back(std::move(line));
        if (recent_.size() > RECENT_CAPACITY) recent_.pop_front();
    }

    /** @brief Most recent formatted lines, oldest first */
    std::vector<std::string> recentLines() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return {recent_.begin(), recent_.end()};
    }

    void shutdown() {
        std::lock_guard<std::mutex> lock(mutex_);
        file_.close();
    }

private:
    AuthLogger() = default;
    AuthLogger(const AuthLogger&) = delete;
    AuthLogger& operator=(const AuthLogger&) = delete;

    static std::string timestamp() {
        auto now = std::chrono::system_clock::now();
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
        std::time_t t = std::chrono::system_clock::to_time_t(now);
        std::tm tm{};
#ifdef _WIN32
        localtime_s(&tm, &t);
#else
        localtime_r(&t, &tm);
#endif
        char buf[32];
        std::size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
        std::snprintf(buf + n, sizeof(buf) - n, ".%03d", static_cast<int>(ms));
        return buf;
    }

    // keeps one previous generation as authcore.log.1
    void rotateIfLarge() {
        std::error_code ec;
        if (std::filesystem::file_size(path_, ec) < ROTATE_BYTES || ec) return;
        file_.close();
        std::filesystem::path previous = path_;
        previous += ".1";
        std::filesystem::rename(path_, previous, ec);
        file_.open(path_, std::ios::app);
    }

    mutable std::mutex mutex_;
    std::filesystem::path path_;
    std::ofstream file_;
    std::deque<std::string> recent_;
    std::atomic<LogLevel> level_{LogLevel::LOG_INFO};
    std::atomic<bool> console_{false};
};

#define AUTHCORE_LOG(level, comp, msg) ::authcore::AuthLogger::instance().log(level, comp, msg)
#define LOG_TRACE(comp, msg) AUTHCORE_LOG(::authcore::LogLevel::LOG_TRACE, comp, msg)
#define LOG_DEBUG(comp, msg) AUTHCORE_LOG(::authcore::LogLevel::LOG_DEBUG, comp, msg)
#define LOG_INFO(comp, msg) AUTHCORE_LOG(::authcore::LogLevel::LOG_INFO, comp, msg)
#define LOG_WARNING(comp, msg) AUTHCORE_LOG(::authcore::LogLevel::LOG_WARNING, comp, msg)
#define LOG_ERROR(comp, msg) AUTHCORE_LOG(::authcore::LogLevel::LOG_ERROR, comp, msg)
#define LOG_FATAL(comp, msg) AUTHCORE_LOG(::authcore::LogLevel::LOG_FATAL, comp, msg)

} // namespace authcore

#endif // AUTHCORE_AUTH_LOGGER_HPP
