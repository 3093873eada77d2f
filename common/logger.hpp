#pragma once

// ============================================================
// logger.hpp -- Thread-safe process-wide logger
// ============================================================

#include "platform.hpp"
#include <string>
#include <mutex>
#include <fstream>
#include <iostream>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <ctime>
#include <cctype>
#include <atomic>

enum class LogLevel {
    DEBUG = 0,
    INFO  = 1,
    WARN  = 2,
    ERR   = 3,
};

// "debug", "info", "warn", "error" (any case); false if unrecognised
inline bool parse_log_level(const std::string& name, LogLevel& out) {
    std::string n;
    for (char c : name) n.push_back((char)std::tolower((unsigned char)c));
    if (n == "debug")                  { out = LogLevel::DEBUG; return true; }
    if (n == "info")                   { out = LogLevel::INFO;  return true; }
    if (n == "warn" || n == "warning") { out = LogLevel::WARN;  return true; }
    if (n == "error")                  { out = LogLevel::ERR;   return true; }
    return false;
}

class Logger {
public:
    static Logger& get() {
        static Logger instance;
        return instance;
    }

    // Level checks are lock-free; session threads call enabled() per packet
    void set_level(LogLevel lvl) { level_.store(lvl, std::memory_order_relaxed); }
    LogLevel level() const { return level_.load(std::memory_order_relaxed); }
    bool enabled(LogLevel lvl) const { return lvl >= level(); }

    // Mirror every line into 'path' (append). Returns false if it can't be opened.
    bool set_log_file(const std::string& path) {
        return reopen(file_, path);
    }

    // Aborted sessions are additionally appended here
    bool set_session_error_file(const std::string& path) {
        return reopen(session_err_file_, path);
    }

    void log(LogLevel lvl, const std::string& msg) {
        if (!enabled(lvl)) return;
        emit(format_line(lvl, msg), lvl >= LogLevel::WARN, false);
    }

    void info(const std::string& msg)  { log(LogLevel::INFO, msg); }
    void warn(const std::string& msg)  { log(LogLevel::WARN, msg); }
    void error(const std::string& msg) { log(LogLevel::ERR,  msg); }
    void debug(const std::string& msg) { log(LogLevel::DEBUG, msg); }

    // A session ended in the ABORTED state; logged regardless of level
    void session_error(const std::string& msg) {
        emit(format_line(LogLevel::ERR, "[SESSION] " + msg), true, true);
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

private:
    Logger() = default;

    bool reopen(std::ofstream& f, const std::string& path) {
        std::lock_guard<std::mutex> lk(mutex_);
        if (f.is_open()) f.close();
        f.open(path, std::ios::app);
        return f.is_open();
    }

    void emit(const std::string& line, bool to_stderr, bool session_file) {
        std::lock_guard<std::mutex> lk(mutex_);
        (to_stderr ? std::cerr : std::cout) << line << "\n";
        if (file_.is_open()) {
            file_ << line << "\n";
            file_.flush();
        }
        if (session_file && session_err_file_.is_open()) {
            session_err_file_ << line << "\n";
            session_err_file_.flush();
        }
    }

    static std::string format_line(LogLevel lvl, const std::string& msg) {
        auto now = std::chrono::system_clock::now();
        auto t   = std::chrono::system_clock::to_time_t(now);
        auto ms  = std::chrono::duration_cast<std::chrono::milliseconds>(
                       now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#ifdef _WIN32
        localtime_s(&tm_buf, &t);
#else
        localtime_r(&t, &tm_buf);
#endif
        std::ostringstream ss;
        ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
        ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
        ss << " [" << level_str(lvl) << "] " << msg;
        return ss.str();
    }

    static const char* level_str(LogLevel lvl) {
        switch (lvl) {
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO:  return "INFO ";
            case LogLevel::WARN:  return "WARN ";
            case LogLevel::ERR:   return "ERROR";
        }
        return "?????";
    }

    std::mutex            mutex_;
    std::atomic<LogLevel> level_{LogLevel::INFO};
    std::ofstream         file_;
    std::ofstream         session_err_file_;
};

// Convenience macros
#define LOG_INFO(msg)  Logger::get().info(msg)
#define LOG_WARN(msg)  Logger::get().warn(msg)
#define LOG_ERROR(msg) Logger::get().error(msg)
#define LOG_DEBUG(msg) Logger::get().debug(msg)
