#pragma once

// ============================================================
// logger.hpp -- Thread-safe logger
// ============================================================

#include "platform.hpp"
#include <string>
#include <mutex>
#include <fstream>
#include <iostream>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <optional>

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO  = 2,
    WARN  = 3,
    ERR   = 4,
};

class Logger {
public:
    static Logger& get() {
        static Logger instance;
        return instance;
    }

    void set_level(LogLevel lvl) {
        std::lock_guard<std::mutex> lk(mutex_);
        level_ = lvl;
    }

    LogLevel level() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return level_;
    }

    // Returns false if the file could not be opened.
    bool set_log_file(const std::string& path) {
        std::lock_guard<std::mutex> lk(mutex_);
        file_.open(path, std::ios::app);
        return file_.is_open();
    }

    bool enabled(LogLevel lvl) const {
        std::lock_guard<std::mutex> lk(mutex_);
        return lvl >= level_;
    }

    void log(LogLevel lvl, const std::string& msg) {
        if (!enabled(lvl)) return;
        std::string line = format_line(lvl, msg);
        std::lock_guard<std::mutex> lk(mutex_);
        if (lvl >= LogLevel::WARN) {
            std::cerr << line << "\n";
        } else {
            std::cout << line << "\n";
        }
        if (file_.is_open()) {
            file_ << line << "\n";
            file_.flush();
        }
    }

    void trace(const std::string& msg) { log(LogLevel::TRACE, msg); }
    void debug(const std::string& msg) { log(LogLevel::DEBUG, msg); }
    void info(const std::string& msg)  { log(LogLevel::INFO, msg); }
    void warn(const std::string& msg)  { log(LogLevel::WARN, msg); }
    void error(const std::string& msg) { log(LogLevel::ERR,  msg); }

    // Parse a level name as given on the command line ("trace", "info", ...)
    static std::optional<LogLevel> parse_level(const std::string& name) {
        std::string s;
        for (char c : name) {
            s += (c >= 'A' && c <= 'Z') ? (char)(c + 32) : c;
        }
        if (s == "trace")                      return LogLevel::TRACE;
        if (s == "debug")                      return LogLevel::DEBUG;
        if (s == "info" || s == "information") return LogLevel::INFO;
        if (s == "warn" || s == "warning")     return LogLevel::WARN;
        if (s == "error")                      return LogLevel::ERR;
        return std::nullopt;
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

private:
    Logger() : level_(LogLevel::INFO) {}

    std::string format_line(LogLevel lvl, const std::string& msg) {
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
            case LogLevel::TRACE: return "TRACE";
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO:  return "INFO ";
            case LogLevel::WARN:  return "WARN ";
            case LogLevel::ERR:   return "ERROR";
        }
        return "?????";
    }

    mutable std::mutex mutex_;
    LogLevel           level_;
    std::ofstream      file_;
};

// Convenience macros
#define LOG_TRACE(msg) do { if (Logger::get().enabled(LogLevel::TRACE)) Logger::get().trace(msg); } while (0)
#define LOG_DEBUG(msg) Logger::get().debug(msg)
#define LOG_INFO(msg)  Logger::get().info(msg)
#define LOG_WARN(msg)  Logger::get().warn(msg)
#define LOG_ERROR(msg) Logger::get().error(msg)
