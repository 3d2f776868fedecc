#pragma once

#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR
};

class Logger {
public:
    static Logger& instance();

    // Unknown names fall back to INFO.
    static LogLevel parseLevel(const std::string& name);

    void setLevel(LogLevel level);
    void log(LogLevel level, const std::string& msg);

    bool isEnabled(LogLevel level);

private:
    Logger() = default;
    LogLevel currentLevel_ = LogLevel::INFO;
    std::mutex mutex_;
};

#define LIVE_LOG(level, msg) \
  do { \
    if (Logger::instance().isEnabled(level)) { \
      std::ostringstream oss_; \
      oss_ << msg; \
      Logger::instance().log(level, oss_.str()); \
    } \
  } while (0)

#define LOG_DEBUG(msg) LIVE_LOG(LogLevel::DEBUG, msg)
#define LOG_INFO(msg) LIVE_LOG(LogLevel::INFO, msg)
#define LOG_WARN(msg) LIVE_LOG(LogLevel::WARN, msg)
#define LOG_ERROR(msg) LIVE_LOG(LogLevel::ERROR, msg)

// Session-scoped variants prefix the line with the session id.
#define SLOG_DEBUG(sid, msg) LOG_DEBUG("[" << (sid) << "] " << msg)
#define SLOG_INFO(sid, msg) LOG_INFO("[" << (sid) << "] " << msg)
#define SLOG_WARN(sid, msg) LOG_WARN("[" << (sid) << "] " << msg)
#define SLOG_ERROR(sid, msg) LOG_ERROR("[" << (sid) << "] " << msg)
