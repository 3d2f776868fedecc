#include "Logger.h"
#include <chrono>
#include <ctime>
#include <iomanip>

Logger &Logger::instance() {
  static Logger instance;
  return instance;
}

LogLevel Logger::parseLevel(const std::string &name) {
  if (name == "DEBUG")
    return LogLevel::DEBUG;
  if (name == "WARN")
    return LogLevel::WARN;
  if (name == "ERROR")
    return LogLevel::ERROR;
  return LogLevel::INFO;
}

void Logger::setLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  currentLevel_ = level;
}

void Logger::log(LogLevel level, const std::string &msg) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto now = std::chrono::system_clock::now();
  auto in_time_t = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) %
            1000;

  std::tm tm{};
  localtime_r(&in_time_t, &tm);

  std::ostream &out =
      (level == LogLevel::WARN || level == LogLevel::ERROR) ? std::cerr
                                                            : std::cout;

  out << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0')
      << std::setw(3) << ms.count() << " ";

  switch (level) {
  case LogLevel::DEBUG:
    out << "[DEBUG] ";
    break;
  case LogLevel::INFO:
    out << "[INFO]  ";
    break;
  case LogLevel::WARN:
    out << "[WARN]  ";
    break;
  case LogLevel::ERROR:
    out << "[ERROR] ";
    break;
  }

  out << msg << std::endl;
}

bool Logger::isEnabled(LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  return level >= currentLevel_;
}
