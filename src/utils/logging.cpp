#include "utils/logging.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>

namespace speakerfusion {
namespace utils {

bool Logger::initialized_ = false;
LogLevel Logger::level_ = LogLevel::INFO;
std::mutex Logger::mutex_;

void Logger::initialize() {
  if (!initialized_) {
    initialized_ = true;
    info("Logger initialized");
  }
}

void Logger::info(const std::string &message) {
  write(LogLevel::INFO, "[INFO] ", message);
}

void Logger::warn(const std::string &message) {
  write(LogLevel::WARN, "[WARN] ", message);
}

void Logger::error(const std::string &message) {
  write(LogLevel::ERROR, "[ERROR] ", message);
}

void Logger::debug(const std::string &message) {
  write(LogLevel::DEBUG, "[DEBUG] ", message);
}

void Logger::setLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  level_ = level;
}

bool Logger::setLevel(const std::string &level) {
  LogLevel parsed;
  if (!parseLevel(level, parsed)) {
    return false;
  }
  setLevel(parsed);
  return true;
}

LogLevel Logger::getLevel() {
  std::lock_guard<std::mutex> lock(mutex_);
  return level_;
}

bool Logger::parseLevel(const std::string &level, LogLevel &out) {
  std::string upper = level;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return std::toupper(c); });

  if (upper == "DEBUG") {
    out = LogLevel::DEBUG;
  } else if (upper == "INFO") {
    out = LogLevel::INFO;
  } else if (upper == "WARN" || upper == "WARNING") {
    out = LogLevel::WARN;
  } else if (upper == "ERROR") {
    out = LogLevel::ERROR;
  } else {
    return false;
  }
  return true;
}

void Logger::write(LogLevel level, const char *tag, const std::string &message) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (level < level_) {
    return;
  }

  if (level == LogLevel::ERROR) {
    std::cerr << tag << message << std::endl;
  } else {
    std::cout << tag << message << std::endl;
  }
}

} // namespace utils
} // namespace speakerfusion
