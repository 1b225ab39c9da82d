#pragma once

#include <mutex>
#include <string>

namespace speakerfusion {
namespace utils {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR
};

class Logger {
public:
    static void initialize();
    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);
    static void debug(const std::string& message);

    static void setLevel(LogLevel level);
    // Accepts DEBUG, INFO, WARN/WARNING, ERROR (case-insensitive); returns false otherwise
    static bool setLevel(const std::string& level);
    static LogLevel getLevel();

    static bool parseLevel(const std::string& level, LogLevel& out);

private:
    static void write(LogLevel level, const char* tag, const std::string& message);

    static bool initialized_;
    static LogLevel level_;
    static std::mutex mutex_;
};

} // namespace utils
} // namespace speakerfusion
