#pragma once

#include <string>
#include <mutex>

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR,
    FATAL
};

class Logger {
public:
    // An empty logPath keeps the logger console-only.
    static bool initialize(const std::string& logPath, LogLevel level = LogLevel::INFO,
                           bool echoToConsole = true);
    static void shutdown();
    static void setLogLevel(LogLevel level);
    static bool parseLevel(const std::string& name, LogLevel& level);

    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warning(const std::string& message);
    static void error(const std::string& message);
    static void fatal(const std::string& message);
    static bool isInitialized();

private:
    static void log(LogLevel level, const std::string& message);
    static std::string levelToString(LogLevel level);

    static std::mutex mutex_;
    static LogLevel currentLevel_;
    static bool initialized_;
    static bool echoToConsole_;
    static std::string logPath_;
};
