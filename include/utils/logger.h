#pragma once

#include <string>
#include <vector>
#include <functional>
#include <cstdint>

namespace testbox {
namespace utils {

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    FATAL = 5,
    OFF = 6
};

struct LogEntry {
    LogLevel level;
    std::string message;
    std::string category;
    uint64_t timestamp;
    uint64_t threadId;
};

class Logger {
public:
    static void init(const std::string& path);
    static void shutdown();
    static void setLevel(LogLevel level);
    static LogLevel getLevel();
    static bool parseLevel(const std::string& name, LogLevel& out);
    static void setPattern(const std::string& pattern);
    static void enableConsole(bool enable);
    static void enableFile(bool enable);
    static void setConsoleToStderr(bool enable);
    static void setMaxFileSize(uint64_t bytes);
    static void setMaxFiles(uint32_t count);

    static void trace(const std::string& msg);
    static void debug(const std::string& msg);
    static void info(const std::string& msg);
    static void warn(const std::string& msg);
    static void error(const std::string& msg);
    static void fatal(const std::string& msg);

    static void log(LogLevel level, const std::string& msg);
    static void log(LogLevel level, const std::string& category, const std::string& msg);

    static void flush();
    static void rotate();

    static void onLog(std::function<void(const LogEntry&)> callback);

    static uint64_t getLogCount();
    static uint64_t getErrorCount();

    static std::string getLogPath();
    static std::vector<LogEntry> getRecentLogs(size_t count = 100);
    static void clearLogs();
    static bool isInitialized();
    static void setAllowSensitiveLogging(bool allow);
    static bool isAllowSensitiveLogging();

    // Replaces the value after credential-like keys (token=..., password: ...)
    static std::string redact(const std::string& text);
};

#define LOG_TRACE(msg) testbox::utils::Logger::trace(msg)
#define LOG_DEBUG(msg) do { if (testbox::utils::Logger::getLevel() <= testbox::utils::LogLevel::DEBUG) testbox::utils::Logger::debug(msg); } while(0)
#define LOG_INFO(msg) testbox::utils::Logger::info(msg)
#define LOG_WARN(msg) testbox::utils::Logger::warn(msg)
#define LOG_ERROR(msg) testbox::utils::Logger::error(msg)
#define LOG_FATAL(msg) testbox::utils::Logger::fatal(msg)
#define LOG_CAT(level, category, msg) testbox::utils::Logger::log(level, category, msg)

}
}
