#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace phichain {
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
    uint64_t timestamp;
    uint64_t threadId;
};

class Logger {
public:
    // Opens (appending) the file sink; parent directories are created.
    static void init(const std::string& path);
    static void shutdown();
    static void setLevel(LogLevel level);
    static LogLevel getLevel();
    static bool parseLevel(const std::string& name, LogLevel& out);
    static void enableConsole(bool enable);
    static void enableFile(bool enable);
    static void setMaxFileSize(uint64_t bytes);
    static void setMaxFiles(uint32_t count);

    static void debug(const std::string& msg);
    static void info(const std::string& msg);
    static void warn(const std::string& msg);
    static void error(const std::string& msg);
    static void fatal(const std::string& msg);

    static std::vector<LogEntry> getRecentLogs(size_t count = 100);
    static void clearLogs();

    // Payloads are opaque application data; log a prefix only unless
    // PHICHAIN_ALLOW_SENSITIVE_LOGS is set.
    static std::string redactPayload(const std::string& payload, size_t keep = 8);
};

#define LOG_DEBUG(msg) do { if (phichain::utils::Logger::getLevel() <= phichain::utils::LogLevel::DEBUG) phichain::utils::Logger::debug(msg); } while(0)
#define LOG_INFO(msg) phichain::utils::Logger::info(msg)
#define LOG_WARN(msg) phichain::utils::Logger::warn(msg)
#define LOG_ERROR(msg) phichain::utils::Logger::error(msg)
#define LOG_FATAL(msg) phichain::utils::Logger::fatal(msg)

}
}
