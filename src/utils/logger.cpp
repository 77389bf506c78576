#include "utils/logger.h"
#include <fstream>
#include <ctime>
#include <iostream>
#include <mutex>
#include <atomic>
#include <thread>
#include <cstdlib>
#include <sstream>
#include <filesystem>
#include <algorithm>
#include <cctype>
#include <deque>
#include <functional>

namespace phichain {
namespace utils {

static bool sensitiveLoggingFromEnv() {
    const char* env = std::getenv("PHICHAIN_ALLOW_SENSITIVE_LOGS");
    if (!env) return false;
    std::string v(env);
    return v == "1" || v == "true" || v == "TRUE";
}

static std::atomic<LogLevel> currentLevel{LogLevel::INFO};
static std::ofstream logFile;
static std::string logPath;
static std::mutex logMutex;
static std::atomic<bool> consoleEnabled{true};
static std::atomic<bool> fileEnabled{true};
static uint64_t maxFileSize = 10 * 1024 * 1024;
static uint32_t maxFiles = 5;
static std::deque<LogEntry> recentLogs;
static const size_t MAX_RECENT_LOGS = 1000;
static const bool allowSensitive = sensitiveLoggingFromEnv();

static const char* levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        default: return "?????";
    }
}

static uint64_t getThreadId() {
    std::hash<std::thread::id> hasher;
    return hasher(std::this_thread::get_id());
}

// Masks the value following a secret-looking key, e.g. "password=x".
static std::string sanitize(const std::string& in) {
    std::string s = in;
    static const char* const keys[] = {"password", "secret", "private_key", "seed"};
    for (const char* k : keys) {
        const size_t keyLen = std::char_traits<char>::length(k);
        size_t pos = 0;
        while ((pos = s.find(k, pos)) != std::string::npos) {
            size_t begin = pos + keyLen;
            while (begin < s.size() && (s[begin] == ' ' || s[begin] == ':' || s[begin] == '=' ||
                                        s[begin] == '"' || s[begin] == '\'')) {
                begin++;
            }
            size_t end = begin;
            while (end < s.size() && std::string(" \"',;)\n").find(s[end]) == std::string::npos) end++;
            if (end > begin) {
                s.replace(begin, end - begin, "[REDACTED]");
                pos = begin + 10;
            } else {
                pos = begin;
            }
        }
    }
    return s;
}

// Shifts path.N to path.N+1, dropping the oldest, then reopens path.
static void rotateUnlocked() {
    if (logPath.empty()) return;
    if (logFile.is_open()) logFile.close();

    std::error_code ec;
    for (int i = static_cast<int>(maxFiles) - 1; i >= 1; i--) {
        std::string from = logPath + "." + std::to_string(i);
        if (!std::filesystem::exists(from, ec)) continue;
        if (i == static_cast<int>(maxFiles) - 1) {
            std::filesystem::remove(from, ec);
        } else {
            std::filesystem::rename(from, logPath + "." + std::to_string(i + 1), ec);
        }
    }
    if (std::filesystem::exists(logPath, ec)) {
        std::filesystem::rename(logPath, logPath + ".1", ec);
    }
    logFile.open(logPath, std::ios::app);
}

static void writeLog(LogLevel level, const std::string& msg) {
    if (level < currentLevel.load()) return;

    std::lock_guard<std::mutex> lock(logMutex);

    time_t now = std::time(nullptr);
    char timeBuf[32];
    std::tm tmNow{};
    localtime_r(&now, &tmNow);
    std::strftime(timeBuf, sizeof(timeBuf), "%Y-%m-%d %H:%M:%S", &tmNow);

    std::string outMsg = allowSensitive ? msg : sanitize(msg);

    std::ostringstream oss;
    oss << timeBuf << " [" << levelToString(level) << "] " << outMsg << "\n";
    std::string line = oss.str();

    // stdout carries the CLI's JSON, so log lines go to stderr.
    if (consoleEnabled) {
        if (level >= LogLevel::ERROR) std::cerr << line;
        else std::clog << line;
    }

    if (fileEnabled && logFile.is_open()) {
        logFile << line;
        logFile.flush();
        if (logFile.tellp() > static_cast<std::streampos>(maxFileSize)) {
            rotateUnlocked();
        }
    }

    LogEntry entry;
    entry.level = level;
    entry.message = outMsg;
    entry.timestamp = static_cast<uint64_t>(now);
    entry.threadId = getThreadId();
    recentLogs.push_back(entry);
    while (recentLogs.size() > MAX_RECENT_LOGS) recentLogs.pop_front();
}

void Logger::init(const std::string& path) {
    std::lock_guard<std::mutex> lock(logMutex);
    logPath = path;

    std::filesystem::path p(path);
    if (p.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(p.parent_path(), ec);
    }
    logFile.open(path, std::ios::app);
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(logMutex);
    if (logFile.is_open()) {
        logFile.flush();
        logFile.close();
    }
}

void Logger::setLevel(LogLevel level) {
    currentLevel = level;
}

LogLevel Logger::getLevel() {
    return currentLevel;
}

bool Logger::parseLevel(const std::string& name, LogLevel& out) {
    std::string v = name;
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "trace") out = LogLevel::TRACE;
    else if (v == "debug") out = LogLevel::DEBUG;
    else if (v == "info") out = LogLevel::INFO;
    else if (v == "warn" || v == "warning") out = LogLevel::WARN;
    else if (v == "error") out = LogLevel::ERROR;
    else if (v == "fatal") out = LogLevel::FATAL;
    else if (v == "off") out = LogLevel::OFF;
    else return false;
    return true;
}

void Logger::enableConsole(bool enable) {
    consoleEnabled = enable;
}

void Logger::enableFile(bool enable) {
    fileEnabled = enable;
}

void Logger::setMaxFileSize(uint64_t bytes) {
    std::lock_guard<std::mutex> lock(logMutex);
    maxFileSize = bytes;
}

void Logger::setMaxFiles(uint32_t count) {
    std::lock_guard<std::mutex> lock(logMutex);
    maxFiles = count;
}

void Logger::debug(const std::string& msg) {
    writeLog(LogLevel::DEBUG, msg);
}

void Logger::info(const std::string& msg) {
    writeLog(LogLevel::INFO, msg);
}

void Logger::warn(const std::string& msg) {
    writeLog(LogLevel::WARN, msg);
}

void Logger::error(const std::string& msg) {
    writeLog(LogLevel::ERROR, msg);
}

void Logger::fatal(const std::string& msg) {
    writeLog(LogLevel::FATAL, msg);
}

std::vector<LogEntry> Logger::getRecentLogs(size_t count) {
    std::lock_guard<std::mutex> lock(logMutex);
    size_t start = recentLogs.size() > count ? recentLogs.size() - count : 0;
    return std::vector<LogEntry>(recentLogs.begin() + static_cast<std::ptrdiff_t>(start), recentLogs.end());
}

void Logger::clearLogs() {
    std::lock_guard<std::mutex> lock(logMutex);
    recentLogs.clear();
}

std::string Logger::redactPayload(const std::string& payload, size_t keep) {
    if (allowSensitive || payload.size() <= keep) {
        return payload;
    }
    return payload.substr(0, keep) + "...(" + std::to_string(payload.size()) + " bytes)";
}

}
}
