#pragma once

#include <string>
#include <iostream>
#include <fstream>
#include <mutex>
#include <chrono>
#include <atomic>
#include <unordered_map>

namespace flowrelay {
namespace server {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

/**
 * Logger singleton - centralised, thread-safe log output
 *
 * Used from the HTTP worker threads, the relay server threads and the
 * upstream read thread at the same time; every line is written under a
 * single mutex so lines never interleave.
 */
class Logger {
public:
    static Logger& instance();

    // Configuration
    void setLevel(LogLevel level) { m_level = level; }
    LogLevel level() const { return m_level; }
    void setOutputStream(std::ostream* os);
    void enableFileLogging(const std::string& filepath);
    void setColorEnabled(bool enabled) { m_color = enabled; }
    void setLogRequests(bool enabled) { m_logRequests = enabled; }
    void setLogResponses(bool enabled) { m_logResponses = enabled; }

    // Logging methods
    void debug(const std::string& message);
    void info(const std::string& message);
    void warn(const std::string& message);
    void error(const std::string& message);

    // Request/Response logging with request ID correlation
    uint64_t logRequest(const std::string& method, const std::string& target, const std::string& body = "");
    void logResponse(uint64_t requestId, int statusCode, const std::string& body, size_t bodySize = 0);

    // Helpers
    static std::string levelToString(LogLevel level);
    static LogLevel levelFromString(const std::string& level);
    static std::string formatSize(size_t bytes);

private:
    Logger() = default;
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void log(LogLevel level, const std::string& message);
    std::string timestamp();
    std::string truncate(const std::string& str, size_t maxLen = 500);

    std::atomic<LogLevel> m_level{LogLevel::INFO};
    std::ostream* m_output = &std::cout;
    std::ofstream m_fileStream;
    std::mutex m_mutex;
    std::atomic<bool> m_color{true};
    bool m_logRequests = true;
    bool m_logResponses = true;

    std::atomic<uint64_t> m_requestIdCounter{0};
    std::unordered_map<uint64_t, std::chrono::steady_clock::time_point> m_requestStartTimes;
};

// Convenience macros
#define LOG_DEBUG(msg) flowrelay::server::Logger::instance().debug(msg)
#define LOG_INFO(msg) flowrelay::server::Logger::instance().info(msg)
#define LOG_WARN(msg) flowrelay::server::Logger::instance().warn(msg)
#define LOG_ERROR(msg) flowrelay::server::Logger::instance().error(msg)

} // namespace server
} // namespace flowrelay
