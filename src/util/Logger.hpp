#pragma once

#include <string>
#include <iostream>
#include <fstream>
#include <mutex>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <atomic>

namespace agegraph {
namespace util {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

/**
 * Logger singleton - centralised logging for every agegraph module
 */
class Logger {
public:
    static Logger& instance();

    // Configuration
    void setLevel(LogLevel level);
    LogLevel level() const;
    void setOutputStream(std::ostream* os);
    void enableFileLogging(const std::string& filepath);

    // Logging methods
    void debug(const std::string& message);
    void info(const std::string& message);
    void warn(const std::string& message);
    void error(const std::string& message);

    bool isEnabled(LogLevel level) const { return level >= m_level; }

    // Helpers
    static std::string levelToString(LogLevel level);

    /**
     * Parse a level name. Accepts DEBUG, INFO, WARN/WARNING, ERROR/CRITICAL
     * (case-insensitive). Throws ValidationError on anything else.
     */
    static LogLevel levelFromString(const std::string& name);

    static std::string truncate(const std::string& str, size_t maxLen = 500);

private:
    Logger();
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void log(LogLevel level, const std::string& message);
    std::string timestamp();

    std::atomic<LogLevel> m_level{LogLevel::INFO};
    std::ostream* m_output = &std::cerr;
    std::ofstream m_fileStream;
    mutable std::mutex m_mutex;
};

// Convenience macros
#define AGEGRAPH_LOG_DEBUG(msg) \
    do { if (::agegraph::util::Logger::instance().isEnabled(::agegraph::util::LogLevel::DEBUG)) \
        ::agegraph::util::Logger::instance().debug(msg); } while (0)
#define AGEGRAPH_LOG_INFO(msg) ::agegraph::util::Logger::instance().info(msg)
#define AGEGRAPH_LOG_WARN(msg) ::agegraph::util::Logger::instance().warn(msg)
#define AGEGRAPH_LOG_ERROR(msg) ::agegraph::util::Logger::instance().error(msg)

} // namespace util
} // namespace agegraph
