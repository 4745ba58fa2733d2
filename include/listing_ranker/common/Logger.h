#pragma once

#include <atomic>
#include <fstream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>

namespace listing_ranker {

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARNING = 3,
    ERR = 4,     // ERROR collides with system macros
    NONE = 5
};

/**
 * Process-wide logger. Lines look like
 *   2026-01-31 14:05:09 [INFO] Ranked 20 candidates ...
 * and go to stderr, so stdout stays free for JSON output, plus an optional file.
 *
 * The level check is lock-free; writing a line takes the mutex, so scoring
 * workers may log concurrently.
 */
class Logger {
public:
    static Logger& getInstance();

    void init(LogLevel level = LogLevel::INFO, bool enableConsoleLogging = true, const std::string& logFilePath = "");

    // LOG_LEVEL and LOG_FILE; unset variables keep the current settings
    void initFromEnvironment();

    void setLogLevel(LogLevel level);
    LogLevel getLogLevel() const { return logLevel.load(); }

    bool isEnabled(LogLevel level) const;

    void log(LogLevel level, const std::string& message);

    void trace(const std::string& message) { log(LogLevel::TRACE, message); }
    void debug(const std::string& message) { log(LogLevel::DEBUG, message); }
    void info(const std::string& message) { log(LogLevel::INFO, message); }
    void warning(const std::string& message) { log(LogLevel::WARNING, message); }
    void error(const std::string& message) { log(LogLevel::ERR, message); }

    void close();

    ~Logger();

    // trace|debug|info|warn|warning|error|none, any case
    static std::optional<LogLevel> parseLevel(const std::string& name);
    static std::string levelName(LogLevel level);

private:
    Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::atomic<LogLevel> logLevel;
    bool logToConsole;
    bool logToFile;
    std::ofstream logFile;
    std::mutex mutex;
};

} // namespace listing_ranker

#define LOG_TRACE(message) ::listing_ranker::Logger::getInstance().trace(message)
#define LOG_DEBUG(message) ::listing_ranker::Logger::getInstance().debug(message)
#define LOG_INFO(message) ::listing_ranker::Logger::getInstance().info(message)
#define LOG_WARNING(message) ::listing_ranker::Logger::getInstance().warning(message)
#define LOG_ERROR(message) ::listing_ranker::Logger::getInstance().error(message)

// Stream-style variants only build the message when the level is enabled
#define LISTING_RANKER_LOG_STREAM(level, message) \
    do { \
        if (::listing_ranker::Logger::getInstance().isEnabled(level)) { \
            std::ostringstream listingRankerLogStream; \
            listingRankerLogStream << message; \
            ::listing_ranker::Logger::getInstance().log(level, listingRankerLogStream.str()); \
        } \
    } while (0)

#define LOG_TRACE_STREAM(message) LISTING_RANKER_LOG_STREAM(::listing_ranker::LogLevel::TRACE, message)
#define LOG_DEBUG_STREAM(message) LISTING_RANKER_LOG_STREAM(::listing_ranker::LogLevel::DEBUG, message)
#define LOG_INFO_STREAM(message) LISTING_RANKER_LOG_STREAM(::listing_ranker::LogLevel::INFO, message)
#define LOG_WARNING_STREAM(message) LISTING_RANKER_LOG_STREAM(::listing_ranker::LogLevel::WARNING, message)
#define LOG_ERROR_STREAM(message) LISTING_RANKER_LOG_STREAM(::listing_ranker::LogLevel::ERR, message)
