#include "../../include/listing_ranker/common/Logger.h"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace listing_ranker {

namespace {

std::string currentTimestamp() {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);
    std::ostringstream out;
    out << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    return out.str();
}

} // namespace

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::Logger() : logLevel(LogLevel::INFO), logToConsole(true), logToFile(false) {
}

Logger::~Logger() {
    close();
}

void Logger::init(LogLevel level, bool enableConsoleLogging, const std::string& logFilePath) {
    std::lock_guard<std::mutex> lock(mutex);
    logLevel = level;
    logToConsole = enableConsoleLogging;

    if (logFile.is_open()) {
        logFile.close();
    }
    logToFile = false;
    if (logFilePath.empty()) {
        return;
    }
    logFile.open(logFilePath, std::ios::out | std::ios::app);
    logToFile = logFile.is_open();
    if (!logToFile) {
        std::cerr << currentTimestamp() << " [WARN] Could not open log file: " << logFilePath << std::endl;
    }
}

void Logger::initFromEnvironment() {
    LogLevel level = logLevel;
    if (const char* levelEnv = std::getenv("LOG_LEVEL")) {
        if (auto parsed = parseLevel(levelEnv)) {
            level = *parsed;
        } else {
            std::cerr << currentTimestamp() << " [WARN] Ignoring unknown LOG_LEVEL: " << levelEnv << std::endl;
        }
    }
    const char* fileEnv = std::getenv("LOG_FILE");
    init(level, true, fileEnv ? fileEnv : "");
}

void Logger::setLogLevel(LogLevel level) {
    logLevel = level;
}

bool Logger::isEnabled(LogLevel level) const {
    return level != LogLevel::NONE && level >= logLevel.load();
}

void Logger::log(LogLevel level, const std::string& message) {
    if (!isEnabled(level)) {
        return;
    }
    std::string line = currentTimestamp() + " [" + levelName(level) + "] " + message;

    std::lock_guard<std::mutex> lock(mutex);
    if (logToConsole) {
        std::cerr << line << std::endl;
    }
    if (logToFile && logFile.is_open()) {
        logFile << line << std::endl;
    }
}

void Logger::close() {
    std::lock_guard<std::mutex> lock(mutex);
    if (logFile.is_open()) {
        logFile.close();
    }
    logToFile = false;
}

std::optional<LogLevel> Logger::parseLevel(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return LogLevel::TRACE;
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warn" || lower == "warning") return LogLevel::WARNING;
    if (lower == "error" || lower == "err") return LogLevel::ERR;
    if (lower == "none" || lower == "off") return LogLevel::NONE;
    return std::nullopt;
}

std::string Logger::levelName(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERR: return "ERROR";
        case LogLevel::NONE: return "NONE";
    }
    return "UNKNOWN";
}

} // namespace listing_ranker
