// include/logging/logger.h
#pragma once

#include <fstream>
#include <iostream>
#include <string>
#include <mutex>
#include <cstdint>
#include <cstddef>

namespace photobooth::logging {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERR
};

LogLevel parseLogLevel(const std::string& name);

// Process-wide logger. Console always, file once initialize() has been called.
class Logger {
public:
    static Logger& getInstance() {
        static Logger instance;
        return instance;
    }

    // Enable file output: <logDirectory>/<logFileName>, rotated past MAX_FILE_SIZE
    void initialize(const std::string& logDirectory, const std::string& logFileName);

    void shutdown();

    void setMinLevel(LogLevel level) {
        std::lock_guard<std::mutex> lock(logMutex_);
        minLevel_ = level;
    }

    void log(LogLevel level, const std::string& message);

    void debug(const std::string& message) { log(LogLevel::DEBUG, message); }
    void info(const std::string& message) { log(LogLevel::INFO, message); }
    void warn(const std::string& message) { log(LogLevel::WARN, message); }
    void error(const std::string& message) { log(LogLevel::ERR, message); }

private:
    Logger() = default;
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static constexpr std::uintmax_t MAX_FILE_SIZE = 10 * 1024 * 1024;

    const char* levelToString(LogLevel level) const {
        switch (level) {
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO:  return "INFO ";
            case LogLevel::WARN:  return "WARN ";
            case LogLevel::ERR: return "ERROR";
            default: return "UNKNOWN";
        }
    }

    std::string formatFileLine(LogLevel level, const std::string& message) const;
    std::string getLogFilePath() const;
    void openLogFile();
    void closeLogFile();
    void rotate();

    std::mutex logMutex_;
    LogLevel minLevel_{LogLevel::INFO};
    std::string logDirectory_;
    std::string logFileName_;
    std::ofstream logFile_;
    std::uintmax_t currentFileSize_{0};
};

} // namespace photobooth::logging
