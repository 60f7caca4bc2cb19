// src/logging/logger.cpp
#include "logging/logger.h"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <chrono>
#include <ctime>

namespace photobooth::logging {

LogLevel parseLogLevel(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error" || lower == "err") return LogLevel::ERR;
    return LogLevel::INFO;
}

Logger::~Logger() {
    closeLogFile();
}

void Logger::initialize(const std::string& logDirectory, const std::string& logFileName) {
    std::lock_guard<std::mutex> lock(logMutex_);
    closeLogFile();
    logDirectory_ = logDirectory;
    logFileName_ = logFileName;

    std::error_code ec;
    std::filesystem::create_directories(logDirectory_, ec);
    if (ec) {
        std::cerr << "[WARN ] Cannot create log directory " << logDirectory_ << ": " << ec.message() << std::endl;
    }
    openLogFile();
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(logMutex_);
    closeLogFile();
    logFileName_.clear();
}

void Logger::log(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(logMutex_);
    if (level < minLevel_) {
        return;
    }

    std::cout << "[" << levelToString(level) << "] " << message << std::endl;

    if (logFileName_.empty()) {
        return;
    }
    if (!logFile_.is_open()) {
        openLogFile();
    }
    if (currentFileSize_ > MAX_FILE_SIZE) {
        rotate();
    }
    if (logFile_.is_open()) {
        std::string formatted = formatFileLine(level, message);
        logFile_ << formatted << std::endl;
        currentFileSize_ += formatted.length() + 1;
    }
}

void Logger::rotate() {
    closeLogFile();

    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::stringstream ss;
    ss << std::put_time(std::localtime(&time_t), "%Y%m%d_%H%M%S");
    std::string rotatedPath = logDirectory_ + "/" + logFileName_ + "." + ss.str();

    std::error_code ec;
    std::filesystem::rename(getLogFilePath(), rotatedPath, ec);
    if (ec) {
        std::cerr << "[WARN ] Log rotation failed: " << ec.message() << std::endl;
    }

    openLogFile();
}

std::string Logger::getLogFilePath() const {
    return logDirectory_ + "/" + logFileName_;
}

std::string Logger::formatFileLine(LogLevel level, const std::string& message) const {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::stringstream ss;
    ss << std::put_time(std::localtime(&time_t), "%Y-%m-%d %H:%M:%S");
    ss << "." << std::setfill('0') << std::setw(3) << ms.count();
    ss << " [" << levelToString(level) << "] " << message;
    return ss.str();
}

void Logger::openLogFile() {
    std::string path = getLogFilePath();
    logFile_.open(path, std::ios::app);
    if (logFile_.is_open()) {
        std::error_code ec;
        auto size = std::filesystem::file_size(path, ec);
        currentFileSize_ = ec ? 0 : size;
    }
}

void Logger::closeLogFile() {
    if (logFile_.is_open()) {
        logFile_.close();
    }
}

} // namespace photobooth::logging
