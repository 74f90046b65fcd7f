#include "Logger.h"
#include <chrono>
#include <iomanip>
#include <sstream>
#include <filesystem>
#include <algorithm>
#include <cctype>
#include <ctime>

namespace QuietSync {

    std::optional<LogLevel> parseLogLevel(const std::string& name) {
        std::string lower = name;
        std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
        if (lower == "debug") return LogLevel::DEBUG;
        if (lower == "info") return LogLevel::INFO;
        if (lower == "warn" || lower == "warning") return LogLevel::WARN;
        if (lower == "error") return LogLevel::ERROR;
        if (lower == "critical") return LogLevel::CRITICAL;
        return std::nullopt;
    }

    Logger& Logger::instance() {
        static Logger instance;
        return instance;
    }

    Logger::~Logger() {
        if (logFile_.is_open()) {
            logFile_.close();
        }
    }

    void Logger::setLogFile(const std::string& path) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (logFile_.is_open()) {
            logFile_.close();
        }
        logFilePath_ = path;
        logFile_.open(path, std::ios::app);
        currentFileSize_ = getFileSize();
    }

    void Logger::setMaxFileSize(size_t maxSizeMB) {
        std::lock_guard<std::mutex> lock(mutex_);
        maxFileBytes_ = std::min(maxSizeMB, qsync::config::MAX_LOG_FILE_SIZE_MB) * 1024 * 1024;
    }

    void Logger::setComponent(const std::string& component) {
        std::lock_guard<std::mutex> lock(mutex_);
        defaultComponent_ = component;
    }

    void Logger::setConsoleOutput(bool enabled) {
        std::lock_guard<std::mutex> lock(mutex_);
        consoleOutput_ = enabled;
    }

    void Logger::setLevel(LogLevel level) {
        currentLevel_ = level;
    }

    void Logger::log(LogLevel level, const std::string& message, const std::string& component) {
        if (level < currentLevel_) {
            return;
        }

        std::string rotatedTo;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            std::string timestamp = getCurrentTime();
            std::string levelStr = levelToString(level);
            std::string comp = component.empty() ? defaultComponent_ : component;

            std::string logEntry = "[" + timestamp + "] [" + levelStr + "] [" + comp + "] " + message;

            // Console output goes to stderr so stdout stays free for command output
            if (consoleOutput_) {
                if (level == LogLevel::ERROR || level == LogLevel::CRITICAL) {
                    std::cerr << "\033[1;31m" << logEntry << "\033[0m" << std::endl;
                } else if (level == LogLevel::WARN) {
                    std::cerr << "\033[1;33m" << logEntry << "\033[0m" << std::endl;
                } else {
                    std::cerr << logEntry << std::endl;
                }
            }

            if (logFile_.is_open()) {
                logFile_ << logEntry << std::endl;
                logFile_.flush();
                currentFileSize_ += logEntry.length() + 1; // +1 for newline
                if (currentFileSize_ > maxFileBytes_) {
                    rotatedTo = rotateLogFile();
                }
            }
        }

        if (!rotatedTo.empty()) {
            log(LogLevel::INFO, "Log file rotated to: " + rotatedTo, "Logger");
        }
    }

    void Logger::debug(const std::string& message, const std::string& component) {
        log(LogLevel::DEBUG, message, component);
    }

    void Logger::info(const std::string& message, const std::string& component) {
        log(LogLevel::INFO, message, component);
    }

    void Logger::warn(const std::string& message, const std::string& component) {
        log(LogLevel::WARN, message, component);
    }

    void Logger::error(const std::string& message, const std::string& component) {
        log(LogLevel::ERROR, message, component);
    }

    void Logger::critical(const std::string& message, const std::string& component) {
        log(LogLevel::CRITICAL, message, component);
    }

    std::string Logger::levelToString(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO: return "INFO";
            case LogLevel::WARN: return "WARN";
            case LogLevel::ERROR: return "ERROR";
            case LogLevel::CRITICAL: return "CRITICAL";
            default: return "UNKNOWN";
        }
    }

    std::string Logger::getCurrentTime() {
        auto now = std::chrono::system_clock::now();
        auto in_time_t = std::chrono::system_clock::to_time_t(now);

        std::stringstream ss;
        struct tm tm_buf;
        localtime_r(&in_time_t, &tm_buf);
        ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
        return ss.str();
    }

    // Caller holds mutex_. Returns the rotated path, or empty if nothing was rotated.
    std::string Logger::rotateLogFile() {
        if (!logFile_.is_open() || logFilePath_.empty()) {
            return "";
        }

        logFile_.close();

        auto now = std::chrono::system_clock::now();
        auto in_time_t = std::chrono::system_clock::to_time_t(now);
        std::stringstream ss;
        struct tm tm_buf;
        localtime_r(&in_time_t, &tm_buf);
        ss << std::put_time(&tm_buf, "%Y%m%d_%H%M%S");

        std::string rotatedPath = logFilePath_ + "." + ss.str();

        std::error_code ec;
        std::filesystem::rename(logFilePath_, rotatedPath, ec);
        if (ec) {
            std::cerr << "Failed to rotate log file: " << ec.message() << std::endl;
            rotatedPath.clear();
        }

        logFile_.open(logFilePath_, std::ios::app);
        currentFileSize_ = getFileSize();
        return rotatedPath;
    }

    size_t Logger::getFileSize() {
        std::error_code ec;
        if (logFilePath_.empty() || !std::filesystem::exists(logFilePath_, ec)) {
            return 0;
        }
        auto size = std::filesystem::file_size(logFilePath_, ec);
        return ec ? 0 : static_cast<size_t>(size);
    }

}
