#pragma once

#include <string>
#include <mutex>
#include <fstream>
#include <iostream>
#include <optional>
#include "Constants.h"

namespace QuietSync {

    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR,
        CRITICAL
    };

    /// Parse "debug", "info", "warn", "error" or "critical" (case-insensitive)
    std::optional<LogLevel> parseLogLevel(const std::string& name);

    class Logger {
    public:
        static Logger& instance();

        void setLogFile(const std::string& path);
        void setLevel(LogLevel level);
        void setMaxFileSize(size_t maxSizeMB); // Rotation threshold, clamped to MAX_LOG_FILE_SIZE_MB
        void setComponent(const std::string& component); // Set default component name
        void setConsoleOutput(bool enabled);

        // Level checking for conditional logging (avoid string construction overhead)
        bool isDebugEnabled() const { return currentLevel_ <= LogLevel::DEBUG; }
        bool isInfoEnabled() const { return currentLevel_ <= LogLevel::INFO; }
        LogLevel getLevel() const { return currentLevel_; }

        void log(LogLevel level, const std::string& message, const std::string& component = "");

        // Helper methods
        void debug(const std::string& message, const std::string& component = "");
        void info(const std::string& message, const std::string& component = "");
        void warn(const std::string& message, const std::string& component = "");
        void error(const std::string& message, const std::string& component = "");
        void critical(const std::string& message, const std::string& component = "");

    private:
        Logger() = default;
        ~Logger();

        std::mutex mutex_;
        std::ofstream logFile_;
        std::string logFilePath_;
        LogLevel currentLevel_ = LogLevel::INFO;
        std::string defaultComponent_ = "Core";
        size_t maxFileBytes_ = qsync::config::DEFAULT_LOG_FILE_SIZE_MB * 1024 * 1024;
        size_t currentFileSize_ = 0;
        bool consoleOutput_ = true;

        std::string levelToString(LogLevel level);
        std::string getCurrentTime();
        std::string rotateLogFile();
        size_t getFileSize();
    };

}
