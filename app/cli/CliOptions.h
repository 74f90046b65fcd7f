#pragma once

#include "Config.h"
#include "Logger.h"
#include "Result.h"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace QuietSync {

/**
 * @brief Flags given on the command line; unset fields fall back to the config file
 */
struct CliOptions {
    std::string source;        // Path, or "-" for stdin
    std::string destination;
    std::string configPath;
    std::optional<size_t> bufferSize;
    std::optional<bool> verify;
    std::optional<bool> syncOnChange;
    std::optional<LogLevel> logLevel;
    std::string logFile;
    bool printStats = false;
    bool showHelp = false;
    bool showVersion = false;
};

/**
 * @brief Effective settings after merging config file and flags
 */
struct RunSettings {
    size_t bufferSize = 0;
    bool verify = false;
    bool syncOnChange = false;
    LogLevel logLevel = LogLevel::INFO;
    std::string logFile;
    size_t logMaxSizeMB = 0;
};

qsync::Result<CliOptions> parseArguments(const std::vector<std::string>& args);

/// Files consulted when no --config is given, lowest priority first
std::vector<std::string> defaultConfigPaths();

/// Validates the config values and applies the flag overrides
qsync::Result<RunSettings> resolveSettings(const Config& config, const CliOptions& options);

std::string usageText();

} // namespace QuietSync
