#include "CliOptions.h"
#include "Constants.h"
#include <cstdlib>
#include <sstream>
#include <unordered_map>

namespace QuietSync {

namespace {

// Decimal digits only, between 1 and `max`
std::optional<size_t> parseBoundedSize(const std::string& value, size_t max) {
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
        return std::nullopt;
    }
    try {
        unsigned long long parsed = std::stoull(value);
        if (parsed == 0 || parsed > max) {
            return std::nullopt;
        }
        return static_cast<size_t>(parsed);
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

std::optional<size_t> parseBufferSize(const std::string& value) {
    return parseBoundedSize(value, qsync::config::MAX_BUFFER_SIZE);
}

} // namespace

qsync::Result<CliOptions> parseArguments(const std::vector<std::string>& args) {
    CliOptions options;
    std::vector<std::string> positional;

    auto needValue = [&](size_t& i) -> std::optional<std::string> {
        if (i + 1 >= args.size()) return std::nullopt;
        return args[++i];
    };

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "-h" || arg == "--help") {
            options.showHelp = true;
        } else if (arg == "--version") {
            options.showVersion = true;
        } else if (arg == "-c" || arg == "--config") {
            auto value = needValue(i);
            if (!value) return qsync::Err<CliOptions>(qsync::ErrorCode::InvalidArgument, arg + " requires a file");
            options.configPath = *value;
        } else if (arg == "-b" || arg == "--buffer-size") {
            auto value = needValue(i);
            if (!value) return qsync::Err<CliOptions>(qsync::ErrorCode::InvalidArgument, arg + " requires a size");
            auto size = parseBufferSize(*value);
            if (!size) {
                return qsync::Err<CliOptions>(qsync::ErrorCode::InvalidArgument,
                    "Invalid buffer size: " + *value);
            }
            options.bufferSize = size;
        } else if (arg == "--verify") {
            options.verify = true;
        } else if (arg == "--sync") {
            options.syncOnChange = true;
        } else if (arg == "--stats") {
            options.printStats = true;
        } else if (arg == "-v" || arg == "--verbose") {
            options.logLevel = LogLevel::DEBUG;
        } else if (arg == "-q" || arg == "--quiet") {
            options.logLevel = LogLevel::WARN;
        } else if (arg == "--log-file") {
            auto value = needValue(i);
            if (!value) return qsync::Err<CliOptions>(qsync::ErrorCode::InvalidArgument, arg + " requires a path");
            options.logFile = *value;
        } else if (arg == "-") {
            positional.push_back(arg);
        } else if (!arg.empty() && arg[0] == '-') {
            return qsync::Err<CliOptions>(qsync::ErrorCode::InvalidArgument, "Unknown option: " + arg);
        } else {
            positional.push_back(arg);
        }
    }

    if (options.showHelp || options.showVersion) {
        return options;
    }

    if (positional.size() != 2) {
        return qsync::Err<CliOptions>(qsync::ErrorCode::InvalidArgument,
            "Expected <source> and <destination>");
    }
    options.source = positional[0];
    options.destination = positional[1];
    return options;
}

std::vector<std::string> defaultConfigPaths() {
    std::vector<std::string> paths{"/etc/quietsync/quietsync.conf"};
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        paths.push_back(std::string(xdg) + "/quietsync/quietsync.conf");
    } else if (const char* home = std::getenv("HOME"); home && *home) {
        paths.push_back(std::string(home) + "/.config/quietsync/quietsync.conf");
    }
    return paths;
}

qsync::Result<RunSettings> resolveSettings(const Config& config, const CliOptions& options) {
    std::unordered_map<std::string, Config::Validator> schema;
    schema["buffer_size"] = [](const std::string& v) { return parseBufferSize(v).has_value(); };
    schema["log_level"] = [](const std::string& v) { return parseLogLevel(v).has_value(); };
    schema["log_max_size_mb"] = [](const std::string& v) {
        return parseBoundedSize(v, qsync::config::MAX_LOG_FILE_SIZE_MB).has_value();
    };
    schema["verify"] = [](const std::string& v) { return parseBool(v).has_value(); };
    schema["sync_on_change"] = [](const std::string& v) { return parseBool(v).has_value(); };

    auto valid = config.validate(schema);
    if (!valid) {
        return valid.error();
    }

    RunSettings settings;
    settings.bufferSize = config.getSize("buffer_size", qsync::config::DEFAULT_BUFFER_SIZE);
    settings.verify = config.getBool("verify", false);
    settings.syncOnChange = config.getBool("sync_on_change", false);
    settings.logLevel = parseLogLevel(config.get("log_level", "info")).value_or(LogLevel::INFO);
    settings.logFile = config.get("log_file", "");
    settings.logMaxSizeMB = config.getSize("log_max_size_mb", qsync::config::DEFAULT_LOG_FILE_SIZE_MB);

    if (options.bufferSize) settings.bufferSize = *options.bufferSize;
    if (options.verify) settings.verify = *options.verify;
    if (options.syncOnChange) settings.syncOnChange = *options.syncOnChange;
    if (options.logLevel) settings.logLevel = *options.logLevel;
    if (!options.logFile.empty()) settings.logFile = options.logFile;

    return settings;
}

std::string usageText() {
    std::ostringstream out;
    out << "Usage: quietsync [options] <source|-> <destination>\n"
        << "\n"
        << "Make <destination> identical to <source>, writing only from the first\n"
        << "differing chunk on. Use '-' to read the source from stdin.\n"
        << "\n"
        << "Options:\n"
        << "  -c, --config <file>       Read settings from a key=value file\n"
        << "  -b, --buffer-size <bytes> Chunk size used for comparison (default 8192)\n"
        << "      --verify              Check the destination's SHA-256 after copying\n"
        << "      --sync                fsync the destination if it changed\n"
        << "      --stats               Print what was compared and written\n"
        << "  -v, --verbose             Debug logging\n"
        << "  -q, --quiet               Only warnings and errors\n"
        << "      --log-file <path>     Also append log lines to a file\n"
        << "  -h, --help                Show this help\n"
        << "      --version             Show version\n";
    return out.str();
}

} // namespace QuietSync
