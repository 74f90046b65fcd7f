#include "CliApp.h"
#include "ByteSource.h"
#include "CliOptions.h"
#include "Constants.h"
#include "DiffCopyEngine.h"
#include "LoggerMacros.h"
#include "SHA256.h"
#include "Version.h"
#include <iostream>
#include <memory>

namespace QuietSync {

namespace {

const char* const COMPONENT = "CLI";

void printStats(const std::string& destination, const CopyStats& stats) {
    std::cout << "destination:      " << destination << "\n"
              << "bytes copied:     " << stats.bytesCopied << "\n"
              << "bytes unchanged:  " << stats.bytesMatched << "\n"
              << "bytes written:    " << stats.bytesWritten << " (" << stats.writeCalls << " writes)\n"
              << "chunks compared:  " << stats.chunksCompared << "\n";
    if (stats.divergence) {
        std::cout << "first divergence: offset " << stats.divergenceOffset
                  << " (" << chunkOutcomeToString(*stats.divergence) << ")\n";
    } else {
        std::cout << "first divergence: none\n";
    }
    std::cout << "length:           " << stats.initialLength << " -> " << stats.finalLength
              << (stats.truncated ? " (truncated)" : "") << "\n"
              << "synced:           " << (stats.synced ? "yes" : "no") << std::endl;
}

qsync::Result<RunSettings> loadSettings(const CliOptions& options) {
    Config config;
    if (!options.configPath.empty()) {
        auto loaded = config.loadFromFile(options.configPath);
        if (!loaded) {
            return loaded.error();
        }
    } else {
        auto loaded = config.loadLayered(defaultConfigPaths());
        if (!loaded) {
            return loaded.error();
        }
    }
    return resolveSettings(config, options);
}

void configureLogger(const RunSettings& settings) {
    auto& logger = Logger::instance();
    logger.setComponent(COMPONENT);
    logger.setLevel(settings.logLevel);
    logger.setMaxFileSize(settings.logMaxSizeMB);
    if (!settings.logFile.empty()) {
        logger.setLogFile(settings.logFile);
    }
}

// Engine failures are logged by the engine; everything else is logged here
qsync::Result<void> synchronize(const CliOptions& options, const RunSettings& settings, int stdinFd) {
    std::unique_ptr<ByteSource> input;
    if (options.source == "-") {
        input = std::make_unique<FdSource>(stdinFd, "stdin");
    } else {
        auto opened = FileSource::open(options.source);
        if (!opened) {
            QS_LOG_ERROR_COMP(opened.error().toString(), COMPONENT);
            return opened.error();
        }
        input = std::move(*opened);
    }

    std::unique_ptr<HashingSource> hasher;
    ByteSource* source = input.get();
    if (settings.verify) {
        hasher = std::make_unique<HashingSource>(*input);
        source = hasher.get();
    }

    CopyOptions copyOptions;
    copyOptions.bufferSize = settings.bufferSize;
    copyOptions.syncOnChange = settings.syncOnChange;
    DiffCopyEngine engine(copyOptions);

    qsync::Result<uint64_t> copied = [&]() {
        QS_SCOPED_TIMER_COMP("Copy to " + options.destination, COMPONENT);
        return engine.copy(*source, options.destination);
    }();
    if (!copied) {
        return copied.error();
    }

    const CopyStats& stats = engine.lastStats();
    QS_LOG_INFO_COMP_IF(options.destination + ": " + std::to_string(*copied) + " bytes, " +
                        (stats.changed() ? std::to_string(stats.bytesWritten) + " written"
                                         : std::string("unchanged")), COMPONENT);

    if (hasher) {
        std::string expected = hasher->digest();
        std::string actual = SHA256::hashFile(options.destination);
        if (expected.empty() || actual.empty()) {
            qsync::Error error{qsync::ErrorCode::IoError,
                "Could not compute SHA-256 for verification of " + options.destination};
            QS_LOG_ERROR_COMP(error.message, COMPONENT);
            return error;
        }
        if (expected != actual) {
            qsync::Error error{qsync::ErrorCode::VerificationFailed,
                "Verification failed for " + options.destination +
                ": expected " + expected + ", found " + actual};
            QS_LOG_ERROR_COMP(error.message, COMPONENT);
            return error;
        }
        QS_LOG_INFO_COMP_IF("Verified " + options.destination + " (sha256 " + actual + ")", COMPONENT);
    }

    if (options.printStats) {
        printStats(options.destination, stats);
    }
    return qsync::Ok();
}

} // namespace

int exitCodeFor(const qsync::Error& error) {
    switch (error.code) {
        case qsync::ErrorCode::InvalidArgument:
        case qsync::ErrorCode::InvalidConfig:
        case qsync::ErrorCode::MissingConfig:
            return qsync::config::EXIT_USAGE;
        case qsync::ErrorCode::VerificationFailed:
            return qsync::config::EXIT_VERIFY_MISMATCH;
        case qsync::ErrorCode::IoError:
        case qsync::ErrorCode::InternalError:
            return qsync::config::EXIT_IO_FAILURE;
    }
    return qsync::config::EXIT_IO_FAILURE;
}

int runCli(const std::vector<std::string>& args, int stdinFd) {
    auto parsed = parseArguments(args);
    if (!parsed) {
        std::cerr << "quietsync: " << parsed.error().message << "\n\n" << usageText();
        return exitCodeFor(parsed.error());
    }
    const CliOptions& options = *parsed;

    if (options.showHelp) {
        std::cout << usageText();
        return qsync::config::EXIT_OK;
    }
    if (options.showVersion) {
        std::cout << Version::toString() << std::endl;
        return qsync::config::EXIT_OK;
    }

    // The logger is not configured yet, so settings problems go straight to stderr
    auto settings = loadSettings(options);
    if (!settings) {
        std::cerr << "quietsync: " << settings.error().message << std::endl;
        return exitCodeFor(settings.error());
    }
    configureLogger(*settings);

    auto result = synchronize(options, *settings, stdinFd);
    if (!result) {
        return exitCodeFor(result.error());
    }
    return qsync::config::EXIT_OK;
}

} // namespace QuietSync
