#include "DiffCopyEngine.h"
#include "LoggerMacros.h"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace QuietSync {

namespace {
    const char* const COMPONENT = "DiffCopy";
}

const char* chunkOutcomeToString(ChunkOutcome outcome) {
    switch (outcome) {
        case ChunkOutcome::Match: return "match";
        case ChunkOutcome::ContentMismatch: return "content mismatch";
        case ChunkOutcome::DestinationLonger: return "destination longer";
        case ChunkOutcome::DestinationShorter: return "destination shorter";
    }
    return "unknown";
}

ChunkOutcome classifyChunk(const uint8_t* source, size_t sourceRead,
                           const uint8_t* destination, size_t destinationRead) {
    if (destinationRead < sourceRead) {
        return ChunkOutcome::DestinationShorter;
    }
    if (destinationRead > sourceRead) {
        return ChunkOutcome::DestinationLonger;
    }
    if (sourceRead == 0 || std::memcmp(source, destination, sourceRead) == 0) {
        return ChunkOutcome::Match;
    }
    return ChunkOutcome::ContentMismatch;
}

DiffCopyEngine::DiffCopyEngine(CopyOptions options)
    : options_(options),
      bufferSize_(options.bufferSize == 0 ? qsync::config::DEFAULT_BUFFER_SIZE : options.bufferSize) {}

qsync::Result<uint64_t> DiffCopyEngine::copy(ByteSource& source, const std::string& destinationPath) {
    stats_ = CopyStats{};
    destinationPath_ = destinationPath;

    auto result = runCopy(source);
    if (!result) {
        QS_LOG_ERROR_COMP("Copy to " + destinationPath + " failed: " + result.error().toString(), COMPONENT);
        return result;
    }

    QS_LOG_DEBUG_COMP_IF(destinationPath + ": " + std::to_string(stats_.bytesCopied) + " bytes, " +
                         std::to_string(stats_.bytesWritten) + " written, " +
                         std::to_string(stats_.bytesMatched) + " unchanged", COMPONENT);
    return result;
}

qsync::Result<uint64_t> DiffCopyEngine::runCopy(ByteSource& source) {
    qsync::FileGuard destination(::open(destinationPath_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC,
                                        qsync::config::DEFAULT_FILE_MODE));
    if (!destination) {
        return qsync::ioError("Failed to open destination " + destinationPath_, errno);
    }

    struct stat st;
    if (::fstat(destination.get(), &st) < 0) {
        return qsync::ioError("Failed to stat destination " + destinationPath_, errno);
    }
    stats_.initialLength = static_cast<uint64_t>(st.st_size);

    std::vector<uint8_t> sourceBuffer(bufferSize_);
    std::vector<uint8_t> destinationBuffer(bufferSize_);
    uint64_t bytesCopied = 0;

    for (;;) {
        auto sourceRead = source.read(sourceBuffer.data(), bufferSize_);
        if (!sourceRead) {
            return sourceRead.error();
        }
        if (*sourceRead == 0) {
            break;
        }

        // The destination cursor sits at bytesCopied here
        auto destinationRead = readDestination(destination.get(), destinationBuffer.data(), bufferSize_);
        if (!destinationRead) {
            return destinationRead.error();
        }
        ++stats_.chunksCompared;

        const size_t length = *sourceRead;
        ChunkOutcome outcome = classifyChunk(sourceBuffer.data(), length,
                                             destinationBuffer.data(), *destinationRead);
        if (outcome == ChunkOutcome::Match) {
            bytesCopied += length;
            stats_.bytesMatched += length;
            continue;
        }

        stats_.divergence = outcome;
        stats_.divergenceOffset = bytesCopied;
        QS_LOG_DEBUG_COMP_IF("Divergence at offset " + std::to_string(bytesCopied) + " (" +
                             chunkOutcomeToString(outcome) + ", source " + std::to_string(length) +
                             " bytes, destination " + std::to_string(*destinationRead) + " bytes)", COMPONENT);

        auto rewritten = rewriteChunk(destination.get(), bytesCopied, sourceBuffer.data(), length);
        if (!rewritten) {
            return rewritten.error();
        }
        bytesCopied += length;

        // Past the first divergence the rest of the source is written without
        // comparing. For DestinationLonger the source is normally exhausted and
        // this reads nothing, but a short source read can land there early.
        auto remaining = copyRemaining(source, destination.get(), sourceBuffer);
        if (!remaining) {
            return remaining.error();
        }
        bytesCopied += *remaining;
        break;
    }

    auto finalized = finalizeLength(destination.get(), bytesCopied);
    if (!finalized) {
        return finalized.error();
    }
    stats_.bytesCopied = bytesCopied;
    stats_.finalLength = bytesCopied;

    if (options_.syncOnChange && stats_.changed()) {
        if (::fsync(destination.get()) < 0) {
            return qsync::ioError("Failed to sync destination " + destinationPath_, errno);
        }
        stats_.synced = true;
    }

    return bytesCopied;
}

qsync::Result<size_t> DiffCopyEngine::readDestination(int fd, uint8_t* buffer, size_t capacity) {
    for (;;) {
        ssize_t n = ::read(fd, buffer, capacity);
        if (n >= 0) {
            return static_cast<size_t>(n);
        }
        if (errno != EINTR) {
            return qsync::ioError("Failed to read destination " + destinationPath_, errno);
        }
    }
}

qsync::Result<void> DiffCopyEngine::rewriteChunk(int fd, uint64_t chunkStart, const uint8_t* data, size_t length) {
    if (::lseek(fd, static_cast<off_t>(chunkStart), SEEK_SET) < 0) {
        return qsync::ioError("Failed to seek destination " + destinationPath_, errno);
    }
    return writeAll(fd, data, length);
}

qsync::Result<uint64_t> DiffCopyEngine::copyRemaining(ByteSource& source, int fd, std::vector<uint8_t>& buffer) {
    uint64_t copied = 0;
    for (;;) {
        auto count = source.read(buffer.data(), buffer.size());
        if (!count) {
            return count.error();
        }
        if (*count == 0) {
            return copied;
        }
        auto written = writeAll(fd, buffer.data(), *count);
        if (!written) {
            return written.error();
        }
        copied += *count;
    }
}

qsync::Result<void> DiffCopyEngine::writeAll(int fd, const uint8_t* data, size_t length) {
    while (length > 0) {
        ssize_t n = ::write(fd, data, length);
        if (n < 0) {
            if (errno == EINTR) continue;
            return qsync::ioError("Failed to write destination " + destinationPath_, errno);
        }
        if (n == 0) {
            return qsync::ioError("Failed to write destination " + destinationPath_, EIO);
        }
        ++stats_.writeCalls;
        stats_.bytesWritten += static_cast<uint64_t>(n);
        data += n;
        length -= static_cast<size_t>(n);
    }
    return qsync::Ok();
}

qsync::Result<void> DiffCopyEngine::finalizeLength(int fd, uint64_t length) {
    struct stat st;
    if (::fstat(fd, &st) < 0) {
        return qsync::ioError("Failed to stat destination " + destinationPath_, errno);
    }
    // Skipped when already right so an unchanged file keeps its mtime
    if (static_cast<uint64_t>(st.st_size) == length) {
        return qsync::Ok();
    }
    if (::ftruncate(fd, static_cast<off_t>(length)) < 0) {
        return qsync::ioError("Failed to truncate destination " + destinationPath_, errno);
    }
    stats_.truncated = true;
    QS_LOG_DEBUG_COMP_IF("Truncated " + destinationPath_ + " from " + std::to_string(st.st_size) +
                         " to " + std::to_string(length) + " bytes", COMPONENT);
    return qsync::Ok();
}

qsync::Result<uint64_t> diffCopy(ByteSource& source, const std::string& destinationPath,
                                 const CopyOptions& options) {
    DiffCopyEngine engine(options);
    return engine.copy(source, destinationPath);
}

} // namespace QuietSync
