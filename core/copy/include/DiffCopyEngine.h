#pragma once

/**
 * @file DiffCopyEngine.h
 * @brief Brings a destination file in line with a byte stream, writing as little as possible
 *
 * The source and the destination are read in lockstep, one chunk at a time.
 * Nothing is written while the chunks agree. From the first chunk that
 * differs (in content or in length) the source is written through, and the
 * destination is finally cut to the number of bytes the source produced.
 *
 * Not safe against other writers of the same destination. Independent
 * engines on different destinations may run on separate threads.
 */

#include "ByteSource.h"
#include "Constants.h"
#include "Result.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace QuietSync {

/**
 * @brief Result of comparing one source chunk with the destination bytes at the same offset
 */
enum class ChunkOutcome {
    Match,              ///< Same length, same bytes
    ContentMismatch,    ///< Same length, different bytes
    DestinationLonger,  ///< Destination delivered more bytes than the source
    DestinationShorter  ///< Destination delivered fewer bytes (includes end of file)
};

const char* chunkOutcomeToString(ChunkOutcome outcome);

/**
 * @brief Three-way comparison of the read counts, then of the content
 */
ChunkOutcome classifyChunk(const uint8_t* source, size_t sourceRead,
                           const uint8_t* destination, size_t destinationRead);

struct CopyOptions {
    /// Bytes compared per step; 0 selects the default
    size_t bufferSize = qsync::config::DEFAULT_BUFFER_SIZE;
    /// fsync the destination after a copy that changed it
    bool syncOnChange = false;
};

/**
 * @brief What the last copy() did to the destination
 */
struct CopyStats {
    uint64_t bytesCopied{0};     // Final destination length
    uint64_t bytesMatched{0};    // Compared equal and left untouched
    uint64_t bytesWritten{0};
    uint64_t writeCalls{0};
    uint64_t chunksCompared{0};
    std::optional<ChunkOutcome> divergence;  // Empty when every compared chunk matched
    uint64_t divergenceOffset{0};
    uint64_t initialLength{0};
    uint64_t finalLength{0};
    bool truncated{false};
    bool synced{false};

    bool changed() const { return bytesWritten > 0 || initialLength != finalLength; }
};

class DiffCopyEngine {
public:
    explicit DiffCopyEngine(CopyOptions options = CopyOptions{});

    /**
     * @brief Make the file at destinationPath hold exactly the bytes of source
     *
     * The destination is created (mode 0644) if missing and never truncated
     * up front. On failure the destination is left as the last completed
     * write made it.
     *
     * @return Number of bytes the source produced, which is now the
     *         destination's length
     */
    qsync::Result<uint64_t> copy(ByteSource& source, const std::string& destinationPath);

    const CopyStats& lastStats() const { return stats_; }
    const CopyOptions& options() const { return options_; }
    size_t bufferSize() const { return bufferSize_; }

private:
    qsync::Result<uint64_t> runCopy(ByteSource& source);
    qsync::Result<size_t> readDestination(int fd, uint8_t* buffer, size_t capacity);
    qsync::Result<void> rewriteChunk(int fd, uint64_t chunkStart, const uint8_t* data, size_t length);
    qsync::Result<uint64_t> copyRemaining(ByteSource& source, int fd, std::vector<uint8_t>& buffer);
    qsync::Result<void> writeAll(int fd, const uint8_t* data, size_t length);
    qsync::Result<void> finalizeLength(int fd, uint64_t length);

    CopyOptions options_;
    size_t bufferSize_;
    CopyStats stats_;
    std::string destinationPath_;
};

/**
 * @brief One-shot helper around DiffCopyEngine::copy
 */
qsync::Result<uint64_t> diffCopy(ByteSource& source, const std::string& destinationPath,
                                 const CopyOptions& options = CopyOptions{});

} // namespace QuietSync
