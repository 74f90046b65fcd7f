#pragma once

/**
 * @file ByteSource.h
 * @brief Sequential, read-once byte streams consumed by DiffCopyEngine
 */

#include "Result.h"
#include "FileGuard.h"
#include "SHA256.h"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace QuietSync {

/**
 * @brief A byte stream read front to back exactly once
 *
 * read() fills at most `capacity` bytes and returns how many it delivered.
 * A return of 0 means the stream is exhausted. Short reads are allowed.
 */
class ByteSource {
public:
    virtual ~ByteSource() = default;

    virtual qsync::Result<size_t> read(uint8_t* buffer, size_t capacity) = 0;
};

/**
 * @brief Reads from a caller-owned memory region
 *
 * The region must outlive the source.
 */
class MemorySource : public ByteSource {
public:
    MemorySource(const void* data, size_t size);
    explicit MemorySource(const std::vector<uint8_t>& data);
    explicit MemorySource(const std::string& data);

    qsync::Result<size_t> read(uint8_t* buffer, size_t capacity) override;

    size_t remaining() const { return size_ - position_; }

private:
    const uint8_t* data_;
    size_t size_;
    size_t position_ = 0;
};

/**
 * @brief Reads from a file descriptor (stdin, a pipe, a socket)
 *
 * A plain int is borrowed and left open; a FileGuard is owned and closed
 * with the source.
 */
class FdSource : public ByteSource {
public:
    explicit FdSource(int fd, std::string name = "fd");
    explicit FdSource(qsync::FileGuard fd, std::string name = "fd");

    qsync::Result<size_t> read(uint8_t* buffer, size_t capacity) override;

private:
    qsync::FileGuard owned_;
    int fd_;
    std::string name_;
};

/**
 * @brief Opens a path read-only and owns the descriptor
 */
class FileSource : public ByteSource {
public:
    static qsync::Result<std::unique_ptr<FileSource>> open(const std::string& path);

    qsync::Result<size_t> read(uint8_t* buffer, size_t capacity) override;

    const std::string& path() const { return path_; }

private:
    FileSource(qsync::FileGuard file, std::string path);

    qsync::FileGuard file_;
    std::string path_;
};

/**
 * @brief Forwards reads to another source, hashing every delivered byte
 *
 * After the inner source is drained, digest() is the SHA-256 of exactly
 * the bytes the consumer received.
 */
class HashingSource : public ByteSource {
public:
    explicit HashingSource(ByteSource& inner);

    qsync::Result<size_t> read(uint8_t* buffer, size_t capacity) override;

    /// Finishes the digest; call once, after the consumer is done reading
    std::string digest();

    uint64_t bytesDelivered() const { return bytesDelivered_; }

private:
    ByteSource& inner_;
    SHA256::Context context_;
    uint64_t bytesDelivered_ = 0;
};

} // namespace QuietSync
