#pragma once

/**
 * @file FileGuard.h
 * @brief Owns a file descriptor and closes it on every return path
 */

#include <unistd.h>

namespace qsync {

/**
 * @brief Move-only owner of a file descriptor
 *
 * Usage:
 * @code
 * FileGuard file(::open(path.c_str(), O_RDWR | O_CREAT, 0644));
 * if (!file) return ioError("Failed to open destination " + path, errno);
 * ::read(file.get(), ...);
 * @endcode
 */
class FileGuard {
public:
    FileGuard() noexcept : fd_(-1) {}

    /// Takes ownership; a negative value (failed open) holds nothing
    explicit FileGuard(int fd) noexcept : fd_(fd) {}

    FileGuard(const FileGuard&) = delete;
    FileGuard& operator=(const FileGuard&) = delete;

    FileGuard(FileGuard&& other) noexcept : fd_(other.fd_) {
        other.fd_ = -1;
    }
    FileGuard& operator=(FileGuard&&) = delete;

    ~FileGuard() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }

    int get() const noexcept { return fd_; }

    explicit operator bool() const noexcept { return fd_ >= 0; }

private:
    int fd_;
};

} // namespace qsync
