#include "ByteSource.h"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace QuietSync {

namespace {

// One read(2) call, restarted only when interrupted before any data arrived
qsync::Result<size_t> readOnce(int fd, uint8_t* buffer, size_t capacity, const std::string& name) {
    for (;;) {
        ssize_t n = ::read(fd, buffer, capacity);
        if (n >= 0) {
            return static_cast<size_t>(n);
        }
        if (errno != EINTR) {
            return qsync::ioError("Failed to read source " + name, errno);
        }
    }
}

} // namespace

// MemorySource

MemorySource::MemorySource(const void* data, size_t size)
    : data_(static_cast<const uint8_t*>(data)), size_(size) {}

MemorySource::MemorySource(const std::vector<uint8_t>& data)
    : MemorySource(data.data(), data.size()) {}

MemorySource::MemorySource(const std::string& data)
    : MemorySource(data.data(), data.size()) {}

qsync::Result<size_t> MemorySource::read(uint8_t* buffer, size_t capacity) {
    size_t count = std::min(capacity, remaining());
    if (count > 0) {
        std::memcpy(buffer, data_ + position_, count);
        position_ += count;
    }
    return count;
}

// FdSource

FdSource::FdSource(int fd, std::string name) : fd_(fd), name_(std::move(name)) {}

FdSource::FdSource(qsync::FileGuard fd, std::string name)
    : owned_(std::move(fd)), fd_(owned_.get()), name_(std::move(name)) {}

qsync::Result<size_t> FdSource::read(uint8_t* buffer, size_t capacity) {
    return readOnce(fd_, buffer, capacity, name_);
}

// FileSource

FileSource::FileSource(qsync::FileGuard file, std::string path)
    : file_(std::move(file)), path_(std::move(path)) {}

qsync::Result<std::unique_ptr<FileSource>> FileSource::open(const std::string& path) {
    qsync::FileGuard file(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
    if (!file) {
        return qsync::ioError("Failed to open source " + path, errno);
    }
    return std::unique_ptr<FileSource>(new FileSource(std::move(file), path));
}

qsync::Result<size_t> FileSource::read(uint8_t* buffer, size_t capacity) {
    return readOnce(file_.get(), buffer, capacity, path_);
}

// HashingSource

HashingSource::HashingSource(ByteSource& inner) : inner_(inner) {}

qsync::Result<size_t> HashingSource::read(uint8_t* buffer, size_t capacity) {
    auto count = inner_.read(buffer, capacity);
    if (!count) {
        return count;
    }
    if (!context_.update(buffer, *count)) {
        return qsync::Error{qsync::ErrorCode::InternalError, "SHA-256 update failed"};
    }
    bytesDelivered_ += *count;
    return count;
}

std::string HashingSource::digest() {
    return context_.finalHex();
}

} // namespace QuietSync
