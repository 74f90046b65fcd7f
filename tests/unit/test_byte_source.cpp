#include "ByteSource.h"
#include "SHA256.h"
#include <iostream>
#include <cassert>
#include <cerrno>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>
#include <vector>

using namespace QuietSync;

namespace {

std::string drain(ByteSource& source, size_t chunk) {
    std::string out;
    std::vector<uint8_t> buffer(chunk);
    for (;;) {
        auto n = source.read(buffer.data(), buffer.size());
        assert(n.ok());
        if (*n == 0) break;
        out.append(reinterpret_cast<const char*>(buffer.data()), *n);
    }
    return out;
}

}

void test_memory_source() {
    std::cout << "Running test_memory_source..." << std::endl;

    std::string data = "foo\nbar\n";
    MemorySource source(data);
    assert(source.remaining() == 8);

    uint8_t buffer[3];
    auto first = source.read(buffer, sizeof(buffer));
    assert(first.ok() && *first == 3);
    assert(std::string(reinterpret_cast<char*>(buffer), 3) == "foo");
    assert(source.remaining() == 5);

    assert(drain(source, 3) == "\nbar\n");

    // Exhausted sources keep reporting end-of-stream
    auto after = source.read(buffer, sizeof(buffer));
    assert(after.ok() && *after == 0);

    MemorySource empty(nullptr, 0);
    auto none = empty.read(buffer, sizeof(buffer));
    assert(none.ok() && *none == 0);

    std::cout << "test_memory_source passed." << std::endl;
}

void test_file_source() {
    std::cout << "Running test_file_source..." << std::endl;

    std::string path = "test_file_source.bin";
    std::string content(20000, 'q');
    {
        std::ofstream out(path, std::ios::binary);
        out << content;
    }

    auto opened = FileSource::open(path);
    assert(opened.ok());
    assert((*opened)->path() == path);
    assert(drain(**opened, 8192) == content);

    auto missing = FileSource::open("no_such_dir/no_such_file.bin");
    assert(!missing);
    assert(missing.error().code == qsync::ErrorCode::IoError);
    assert(missing.error().system.value() == ENOENT);

    std::filesystem::remove(path);
    std::cout << "test_file_source passed." << std::endl;
}

void test_fd_source_pipe() {
    std::cout << "Running test_fd_source_pipe..." << std::endl;

    int fds[2];
    assert(::pipe(fds) == 0);
    std::string payload = "streamed through a pipe";
    assert(::write(fds[1], payload.data(), payload.size()) == static_cast<ssize_t>(payload.size()));
    ::close(fds[1]);

    FdSource source(fds[0], "pipe");
    assert(drain(source, 4) == payload);
    ::close(fds[0]);

    // Reading a closed descriptor reports EBADF
    FdSource closed(fds[0], "closed");
    uint8_t byte;
    auto bad = closed.read(&byte, 1);
    assert(!bad);
    assert(bad.error().system.value() == EBADF);
    assert(bad.error().message.find("closed") != std::string::npos);

    std::cout << "test_fd_source_pipe passed." << std::endl;
}

void test_fd_source_owned() {
    std::cout << "Running test_fd_source_owned..." << std::endl;

    int fds[2];
    assert(::pipe(fds) == 0);
    std::string payload = "owned end";
    assert(::write(fds[1], payload.data(), payload.size()) == static_cast<ssize_t>(payload.size()));
    ::close(fds[1]);

    {
        FdSource source(qsync::FileGuard(fds[0]), "owned pipe");
        assert(drain(source, 64) == payload);
        assert(::fcntl(fds[0], F_GETFD) != -1);
    }

    // Destroying the source closed the read end
    errno = 0;
    assert(::fcntl(fds[0], F_GETFD) == -1);
    assert(errno == EBADF);

    std::cout << "test_fd_source_owned passed." << std::endl;
}

void test_hashing_source() {
    std::cout << "Running test_hashing_source..." << std::endl;

    std::string data(50000, '\0');
    for (size_t i = 0; i < data.size(); ++i) data[i] = static_cast<char>(i % 251);

    MemorySource inner(data);
    HashingSource hashing(inner);
    assert(drain(hashing, 777) == data);
    assert(hashing.bytesDelivered() == data.size());
    assert(hashing.digest() == SHA256::hash(data));

    std::cout << "test_hashing_source passed." << std::endl;
}

int main() {
    try {
        test_memory_source();
        test_file_source();
        test_fd_source_pipe();
        test_fd_source_owned();
        test_hashing_source();
        std::cout << "All ByteSource tests passed!" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
