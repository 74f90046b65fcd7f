#include "CliApp.h"
#include "Constants.h"
#include "Logger.h"
#include <iostream>
#include <cassert>
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <unistd.h>
#include <vector>

using namespace QuietSync;

namespace {

const std::string DIR = "test_cli_run_tmp";

void writeFile(const std::string& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary);
    out << content;
}

std::string readFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

std::string patterned(size_t size) {
    std::string data(size, '\0');
    for (size_t i = 0; i < size; ++i) data[i] = static_cast<char>((i * 7) % 253);
    return data;
}

}

void test_help_and_version() {
    std::cout << "Running test_help_and_version..." << std::endl;
    assert(runCli({"--help"}) == qsync::config::EXIT_OK);
    assert(runCli({"--version"}) == qsync::config::EXIT_OK);
    std::cout << "test_help_and_version passed." << std::endl;
}

void test_usage_errors_exit_2() {
    std::cout << "Running test_usage_errors_exit_2..." << std::endl;
    std::string source = DIR + "/usage_src.bin";
    std::string destination = DIR + "/usage_dst.bin";
    writeFile(source, "data");

    assert(runCli({"--frobnicate", source, destination}) == qsync::config::EXIT_USAGE);
    assert(runCli({source}) == qsync::config::EXIT_USAGE);

    std::string badConfig = DIR + "/bad_buffer.conf";
    writeFile(badConfig, "buffer_size=0\n");
    assert(runCli({"-c", badConfig, source, destination}) == qsync::config::EXIT_USAGE);

    std::string malformed = DIR + "/malformed.conf";
    writeFile(malformed, "verify\n");
    assert(runCli({"-c", malformed, source, destination}) == qsync::config::EXIT_USAGE);

    assert(runCli({"-c", DIR + "/absent.conf", source, destination}) == qsync::config::EXIT_USAGE);

    // No copy happens when the settings are rejected
    assert(!std::filesystem::exists(destination));

    std::cout << "test_usage_errors_exit_2 passed." << std::endl;
}

void test_io_errors_exit_1() {
    std::cout << "Running test_io_errors_exit_1..." << std::endl;
    std::string destination = DIR + "/io_dst.bin";

    assert(runCli({DIR + "/missing_source.bin", destination}) == qsync::config::EXIT_IO_FAILURE);
    assert(!std::filesystem::exists(destination));

    std::string source = DIR + "/io_src.bin";
    writeFile(source, "data");
    assert(runCli({source, DIR + "/no_such_dir/out.bin"}) == qsync::config::EXIT_IO_FAILURE);

    std::cout << "test_io_errors_exit_1 passed." << std::endl;
}

void test_file_copy_with_config() {
    std::cout << "Running test_file_copy_with_config..." << std::endl;
    std::string source = DIR + "/cfg_src.bin";
    std::string destination = DIR + "/cfg_dst.bin";
    std::string config = DIR + "/good.conf";
    std::string content = patterned(40000);
    writeFile(source, content);
    writeFile(destination, patterned(50000));
    writeFile(config, "# tuned\nbuffer_size=1000\nverify=yes\nsync_on_change=true\n");

    assert(runCli({"-q", "-c", config, source, destination}) == qsync::config::EXIT_OK);
    assert(readFile(destination) == content);

    std::cout << "test_file_copy_with_config passed." << std::endl;
}

void test_stdin_verify_and_stats() {
    std::cout << "Running test_stdin_verify_and_stats..." << std::endl;
    std::string destination = DIR + "/stdin_dst.bin";
    std::string content = patterned(20000);
    writeFile(destination, content.substr(0, 9000) + "stale tail");

    // Small enough to sit in the pipe buffer before anyone reads
    int fds[2];
    assert(::pipe(fds) == 0);
    assert(::write(fds[1], content.data(), content.size()) == static_cast<ssize_t>(content.size()));
    ::close(fds[1]);

    int status = runCli({"--verify", "--stats", "-", destination}, fds[0]);
    ::close(fds[0]);

    assert(status == qsync::config::EXIT_OK);
    assert(readFile(destination) == content);

    std::cout << "test_stdin_verify_and_stats passed." << std::endl;
}

void test_exit_code_mapping() {
    std::cout << "Running test_exit_code_mapping..." << std::endl;
    using qsync::ErrorCode;
    assert(exitCodeFor(qsync::ioError("Failed to write destination x", EIO)) == qsync::config::EXIT_IO_FAILURE);
    assert(exitCodeFor(qsync::Error{ErrorCode::InternalError}) == qsync::config::EXIT_IO_FAILURE);
    assert(exitCodeFor(qsync::Error{ErrorCode::InvalidArgument}) == qsync::config::EXIT_USAGE);
    assert(exitCodeFor(qsync::Error{ErrorCode::InvalidConfig}) == qsync::config::EXIT_USAGE);
    assert(exitCodeFor(qsync::Error{ErrorCode::MissingConfig}) == qsync::config::EXIT_USAGE);
    assert(exitCodeFor(qsync::Error{ErrorCode::VerificationFailed}) == qsync::config::EXIT_VERIFY_MISMATCH);
    std::cout << "test_exit_code_mapping passed." << std::endl;
}

int main() {
    try {
        std::filesystem::remove_all(DIR);
        std::filesystem::create_directories(DIR);
        Logger::instance().setConsoleOutput(false);

        test_help_and_version();
        test_usage_errors_exit_2();
        test_io_errors_exit_1();
        test_file_copy_with_config();
        test_stdin_verify_and_stats();
        test_exit_code_mapping();

        std::filesystem::remove_all(DIR);
        std::cout << "All CLI run tests passed!" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
