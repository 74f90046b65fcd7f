#include "Result.h"
#include <iostream>
#include <cassert>
#include <cerrno>
#include <string>

using namespace qsync;

Result<int> divide(int a, int b) {
    if (b == 0) return Error{ErrorCode::InvalidArgument, "Division by zero"};
    return a / b;
}

Result<void> touch(bool fail) {
    if (fail) return ioError("Failed to write destination out.bin", ENOSPC);
    return Ok();
}

void test_success() {
    std::cout << "Running test_success..." << std::endl;

    auto res = divide(10, 2);
    assert(res);
    assert(res.ok());
    assert(*res == 5);

    std::cout << "test_success passed." << std::endl;
}

void test_failure() {
    std::cout << "Running test_failure..." << std::endl;

    auto res = divide(10, 0);
    assert(!res);
    assert(res.error().code == ErrorCode::InvalidArgument);
    assert(res.error().message == "Division by zero");
    assert(!res.error().system);
    assert(res.error().toString() == "Division by zero");

    auto config = Err<std::string>(ErrorCode::InvalidConfig, "bad line");
    assert(!config.ok());
    assert(config.error().code == ErrorCode::InvalidConfig);

    std::cout << "test_failure passed." << std::endl;
}

void test_io_error_keeps_errno() {
    std::cout << "Running test_io_error_keeps_errno..." << std::endl;

    auto res = touch(true);
    assert(!res);
    assert(res.error().code == ErrorCode::IoError);
    assert(res.error().system.value() == ENOSPC);
    assert(res.error().system == std::errc::no_space_on_device);
    assert(res.error().toString().find("Failed to write destination out.bin: ") == 0);

    assert(touch(false).ok());

    std::cout << "test_io_error_keeps_errno passed." << std::endl;
}

void test_error_string() {
    std::cout << "Running test_error_string..." << std::endl;

    assert(std::string(errorCodeToString(ErrorCode::IoError)) == "I/O error");
    assert(std::string(errorCodeToString(ErrorCode::VerificationFailed)) == "Verification failed");
    assert(Error{ErrorCode::InvalidConfig}.message == "Invalid configuration");

    std::cout << "test_error_string passed." << std::endl;
}

int main() {
    try {
        test_success();
        test_failure();
        test_io_error_keeps_errno();
        test_error_string();
        std::cout << "All Result tests passed!" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
