#pragma once

/**
 * @file Result.h
 * @brief Error handling types for QuietSync
 *
 * Storage and CLI code return a Result instead of throwing. An error keeps
 * the errno of the system call that failed, so callers can inspect the
 * exact OS reason.
 */

#include <variant>
#include <string>
#include <optional>
#include <utility>
#include <system_error>

namespace qsync {

/**
 * @brief What kind of failure an Error describes
 *
 * The CLI maps each kind to its exit status.
 */
enum class ErrorCode {
    // I/O errors (100-199)
    IoError = 100,

    // Configuration errors (600-699)
    InvalidConfig = 601,
    MissingConfig = 602,

    // Verification errors (700-799)
    VerificationFailed = 700,

    // General errors (900-999)
    InvalidArgument = 900,
    InternalError = 999
};

inline const char* errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::IoError: return "I/O error";
        case ErrorCode::InvalidConfig: return "Invalid configuration";
        case ErrorCode::MissingConfig: return "Missing configuration";
        case ErrorCode::VerificationFailed: return "Verification failed";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::InternalError: return "Internal error";
    }
    return "Unknown error";
}

/**
 * @brief Error type with code, message and the OS error behind it
 *
 * `system` holds the errno reported by the failing call, unaltered.
 * It is empty for errors that did not originate in a system call.
 */
struct Error {
    ErrorCode code;
    std::string message;
    std::error_code system;

    Error(ErrorCode c) : code(c), message(errorCodeToString(c)) {}
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
    Error(ErrorCode c, std::string msg, std::error_code sys)
        : code(c), message(std::move(msg)), system(sys) {}

    /// Message followed by the OS reason, if any
    std::string toString() const {
        if (!system) return message;
        return message + ": " + system.message();
    }
};

/// Build an I/O error from an errno value
inline Error ioError(const std::string& what, int err) {
    return Error{ErrorCode::IoError, what, std::error_code(err, std::generic_category())};
}

/**
 * @brief Value or Error
 *
 * Usage:
 * @code
 * Result<uint64_t> copied = engine.copy(source, "out.bin");
 * if (copied) {
 *     std::cout << "Copied: " << *copied << std::endl;
 * } else {
 *     std::cout << "Error: " << copied.error().toString() << std::endl;
 * }
 * @endcode
 */
template<typename T, typename E = Error>
class Result {
public:
    Result(T value) : data_(std::move(value)) {}
    Result(E error) : data_(std::move(error)) {}

    bool ok() const { return std::holds_alternative<T>(data_); }
    explicit operator bool() const { return ok(); }

    /// Throws std::bad_variant_access on an error result
    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }

    E& error() & { return std::get<E>(data_); }
    const E& error() const& { return std::get<E>(data_); }

    T& operator*() & { return value(); }
    const T& operator*() const& { return value(); }

    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }

private:
    std::variant<T, E> data_;
};

template<typename E>
class Result<void, E> {
public:
    Result() : error_(std::nullopt) {}
    Result(E error) : error_(std::move(error)) {}

    bool ok() const { return !error_.has_value(); }
    explicit operator bool() const { return ok(); }

    E& error() { return *error_; }
    const E& error() const { return *error_; }

private:
    std::optional<E> error_;
};

inline Result<void> Ok() {
    return Result<void>();
}

template<typename T = void>
Result<T> Err(ErrorCode code, std::string message) {
    return Result<T>(Error{code, std::move(message)});
}

} // namespace qsync
