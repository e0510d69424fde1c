#pragma once

#include <cerrno>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <variant>

namespace sweep {

// Error codes shared by the scanner, cache, snapshot and removal layers
enum class ErrorCode {
    OK = 0,
    NOT_FOUND,
    ALREADY_EXISTS,
    IO_ERROR,
    CORRUPTION,
    INVALID_ARGUMENT,
    PERMISSION_DENIED,
    INTERNAL_ERROR,
    STORE_NOT_OPEN,     // Metadata store must be opened before operations
    CANCELLED,          // Cooperative cancellation observed
    // Snapshot-specific error codes
    MANIFEST_INVALID,   // Manifest missing, unparsable or inconsistent
    ARCHIVE_ERROR,      // libarchive failed to write or read an archive
    ELEVATION_FAILED    // Privileged fallback command did not succeed
};

// Error with code and message
class Error {
public:
    Error() : code_(ErrorCode::OK) {}
    Error(ErrorCode code, std::string message = "")
        : code_(code), message_(std::move(message)) {}

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }

    bool ok() const { return code_ == ErrorCode::OK; }
    explicit operator bool() const { return !ok(); }

    std::string to_string() const {
        if (message_.empty()) {
            return std::string(error_code_name(code_));
        }
        return std::string(error_code_name(code_)) + ": " + message_;
    }

    static const char* error_code_name(ErrorCode code) {
        switch (code) {
            case ErrorCode::OK: return "OK";
            case ErrorCode::NOT_FOUND: return "NOT_FOUND";
            case ErrorCode::ALREADY_EXISTS: return "ALREADY_EXISTS";
            case ErrorCode::IO_ERROR: return "IO_ERROR";
            case ErrorCode::CORRUPTION: return "CORRUPTION";
            case ErrorCode::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
            case ErrorCode::PERMISSION_DENIED: return "PERMISSION_DENIED";
            case ErrorCode::INTERNAL_ERROR: return "INTERNAL_ERROR";
            case ErrorCode::STORE_NOT_OPEN: return "STORE_NOT_OPEN";
            case ErrorCode::CANCELLED: return "CANCELLED";
            case ErrorCode::MANIFEST_INVALID: return "MANIFEST_INVALID";
            case ErrorCode::ARCHIVE_ERROR: return "ARCHIVE_ERROR";
            case ErrorCode::ELEVATION_FAILED: return "ELEVATION_FAILED";
            default: return "UNKNOWN";
        }
    }

private:
    ErrorCode code_;
    std::string message_;
};

// Result type for operations that can fail
// Similar to Rust's Result<T, E> or C++23's std::expected
template<typename T>
class Result {
public:
    // Success constructor
    Result(T value) : data_(std::move(value)) {}

    // Error constructors
    Result(Error error) : data_(std::move(error)) {}
    Result(ErrorCode code, std::string message = "")
        : data_(Error(code, std::move(message))) {}

    bool ok() const { return std::holds_alternative<T>(data_); }
    explicit operator bool() const { return ok(); }

    // Access value (throws if error)
    T& value() & {
        if (!ok()) {
            throw std::runtime_error(error().to_string());
        }
        return std::get<T>(data_);
    }

    const T& value() const& {
        if (!ok()) {
            throw std::runtime_error(error().to_string());
        }
        return std::get<T>(data_);
    }

    T&& value() && {
        if (!ok()) {
            throw std::runtime_error(error().to_string());
        }
        return std::move(std::get<T>(data_));
    }

    T value_or(T default_value) const {
        if (ok()) {
            return std::get<T>(data_);
        }
        return default_value;
    }

    // Access error (throws if success)
    const Error& error() const {
        if (ok()) {
            throw std::logic_error("Result has no error");
        }
        return std::get<Error>(data_);
    }

    ErrorCode error_code() const {
        if (ok()) {
            return ErrorCode::OK;
        }
        return error().code();
    }

    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }
    T& operator*() & { return value(); }
    const T& operator*() const& { return value(); }

private:
    std::variant<T, Error> data_;
};

// Specialization for void results
template<>
class Result<void> {
public:
    Result() : error_() {}
    Result(Error error) : error_(std::move(error)) {}
    Result(ErrorCode code, std::string message = "")
        : error_(Error(code, std::move(message))) {}

    bool ok() const { return error_.ok(); }
    explicit operator bool() const { return ok(); }

    const Error& error() const { return error_; }
    ErrorCode error_code() const { return error_.code(); }

    void value() const {
        if (!ok()) {
            throw std::runtime_error(error_.to_string());
        }
    }

private:
    Error error_;
};

inline Result<void> Ok() { return Result<void>(); }

inline Error Err(ErrorCode code, std::string message = "") {
    return Error(code, std::move(message));
}

/**
 * Map an errno value onto the error taxonomy.
 *
 * EACCES/EPERM/EROFS are permission problems, ENOENT/ENOTDIR mean the
 * entry is already absent; everything else is a generic I/O failure.
 */
inline ErrorCode error_code_from_errno(int err) {
    switch (err) {
        case 0: return ErrorCode::OK;
        case EACCES:
        case EPERM:
        case EROFS:
            return ErrorCode::PERMISSION_DENIED;
        case ENOENT:
        case ENOTDIR:
            return ErrorCode::NOT_FOUND;
        case EEXIST:
            return ErrorCode::ALREADY_EXISTS;
        default:
            return ErrorCode::IO_ERROR;
    }
}

inline Error error_from_errno(int err, const std::string& context) {
    return Error(error_code_from_errno(err),
                 context + ": " + std::generic_category().message(err));
}

inline Error error_from_code(const std::error_code& ec, const std::string& context) {
    // std::filesystem reports POSIX errors through the system category
    return Error(error_code_from_errno(ec.value()), context + ": " + ec.message());
}

}  // namespace sweep
