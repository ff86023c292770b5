#pragma once

/**
 * @file Result.h
 * @brief Consistent error handling types for Tessera
 *
 * Provides a Result<T, E> type similar to Rust's Result or C++23's std::expected.
 * Use this for functions that can fail with a reason. Reassembly outcomes
 * stay plain booleans; connection setup, parsing and I/O return Result.
 */

#include <variant>
#include <string>
#include <optional>
#include <utility>

namespace tsr {

/**
 * @brief Error codes for Tessera operations
 */
enum class ErrorCode {
    Success = 0,

    // Network errors (100-199)
    NetworkError = 100,
    ConnectionFailed = 101,
    ConnectionTimeout = 102,
    ConnectionClosed = 103,
    PeerNotFound = 104,
    SendFailed = 105,
    ReceiveFailed = 106,
    FrameTooLarge = 107,
    ProtocolError = 108,
    AddressResolutionFailed = 109,

    // File system errors (200-299)
    FileNotFound = 200,
    FileAccessDenied = 201,
    FileReadError = 202,
    FileWriteError = 203,
    DirectoryCreateFailed = 205,

    // Storage/Database errors (300-399)
    DatabaseError = 300,
    DatabaseOpenFailed = 301,
    QueryFailed = 302,

    // Transfer errors (500-599)
    InvalidManifest = 500,
    ChecksumMismatch = 501,
    IncompleteTransfer = 502,
    TransferNotFound = 503,
    IndexOutOfRange = 504,

    // Configuration errors (600-699)
    ConfigError = 600,
    InvalidConfig = 601,

    // General errors (900-999)
    InvalidArgument = 900,
    InternalError = 999
};

/**
 * @brief Convert error code to human-readable string
 */
inline const char* errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::NetworkError: return "Network error";
        case ErrorCode::ConnectionFailed: return "Connection failed";
        case ErrorCode::ConnectionTimeout: return "Connection timeout";
        case ErrorCode::ConnectionClosed: return "Connection closed";
        case ErrorCode::PeerNotFound: return "Peer not found";
        case ErrorCode::SendFailed: return "Send failed";
        case ErrorCode::ReceiveFailed: return "Receive failed";
        case ErrorCode::FrameTooLarge: return "Frame too large";
        case ErrorCode::ProtocolError: return "Protocol error";
        case ErrorCode::AddressResolutionFailed: return "Address resolution failed";
        case ErrorCode::FileNotFound: return "File not found";
        case ErrorCode::FileAccessDenied: return "File access denied";
        case ErrorCode::FileReadError: return "File read error";
        case ErrorCode::FileWriteError: return "File write error";
        case ErrorCode::DirectoryCreateFailed: return "Directory creation failed";
        case ErrorCode::DatabaseError: return "Database error";
        case ErrorCode::DatabaseOpenFailed: return "Database open failed";
        case ErrorCode::QueryFailed: return "Query failed";
        case ErrorCode::InvalidManifest: return "Invalid manifest";
        case ErrorCode::ChecksumMismatch: return "Checksum mismatch";
        case ErrorCode::IncompleteTransfer: return "Incomplete transfer";
        case ErrorCode::TransferNotFound: return "Transfer not found";
        case ErrorCode::IndexOutOfRange: return "Index out of range";
        case ErrorCode::ConfigError: return "Configuration error";
        case ErrorCode::InvalidConfig: return "Invalid configuration";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::InternalError: return "Internal error";
        default: return "Unknown error";
    }
}

/**
 * @brief Error type with code and optional message
 */
struct Error {
    ErrorCode code;
    std::string message;

    Error(ErrorCode c) : code(c), message(errorCodeToString(c)) {}
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

    bool operator==(const Error& other) const { return code == other.code; }
    bool operator!=(const Error& other) const { return code != other.code; }
};

/**
 * @brief Result type for operations that can fail
 *
 * @tparam T Success value type
 * @tparam E Error type (defaults to Error)
 *
 * Usage:
 * @code
 * Result<Endpoint> parsed = parseEndpoint("tcp://relay.local:9000");
 * if (parsed) {
 *     connectTo(*parsed);
 * } else {
 *     logger.warn(parsed.error().message);
 * }
 * @endcode
 */
template<typename T, typename E = Error>
class Result {
public:
    /// Construct success result
    Result(T value) : data_(std::move(value)) {}

    /// Construct error result
    Result(E error) : data_(std::move(error)) {}

    /// Check if result is success
    bool ok() const { return std::holds_alternative<T>(data_); }

    /// Check if result is success (bool conversion)
    explicit operator bool() const { return ok(); }

    /// Check if result is error
    bool isError() const { return std::holds_alternative<E>(data_); }

    /// Get success value (throws if error)
    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    /// Get success value with default
    T valueOr(T defaultValue) const {
        if (ok()) return std::get<T>(data_);
        return defaultValue;
    }

    /// Get error (throws if success)
    E& error() & { return std::get<E>(data_); }
    const E& error() const& { return std::get<E>(data_); }

    /// Dereference operator (get value)
    T& operator*() & { return value(); }
    const T& operator*() const& { return value(); }
    T&& operator*() && { return std::move(value()); }

    /// Arrow operator (access value members)
    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }

private:
    std::variant<T, E> data_;
};

/**
 * @brief Specialization for void success type
 */
template<typename E>
class Result<void, E> {
public:
    /// Construct success result
    Result() : error_(std::nullopt) {}

    /// Construct error result
    Result(E error) : error_(std::move(error)) {}

    /// Check if result is success
    bool ok() const { return !error_.has_value(); }

    /// Check if result is success (bool conversion)
    explicit operator bool() const { return ok(); }

    /// Check if result is error
    bool isError() const { return error_.has_value(); }

    /// Get error (throws if success)
    E& error() { return *error_; }
    const E& error() const { return *error_; }

private:
    std::optional<E> error_;
};

/// Create a void success result
inline Result<void> Ok() {
    return Result<void>();
}

/// Create an error result
template<typename T = void>
Result<T> Err(ErrorCode code) {
    return Result<T>(Error{code});
}

/// Create an error result with message
template<typename T = void>
Result<T> Err(ErrorCode code, std::string message) {
    return Result<T>(Error{code, std::move(message)});
}

} // namespace tsr
