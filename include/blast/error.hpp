#pragma once

#include "blast/common.hpp"
#include <stdexcept>
#include <string>
#include <variant>
#include <optional>
#include <functional>

namespace blast {

// Error codes for structured error handling
enum class ErrorCode {
    // Generic errors
    Success = 0,
    Unknown,
    InvalidArgument,
    NotSupported,

    // I/O errors
    IoError,
    PermissionDenied,

    // Cache errors
    SizeLimitExceeded,
    HashNotFound,
    KeyNotFound,
    Corrupted,
    CompressionFailed,
    DecompressionFailed,

    // Serialization errors
    SerializationFailed,
    DeserializationFailed,
    InvalidFormat
};

// Convert error code to string
const char* error_code_to_string(ErrorCode code);

// Error class with structured information
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    Error(ErrorCode code, std::string message, std::string details)
        : code_(code), message_(std::move(message)), details_(std::move(details)) {}

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }
    const std::string& details() const { return details_; }

    /**
     * Wrap this error with a higher-level context message, keeping the code
     */
    Error with_context(const std::string& context) const;

    std::string to_string() const;

private:
    ErrorCode code_;
    std::string message_;
    std::string details_;
};

// Result type for error handling
template<typename T>
class Result {
public:
    // Success constructor
    static Result Ok(T value) {
        return Result(std::move(value));
    }

    // Error constructor
    static Result Err(Error error) {
        return Result(std::move(error));
    }

    // Error constructor with code and message
    static Result Err(ErrorCode code, const std::string& message) {
        return Result(Error(code, message));
    }

    // Implicit conversion so errors propagate across result types
    Result(Error error) : value_(std::move(error)) {}

    // Check if result contains a value
    bool is_ok() const { return std::holds_alternative<T>(value_); }
    bool is_err() const { return std::holds_alternative<Error>(value_); }

    // Get the value (throws if error)
    T& value() {
        if (is_err()) {
            throw std::runtime_error("Called value() on error Result: " + error().to_string());
        }
        return std::get<T>(value_);
    }

    const T& value() const {
        if (is_err()) {
            throw std::runtime_error("Called value() on error Result: " + error().to_string());
        }
        return std::get<T>(value_);
    }

    // Get the error (throws if ok)
    const Error& error() const {
        if (is_ok()) {
            throw std::runtime_error("Called error() on ok Result");
        }
        return std::get<Error>(value_);
    }

    // Get value or default
    T value_or(T default_value) const {
        if (is_ok()) {
            return std::get<T>(value_);
        }
        return default_value;
    }

    // Unwrap (throws if error)
    T unwrap() {
        return std::move(value());
    }

    // Unwrap or throw custom error
    T expect(const std::string& message) {
        if (is_err()) {
            throw std::runtime_error(message + ": " + error().to_string());
        }
        return std::move(value());
    }

    // Map the value if ok
    template<typename F>
    auto map(F&& func) -> Result<decltype(func(std::declval<T>()))> {
        using U = decltype(func(std::declval<T>()));
        if (is_ok()) {
            return Result<U>::Ok(func(value()));
        }
        return Result<U>::Err(error());
    }

    // Map the error if err
    Result<T> map_err(std::function<Error(const Error&)> func) {
        if (is_err()) {
            return Result<T>::Err(func(error()));
        }
        return Result<T>::Ok(std::move(value()));
    }

    // Convert to optional
    std::optional<T> ok() const {
        if (is_ok()) {
            return std::get<T>(value_);
        }
        return std::nullopt;
    }

    std::optional<Error> err() const {
        if (is_err()) {
            return std::get<Error>(value_);
        }
        return std::nullopt;
    }

private:
    explicit Result(T value) : value_(std::move(value)) {}

    std::variant<T, Error> value_;
};

// Specialized Result<void> for operations that don't return a value
template<>
class Result<void> {
public:
    static Result Ok() {
        return Result(true);
    }

    static Result Err(Error error) {
        return Result(std::move(error));
    }

    static Result Err(ErrorCode code, const std::string& message) {
        return Result(Error(code, message));
    }

    Result(Error error) : error_(std::move(error)) {}

    bool is_ok() const { return !error_.has_value(); }
    bool is_err() const { return error_.has_value(); }

    const Error& error() const {
        if (!error_) {
            throw std::runtime_error("Called error() on ok Result");
        }
        return *error_;
    }

    Result<void> map_err(std::function<Error(const Error&)> func) const {
        if (is_err()) {
            return Result<void>::Err(func(*error_));
        }
        return Result<void>::Ok();
    }

    void unwrap() {
        if (is_err()) {
            throw std::runtime_error("Called unwrap() on error Result: " + error().to_string());
        }
    }

    void expect(const std::string& message) {
        if (is_err()) {
            throw std::runtime_error(message + ": " + error().to_string());
        }
    }

private:
    explicit Result(bool) : error_(std::nullopt) {}

    std::optional<Error> error_;
};

// Custom exception classes
class BlastException : public std::runtime_error {
public:
    BlastException(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

class StorageException : public BlastException {
public:
    StorageException(ErrorCode code, const std::string& message)
        : BlastException(code, "Storage error: " + message) {}
};

class CacheException : public BlastException {
public:
    CacheException(ErrorCode code, const std::string& message)
        : BlastException(code, "Cache error: " + message) {}
};

// Utility macros for error handling
#define BLAST_TRY(expr) \
    do { \
        auto __result = (expr); \
        if (__result.is_err()) { \
            return __result.error(); \
        } \
    } while (0)

#define BLAST_TRY_UNWRAP(var, expr) \
    auto __result_##var = (expr); \
    if (__result_##var.is_err()) { \
        return __result_##var.error(); \
    } \
    auto var = std::move(__result_##var.value());

} // namespace blast
