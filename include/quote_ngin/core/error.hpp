// include/quote_ngin/core/error.hpp

#pragma once

#include <exception>
#include <memory>
#include <stdexcept>
#include <string>

namespace quote_ngin {

/**
 * @brief Error codes shared by every pipeline component
 */
enum class ErrorCode {
    NONE = 0,
    UNKNOWN_ERROR = 1,
    INVALID_ARGUMENT = 2,
    NOT_INITIALIZED = 3,

    // Data errors
    INVALID_DATA = 4,
    DATA_NOT_FOUND = 5,
    CONVERSION_ERROR = 6,

    // Provider and network errors
    CONNECTION_ERROR = 7,
    TIMEOUT_ERROR = 8,
    API_ERROR = 9,
    MARKET_DATA_ERROR = 10,

    // File and I/O errors
    FILE_NOT_FOUND = 11,
    FILE_IO_ERROR = 12,

    // JSON and parsing errors
    JSON_PARSE_ERROR = 13,

    // Messaging errors
    BUS_CLOSED = 14,
    MAILBOX_CLOSED = 15,
    MAILBOX_FULL = 16,
    ACTOR_ERROR = 17,

    // Custom error range
    CUSTOM_ERROR_START = 1000
};

/**
 * @brief Exception type carried by failed results
 */
class PipelineError : public std::runtime_error {
public:
    /**
     * @brief Constructor for PipelineError
     * @param code The error code
     * @param message Detailed error message
     * @param component Component where error occurred
     */
    PipelineError(ErrorCode code, const std::string& message, const std::string& component = "")
        : std::runtime_error(message), code_(code), component_(component) {}

    ErrorCode code() const noexcept {
        return code_;
    }

    const std::string& component() const noexcept {
        return component_;
    }

    /**
     * @brief Convert error to string representation
     * @return Formatted error string
     */
    std::string to_string() const {
        return "Error in " + component_ + ": " + what() +
               " (Code: " + std::to_string(static_cast<int>(code_)) + ")";
    }

private:
    ErrorCode code_;
    std::string component_;
};

/**
 * @brief Result type for operations that can fail
 * @tparam T The type of the successful result
 */
template <typename T>
class Result {
public:
    template <typename U = T>
    Result(U&& value) : value_(std::forward<U>(value)), error_(nullptr) {}

    Result(std::unique_ptr<PipelineError> error) : error_(std::move(error)) {}

    Result(Result&& other) noexcept
        : value_(std::move(other.value_)), error_(std::move(other.error_)) {}

    Result& operator=(Result&& other) noexcept {
        if (this != &other) {
            value_ = std::move(other.value_);
            error_ = std::move(other.error_);
        }
        return *this;
    }

    Result(const Result&) = delete;
    Result& operator=(const Result&) = delete;

    bool is_ok() const {
        return error_ == nullptr;
    }

    bool is_error() const {
        return error_ != nullptr;
    }

    /**
     * @brief Get the success value
     * @throws PipelineError if result represents an error
     */
    const T& value() const {
        if (error_)
            throw *error_;
        return value_;
    }

    /**
     * @brief Move the success value out of the result
     * @throws PipelineError if result represents an error
     */
    T take_value() {
        if (error_)
            throw *error_;
        return std::move(value_);
    }

    const PipelineError* error() const {
        return error_.get();
    }

private:
    T value_;
    std::unique_ptr<PipelineError> error_;
};

// Specialization for void
template <>
class Result<void> {
public:
    Result() : error_(nullptr) {}
    Result(std::unique_ptr<PipelineError> error) : error_(std::move(error)) {}

    bool is_ok() const {
        return error_ == nullptr;
    }
    bool is_error() const {
        return error_ != nullptr;
    }

    void value() const {
        if (error_)
            throw *error_;
    }

    const PipelineError* error() const {
        return error_.get();
    }

private:
    std::unique_ptr<PipelineError> error_;
};

/**
 * @brief Helper for creating error results
 * @param code The error code
 * @param message The error message
 * @param component The component where error occurred
 */
template <typename T>
Result<T> make_error(ErrorCode code, const std::string& message,
                     const std::string& component = "") {
    return Result<T>(std::make_unique<PipelineError>(code, message, component));
}

/**
 * @brief Re-wrap the error of one result as a result of another type
 */
template <typename T, typename U>
Result<T> forward_error(const Result<U>& failed) {
    return make_error<T>(failed.error()->code(), failed.error()->what(),
                         failed.error()->component());
}

}  // namespace quote_ngin
