// include/lifecycle_ngin/core/error.hpp

#pragma once

#include <exception>
#include <memory>
#include <stdexcept>
#include <string>

namespace lifecycle_ngin {

/**
 * @brief Error codes for the position lifecycle engine
 */
enum class ErrorCode {
    NONE = 0,
    UNKNOWN_ERROR = 1,
    INVALID_ARGUMENT = 2,
    NOT_INITIALIZED = 3,

    // Data errors
    DATABASE_ERROR = 4,
    DATA_NOT_FOUND = 5,
    INVALID_DATA = 6,
    CONVERSION_ERROR = 7,
    INSUFFICIENT_DATA = 8,
    STALE_DATA = 9,

    // Position errors
    POSITION_NOT_FOUND = 10,
    DUPLICATE_POSITION = 11,
    INVALID_STATUS_TRANSITION = 12,
    INVARIANT_VIOLATION = 13,

    // Execution errors
    ORDER_REJECTED = 14,
    INSUFFICIENT_FUNDS = 15,
    EXECUTION_FAILED = 16,
    ALLOCATION_EXHAUSTED = 17,

    // Signal and scoring errors
    INVALID_SIGNAL = 18,
    INVALID_RISK_CALCULATION = 19,

    // System errors
    CONNECTION_ERROR = 20,
    TIMEOUT_ERROR = 21,

    // File and parsing errors
    FILE_NOT_FOUND = 22,
    FILE_IO_ERROR = 23,
    JSON_PARSE_ERROR = 24
};

/**
 * @brief Short, stable name for an error code (used in audit records)
 */
std::string error_code_to_string(ErrorCode code);

/**
 * @brief Error raised or carried by lifecycle_ngin components
 */
class EngineError : public std::runtime_error {
public:
    /**
     * @brief Constructor for EngineError
     * @param code The error code
     * @param message Detailed error message
     * @param component Component where error occurred
     */
    EngineError(ErrorCode code, const std::string& message, const std::string& component = "")
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
        return "Error in " + component_ + ": " + what() + " (" + error_code_to_string(code_) +
               ")";
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
    /**
     * @brief Constructor for success case
     * @param value The successful result
     */
    template <typename U = T>
    Result(U&& value) : value_(std::forward<U>(value)), error_(nullptr) {}

    /**
     * @brief Constructor for error case
     * @param error The error that occurred
     */
    Result(std::unique_ptr<EngineError> error) : error_(std::move(error)) {}

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
     * @throws EngineError if result represents an error
     */
    const T& value() const {
        if (error_)
            throw *error_;
        return value_;
    }

    /**
     * @brief Move the success value out of the result
     * @throws EngineError if result represents an error
     */
    T take_value() {
        if (error_)
            throw *error_;
        return std::move(value_);
    }

    /**
     * @brief Get the error if present
     * @return Pointer to the error, or nullptr if success
     */
    const EngineError* error() const {
        return error_.get();
    }

private:
    T value_;
    std::unique_ptr<EngineError> error_;
};

// Specialization for void
template <>
class Result<void> {
public:
    Result() : error_(nullptr) {}
    Result(std::unique_ptr<EngineError> error) : error_(std::move(error)) {}

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

    const EngineError* error() const {
        return error_.get();
    }

private:
    std::unique_ptr<EngineError> error_;
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
    return Result<T>(std::make_unique<EngineError>(code, message, component));
}

/**
 * @brief Re-wrap an error from one result type into another
 */
template <typename T, typename U>
Result<T> forward_error(const Result<U>& other, const std::string& component = "") {
    const EngineError* err = other.error();
    if (!err) {
        return make_error<T>(ErrorCode::UNKNOWN_ERROR, "forward_error called on a success result",
                             component);
    }
    return make_error<T>(err->code(), err->what(),
                         component.empty() ? err->component() : component);
}

}  // namespace lifecycle_ngin
