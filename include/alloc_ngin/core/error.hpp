// include/alloc_ngin/core/error.hpp

#pragma once

#include <exception>
#include <memory>
#include <stdexcept>
#include <string>

namespace alloc_ngin {

/**
 * @brief Error codes for the allocation engine
 * Defines all possible error conditions that can occur
 */
enum class ErrorCode {
    NONE = 0,
    UNKNOWN_ERROR = 1,
    INVALID_ARGUMENT = 2,

    // Data errors
    INVALID_DATA = 3,
    CONVERSION_ERROR = 4,
    INSUFFICIENT_DATA = 5,
    EMPTY_UNIVERSE = 6,

    // Estimation and optimization errors
    SINGULAR_COVARIANCE = 7,
    DEGENERATE_COVARIANCE = 8,
    OPTIMIZATION_DID_NOT_CONVERGE = 9,
    INFEASIBLE_BOUNDS = 10,
    NO_TANGENCY_PORTFOLIO = 11,

    // Statistical testing errors
    INDETERMINATE_SIGNIFICANCE = 12,

    // File and I/O errors
    FILE_NOT_FOUND = 13,
    FILE_IO_ERROR = 14,

    // JSON and parsing errors
    JSON_PARSE_ERROR = 15
};

inline std::string error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE:
            return "NONE";
        case ErrorCode::UNKNOWN_ERROR:
            return "UNKNOWN_ERROR";
        case ErrorCode::INVALID_ARGUMENT:
            return "INVALID_ARGUMENT";
        case ErrorCode::INVALID_DATA:
            return "INVALID_DATA";
        case ErrorCode::CONVERSION_ERROR:
            return "CONVERSION_ERROR";
        case ErrorCode::INSUFFICIENT_DATA:
            return "INSUFFICIENT_DATA";
        case ErrorCode::EMPTY_UNIVERSE:
            return "EMPTY_UNIVERSE";
        case ErrorCode::SINGULAR_COVARIANCE:
            return "SINGULAR_COVARIANCE";
        case ErrorCode::DEGENERATE_COVARIANCE:
            return "DEGENERATE_COVARIANCE";
        case ErrorCode::OPTIMIZATION_DID_NOT_CONVERGE:
            return "OPTIMIZATION_DID_NOT_CONVERGE";
        case ErrorCode::INFEASIBLE_BOUNDS:
            return "INFEASIBLE_BOUNDS";
        case ErrorCode::NO_TANGENCY_PORTFOLIO:
            return "NO_TANGENCY_PORTFOLIO";
        case ErrorCode::INDETERMINATE_SIGNIFICANCE:
            return "INDETERMINATE_SIGNIFICANCE";
        case ErrorCode::FILE_NOT_FOUND:
            return "FILE_NOT_FOUND";
        case ErrorCode::FILE_IO_ERROR:
            return "FILE_IO_ERROR";
        case ErrorCode::JSON_PARSE_ERROR:
            return "JSON_PARSE_ERROR";
        default:
            return "UNRECOGNIZED_ERROR";
    }
}

/**
 * @brief Error type carried by failed results
 */
class AllocError : public std::runtime_error {
public:
    /**
     * @brief Constructor for AllocError
     * @param code The error code
     * @param message Detailed error message
     * @param component Component where error occurred
     */
    AllocError(ErrorCode code, const std::string& message, const std::string& component = "")
        : std::runtime_error(message), code_(code), component_(component) {}

    /**
     * @brief Get the error code
     * @return ErrorCode representing the type of error
     */
    ErrorCode code() const noexcept {
        return code_;
    }

    /**
     * @brief Get the component where error occurred
     * @return String identifying the component
     */
    const std::string& component() const noexcept {
        return component_;
    }

    /**
     * @brief Convert error to string representation
     * @return Formatted error string
     */
    std::string to_string() const {
        return "Error in " + component_ + ": " + what() + " (Code: " + error_code_to_string(code_) +
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
    Result(std::unique_ptr<AllocError> error) : error_(std::move(error)) {}

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

    /**
     * @brief Check if result represents success
     * @return true if operation was successful
     */
    bool is_ok() const {
        return error_ == nullptr;
    }

    /**
     * @brief Check if result represents error
     * @return true if operation failed
     */
    bool is_error() const {
        return error_ != nullptr;
    }

    /**
     * @brief Get the success value
     * @return Reference to the contained value
     * @throws AllocError if result represents an error
     */
    const T& value() const {
        if (error_)
            throw *error_;
        return value_;
    }

    /**
     * @brief Move the success value out of the result
     * @throws AllocError if result represents an error
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
    const AllocError* error() const {
        return error_.get();
    }

private:
    T value_;
    std::unique_ptr<AllocError> error_;
};

// Specialization for void
template <>
class Result<void> {
public:
    Result() : error_(nullptr) {}
    Result(std::unique_ptr<AllocError> error) : error_(std::move(error)) {}

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

    const AllocError* error() const {
        return error_.get();
    }

private:
    std::unique_ptr<AllocError> error_;
};

/**
 * @brief Helper for creating error results
 * @tparam T The type of the successful result
 * @param code The error code
 * @param message The error message
 * @param component The component where error occurred
 * @return Result representing the error
 */
template <typename T>
Result<T> make_error(ErrorCode code, const std::string& message,
                     const std::string& component = "") {
    return Result<T>(std::make_unique<AllocError>(code, message, component));
}

/**
 * @brief Re-wrap the error of one result as the error of another type
 */
template <typename T, typename U>
Result<T> forward_error(const Result<U>& failed, const std::string& component = "") {
    const AllocError* err = failed.error();
    return make_error<T>(err->code(), err->what(),
                         component.empty() ? err->component() : component);
}

}  // namespace alloc_ngin
