// include/renewfolio/core/error.hpp

#pragma once

#include <exception>
#include <memory>
#include <stdexcept>
#include <string>

namespace renewfolio {

/**
 * @brief Error codes for the allocation system
 * Numerical failures are grouped by the stage that detects them
 */
enum class ErrorCode {
    NONE = 0,
    UNKNOWN_ERROR = 1,
    INVALID_ARGUMENT = 2,
    NOT_INITIALIZED = 3,

    // Data errors
    INVALID_DATA = 4,
    INSUFFICIENT_DATA = 5,
    SERIES_MISMATCH = 6,

    // Configuration errors
    CONFIGURATION_ERROR = 7,

    // Model errors
    MODEL_FIT_ERROR = 8,
    INFEASIBLE_CONSTRAINTS = 9,

    // File and I/O errors
    FILE_NOT_FOUND = 20,
    FILE_IO_ERROR = 21,

    // JSON and parsing errors
    JSON_PARSE_ERROR = 23
};

inline std::string error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE:
            return "NONE";
        case ErrorCode::UNKNOWN_ERROR:
            return "UNKNOWN_ERROR";
        case ErrorCode::INVALID_ARGUMENT:
            return "INVALID_ARGUMENT";
        case ErrorCode::NOT_INITIALIZED:
            return "NOT_INITIALIZED";
        case ErrorCode::INVALID_DATA:
            return "INVALID_DATA";
        case ErrorCode::INSUFFICIENT_DATA:
            return "INSUFFICIENT_DATA";
        case ErrorCode::SERIES_MISMATCH:
            return "SERIES_MISMATCH";
        case ErrorCode::CONFIGURATION_ERROR:
            return "CONFIGURATION_ERROR";
        case ErrorCode::MODEL_FIT_ERROR:
            return "MODEL_FIT_ERROR";
        case ErrorCode::INFEASIBLE_CONSTRAINTS:
            return "INFEASIBLE_CONSTRAINTS";
        case ErrorCode::FILE_NOT_FOUND:
            return "FILE_NOT_FOUND";
        case ErrorCode::FILE_IO_ERROR:
            return "FILE_IO_ERROR";
        case ErrorCode::JSON_PARSE_ERROR:
            return "JSON_PARSE_ERROR";
        default:
            return "UNKNOWN";
    }
}

/**
 * @brief Error raised by renewfolio components
 */
class RenewfolioError : public std::runtime_error {
public:
    /**
     * @brief Constructor for RenewfolioError
     * @param code The error code
     * @param message Detailed error message
     * @param component Component where error occurred
     */
    RenewfolioError(ErrorCode code, const std::string& message, const std::string& component = "")
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
    Result(std::unique_ptr<RenewfolioError> error) : error_(std::move(error)) {}

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
     * @return Reference to the contained value
     * @throws RenewfolioError if result represents an error
     */
    const T& value() const {
        if (error_)
            throw *error_;
        return value_;
    }

    /**
     * @brief Get the error if present
     * @return Pointer to the error, or nullptr if success
     */
    const RenewfolioError* error() const {
        return error_.get();
    }

private:
    T value_;
    std::unique_ptr<RenewfolioError> error_;
};

// Specialization for void
template <>
class Result<void> {
public:
    Result() : error_(nullptr) {}
    Result(std::unique_ptr<RenewfolioError> error) : error_(std::move(error)) {}

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

    const RenewfolioError* error() const {
        return error_.get();
    }

private:
    std::unique_ptr<RenewfolioError> error_;
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
    return Result<T>(std::make_unique<RenewfolioError>(code, message, component));
}

/**
 * @brief Re-wrap an error from another Result under a new value type
 */
template <typename T>
Result<T> forward_error(const RenewfolioError* error) {
    return make_error<T>(error->code(), error->what(), error->component());
}

}  // namespace renewfolio
