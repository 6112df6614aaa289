#ifndef QFAB_CORE_RESULT_H_
#define QFAB_CORE_RESULT_H_

#include <string>
#include <optional>
#include <memory>
#include <stdexcept>
#include <utility>
#include "qfab/core/error.h"

namespace qfab {
namespace core {

/**
 * @brief Result type for operations that can fail
 *
 * An error result carries a message and an Error::Code so callers can tell a
 * configuration problem from a planning or write failure without parsing text.
 *
 * Usage:
 * ```
 * Result<int> foo() {
 *     if (error_condition) {
 *         return Result<int>::error("error message", Error::Code::INVALID_ARGUMENT);
 *     }
 *     return Result<int>(42);
 * }
 *
 * auto result = foo();
 * if (result.ok()) {
 *     int value = result.value();
 * } else {
 *     std::string error = result.error();
 * }
 * ```
 */
template<typename T>
class Result {
public:
    Result(T value) : value_(std::move(value)), error_msg_(std::nullopt), code_(Error::Code::UNKNOWN) {}

    explicit Result(const Error& error)
        : value_(), error_msg_(std::string(error.what())), code_(error.code()) {}

    struct ErrorTag {};
    explicit Result(std::string error_msg, Error::Code code, ErrorTag)
        : value_(), error_msg_(std::move(error_msg)), code_(code) {}

    Result(Result&& other) noexcept
        : value_(std::move(other.value_)), error_msg_(std::move(other.error_msg_)), code_(other.code_) {}

    Result& operator=(Result&& other) noexcept {
        if (this != &other) {
            value_ = std::move(other.value_);
            error_msg_ = std::move(other.error_msg_);
            code_ = other.code_;
        }
        return *this;
    }

    // Result is move-only
    Result(const Result&) = delete;
    Result& operator=(const Result&) = delete;

    bool ok() const { return !error_msg_.has_value(); }
    std::string error() const {
        if (!error_msg_) {
            throw std::runtime_error("Attempting to access error of ok result");
        }
        return *error_msg_;
    }
    Error::Code error_code() const { return ok() ? Error::Code::UNKNOWN : code_; }

    const T& value() const { return value_; }
    T& value() { return value_; }
    T&& take_value() { return std::move(value_); }

    static Result<T> error(const std::string& message, Error::Code code = Error::Code::UNKNOWN) {
        return Result<T>(message, code, ErrorTag{});
    }

    // Re-wraps the error of another result, keeping message and code
    template<typename U>
    static Result<T> error(const Result<U>& other) {
        return Result<T>(other.error(), other.error_code(), ErrorTag{});
    }

private:
    T value_;
    std::optional<std::string> error_msg_;
    Error::Code code_;
};

/**
 * @brief Specialization for void results
 */
template<>
class Result<void> {
public:
    Result() : error_msg_(std::nullopt), code_(Error::Code::UNKNOWN) {}
    explicit Result(const Error& error) : error_msg_(std::string(error.what())), code_(error.code()) {}

    struct ErrorTag {};
    explicit Result(std::string error_msg, Error::Code code, ErrorTag)
        : error_msg_(std::move(error_msg)), code_(code) {}

    bool ok() const { return !error_msg_.has_value(); }
    std::string error() const {
        if (!error_msg_) {
            throw std::runtime_error("Attempting to access error of ok result");
        }
        return *error_msg_;
    }
    Error::Code error_code() const { return ok() ? Error::Code::UNKNOWN : code_; }

    static Result<void> error(const std::string& message, Error::Code code = Error::Code::UNKNOWN) {
        return Result<void>(message, code, ErrorTag{});
    }

    template<typename U>
    static Result<void> error(const Result<U>& other) {
        return Result<void>(other.error(), other.error_code(), ErrorTag{});
    }

private:
    std::optional<std::string> error_msg_;
    Error::Code code_;
};

} // namespace core
} // namespace qfab

#endif // QFAB_CORE_RESULT_H_
