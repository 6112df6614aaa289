#ifndef QFAB_CORE_ERROR_H_
#define QFAB_CORE_ERROR_H_

#include <stdexcept>
#include <string>

namespace qfab {
namespace core {

/**
 * @brief Base class for all qfab errors
 */
class Error : public std::runtime_error {
public:
    enum class Code {
        UNKNOWN = 0,
        INVALID_ARGUMENT = 1,
        NOT_FOUND = 2,
        ALREADY_EXISTS = 3,
        RESOURCE_EXHAUSTED = 4,
        INTERNAL = 5,
        INVALID_CONFIGURATION = 6,
        UNSUPPORTED_STORAGE_BACKEND = 7,
        RESOURCE_RESOLUTION_FAILURE = 8,
        PLANNING_FAILURE = 9,
        EXECUTION_FAILURE = 10,
        WRITE_FAILURE = 11
    };

    explicit Error(const std::string& message, Code code = Code::UNKNOWN)
        : std::runtime_error(message), code_(code) {}
    explicit Error(const char* message, Code code = Code::UNKNOWN)
        : std::runtime_error(message), code_(code) {}

    Code code() const { return code_; }
    const char* what() const noexcept override { return std::runtime_error::what(); }

private:
    Code code_;
};

/**
 * @brief Returns the canonical upper-case name of an error code
 */
const char* ErrorCodeName(Error::Code code);

/**
 * @brief Error indicating invalid arguments or parameters
 */
class InvalidArgumentError : public Error {
public:
    explicit InvalidArgumentError(const std::string& message)
        : Error(message, Code::INVALID_ARGUMENT) {}
};

/**
 * @brief Error indicating resource not found
 */
class NotFoundError : public Error {
public:
    explicit NotFoundError(const std::string& message)
        : Error(message, Code::NOT_FOUND) {}
};

/**
 * @brief Static misconfiguration detected while building a context
 */
class InvalidConfigurationError : public Error {
public:
    explicit InvalidConfigurationError(const std::string& message)
        : Error(message, Code::INVALID_CONFIGURATION) {}
};

/**
 * @brief Storage URL scheme or session storage kind with no backend
 */
class UnsupportedStorageBackendError : public Error {
public:
    explicit UnsupportedStorageBackendError(const std::string& message)
        : Error(message, Code::UNSUPPORTED_STORAGE_BACKEND) {}
};

/**
 * @brief Error indicating internal error
 */
class InternalError : public Error {
public:
    explicit InternalError(const std::string& message)
        : Error(message, Code::INTERNAL) {}
};

} // namespace core
} // namespace qfab

#endif // QFAB_CORE_ERROR_H_
