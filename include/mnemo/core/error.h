#ifndef MNEMO_CORE_ERROR_H_
#define MNEMO_CORE_ERROR_H_

#include <stdexcept>
#include <string>

namespace mnemo {
namespace core {

/**
 * @brief Base class for all mnemo errors
 */
class Error : public std::runtime_error {
public:
    enum class Code {
        UNKNOWN = 0,
        INVALID_ARGUMENT = 1,
        NOT_FOUND = 2,
        IO_ERROR = 3,
        CONSISTENCY = 4,
        INTERNAL = 5
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
 * @brief Returns a stable upper-case name for an error code
 */
inline const char* error_code_name(Error::Code code) {
    switch (code) {
        case Error::Code::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
        case Error::Code::NOT_FOUND: return "NOT_FOUND";
        case Error::Code::IO_ERROR: return "IO_ERROR";
        case Error::Code::CONSISTENCY: return "CONSISTENCY";
        case Error::Code::INTERNAL: return "INTERNAL";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Rejected input (bad category, importance out of range, bad config)
 */
class InvalidArgumentError : public Error {
public:
    explicit InvalidArgumentError(const std::string& message)
        : Error(message, Code::INVALID_ARGUMENT) {}
    explicit InvalidArgumentError(const char* message)
        : Error(message, Code::INVALID_ARGUMENT) {}
};

/**
 * @brief Error indicating resource not found
 */
class NotFoundError : public Error {
public:
    explicit NotFoundError(const std::string& message)
        : Error(message, Code::NOT_FOUND) {}
    explicit NotFoundError(const char* message)
        : Error(message, Code::NOT_FOUND) {}
};

/**
 * @brief Snapshot read/write failure
 */
class IOError : public Error {
public:
    explicit IOError(const std::string& message)
        : Error(message, Code::IO_ERROR) {}
    explicit IOError(const char* message)
        : Error(message, Code::IO_ERROR) {}
};

/**
 * @brief Fragment store and vector index disagree
 */
class ConsistencyError : public Error {
public:
    explicit ConsistencyError(const std::string& message)
        : Error(message, Code::CONSISTENCY) {}
    explicit ConsistencyError(const char* message)
        : Error(message, Code::CONSISTENCY) {}
};

/**
 * @brief Error indicating internal error
 */
class InternalError : public Error {
public:
    explicit InternalError(const std::string& message)
        : Error(message, Code::INTERNAL) {}
    explicit InternalError(const char* message)
        : Error(message, Code::INTERNAL) {}
};

} // namespace core
} // namespace mnemo

#endif // MNEMO_CORE_ERROR_H_
