#pragma once

#include "facegate/core/types.hpp"
#include <stdexcept>
#include <string>

/**
 * @file exception.h
 * @brief Exception handling system for the facegate library
 */

namespace facegate {
namespace core {

/**
 * @brief Base exception class for all facegate exceptions
 *
 * Carries a result code and optional context (usually file:line of the
 * throw site). Exceptions are reserved for startup and programming errors;
 * per-request outcomes are reported as result values.
 */
class Exception : public std::runtime_error {
public:
    /**
     * @brief Construct exception with result code and message
     * @param code Result code indicating error type
     * @param message Detailed error description
     * @param context Additional context information
     */
    Exception(ResultCode code,
              const std::string& message,
              const std::string& context = "")
        : std::runtime_error(formatMessage(code, message, context))
        , result_code_(code)
        , message_(message)
        , context_(context) {}

    ResultCode getResultCode() const noexcept { return result_code_; }

    const std::string& getMessage() const noexcept { return message_; }

    const std::string& getContext() const noexcept { return context_; }

private:
    ResultCode result_code_;
    std::string message_;
    std::string context_;

    static std::string formatMessage(ResultCode code,
                                     const std::string& message,
                                     const std::string& context);
};

/**
 * @brief Invalid argument passed to a library call
 */
class InvalidParameterException : public Exception {
public:
    InvalidParameterException(const std::string& message,
                              const std::string& context = "")
        : Exception(ResultCode::ERROR_INVALID_PARAMETER, message, context) {}
};

/**
 * @brief Configuration failed validation
 */
class ConfigurationException : public Exception {
public:
    ConfigurationException(const std::string& message,
                           const std::string& context = "")
        : Exception(ResultCode::ERROR_CONFIGURATION_INVALID, message, context) {}
};

/**
 * @brief Convert result code to string representation
 * @param code Result code to convert
 * @return String representation of result code
 */
std::string resultCodeToString(ResultCode code);

/**
 * @brief Macro for throwing exceptions with automatic context
 */
#define FACEGATE_THROW(ExceptionType, message) \
    throw ExceptionType(message, std::string(__FILE__) + ":" + std::to_string(__LINE__))

#define FACEGATE_THROW_CODE(ExceptionType, code, message) \
    throw ExceptionType(code, message, std::string(__FILE__) + ":" + std::to_string(__LINE__))

} // namespace core
} // namespace facegate
