#pragma once

#include <cstdint>
#include <string>

/**
 * @file types.hpp
 * @brief Common type definitions shared across the facegate library
 */

namespace facegate {
namespace core {

/**
 * @brief Generic result codes for library operations
 */
enum class ResultCode : int32_t {
    SUCCESS = 0,
    ERROR_GENERIC = -1,
    ERROR_INVALID_PARAMETER = -2,
    ERROR_NOT_INITIALIZED = -3,
    ERROR_ALREADY_INITIALIZED = -4,
    ERROR_FILE_NOT_FOUND = -5,
    ERROR_FILE_IO = -6,
    ERROR_CONFIGURATION_INVALID = -7,
    ERROR_PROVIDER_FAILURE = -8
};

/**
 * @brief Library version information
 */
struct Version {
    int major;
    int minor;
    int patch;
    std::string tag;

    std::string toString() const {
        std::string result = std::to_string(major) + "." +
                             std::to_string(minor) + "." +
                             std::to_string(patch);
        if (!tag.empty()) {
            result += "-" + tag;
        }
        return result;
    }
};

} // namespace core
} // namespace facegate
