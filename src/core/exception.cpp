#include "facegate/core/exception.h"
#include <sstream>

namespace facegate {
namespace core {

std::string Exception::formatMessage(ResultCode code,
                                     const std::string& message,
                                     const std::string& context) {
    std::ostringstream oss;
    oss << "[" << resultCodeToString(code) << "] " << message;
    if (!context.empty()) {
        oss << " (Context: " << context << ")";
    }
    return oss.str();
}

std::string resultCodeToString(ResultCode code) {
    switch (code) {
        case ResultCode::SUCCESS:
            return "SUCCESS";
        case ResultCode::ERROR_GENERIC:
            return "ERROR_GENERIC";
        case ResultCode::ERROR_INVALID_PARAMETER:
            return "ERROR_INVALID_PARAMETER";
        case ResultCode::ERROR_NOT_INITIALIZED:
            return "ERROR_NOT_INITIALIZED";
        case ResultCode::ERROR_ALREADY_INITIALIZED:
            return "ERROR_ALREADY_INITIALIZED";
        case ResultCode::ERROR_FILE_NOT_FOUND:
            return "ERROR_FILE_NOT_FOUND";
        case ResultCode::ERROR_FILE_IO:
            return "ERROR_FILE_IO";
        case ResultCode::ERROR_CONFIGURATION_INVALID:
            return "ERROR_CONFIGURATION_INVALID";
        case ResultCode::ERROR_PROVIDER_FAILURE:
            return "ERROR_PROVIDER_FAILURE";
        default:
            return "UNKNOWN_ERROR";
    }
}

} // namespace core
} // namespace facegate
