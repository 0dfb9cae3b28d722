#include "facegate/face/FaceException.hpp"

namespace facegate {
namespace face {

namespace {

core::ResultCode toCoreCode(FaceResultCode code) {
    switch (code) {
        case FaceResultCode::SUCCESS:
            return core::ResultCode::SUCCESS;
        case FaceResultCode::ERROR_PROVIDER_UNAVAILABLE:
        case FaceResultCode::ERROR_PROVIDER_INIT_FAILED:
            return core::ResultCode::ERROR_PROVIDER_FAILURE;
        case FaceResultCode::ERROR_EMBEDDING_DIMENSION_MISMATCH:
        case FaceResultCode::ERROR_EMBEDDING_DEGENERATE:
        case FaceResultCode::ERROR_INVALID_ADAPTIVE_ALPHA:
            return core::ResultCode::ERROR_INVALID_PARAMETER;
        default:
            return core::ResultCode::ERROR_GENERIC;
    }
}

std::string composeMessage(FaceResultCode code, const std::string& message) {
    std::string text = faceResultCodeToString(code);
    if (!message.empty()) {
        text += ": " + message;
    }
    return text;
}

} // namespace

FaceException::FaceException(FaceResultCode code, const std::string& message)
    : core::Exception(toCoreCode(code), composeMessage(code, message))
    , face_error_code_(code) {}

FaceException::FaceException(FaceResultCode code,
                             const std::string& message,
                             const std::map<std::string, std::string>& context)
    : core::Exception(toCoreCode(code), composeMessage(code, message))
    , face_error_code_(code)
    , context_(context) {}

void FaceException::addContext(const std::string& key, const std::string& value) {
    context_[key] = value;
}

ProviderInitException::ProviderInitException(const std::string& provider_name,
                                             const std::string& message)
    : FaceException(FaceResultCode::ERROR_PROVIDER_INIT_FAILED,
                    provider_name + ": " + message,
                    {{"provider", provider_name}})
    , provider_name_(provider_name) {}

FaceMatchingException::FaceMatchingException(FaceResultCode code, const std::string& message)
    : FaceException(code, message) {}

} // namespace face
} // namespace facegate
