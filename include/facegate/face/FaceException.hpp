#pragma once

#include "facegate/face/FaceTypes.hpp"
#include "facegate/core/exception.h"
#include <string>
#include <map>

namespace facegate {
namespace face {

/**
 * @brief Base exception class for face operations
 *
 * Thrown only for conditions the caller cannot turn into a verdict: a
 * mandatory provider that fails to load at startup, or a broken precondition
 * on the matcher inputs.
 */
class FaceException : public core::Exception {
public:
    /**
     * @brief Constructor with error code and message
     * @param code Face-specific error code
     * @param message Human-readable error message
     */
    explicit FaceException(FaceResultCode code, const std::string& message = "");

    /**
     * @brief Constructor with error code, message, and context
     * @param code Face-specific error code
     * @param message Human-readable error message
     * @param context Additional error context
     */
    FaceException(FaceResultCode code,
                  const std::string& message,
                  const std::map<std::string, std::string>& context);

    virtual ~FaceException() noexcept = default;

    FaceResultCode getFaceErrorCode() const noexcept { return face_error_code_; }

    const std::map<std::string, std::string>& getContextMap() const noexcept { return context_; }

    /**
     * @brief Add additional context information
     * @param key Context key
     * @param value Context value
     */
    void addContext(const std::string& key, const std::string& value);

protected:
    FaceResultCode face_error_code_;
    std::map<std::string, std::string> context_;
};

/**
 * @brief A mandatory provider (face locator, embedding extractor) could not be created
 */
class ProviderInitException : public FaceException {
public:
    ProviderInitException(const std::string& provider_name, const std::string& message);

    const std::string& getProviderName() const noexcept { return provider_name_; }

private:
    std::string provider_name_;
};

/**
 * @brief Face matching specific exception
 */
class FaceMatchingException : public FaceException {
public:
    explicit FaceMatchingException(FaceResultCode code, const std::string& message = "");
};

} // namespace face
} // namespace facegate
