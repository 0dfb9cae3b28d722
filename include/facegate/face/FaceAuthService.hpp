#pragma once

#include "facegate/face/FaceTypes.hpp"
#include "facegate/face/FaceConfig.hpp"
#include "facegate/face/FaceMatcher.hpp"
#include "facegate/face/LivenessDetector.hpp"
#include "facegate/face/ProviderRegistry.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace facegate {
namespace face {

/**
 * @brief Result of an enrollment attempt
 *
 * On success the embedding is the new template; persisting it is up to the caller.
 */
struct EnrollmentOutcome {
    LivenessVerdict verdict;
    std::optional<Embedding> embedding;
    FaceResultCode result_code = FaceResultCode::ERROR_DECODE_FAILED;

    bool succeeded() const { return result_code == FaceResultCode::SUCCESS; }
};

/**
 * @brief Result of a login attempt
 *
 * updated_embedding is set only on a match and holds the adaptively updated
 * template the caller should store in place of the old one.
 */
struct VerificationOutcome {
    LivenessVerdict verdict;
    MatchResult match;
    std::optional<Embedding> updated_embedding;
    FaceResultCode result_code = FaceResultCode::ERROR_DECODE_FAILED;

    bool succeeded() const { return result_code == FaceResultCode::SUCCESS; }
};

/**
 * @brief Entry point for enrollment and login flows
 *
 * Usage:
 * @code
 *   auto registry = ProviderRegistry::fromConfig(provider_config);
 *   FaceAuthService service(liveness_config, matcher_config, registry);
 *   service.initialize();   // throws ProviderInitException on a missing model
 *   EnrollmentOutcome enrolled = service.enroll(image);
 * @endcode
 */
class FaceAuthService {
public:
    /**
     * @throws core::ConfigurationException if either configuration is invalid
     * @throws core::InvalidParameterException if registry is null
     */
    FaceAuthService(const LivenessConfig& liveness_config,
                    const MatcherConfig& matcher_config,
                    std::shared_ptr<ProviderRegistry> registry);

    FaceAuthService(const FaceAuthService&) = delete;
    FaceAuthService& operator=(const FaceAuthService&) = delete;

    /**
     * @brief Resolve providers and build the liveness engine
     *
     * Idempotent and safe to call from several threads; the first caller
     * builds the engine, the others wait for it. A failed attempt leaves the
     * service uninitialized so a later call retries. Must complete before any
     * other operation.
     * @throws ProviderInitException if a mandatory provider cannot be loaded
     */
    void initialize();

    bool isInitialized() const { return initialized_.load(std::memory_order_acquire); }

    LivenessVerdict checkSingleFrameLiveness(const ImageBytes& image) const;

    LivenessVerdict checkSequenceLiveness(const std::vector<ImageBytes>& images) const;

    MatchResult compareEmbeddings(const Embedding& live, const Embedding& stored) const;

    Embedding adaptiveUpdate(const Embedding& stored, const Embedding& live) const;

    /**
     * @brief Unit-norm embedding of the face in an encoded image
     * @return std::nullopt when the image cannot be decoded or holds no usable face
     */
    std::optional<Embedding> extractEmbedding(const ImageBytes& image) const;

    /// Single-frame liveness followed by template extraction
    EnrollmentOutcome enroll(const ImageBytes& image) const;

    /**
     * @brief Sequence liveness, then match the middle frame against the stored template
     * @throws FaceMatchingException if the stored template has the wrong length
     */
    VerificationOutcome verify(const std::vector<ImageBytes>& images, const Embedding& stored) const;

    const LivenessConfig& livenessConfig() const { return liveness_config_; }

    const MatcherConfig& matcherConfig() const { return matcher_config_; }

private:
    const LivenessDetector& detector() const;

    LivenessConfig liveness_config_;
    MatcherConfig matcher_config_;
    std::shared_ptr<ProviderRegistry> registry_;
    FaceMatcher matcher_;

    // Written once under init_mutex_, read-only after initialized_ is set
    std::shared_ptr<EmbeddingExtractor> extractor_;
    std::unique_ptr<LivenessDetector> detector_;
    std::atomic<bool> initialized_{false};
    std::mutex init_mutex_;
};

} // namespace face
} // namespace facegate
