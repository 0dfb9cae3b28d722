#include "facegate/face/FaceAuthService.hpp"
#include "facegate/face/FaceException.hpp"
#include "facegate/core/exception.h"
#include "facegate/core/Logger.hpp"

namespace facegate {
namespace face {

FaceAuthService::FaceAuthService(const LivenessConfig& liveness_config,
                                 const MatcherConfig& matcher_config,
                                 std::shared_ptr<ProviderRegistry> registry)
    : liveness_config_(liveness_config)
    , matcher_config_(matcher_config)
    , registry_(std::move(registry))
    , matcher_(matcher_config) {
    requireValid("liveness", liveness_config_.validate());
    requireValid("matching", matcher_config_.validate());

    if (!registry_) {
        FACEGATE_THROW(core::InvalidParameterException, "FaceAuthService requires a provider registry");
    }
}

void FaceAuthService::initialize() {
    if (initialized_.load(std::memory_order_acquire)) {
        return;
    }

    std::lock_guard<std::mutex> lock(init_mutex_);
    if (initialized_.load(std::memory_order_relaxed)) {
        return;
    }

    std::shared_ptr<FaceLocator> locator = registry_->faceLocator();
    std::shared_ptr<EmbeddingExtractor> extractor = registry_->embeddingExtractor();

    if (extractor->dimension() != matcher_config_.embedding_dimension) {
        ProviderInitException error(extractor->name(), "embedding dimension does not match the matcher");
        error.addContext("extractor_dimension", std::to_string(extractor->dimension()));
        error.addContext("matcher_dimension", std::to_string(matcher_config_.embedding_dimension));
        throw error;
    }

    std::shared_ptr<DepthEstimator> depth = registry_->depthEstimator();
    extractor_ = std::move(extractor);
    detector_ = std::make_unique<LivenessDetector>(liveness_config_, std::move(locator), std::move(depth));
    initialized_.store(true, std::memory_order_release);

    LOG_INFO("Face auth service ready (facegate " + FACEGATE_VERSION.toString() +
             ", depth " + (detector_->hasDepthEstimator() ? "enabled" : "unavailable") + ")");
}

const LivenessDetector& FaceAuthService::detector() const {
    if (!initialized_.load(std::memory_order_acquire)) {
        FACEGATE_THROW_CODE(core::Exception, core::ResultCode::ERROR_NOT_INITIALIZED,
                            "FaceAuthService::initialize() has not been called");
    }
    return *detector_;
}

LivenessVerdict FaceAuthService::checkSingleFrameLiveness(const ImageBytes& image) const {
    return detector().checkSingleFrame(image);
}

LivenessVerdict FaceAuthService::checkSequenceLiveness(const std::vector<ImageBytes>& images) const {
    return detector().checkSequence(images);
}

MatchResult FaceAuthService::compareEmbeddings(const Embedding& live, const Embedding& stored) const {
    return matcher_.compare(live, stored);
}

Embedding FaceAuthService::adaptiveUpdate(const Embedding& stored, const Embedding& live) const {
    return matcher_.adaptiveUpdate(stored, live);
}

std::optional<Embedding> FaceAuthService::extractEmbedding(const ImageBytes& image) const {
    detector();

    std::optional<cv::Mat> frame = LivenessDetector::decodeFrame(image);
    if (!frame) {
        return std::nullopt;
    }

    std::optional<Embedding> embedding = extractor_->embed(*frame);
    if (!embedding) {
        LOG_DEBUG("No face embedding extracted");
        return std::nullopt;
    }
    return normalizeEmbedding(*embedding);
}

EnrollmentOutcome FaceAuthService::enroll(const ImageBytes& image) const {
    EnrollmentOutcome outcome;
    outcome.verdict = detector().checkSingleFrame(image);
    if (!outcome.verdict.passed) {
        outcome.result_code = outcome.verdict.result_code;
        FACEGATE_LOG_INFO("Enroll") << "Liveness failed: " << outcome.verdict.reason;
        return outcome;
    }

    outcome.embedding = extractEmbedding(image);
    if (!outcome.embedding) {
        outcome.result_code = FaceResultCode::ERROR_NO_FACE_DETECTED;
        FACEGATE_LOG_INFO("Enroll") << "No face embedding in enrollment image";
        return outcome;
    }

    outcome.result_code = FaceResultCode::SUCCESS;
    return outcome;
}

VerificationOutcome FaceAuthService::verify(const std::vector<ImageBytes>& images,
                                            const Embedding& stored) const {
    VerificationOutcome outcome;
    outcome.verdict = detector().checkSequence(images);
    if (!outcome.verdict.passed) {
        outcome.result_code = outcome.verdict.result_code;
        FACEGATE_LOG_INFO("Verify") << "Liveness failed: " << outcome.verdict.reason;
        return outcome;
    }

    const ImageBytes& middle = images[images.size() / 2];
    std::optional<Embedding> live = extractEmbedding(middle);
    if (!live) {
        outcome.result_code = FaceResultCode::ERROR_NO_FACE_DETECTED;
        FACEGATE_LOG_INFO("Verify") << "No face embedding in frame " << images.size() / 2;
        return outcome;
    }

    outcome.match = matcher_.compare(*live, stored);
    FACEGATE_LOG_INFO("Verify") << "similarity=" << formatDecimal(outcome.match.similarity, 3)
                                << " threshold=" << formatDecimal(matcher_.threshold(), 3);

    if (!outcome.match.is_match) {
        outcome.result_code = FaceResultCode::ERROR_NO_MATCH;
        return outcome;
    }

    outcome.updated_embedding = matcher_.adaptiveUpdate(stored, *live);
    outcome.result_code = FaceResultCode::SUCCESS;
    return outcome;
}

} // namespace face
} // namespace facegate
