#include "facegate/face/FaceMatcher.hpp"
#include "facegate/face/FaceException.hpp"
#include "facegate/core/Logger.hpp"
#include <algorithm>
#include <cmath>

namespace facegate {
namespace face {

FaceMatcher::FaceMatcher(const MatcherConfig& config)
    : config_(config) {
}

void FaceMatcher::checkDimensions(const Embedding& a, const Embedding& b) const {
    const size_t expected = static_cast<size_t>(config_.embedding_dimension);
    if (a.size() != expected || b.size() != expected) {
        throw FaceMatchingException(FaceResultCode::ERROR_EMBEDDING_DIMENSION_MISMATCH,
                                    "expected " + std::to_string(expected) + " values, got " +
                                    std::to_string(a.size()) + " and " + std::to_string(b.size()));
    }
}

float FaceMatcher::similarity(const Embedding& a, const Embedding& b) const {
    checkDimensions(a, b);

    double dot = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * static_cast<double>(b[i]);
    }

    return static_cast<float>(std::clamp(dot, -1.0, 1.0));
}

MatchResult FaceMatcher::compare(const Embedding& live, const Embedding& stored) const {
    MatchResult result;
    result.similarity = similarity(live, stored);
    result.is_match = result.similarity >= config_.similarity_threshold;

    LOG_DEBUG("Face similarity " + std::to_string(result.similarity) +
              (result.is_match ? " (match)" : " (no match)"));
    return result;
}

Embedding FaceMatcher::adaptiveUpdate(const Embedding& stored, const Embedding& live) const {
    return adaptiveUpdate(stored, live, config_.adaptive_alpha);
}

Embedding FaceMatcher::adaptiveUpdate(const Embedding& stored, const Embedding& live, float alpha) const {
    if (!(alpha > 0.0f && alpha <= 1.0f)) {
        throw FaceMatchingException(FaceResultCode::ERROR_INVALID_ADAPTIVE_ALPHA,
                                    "alpha must be in (0, 1], got " + std::to_string(alpha));
    }
    checkDimensions(stored, live);

    Embedding blended(stored.size());
    for (size_t i = 0; i < stored.size(); ++i) {
        blended[i] = (1.0f - alpha) * stored[i] + alpha * live[i];
    }

    std::optional<Embedding> normalized = normalizeEmbedding(blended);
    if (!normalized) {
        throw FaceMatchingException(FaceResultCode::ERROR_EMBEDDING_DEGENERATE,
                                    "blended template has zero norm");
    }
    return *normalized;
}

} // namespace face
} // namespace facegate
