#pragma once

#include "facegate/face/FaceTypes.hpp"
#include "facegate/face/FaceConfig.hpp"

namespace facegate {
namespace face {

/**
 * @brief Identity matching on unit-norm embeddings
 *
 * Similarity is the dot product of two unit vectors (cosine similarity),
 * clamped to [-1, 1]. A pair matches when similarity >= threshold.
 *
 * The adaptive update blends the stored template toward a live sample,
 * new = normalize((1 - alpha) * stored + alpha * live), so a template tracks
 * gradual appearance drift across successful logins.
 *
 * Stateless apart from configuration; safe to share between threads.
 */
class FaceMatcher {
public:
    explicit FaceMatcher(const MatcherConfig& config = MatcherConfig());

    /**
     * @brief Compare a live embedding against a stored one
     * @throws FaceMatchingException if the lengths differ from each other or
     *         from the configured dimension
     */
    MatchResult compare(const Embedding& live, const Embedding& stored) const;

    /**
     * @brief Cosine similarity of two unit-norm embeddings
     * @throws FaceMatchingException on length mismatch
     */
    float similarity(const Embedding& a, const Embedding& b) const;

    /// Blend with the configured alpha
    Embedding adaptiveUpdate(const Embedding& stored, const Embedding& live) const;

    /**
     * @brief Blend the stored template toward the live sample
     * @return Unit-norm blended template
     * @throws FaceMatchingException on length mismatch, alpha outside (0, 1]
     *         or a blend with zero norm
     */
    Embedding adaptiveUpdate(const Embedding& stored, const Embedding& live, float alpha) const;

    float threshold() const { return config_.similarity_threshold; }

    float alpha() const { return config_.adaptive_alpha; }

private:
    void checkDimensions(const Embedding& a, const Embedding& b) const;

    MatcherConfig config_;
};

} // namespace face
} // namespace facegate
