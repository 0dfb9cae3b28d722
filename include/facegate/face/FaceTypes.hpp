#pragma once

#include "facegate/core/types.hpp"
#include <opencv2/core.hpp>
#include <cstdint>
#include <string>
#include <vector>
#include <optional>

namespace facegate {
namespace face {

/**
 * @brief Core types for face liveness and identity matching
 *
 * Frames are plain cv::Mat buffers (CV_8UC3, BGR) owned by the caller for the
 * duration of one request; nothing in this library retains them.
 */

/// Face-specific result codes
enum class FaceResultCode : int32_t {
    SUCCESS = 0,

    // Input / quality
    ERROR_DECODE_FAILED = -100,
    ERROR_IMAGE_TOO_BLURRY = -101,
    ERROR_INSUFFICIENT_FRAMES = -102,

    // Presence
    ERROR_NO_FACE_DETECTED = -110,

    // Spoofing
    ERROR_PRESENTATION_ATTACK_DETECTED = -120,
    ERROR_MOTION_LIVENESS_FAILED = -121,

    // Matching
    ERROR_NO_MATCH = -130,
    ERROR_EMBEDDING_DIMENSION_MISMATCH = -131,
    ERROR_EMBEDDING_DEGENERATE = -132,
    ERROR_INVALID_ADAPTIVE_ALPHA = -133,

    // Providers
    ERROR_PROVIDER_UNAVAILABLE = -140,
    ERROR_PROVIDER_INIT_FAILED = -141
};

/// Encoded image (JPEG, PNG, ...) as received from the capture client
using ImageBytes = std::vector<uint8_t>;

/// Fixed embedding length produced by the SFace recognizer
constexpr int EMBEDDING_DIMENSION = 128;

/// Identity embedding, unit L2 norm at every observable boundary
using Embedding = std::vector<float>;

/**
 * @brief Axis-aligned face rectangle in frame coordinates
 */
struct FaceRegion {
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;

    FaceRegion() = default;
    FaceRegion(int x_, int y_, int w_, int h_) : x(x_), y(y_), width(w_), height(h_) {}

    bool hasPositiveArea() const { return width > 0 && height > 0; }

    /// Both dimensions at least min_size pixels
    bool isAnalyzable(int min_size) const {
        return width >= min_size && height >= min_size;
    }

    int area() const { return width * height; }

    cv::Rect toRect() const { return cv::Rect(x, y, width, height); }

    /**
     * @brief Intersect a rectangle with the frame bounds
     * @return Clipped region, empty if the rectangle lies outside the frame
     */
    static FaceRegion clippedTo(const cv::Rect& rect, const cv::Size& frame_size) {
        cv::Rect clipped = rect & cv::Rect(0, 0, frame_size.width, frame_size.height);
        return FaceRegion(clipped.x, clipped.y, clipped.width, clipped.height);
    }
};

/**
 * @brief Output of one anti-spoof signal on one analyzed frame
 */
struct SignalReading {
    std::string name;         ///< Signal name ("texture", "screen_pattern", ...)
    bool failed = false;      ///< Signal reports a spoof indication
    double value = 0.0;       ///< Primary measured value
    std::string diagnostic;   ///< Formatted measurement, e.g. "entropy=3.21"
};

/**
 * @brief Liveness decision returned to the caller
 */
struct LivenessVerdict {
    bool passed = false;
    std::string reason;
    double blur_score = 0.0;     ///< Mean Laplacian variance of usable frames
    double motion_score = 0.0;   ///< Mean inter-frame absolute difference
    FaceResultCode result_code = FaceResultCode::ERROR_DECODE_FAILED;
    std::vector<SignalReading> signals;  ///< Spatial signal readings (sequence mode)

    static LivenessVerdict pass(double blur, double motion = 0.0) {
        LivenessVerdict verdict;
        verdict.passed = true;
        verdict.reason = "OK";
        verdict.blur_score = blur;
        verdict.motion_score = motion;
        verdict.result_code = FaceResultCode::SUCCESS;
        return verdict;
    }

    static LivenessVerdict fail(FaceResultCode code, const std::string& reason,
                                double blur = 0.0, double motion = 0.0) {
        LivenessVerdict verdict;
        verdict.passed = false;
        verdict.reason = reason;
        verdict.blur_score = blur;
        verdict.motion_score = motion;
        verdict.result_code = code;
        return verdict;
    }
};

/**
 * @brief Embedding comparison result
 */
struct MatchResult {
    bool is_match = false;
    float similarity = 0.0f;   ///< Cosine similarity in [-1, 1]
};

/// Euclidean norm of an embedding
double embeddingNorm(const Embedding& embedding);

/**
 * @brief Scale an embedding to unit length
 * @return Normalized copy, or std::nullopt for an empty or zero vector
 */
std::optional<Embedding> normalizeEmbedding(const Embedding& embedding);

/// Helper function to convert FaceResultCode to string
std::string faceResultCodeToString(FaceResultCode code);

/// Current library version
const core::Version FACEGATE_VERSION{1, 0, 0, ""};

} // namespace face
} // namespace facegate
