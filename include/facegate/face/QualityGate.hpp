#pragma once

#include "facegate/face/FaceConfig.hpp"
#include <opencv2/core.hpp>

namespace facegate {
namespace face {

/// Capture mode selecting the sharpness floor
enum class CaptureMode {
    SINGLE_FRAME,   ///< Enrollment still, stricter floor
    SEQUENCE        ///< Login burst, per-frame floor
};

/**
 * @brief Per-frame sharpness filter
 *
 * The blur score is the variance of the Laplacian of the grayscale frame;
 * higher is sharper. A single still must clear blur_min_single, each frame of
 * a burst only blur_min_sequence since blurry burst frames can be dropped.
 */
class QualityGate {
public:
    explicit QualityGate(const LivenessConfig& config);

    /**
     * @brief Laplacian variance of a grayscale image
     * @param gray CV_8UC1 image
     * @return Sharpness score, 0 for an empty image
     */
    static double computeBlurScore(const cv::Mat& gray);

    /// Threshold applied in the given mode
    double threshold(CaptureMode mode) const;

    bool accepts(double blur_score, CaptureMode mode) const {
        return blur_score >= threshold(mode);
    }

private:
    double single_threshold_;
    double sequence_threshold_;
};

} // namespace face
} // namespace facegate
