#pragma once

#include "facegate/face/FaceTypes.hpp"
#include "facegate/face/FaceConfig.hpp"
#include "facegate/face/FaceProviders.hpp"
#include "facegate/face/QualityGate.hpp"
#include "facegate/face/MotionAnalyzer.hpp"
#include "facegate/face/SpoofFusion.hpp"
#include <opencv2/core.hpp>
#include <memory>
#include <optional>
#include <vector>

namespace facegate {
namespace face {

/**
 * @brief Liveness decision engine for enrollment stills and login bursts
 *
 * Single-frame policy (enrollment): decode, sharpness floor, face presence.
 * No anti-spoof signals run in this mode.
 *
 * Sequence policy (login):
 *  1. drop frames that fail to decode or fall below the sequence sharpness floor
 *  2. require min_sequence_frames survivors and at least one located face
 *  3. run texture, screen pattern, flat color and depth signals on the sharpest
 *     survivor; reject when failures_to_reject or more signals fail
 *  4. reject when the mean inter-frame difference is below the motion floor
 *
 * Every path returns a verdict. OpenCV errors on frame data become verdicts,
 * and a missing depth provider skips the depth signal.
 *
 * The detector holds no per-request state; concurrent calls are safe as long
 * as the providers are.
 */
class LivenessDetector {
public:
    /**
     * @param locator Mandatory face locator
     * @param depth Optional depth estimator, nullptr when unavailable
     * @throws InvalidParameterException if locator is null
     */
    LivenessDetector(const LivenessConfig& config,
                     std::shared_ptr<FaceLocator> locator,
                     std::shared_ptr<DepthEstimator> depth = nullptr);

    /// Enrollment check on one encoded still
    LivenessVerdict checkSingleFrame(const ImageBytes& image) const;

    /// Enrollment check on a decoded frame; an empty frame counts as undecodable
    LivenessVerdict checkSingleFrame(const cv::Mat& frame) const;

    /// Login check on an ordered burst of encoded frames
    LivenessVerdict checkSequence(const std::vector<ImageBytes>& images) const;

    /// Login check on decoded frames; empty frames are skipped like undecodable ones
    LivenessVerdict checkSequence(const std::vector<cv::Mat>& frames) const;

    /**
     * @brief Spatial signal measurements for one frame and face region
     *
     * Texture, screen pattern and flat color are computed only when the region
     * is at least min_face_size in both dimensions. Depth is attached when a
     * depth estimator is available and the mapped region is large enough.
     */
    SpatialMeasurements measure(const cv::Mat& bgr_frame, const cv::Mat& gray_frame,
                                const FaceRegion& region) const;

    bool hasDepthEstimator() const { return depth_ != nullptr; }

    const LivenessConfig& config() const { return config_; }

    /// Decode an encoded image to BGR, std::nullopt when the bytes are not an image
    static std::optional<cv::Mat> decodeFrame(const ImageBytes& image);

private:
    LivenessConfig config_;
    std::shared_ptr<FaceLocator> locator_;
    std::shared_ptr<DepthEstimator> depth_;
    QualityGate quality_gate_;
    MotionAnalyzer motion_analyzer_;
    SpoofFusion fusion_;
};

} // namespace face
} // namespace facegate
