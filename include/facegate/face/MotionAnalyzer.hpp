#pragma once

#include "facegate/face/FaceConfig.hpp"
#include <opencv2/core.hpp>
#include <vector>

namespace facegate {
namespace face {

/**
 * @brief Inter-frame motion over a login burst
 *
 * Natural micro-movement (blinks, head sway) changes pixels between frames;
 * a replayed photo or a looped still barely does.
 */
class MotionAnalyzer {
public:
    explicit MotionAnalyzer(const LivenessConfig& config)
        : motion_floor_(config.motion_avg_min) {}

    /**
     * @brief Mean absolute pixel difference of two equally sized grayscale frames
     * @return 0 when either frame is empty or sizes differ
     */
    static double computeFrameDifference(const cv::Mat& previous, const cv::Mat& current);

    /**
     * @brief Average of the per-pair differences over consecutive frames
     * @param gray_frames Ordered grayscale frames
     * @return 0 for fewer than two frames
     */
    static double computeAverageMotion(const std::vector<cv::Mat>& gray_frames);

    /// True when the average motion is below the configured floor
    bool isStatic(double average_motion) const { return average_motion < motion_floor_; }

    double motionFloor() const { return motion_floor_; }

private:
    double motion_floor_;
};

} // namespace face
} // namespace facegate
