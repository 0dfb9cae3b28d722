#include "facegate/face/QualityGate.hpp"
#include <opencv2/imgproc.hpp>

namespace facegate {
namespace face {

QualityGate::QualityGate(const LivenessConfig& config)
    : single_threshold_(config.blur_min_single)
    , sequence_threshold_(config.blur_min_sequence) {}

double QualityGate::computeBlurScore(const cv::Mat& gray) {
    if (gray.empty()) {
        return 0.0;
    }

    cv::Mat laplacian;
    cv::Laplacian(gray, laplacian, CV_64F);

    cv::Scalar mean, stddev;
    cv::meanStdDev(laplacian, mean, stddev);
    return stddev[0] * stddev[0];
}

double QualityGate::threshold(CaptureMode mode) const {
    return mode == CaptureMode::SINGLE_FRAME ? single_threshold_ : sequence_threshold_;
}

} // namespace face
} // namespace facegate
