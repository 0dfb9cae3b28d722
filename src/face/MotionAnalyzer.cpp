#include "facegate/face/MotionAnalyzer.hpp"

namespace facegate {
namespace face {

double MotionAnalyzer::computeFrameDifference(const cv::Mat& previous, const cv::Mat& current) {
    if (previous.empty() || current.empty() ||
        previous.size() != current.size() || previous.type() != current.type()) {
        return 0.0;
    }

    cv::Mat diff;
    cv::absdiff(previous, current, diff);
    return cv::mean(diff)[0];
}

double MotionAnalyzer::computeAverageMotion(const std::vector<cv::Mat>& gray_frames) {
    if (gray_frames.size() < 2) {
        return 0.0;
    }

    double sum = 0.0;
    for (size_t i = 1; i < gray_frames.size(); ++i) {
        sum += computeFrameDifference(gray_frames[i - 1], gray_frames[i]);
    }
    return sum / static_cast<double>(gray_frames.size() - 1);
}

} // namespace face
} // namespace facegate
