#pragma once

#include "facegate/face/FaceProviders.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace facegate {
namespace face {

/**
 * @brief Monocular relative depth from a MiDaS-small ONNX model (ONNX Runtime)
 *
 * Output is an input_size x input_size CV_32FC1 inverse-depth map.
 */
class MidasDepthEstimator : public DepthEstimator {
public:
    /**
     * @throws ProviderInitException if the model cannot be loaded
     */
    explicit MidasDepthEstimator(const std::string& model_path, int input_size = 256);

    ~MidasDepthEstimator() override;

    MidasDepthEstimator(const MidasDepthEstimator&) = delete;
    MidasDepthEstimator& operator=(const MidasDepthEstimator&) = delete;

    std::optional<cv::Mat> estimateDepth(const cv::Mat& bgr_frame) override;

    std::string name() const override { return "midas"; }

    /**
     * @brief Network input for a BGR frame: RGB planes (NCHW order), bilinear
     *        resize to size x size, ImageNet mean/std normalization
     */
    static std::vector<float> preprocess(const cv::Mat& bgr_frame, int size);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
    int input_size_;
    std::mutex mutex_;
};

} // namespace face
} // namespace facegate
