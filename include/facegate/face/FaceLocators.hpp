#pragma once

#include "facegate/face/FaceProviders.hpp"
#include <opencv2/objdetect.hpp>
#include <mutex>
#include <string>

namespace facegate {
namespace face {

/**
 * @brief Face locator backed by the YuNet ONNX detector (cv::FaceDetectorYN)
 *
 * Returns the highest-scoring detection. Calls are serialized because the
 * detector keeps per-call input size state.
 */
class YuNetFaceLocator : public FaceLocator {
public:
    /**
     * @throws ProviderInitException if the model cannot be loaded
     */
    YuNetFaceLocator(const std::string& model_path,
                     float score_threshold = 0.6f,
                     float nms_threshold = 0.3f,
                     int top_k = 5000);

    std::optional<FaceRegion> locate(const cv::Mat& bgr_frame) override;

    std::string name() const override { return "yunet"; }

private:
    cv::Ptr<cv::FaceDetectorYN> detector_;
    std::mutex mutex_;
};

/**
 * @brief Face locator backed by a Haar cascade; picks the largest face
 */
class HaarFaceLocator : public FaceLocator {
public:
    /**
     * @throws ProviderInitException if the cascade cannot be loaded
     */
    explicit HaarFaceLocator(const std::string& cascade_path, int min_face_size = 60);

    std::optional<FaceRegion> locate(const cv::Mat& bgr_frame) override;

    std::string name() const override { return "haar"; }

private:
    cv::CascadeClassifier cascade_;
    int min_face_size_;
    std::mutex mutex_;
};

/**
 * @brief Index of the strongest face in a cv::FaceDetectorYN result (N x 15, score in column 14)
 * @return -1 when there are no detections
 */
int selectStrongestDetection(const cv::Mat& detections);

} // namespace face
} // namespace facegate
