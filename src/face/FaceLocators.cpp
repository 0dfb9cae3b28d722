#include "facegate/face/FaceLocators.hpp"
#include "facegate/face/FaceException.hpp"
#include "facegate/core/Logger.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <filesystem>
#include <system_error>
#include <vector>

namespace facegate {
namespace face {

namespace fs = std::filesystem;

int selectStrongestDetection(const cv::Mat& detections) {
    if (detections.empty() || detections.cols < 15) {
        return -1;
    }

    int best = 0;
    for (int i = 1; i < detections.rows; ++i) {
        if (detections.at<float>(i, 14) > detections.at<float>(best, 14)) {
            best = i;
        }
    }
    return best;
}

YuNetFaceLocator::YuNetFaceLocator(const std::string& model_path,
                                   float score_threshold,
                                   float nms_threshold,
                                   int top_k) {
    std::error_code ec;
    if (!fs::is_regular_file(model_path, ec)) {
        throw ProviderInitException(name(), "model not found at " + model_path);
    }

    try {
        detector_ = cv::FaceDetectorYN::create(model_path, "", cv::Size(320, 320),
                                               score_threshold, nms_threshold, top_k);
    } catch (const cv::Exception& e) {
        throw ProviderInitException(name(), std::string("failed to load model: ") + e.what());
    }

    if (detector_.empty()) {
        throw ProviderInitException(name(), "detector creation returned null");
    }

    LOG_INFO("YuNet face locator loaded from " + model_path);
}

std::optional<FaceRegion> YuNetFaceLocator::locate(const cv::Mat& bgr_frame) {
    if (bgr_frame.empty()) {
        return std::nullopt;
    }

    cv::Mat detections;
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        detector_->setInputSize(bgr_frame.size());
        detector_->detect(bgr_frame, detections);
    } catch (const cv::Exception& e) {
        LOG_ERROR(std::string("YuNet detection failed: ") + e.what());
        return std::nullopt;
    }

    const int best = selectStrongestDetection(detections);
    if (best < 0) {
        return std::nullopt;
    }

    const cv::Rect rect(static_cast<int>(detections.at<float>(best, 0)),
                        static_cast<int>(detections.at<float>(best, 1)),
                        static_cast<int>(detections.at<float>(best, 2)),
                        static_cast<int>(detections.at<float>(best, 3)));

    FaceRegion region = FaceRegion::clippedTo(rect, bgr_frame.size());
    if (!region.hasPositiveArea()) {
        return std::nullopt;
    }
    return region;
}

HaarFaceLocator::HaarFaceLocator(const std::string& cascade_path, int min_face_size)
    : min_face_size_(min_face_size) {
    if (!cascade_.load(cascade_path)) {
        throw ProviderInitException(name(), "failed to load cascade " + cascade_path);
    }
    LOG_INFO("Haar face locator loaded from " + cascade_path);
}

std::optional<FaceRegion> HaarFaceLocator::locate(const cv::Mat& bgr_frame) {
    if (bgr_frame.empty()) {
        return std::nullopt;
    }

    cv::Mat gray;
    if (bgr_frame.channels() == 3) {
        cv::cvtColor(bgr_frame, gray, cv::COLOR_BGR2GRAY);
    } else {
        gray = bgr_frame;
    }

    std::vector<cv::Rect> faces;
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        cascade_.detectMultiScale(gray, faces, 1.1, 5, 0,
                                  cv::Size(min_face_size_, min_face_size_));
    } catch (const cv::Exception& e) {
        LOG_ERROR(std::string("Haar detection failed: ") + e.what());
        return std::nullopt;
    }

    if (faces.empty()) {
        return std::nullopt;
    }

    auto largest = std::max_element(faces.begin(), faces.end(),
        [](const cv::Rect& a, const cv::Rect& b) { return a.area() < b.area(); });

    FaceRegion region = FaceRegion::clippedTo(*largest, bgr_frame.size());
    if (!region.hasPositiveArea()) {
        return std::nullopt;
    }
    return region;
}

} // namespace face
} // namespace facegate
