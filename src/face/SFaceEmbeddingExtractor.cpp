#include "facegate/face/SFaceEmbeddingExtractor.hpp"
#include "facegate/face/FaceLocators.hpp"
#include "facegate/face/FaceException.hpp"
#include "facegate/core/Logger.hpp"
#include <filesystem>
#include <system_error>

namespace facegate {
namespace face {

namespace fs = std::filesystem;

SFaceEmbeddingExtractor::SFaceEmbeddingExtractor(const std::string& detector_model_path,
                                                 const std::string& recognizer_model_path,
                                                 float score_threshold,
                                                 float nms_threshold,
                                                 int top_k) {
    std::error_code ec;
    if (!fs::is_regular_file(detector_model_path, ec)) {
        throw ProviderInitException(name(), "detector model not found at " + detector_model_path);
    }
    if (!fs::is_regular_file(recognizer_model_path, ec)) {
        throw ProviderInitException(name(), "recognizer model not found at " + recognizer_model_path);
    }

    try {
        detector_ = cv::FaceDetectorYN::create(detector_model_path, "", cv::Size(320, 320),
                                               score_threshold, nms_threshold, top_k);
        recognizer_ = cv::FaceRecognizerSF::create(recognizer_model_path, "");
    } catch (const cv::Exception& e) {
        throw ProviderInitException(name(), std::string("failed to load models: ") + e.what());
    }

    if (detector_.empty() || recognizer_.empty()) {
        throw ProviderInitException(name(), "model creation returned null");
    }

    LOG_INFO("SFace embedding extractor loaded from " + recognizer_model_path);
}

std::optional<Embedding> SFaceEmbeddingExtractor::embed(const cv::Mat& bgr_frame) {
    if (bgr_frame.empty()) {
        return std::nullopt;
    }

    cv::Mat feature;
    try {
        std::lock_guard<std::mutex> lock(mutex_);

        cv::Mat detections;
        detector_->setInputSize(bgr_frame.size());
        detector_->detect(bgr_frame, detections);

        const int best = selectStrongestDetection(detections);
        if (best < 0) {
            return std::nullopt;
        }

        cv::Mat aligned;
        recognizer_->alignCrop(bgr_frame, detections.row(best), aligned);
        recognizer_->feature(aligned, feature);
    } catch (const cv::Exception& e) {
        LOG_ERROR(std::string("SFace embedding failed: ") + e.what());
        return std::nullopt;
    }

    if (feature.total() != static_cast<size_t>(EMBEDDING_DIMENSION)) {
        LOG_ERROR("SFace returned " + std::to_string(feature.total()) + " values, expected " +
                  std::to_string(EMBEDDING_DIMENSION));
        return std::nullopt;
    }

    cv::Mat flat = feature.reshape(1, 1);
    if (flat.type() != CV_32F) {
        flat.convertTo(flat, CV_32F);
    }
    Embedding raw(flat.ptr<float>(0), flat.ptr<float>(0) + EMBEDDING_DIMENSION);

    return normalizeEmbedding(raw);
}

} // namespace face
} // namespace facegate
