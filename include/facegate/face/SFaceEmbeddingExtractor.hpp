#pragma once

#include "facegate/face/FaceProviders.hpp"
#include <opencv2/objdetect.hpp>
#include <mutex>
#include <string>

namespace facegate {
namespace face {

/**
 * @brief Identity embeddings from the SFace recognizer (cv::FaceRecognizerSF)
 *
 * The face is located and landmarked with YuNet, aligned with alignCrop and
 * passed through SFace. Output is 128 floats scaled to unit length.
 */
class SFaceEmbeddingExtractor : public EmbeddingExtractor {
public:
    /**
     * @throws ProviderInitException if either model cannot be loaded
     */
    SFaceEmbeddingExtractor(const std::string& detector_model_path,
                            const std::string& recognizer_model_path,
                            float score_threshold = 0.6f,
                            float nms_threshold = 0.3f,
                            int top_k = 5000);

    std::optional<Embedding> embed(const cv::Mat& bgr_frame) override;

    int dimension() const override { return EMBEDDING_DIMENSION; }

    std::string name() const override { return "sface"; }

private:
    cv::Ptr<cv::FaceDetectorYN> detector_;
    cv::Ptr<cv::FaceRecognizerSF> recognizer_;
    std::mutex mutex_;
};

} // namespace face
} // namespace facegate
