#pragma once

#include "facegate/face/FaceTypes.hpp"
#include <opencv2/core.hpp>
#include <optional>
#include <string>

namespace facegate {
namespace face {

/**
 * @brief Locates the most prominent face in a frame
 */
class FaceLocator {
public:
    virtual ~FaceLocator() = default;

    /**
     * @param bgr_frame CV_8UC3 frame
     * @return Face region inside the frame bounds, or std::nullopt
     */
    virtual std::optional<FaceRegion> locate(const cv::Mat& bgr_frame) = 0;

    virtual std::string name() const = 0;
};

/**
 * @brief Produces identity embeddings
 */
class EmbeddingExtractor {
public:
    virtual ~EmbeddingExtractor() = default;

    /**
     * @param bgr_frame CV_8UC3 frame
     * @return Unit-norm embedding, or std::nullopt when no usable face exists
     */
    virtual std::optional<Embedding> embed(const cv::Mat& bgr_frame) = 0;

    virtual int dimension() const = 0;

    virtual std::string name() const = 0;
};

/**
 * @brief Estimates a dense relative depth surface
 *
 * The returned map (CV_32FC1, larger = closer) is sized independently of the
 * input frame.
 */
class DepthEstimator {
public:
    virtual ~DepthEstimator() = default;

    virtual std::optional<cv::Mat> estimateDepth(const cv::Mat& bgr_frame) = 0;

    virtual std::string name() const = 0;
};

} // namespace face
} // namespace facegate
