#include "facegate/face/LivenessDetector.hpp"
#include "facegate/face/SpoofSignals.hpp"
#include "facegate/core/exception.h"
#include "facegate/core/Logger.hpp"
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>

namespace facegate {
namespace face {

namespace {

/// Frame that survived decoding and the sequence sharpness floor
struct UsableFrame {
    cv::Mat bgr;
    cv::Mat gray;
    double blur_score = 0.0;
    std::optional<FaceRegion> face;
};

cv::Mat toGray(const cv::Mat& bgr) {
    cv::Mat gray;
    if (bgr.channels() == 3) {
        cv::cvtColor(bgr, gray, cv::COLOR_BGR2GRAY);
    } else {
        gray = bgr;
    }
    return gray;
}

bool isDecodedFrame(const cv::Mat& frame) {
    return !frame.empty() && frame.type() == CV_8UC3;
}

} // anonymous namespace

LivenessDetector::LivenessDetector(const LivenessConfig& config,
                                   std::shared_ptr<FaceLocator> locator,
                                   std::shared_ptr<DepthEstimator> depth)
    : config_(config)
    , locator_(std::move(locator))
    , depth_(std::move(depth))
    , quality_gate_(config)
    , motion_analyzer_(config)
    , fusion_(SpoofFusion::fromConfig(config)) {
    if (!locator_) {
        FACEGATE_THROW(core::InvalidParameterException, "LivenessDetector requires a face locator");
    }
}

std::optional<cv::Mat> LivenessDetector::decodeFrame(const ImageBytes& image) {
    if (image.empty()) {
        return std::nullopt;
    }

    cv::Mat frame;
    try {
        frame = cv::imdecode(image, cv::IMREAD_COLOR);
    } catch (const cv::Exception& e) {
        LOG_DEBUG(std::string("Image decode failed: ") + e.what());
        return std::nullopt;
    }

    if (frame.empty()) {
        return std::nullopt;
    }
    return frame;
}

LivenessVerdict LivenessDetector::checkSingleFrame(const ImageBytes& image) const {
    std::optional<cv::Mat> frame = decodeFrame(image);
    return checkSingleFrame(frame ? *frame : cv::Mat());
}

LivenessVerdict LivenessDetector::checkSingleFrame(const cv::Mat& frame) const {
    if (!isDecodedFrame(frame)) {
        return LivenessVerdict::fail(FaceResultCode::ERROR_DECODE_FAILED, "Could not decode image");
    }

    const double blur = QualityGate::computeBlurScore(toGray(frame));
    if (!quality_gate_.accepts(blur, CaptureMode::SINGLE_FRAME)) {
        return LivenessVerdict::fail(FaceResultCode::ERROR_IMAGE_TOO_BLURRY,
                                     "Image too blurry (score=" + formatDecimal(blur, 1) + ")",
                                     blur);
    }

    if (!locator_->locate(frame)) {
        return LivenessVerdict::fail(FaceResultCode::ERROR_NO_FACE_DETECTED, "No face detected", blur);
    }

    return LivenessVerdict::pass(blur);
}

LivenessVerdict LivenessDetector::checkSequence(const std::vector<ImageBytes>& images) const {
    std::vector<cv::Mat> frames;
    frames.reserve(images.size());
    for (const auto& image : images) {
        std::optional<cv::Mat> frame = decodeFrame(image);
        frames.push_back(frame ? *frame : cv::Mat());
    }
    return checkSequence(frames);
}

LivenessVerdict LivenessDetector::checkSequence(const std::vector<cv::Mat>& frames) const {
    if (frames.size() < 2) {
        return LivenessVerdict::fail(FaceResultCode::ERROR_INSUFFICIENT_FRAMES, "Not enough frames");
    }

    // Triage
    std::vector<UsableFrame> usable;
    usable.reserve(frames.size());
    for (size_t i = 0; i < frames.size(); ++i) {
        if (!isDecodedFrame(frames[i])) {
            FACEGATE_LOG_DEBUG("Liveness") << "Frame " << i << " skipped: not decodable";
            continue;
        }

        UsableFrame candidate;
        candidate.gray = toGray(frames[i]);
        candidate.blur_score = QualityGate::computeBlurScore(candidate.gray);
        if (!quality_gate_.accepts(candidate.blur_score, CaptureMode::SEQUENCE)) {
            FACEGATE_LOG_DEBUG("Liveness") << "Frame " << i << " skipped: blur="
                                           << formatDecimal(candidate.blur_score, 1);
            continue;
        }

        candidate.bgr = frames[i];
        candidate.face = locator_->locate(candidate.bgr);
        usable.push_back(std::move(candidate));
    }

    if (usable.size() < static_cast<size_t>(config_.min_sequence_frames)) {
        return LivenessVerdict::fail(FaceResultCode::ERROR_INSUFFICIENT_FRAMES, "Not enough usable frames");
    }

    double blur_sum = 0.0;
    for (const auto& frame : usable) {
        blur_sum += frame.blur_score;
    }
    const double mean_blur = blur_sum / static_cast<double>(usable.size());

    auto first_face = std::find_if(usable.begin(), usable.end(),
                                   [](const UsableFrame& f) { return f.face.has_value(); });
    if (first_face == usable.end()) {
        return LivenessVerdict::fail(FaceResultCode::ERROR_NO_FACE_DETECTED,
                                     "No face detected in frames", mean_blur);
    }

    // Spatial signals on the sharpest frame, borrowing the first located face
    // when the sharpest frame has none
    auto reference = std::max_element(usable.begin(), usable.end(),
        [](const UsableFrame& a, const UsableFrame& b) { return a.blur_score < b.blur_score; });
    const FaceRegion region = reference->face ? *reference->face : *first_face->face;

    const SpatialMeasurements measurements = measure(reference->bgr, reference->gray, region);
    FusionDecision decision = fusion_.evaluate(measurements);

    if (decision.rejected) {
        FACEGATE_LOG_INFO("Liveness") << decision.reason;
        LivenessVerdict verdict = LivenessVerdict::fail(
            FaceResultCode::ERROR_PRESENTATION_ATTACK_DETECTED, decision.reason, mean_blur);
        verdict.signals = std::move(decision.readings);
        return verdict;
    }

    // Motion over the whole surviving sequence
    std::vector<cv::Mat> grays;
    grays.reserve(usable.size());
    for (const auto& frame : usable) {
        grays.push_back(frame.gray);
    }
    const double motion = MotionAnalyzer::computeAverageMotion(grays);
    FACEGATE_LOG_INFO("Liveness") << "Motion avg=" << formatDecimal(motion, 3)
                                  << " over " << grays.size() << " frames";

    if (motion_analyzer_.isStatic(motion)) {
        LivenessVerdict verdict = LivenessVerdict::fail(
            FaceResultCode::ERROR_MOTION_LIVENESS_FAILED,
            "Insufficient motion (" + formatDecimal(motion, 3) + ") - possible photo replay",
            mean_blur, motion);
        verdict.signals = std::move(decision.readings);
        return verdict;
    }

    LivenessVerdict verdict = LivenessVerdict::pass(mean_blur, motion);
    verdict.signals = std::move(decision.readings);
    return verdict;
}

SpatialMeasurements LivenessDetector::measure(const cv::Mat& bgr_frame, const cv::Mat& gray_frame,
                                              const FaceRegion& region) const {
    SpatialMeasurements measurements;
    const FaceRegion clipped = FaceRegion::clippedTo(region.toRect(), bgr_frame.size());

    if (clipped.isAnalyzable(config_.min_face_size)) {
        const cv::Mat gray_face = gray_frame(clipped.toRect());
        measurements.face_analyzable = true;
        measurements.lbp_entropy = signals::computeLbpEntropy(gray_face, config_.lbp_crop_size);
        measurements.moire_ratio = signals::computeMoireRatio(gray_face, config_.moire_crop_size,
                                                              config_.moire_low_freq_radius);
        measurements.chroma_variance = signals::computeChromaVariance(bgr_frame, clipped,
                                                                      config_.chroma_empty_roi_value);

        FACEGATE_LOG_INFO("Liveness") << "Anti-spoof signals: LBP_entropy="
                                      << formatDecimal(measurements.lbp_entropy, 2)
                                      << " moire=" << formatDecimal(measurements.moire_ratio, 3)
                                      << " Cr_var=" << formatDecimal(measurements.chroma_variance, 1);
    } else {
        FACEGATE_LOG_INFO("Liveness") << "Face crop " << clipped.width << "x" << clipped.height
                                      << " too small, texture/moire/chroma skipped";
    }

    if (!depth_) {
        FACEGATE_LOG_DEBUG("Liveness") << "No depth estimator, depth signal skipped";
        return measurements;
    }

    std::optional<cv::Mat> depth_map = depth_->estimateDepth(bgr_frame);
    if (!depth_map || depth_map->empty()) {
        FACEGATE_LOG_WARNING("Liveness") << "Depth estimation produced no map, depth signal skipped";
        return measurements;
    }

    signals::DepthStatistics stats = signals::computeDepthStatistics(
        *depth_map, clipped, bgr_frame.size(), config_.depth_min_roi_pixels);
    if (!stats.evaluated) {
        FACEGATE_LOG_INFO("Liveness") << "Depth ROI too small, depth signal skipped";
        return measurements;
    }

    FACEGATE_LOG_INFO("Liveness") << "Depth check: range=" << formatDecimal(stats.range, 1)
                                  << " std=" << formatDecimal(stats.stddev, 1)
                                  << " gradient=" << formatDecimal(stats.center_edge_gradient, 1);
    measurements.depth = stats;
    return measurements;
}

} // namespace face
} // namespace facegate
