#include "facegate/face/FaceConfig.hpp"
#include "facegate/core/Configuration.hpp"
#include "facegate/core/exception.h"
#include "facegate/core/Logger.hpp"
#include <sstream>

namespace facegate {
namespace face {

LivenessConfig LivenessConfig::fromConfiguration(const core::Configuration& config) {
    LivenessConfig c;
    c.blur_min_single = config.getDouble("liveness.blur_min_single", c.blur_min_single);
    c.blur_min_sequence = config.getDouble("liveness.blur_min_sequence", c.blur_min_sequence);
    c.min_sequence_frames = config.getInt("liveness.min_sequence_frames", c.min_sequence_frames);
    c.min_face_size = config.getInt("liveness.min_face_size", c.min_face_size);

    c.lbp_crop_size = config.getInt("liveness.lbp_crop_size", c.lbp_crop_size);
    c.lbp_entropy_min = config.getDouble("liveness.lbp_entropy_min", c.lbp_entropy_min);

    c.moire_crop_size = config.getInt("liveness.moire_crop_size", c.moire_crop_size);
    c.moire_low_freq_radius = config.getInt("liveness.moire_low_freq_radius", c.moire_low_freq_radius);
    c.moire_ratio_max = config.getDouble("liveness.moire_ratio_max", c.moire_ratio_max);

    c.chroma_variance_min = config.getDouble("liveness.chroma_variance_min", c.chroma_variance_min);
    c.chroma_empty_roi_value = config.getDouble("liveness.chroma_empty_roi_value", c.chroma_empty_roi_value);

    c.depth_std_min = config.getDouble("liveness.depth_std_min", c.depth_std_min);
    c.depth_gradient_min = config.getDouble("liveness.depth_gradient_min", c.depth_gradient_min);
    c.depth_min_roi_pixels = config.getInt("liveness.depth_min_roi_pixels", c.depth_min_roi_pixels);

    c.spoof_failures_to_reject = config.getInt("liveness.spoof_failures_to_reject", c.spoof_failures_to_reject);
    c.motion_avg_min = config.getDouble("liveness.motion_avg_min", c.motion_avg_min);
    return c;
}

std::vector<std::string> LivenessConfig::validate() const {
    std::vector<std::string> errors;
    if (blur_min_single < 0.0 || blur_min_sequence < 0.0) {
        errors.push_back("blur thresholds must be non-negative");
    }
    if (min_sequence_frames < 2) {
        errors.push_back("min_sequence_frames must be at least 2");
    }
    if (min_face_size < 1) {
        errors.push_back("min_face_size must be positive");
    }
    if (lbp_crop_size < 3) {
        errors.push_back("lbp_crop_size must be at least 3");
    }
    if (moire_crop_size < 2) {
        errors.push_back("moire_crop_size must be at least 2");
    }
    if (moire_low_freq_radius < 0) {
        errors.push_back("moire_low_freq_radius must be non-negative");
    }
    if (moire_ratio_max < 0.0 || moire_ratio_max > 1.0) {
        errors.push_back("moire_ratio_max must lie in [0, 1]");
    }
    if (depth_min_roi_pixels < 1) {
        errors.push_back("depth_min_roi_pixels must be positive");
    }
    if (spoof_failures_to_reject < 1) {
        errors.push_back("spoof_failures_to_reject must be at least 1");
    }
    if (motion_avg_min < 0.0) {
        errors.push_back("motion_avg_min must be non-negative");
    }
    return errors;
}

MatcherConfig MatcherConfig::fromConfiguration(const core::Configuration& config) {
    MatcherConfig c;
    c.similarity_threshold = static_cast<float>(
        config.getDouble("matching.similarity_threshold", c.similarity_threshold));
    c.adaptive_alpha = static_cast<float>(
        config.getDouble("matching.adaptive_alpha", c.adaptive_alpha));
    c.embedding_dimension = config.getInt("matching.embedding_dimension", c.embedding_dimension);
    return c;
}

std::vector<std::string> MatcherConfig::validate() const {
    std::vector<std::string> errors;
    if (similarity_threshold < -1.0f || similarity_threshold > 1.0f) {
        errors.push_back("similarity_threshold must lie in [-1, 1]");
    }
    if (!(adaptive_alpha > 0.0f) || adaptive_alpha > 1.0f) {
        errors.push_back("adaptive_alpha must lie in (0, 1]");
    }
    if (embedding_dimension < 1) {
        errors.push_back("embedding_dimension must be positive");
    }
    return errors;
}

std::string ProviderConfig::resolve(const std::string& file) const {
    if (file.empty() || file.front() == '/' || models_dir.empty()) {
        return file;
    }
    if (models_dir.back() == '/') {
        return models_dir + file;
    }
    return models_dir + "/" + file;
}

ProviderConfig ProviderConfig::fromConfiguration(const core::Configuration& config) {
    ProviderConfig c;
    c.models_dir = config.getString("providers.models_dir", c.models_dir);
    c.face_locator = config.getString("providers.face_locator", c.face_locator);
    c.yunet_model = config.getString("providers.yunet_model", c.yunet_model);
    c.sface_model = config.getString("providers.sface_model", c.sface_model);
    c.midas_model = config.getString("providers.midas_model", c.midas_model);
    c.haar_cascade = config.getString("providers.haar_cascade", c.haar_cascade);

    c.yunet_score_threshold = static_cast<float>(
        config.getDouble("providers.yunet_score_threshold", c.yunet_score_threshold));
    c.yunet_nms_threshold = static_cast<float>(
        config.getDouble("providers.yunet_nms_threshold", c.yunet_nms_threshold));
    c.yunet_top_k = config.getInt("providers.yunet_top_k", c.yunet_top_k);
    c.haar_min_face_size = config.getInt("providers.haar_min_face_size", c.haar_min_face_size);

    c.depth_enabled = config.getBool("providers.depth_enabled", c.depth_enabled);
    c.depth_input_size = config.getInt("providers.depth_input_size", c.depth_input_size);
    return c;
}

std::vector<std::string> ProviderConfig::validate() const {
    std::vector<std::string> errors;
    if (face_locator != "yunet" && face_locator != "haar") {
        errors.push_back("face_locator must be \"yunet\" or \"haar\", got \"" + face_locator + "\"");
    }
    if (yunet_score_threshold <= 0.0f || yunet_score_threshold >= 1.0f) {
        errors.push_back("yunet_score_threshold must lie in (0, 1)");
    }
    if (yunet_top_k < 1) {
        errors.push_back("yunet_top_k must be positive");
    }
    if (depth_input_size < 32) {
        errors.push_back("depth_input_size must be at least 32");
    }
    return errors;
}

} // namespace face
void requireValid(const std::string& section, const std::vector<std::string>& problems) {
    if (problems.empty()) {
        return;
    }

    std::ostringstream oss;
    oss << "Invalid " << section << " configuration: ";
    for (size_t i = 0; i < problems.size(); ++i) {
        if (i > 0) {
            oss << "; ";
        }
        oss << problems[i];
    }
    LOG_ERROR(oss.str());
    FACEGATE_THROW(core::ConfigurationException, oss.str());
}

} // namespace facegate
