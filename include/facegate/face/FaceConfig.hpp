#pragma once

#include <string>
#include <vector>

namespace facegate {
namespace core {
class Configuration;
}

namespace face {

/**
 * @brief Liveness thresholds, tuned for a phone front camera with the face
 *        at roughly 30-60 cm
 *
 * Read from the "liveness" section of the YAML configuration.
 */
struct LivenessConfig {
    // Quality gate
    double blur_min_single = 25.0;       ///< Laplacian variance floor for the enrollment still
    double blur_min_sequence = 15.0;     ///< Per-frame floor in a login burst
    int min_sequence_frames = 2;         ///< Usable frames required in sequence mode
    int min_face_size = 30;              ///< Smaller face crops skip texture/moire/chroma

    // Texture entropy (LBP)
    int lbp_crop_size = 96;
    double lbp_entropy_min = 4.5;        ///< bits

    // Spectral moire
    int moire_crop_size = 128;
    int moire_low_freq_radius = 15;      ///< pixels from spectrum center
    double moire_ratio_max = 0.96;

    // Chrominance
    double chroma_variance_min = 8.0;    ///< Cr channel variance
    double chroma_empty_roi_value = 100.0;

    // Depth gradient
    double depth_std_min = 5.0;
    double depth_gradient_min = 15.0;    ///< |center - periphery| mean depth
    int depth_min_roi_pixels = 100;      ///< Smaller mapped ROIs skip the depth signal

    // Fusion
    int spoof_failures_to_reject = 2;    ///< Failing spatial signals that reject the sequence

    // Motion
    double motion_avg_min = 0.8;         ///< Mean absolute inter-frame difference

    static LivenessConfig fromConfiguration(const core::Configuration& config);

    /**
     * @brief Check parameter ranges
     * @return Human-readable problems, empty when valid
     */
    std::vector<std::string> validate() const;
};

/**
 * @brief Identity matching parameters ("matching" section)
 */
struct MatcherConfig {
    float similarity_threshold = 0.593f; ///< SFace cosine threshold for same identity
    float adaptive_alpha = 0.05f;        ///< Weight of the live sample in the template update
    int embedding_dimension = 128;

    static MatcherConfig fromConfiguration(const core::Configuration& config);

    std::vector<std::string> validate() const;
};

/**
 * @brief Model-backed provider settings ("providers" section)
 */
struct ProviderConfig {
    std::string models_dir = "/usr/share/facegate/models";
    std::string face_locator = "yunet";  ///< "yunet" or "haar"
    std::string yunet_model = "face_detection_yunet.onnx";
    std::string sface_model = "face_recognition_sface.onnx";
    std::string midas_model = "midas_small.onnx";
    std::string haar_cascade = "haarcascade_frontalface_default.xml";

    float yunet_score_threshold = 0.6f;
    float yunet_nms_threshold = 0.3f;
    int yunet_top_k = 5000;
    int haar_min_face_size = 60;

    bool depth_enabled = true;
    int depth_input_size = 256;

    /// Resolve a file name against models_dir (absolute names are kept)
    std::string resolve(const std::string& file) const;

    static ProviderConfig fromConfiguration(const core::Configuration& config);

    std::vector<std::string> validate() const;
};

} // namespace face
/**
 * @brief Throw core::ConfigurationException listing every problem, if any
 * @param section Configuration section named in the message ("liveness", ...)
 */
void requireValid(const std::string& section, const std::vector<std::string>& problems);

} // namespace facegate
