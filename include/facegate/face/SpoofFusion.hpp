#pragma once

#include "facegate/face/FaceTypes.hpp"
#include "facegate/face/FaceConfig.hpp"
#include "facegate/face/SpoofSignals.hpp"
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace facegate {
namespace face {

/**
 * @brief Raw spatial measurements taken on the reference frame
 */
struct SpatialMeasurements {
    bool face_analyzable = false;    ///< Texture, moire and chroma were computed
    double lbp_entropy = 0.0;
    double moire_ratio = 0.0;
    double chroma_variance = 0.0;

    /// Present only when a depth map was produced and the mapped ROI was evaluated
    std::optional<signals::DepthStatistics> depth;
};

/**
 * @brief One anti-spoof signal: availability, failure predicate and diagnostics
 */
struct SignalRule {
    std::string name;
    std::function<bool(const SpatialMeasurements&)> available;
    std::function<bool(const SpatialMeasurements&)> fails;
    std::function<double(const SpatialMeasurements&)> value;
    std::function<std::string(const SpatialMeasurements&)> describe;
};

/**
 * @brief Result of the vote over the available signals
 */
struct FusionDecision {
    std::vector<SignalReading> readings;
    int failed_count = 0;
    bool rejected = false;
    std::string reason;     ///< "Anti-spoof failed: name(diag), ..." when rejected
};

/**
 * @brief Threshold vote over an ordered list of signal rules
 *
 * Rules are evaluated uniformly in order; the sample is rejected when at
 * least failures_to_reject available signals fail. One noisy signal under
 * normal lighting is tolerated.
 */
class SpoofFusion {
public:
    SpoofFusion(std::vector<SignalRule> rules, int failures_to_reject);

    /**
     * @brief Standard rules: texture, screen_pattern, flat_color, flat_depth
     */
    static std::vector<SignalRule> defaultRules(const LivenessConfig& config);

    static SpoofFusion fromConfig(const LivenessConfig& config);

    /// Readings of all available rules, in rule order
    std::vector<SignalReading> read(const SpatialMeasurements& measurements) const;

    /// Apply the vote to a list of readings
    FusionDecision decide(std::vector<SignalReading> readings) const;

    FusionDecision evaluate(const SpatialMeasurements& measurements) const {
        return decide(read(measurements));
    }

    size_t ruleCount() const { return rules_.size(); }

    int failuresToReject() const { return failures_to_reject_; }

private:
    std::vector<SignalRule> rules_;
    int failures_to_reject_;
};

/// Fixed-precision decimal formatting used in reasons and diagnostics
std::string formatDecimal(double value, int precision);

} // namespace face
} // namespace facegate
