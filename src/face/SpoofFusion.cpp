#include "facegate/face/SpoofFusion.hpp"
#include <iomanip>
#include <sstream>
#include <utility>

namespace facegate {
namespace face {

std::string formatDecimal(double value, int precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

SpoofFusion::SpoofFusion(std::vector<SignalRule> rules, int failures_to_reject)
    : rules_(std::move(rules))
    , failures_to_reject_(failures_to_reject) {}

std::vector<SignalRule> SpoofFusion::defaultRules(const LivenessConfig& config) {
    const double entropy_min = config.lbp_entropy_min;
    const double moire_max = config.moire_ratio_max;
    const double chroma_min = config.chroma_variance_min;
    const double depth_std_min = config.depth_std_min;
    const double depth_gradient_min = config.depth_gradient_min;

    auto face_analyzable = [](const SpatialMeasurements& m) { return m.face_analyzable; };

    std::vector<SignalRule> rules;

    rules.push_back({
        "texture",
        face_analyzable,
        [entropy_min](const SpatialMeasurements& m) { return m.lbp_entropy < entropy_min; },
        [](const SpatialMeasurements& m) { return m.lbp_entropy; },
        [](const SpatialMeasurements& m) { return "entropy=" + formatDecimal(m.lbp_entropy, 2); }
    });

    rules.push_back({
        "screen_pattern",
        face_analyzable,
        [moire_max](const SpatialMeasurements& m) { return m.moire_ratio > moire_max; },
        [](const SpatialMeasurements& m) { return m.moire_ratio; },
        [](const SpatialMeasurements& m) { return "moire=" + formatDecimal(m.moire_ratio, 3); }
    });

    rules.push_back({
        "flat_color",
        face_analyzable,
        [chroma_min](const SpatialMeasurements& m) { return m.chroma_variance < chroma_min; },
        [](const SpatialMeasurements& m) { return m.chroma_variance; },
        [](const SpatialMeasurements& m) { return "Cr_var=" + formatDecimal(m.chroma_variance, 1); }
    });

    // Either sub-signal clears the check: flat prints lack overall relief,
    // tilted screens lack the nose-to-cheek gradient.
    rules.push_back({
        "flat_depth",
        [](const SpatialMeasurements& m) { return m.depth.has_value() && m.depth->evaluated; },
        [depth_std_min, depth_gradient_min](const SpatialMeasurements& m) {
            return !(m.depth->stddev >= depth_std_min ||
                     m.depth->center_edge_gradient >= depth_gradient_min);
        },
        [](const SpatialMeasurements& m) { return m.depth->stddev; },
        [](const SpatialMeasurements& m) {
            return "range=" + formatDecimal(m.depth->range, 1) +
                   " std=" + formatDecimal(m.depth->stddev, 1) +
                   " gradient=" + formatDecimal(m.depth->center_edge_gradient, 1);
        }
    });

    return rules;
}

SpoofFusion SpoofFusion::fromConfig(const LivenessConfig& config) {
    return SpoofFusion(defaultRules(config), config.spoof_failures_to_reject);
}

std::vector<SignalReading> SpoofFusion::read(const SpatialMeasurements& measurements) const {
    std::vector<SignalReading> readings;
    readings.reserve(rules_.size());

    for (const auto& rule : rules_) {
        if (rule.available && !rule.available(measurements)) {
            continue;
        }
        SignalReading reading;
        reading.name = rule.name;
        reading.failed = rule.fails(measurements);
        reading.value = rule.value ? rule.value(measurements) : 0.0;
        reading.diagnostic = rule.describe ? rule.describe(measurements) : std::string();
        readings.push_back(std::move(reading));
    }
    return readings;
}

FusionDecision SpoofFusion::decide(std::vector<SignalReading> readings) const {
    FusionDecision decision;
    decision.readings = std::move(readings);

    std::string failing;
    for (const auto& reading : decision.readings) {
        if (!reading.failed) {
            continue;
        }
        ++decision.failed_count;
        if (!failing.empty()) {
            failing += ", ";
        }
        failing += reading.name + "(" + reading.diagnostic + ")";
    }

    decision.rejected = decision.failed_count >= failures_to_reject_;
    if (decision.rejected) {
        decision.reason = "Anti-spoof failed: " + failing;
    }
    return decision;
}

} // namespace face
} // namespace facegate
