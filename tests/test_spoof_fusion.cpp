/**
 * @file test_spoof_fusion.cpp
 * @brief Signal rules in isolation and the failing-signal vote
 */

#include <gtest/gtest.h>
#include <facegate/face/SpoofFusion.hpp>

using namespace facegate::face;

class SpoofFusionTest : public ::testing::Test {
protected:
    /// Measurements that pass every default rule
    SpatialMeasurements liveMeasurements() const {
        SpatialMeasurements m;
        m.face_analyzable = true;
        m.lbp_entropy = 6.8;
        m.moire_ratio = 0.91;
        m.chroma_variance = 40.0;
        return m;
    }

    static signals::DepthStatistics depth(double stddev, double gradient, double range = 30.0) {
        signals::DepthStatistics d;
        d.evaluated = true;
        d.stddev = stddev;
        d.center_edge_gradient = gradient;
        d.range = range;
        return d;
    }

    static const SignalReading* find(const std::vector<SignalReading>& readings, const std::string& name) {
        for (const auto& r : readings) {
            if (r.name == name) {
                return &r;
            }
        }
        return nullptr;
    }

    LivenessConfig config_;
};

/**
 * Test 1: Default rule order and names
 */
TEST_F(SpoofFusionTest, DefaultRules) {
    auto rules = SpoofFusion::defaultRules(config_);
    ASSERT_EQ(rules.size(), 4u);
    EXPECT_EQ(rules[0].name, "texture");
    EXPECT_EQ(rules[1].name, "screen_pattern");
    EXPECT_EQ(rules[2].name, "flat_color");
    EXPECT_EQ(rules[3].name, "flat_depth");

    SpoofFusion fusion = SpoofFusion::fromConfig(config_);
    EXPECT_EQ(fusion.ruleCount(), 4u);
    EXPECT_EQ(fusion.failuresToReject(), 2);
}

/**
 * Test 2: Each rule trips on its own threshold
 */
TEST_F(SpoofFusionTest, RulesInIsolation) {
    SpoofFusion fusion = SpoofFusion::fromConfig(config_);

    SpatialMeasurements m = liveMeasurements();
    m.lbp_entropy = 4.49;
    auto readings = fusion.read(m);
    ASSERT_NE(find(readings, "texture"), nullptr);
    EXPECT_TRUE(find(readings, "texture")->failed);
    EXPECT_EQ(find(readings, "texture")->diagnostic, "entropy=4.49");

    m = liveMeasurements();
    m.lbp_entropy = 4.5;
    EXPECT_FALSE(find(fusion.read(m), "texture")->failed);

    m = liveMeasurements();
    m.moire_ratio = 0.97;
    readings = fusion.read(m);
    EXPECT_TRUE(find(readings, "screen_pattern")->failed);
    EXPECT_EQ(find(readings, "screen_pattern")->diagnostic, "moire=0.970");

    m = liveMeasurements();
    m.moire_ratio = 0.96;
    EXPECT_FALSE(find(fusion.read(m), "screen_pattern")->failed);

    m = liveMeasurements();
    m.chroma_variance = 3.21;
    readings = fusion.read(m);
    EXPECT_TRUE(find(readings, "flat_color")->failed);
    EXPECT_EQ(find(readings, "flat_color")->diagnostic, "Cr_var=3.2");
}

/**
 * Test 3: Depth passes when either the deviation or the gradient clears its floor
 */
TEST_F(SpoofFusionTest, DepthRuleIsAnOrOfSubSignals) {
    SpoofFusion fusion = SpoofFusion::fromConfig(config_);
    SpatialMeasurements m = liveMeasurements();

    m.depth = depth(6.0, 0.0);
    EXPECT_FALSE(find(fusion.read(m), "flat_depth")->failed);

    m.depth = depth(0.5, 20.0);
    EXPECT_FALSE(find(fusion.read(m), "flat_depth")->failed);

    m.depth = depth(5.0, 15.0);
    EXPECT_FALSE(find(fusion.read(m), "flat_depth")->failed);

    m.depth = depth(4.9, 14.9, 12.0);
    auto readings = fusion.read(m);
    EXPECT_TRUE(find(readings, "flat_depth")->failed);
    EXPECT_EQ(find(readings, "flat_depth")->diagnostic, "range=12.0 std=4.9 gradient=14.9");
}

/**
 * Test 4: Unavailable signals produce no reading
 */
TEST_F(SpoofFusionTest, UnavailableSignalsAreSkipped) {
    SpoofFusion fusion = SpoofFusion::fromConfig(config_);

    SpatialMeasurements m = liveMeasurements();
    EXPECT_EQ(fusion.read(m).size(), 3u);

    m.depth = signals::DepthStatistics{};
    EXPECT_EQ(fusion.read(m).size(), 3u);

    SpatialMeasurements small;
    small.face_analyzable = false;
    small.depth = depth(0.0, 0.0);
    auto readings = fusion.read(small);
    ASSERT_EQ(readings.size(), 1u);
    EXPECT_EQ(readings[0].name, "flat_depth");

    FusionDecision decision = fusion.evaluate(small);
    EXPECT_EQ(decision.failed_count, 1);
    EXPECT_FALSE(decision.rejected);
}

/**
 * Test 5: One failing signal is tolerated, two reject
 */
TEST_F(SpoofFusionTest, TwoFailuresReject) {
    SpoofFusion fusion = SpoofFusion::fromConfig(config_);

    SpatialMeasurements m = liveMeasurements();
    m.moire_ratio = 0.99;
    FusionDecision decision = fusion.evaluate(m);
    EXPECT_EQ(decision.failed_count, 1);
    EXPECT_FALSE(decision.rejected);
    EXPECT_TRUE(decision.reason.empty());

    m.chroma_variance = 2.0;
    decision = fusion.evaluate(m);
    EXPECT_EQ(decision.failed_count, 2);
    EXPECT_TRUE(decision.rejected);
    EXPECT_EQ(decision.reason, "Anti-spoof failed: screen_pattern(moire=0.990), flat_color(Cr_var=2.0)");
}

/**
 * Test 6: Reason lists every failing reading in order
 */
TEST_F(SpoofFusionTest, ReasonFormat) {
    SpoofFusion fusion({}, 2);

    std::vector<SignalReading> readings = {
        {"texture", true, 3.2, "entropy=3.20"},
        {"screen_pattern", false, 0.9, "moire=0.900"},
        {"flat_color", true, 2.0, "Cr_var=2.0"},
        {"flat_depth", true, 1.0, "range=3.0 std=1.0 gradient=2.0"}
    };

    FusionDecision decision = fusion.decide(readings);
    EXPECT_EQ(decision.failed_count, 3);
    EXPECT_TRUE(decision.rejected);
    EXPECT_EQ(decision.reason,
              "Anti-spoof failed: texture(entropy=3.20), flat_color(Cr_var=2.0), "
              "flat_depth(range=3.0 std=1.0 gradient=2.0)");
    EXPECT_EQ(decision.readings.size(), 4u);
}

/**
 * Test 7: Custom rules and failure count
 */
TEST_F(SpoofFusionTest, CustomRules) {
    SignalRule always_fails{
        "always",
        nullptr,
        [](const SpatialMeasurements&) { return true; },
        [](const SpatialMeasurements&) { return 1.0; },
        [](const SpatialMeasurements&) { return std::string("x=1"); }
    };

    SpoofFusion strict({always_fails}, 1);
    FusionDecision decision = strict.evaluate(SpatialMeasurements{});
    EXPECT_TRUE(decision.rejected);
    EXPECT_EQ(decision.reason, "Anti-spoof failed: always(x=1)");

    SpoofFusion lenient({always_fails}, 2);
    EXPECT_FALSE(lenient.evaluate(SpatialMeasurements{}).rejected);
}

TEST(FormatDecimalTest, FixedPrecision) {
    EXPECT_EQ(formatDecimal(3.14159, 2), "3.14");
    EXPECT_EQ(formatDecimal(0.0, 3), "0.000");
}
