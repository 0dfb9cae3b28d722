/**
 * @file test_configuration.cpp
 * @brief YAML configuration loading and typed face configuration
 */

#include <gtest/gtest.h>
#include <facegate/core/Configuration.hpp>
#include <facegate/core/Logger.hpp>
#include <facegate/face/FaceConfig.hpp>
#include <cstdio>
#include <fstream>

using namespace facegate;

class ConfigurationTest : public ::testing::Test {
protected:
    void SetUp() override {
        core::Logger::getInstance().setLevel(core::LogLevel::CRITICAL);
        core::Configuration::getInstance().clear();
    }

    void TearDown() override {
        core::Configuration::getInstance().clear();
    }

    core::Configuration& config() { return core::Configuration::getInstance(); }
};

/**
 * Test 1: Dotted keys reach nested values
 */
TEST_F(ConfigurationTest, DottedKeys) {
    ASSERT_TRUE(config().loadFromString(
        "liveness:\n"
        "  blur_min_single: 30.5\n"
        "  min_sequence_frames: 3\n"
        "providers:\n"
        "  face_locator: haar\n"
        "  depth_enabled: false\n"));

    EXPECT_TRUE(config().has("liveness.blur_min_single"));
    EXPECT_DOUBLE_EQ(config().getDouble("liveness.blur_min_single"), 30.5);
    EXPECT_EQ(config().getInt("liveness.min_sequence_frames"), 3);
    EXPECT_EQ(config().getString("providers.face_locator"), "haar");
    EXPECT_FALSE(config().getBool("providers.depth_enabled", true));
    EXPECT_TRUE(config().getFilename().empty());
}

/**
 * Test 2: Missing keys and type mismatches fall back to the default
 */
TEST_F(ConfigurationTest, DefaultsForMissingOrMistypedKeys) {
    ASSERT_TRUE(config().loadFromString("matching:\n  similarity_threshold: high\n"));

    EXPECT_FALSE(config().has("matching.adaptive_alpha"));
    EXPECT_DOUBLE_EQ(config().getDouble("matching.adaptive_alpha", 0.05), 0.05);
    EXPECT_DOUBLE_EQ(config().getDouble("matching.similarity_threshold", 0.593), 0.593);
    EXPECT_EQ(config().getInt("matching", 7), 7);
    EXPECT_EQ(config().getString("nothing.here", "fallback"), "fallback");
    EXPECT_FALSE(config().has(""));
}

/**
 * Test 3: Malformed YAML and missing files are reported, not thrown
 */
TEST_F(ConfigurationTest, LoadFailures) {
    EXPECT_FALSE(config().loadFromString("liveness: [unclosed"));
    EXPECT_FALSE(config().load("/nonexistent/facegate.yaml"));
    EXPECT_FALSE(config().reload());
}

/**
 * Test 4: Load and reload from a file
 */
TEST_F(ConfigurationTest, LoadAndReloadFile) {
    const std::string path = "/tmp/facegate_test_config.yaml";
    {
        std::ofstream out(path);
        out << "logging:\n  level: DEBUG\n";
    }

    ASSERT_TRUE(config().load(path));
    EXPECT_EQ(config().getFilename(), path);
    EXPECT_EQ(config().getString("logging.level"), "DEBUG");

    {
        std::ofstream out(path);
        out << "logging:\n  level: ERROR\n";
    }
    ASSERT_TRUE(config().reload());
    EXPECT_EQ(config().getString("logging.level"), "ERROR");

    std::remove(path.c_str());
}

/**
 * Test 5: Face configuration picks overrides and keeps defaults
 */
TEST_F(ConfigurationTest, LivenessConfigFromConfiguration) {
    ASSERT_TRUE(config().loadFromString(
        "liveness:\n"
        "  lbp_entropy_min: 5.0\n"
        "  spoof_failures_to_reject: 3\n"
        "  depth_gradient_min: 12.5\n"));

    face::LivenessConfig liveness = face::LivenessConfig::fromConfiguration(config());
    EXPECT_DOUBLE_EQ(liveness.lbp_entropy_min, 5.0);
    EXPECT_EQ(liveness.spoof_failures_to_reject, 3);
    EXPECT_DOUBLE_EQ(liveness.depth_gradient_min, 12.5);

    EXPECT_DOUBLE_EQ(liveness.blur_min_single, 25.0);
    EXPECT_DOUBLE_EQ(liveness.blur_min_sequence, 15.0);
    EXPECT_DOUBLE_EQ(liveness.moire_ratio_max, 0.96);
    EXPECT_DOUBLE_EQ(liveness.motion_avg_min, 0.8);
    EXPECT_TRUE(liveness.validate().empty());
}

TEST_F(ConfigurationTest, MatcherAndProviderConfigFromConfiguration) {
    ASSERT_TRUE(config().loadFromString(
        "matching:\n"
        "  similarity_threshold: 0.593\n"
        "  adaptive_alpha: 0.1\n"
        "providers:\n"
        "  models_dir: /opt/facegate\n"
        "  face_locator: haar\n"
        "  depth_input_size: 384\n"));

    face::MatcherConfig matcher = face::MatcherConfig::fromConfiguration(config());
    EXPECT_EQ(matcher.similarity_threshold, 0.593f);
    EXPECT_FLOAT_EQ(matcher.adaptive_alpha, 0.1f);
    EXPECT_EQ(matcher.embedding_dimension, 128);

    face::ProviderConfig providers = face::ProviderConfig::fromConfiguration(config());
    EXPECT_EQ(providers.face_locator, "haar");
    EXPECT_EQ(providers.depth_input_size, 384);
    EXPECT_EQ(providers.resolve(providers.haar_cascade), "/opt/facegate/haarcascade_frontalface_default.xml");
    EXPECT_TRUE(providers.depth_enabled);
}

/**
 * Test 6: Validation lists every problem
 */
TEST_F(ConfigurationTest, Validation) {
    face::LivenessConfig liveness;
    liveness.min_sequence_frames = 1;
    liveness.spoof_failures_to_reject = 0;
    liveness.moire_ratio_max = 1.5;
    EXPECT_EQ(liveness.validate().size(), 3u);

    face::MatcherConfig matcher;
    matcher.adaptive_alpha = 1.5f;
    EXPECT_FALSE(matcher.validate().empty());
    matcher.adaptive_alpha = 1.0f;
    EXPECT_TRUE(matcher.validate().empty());

    face::ProviderConfig providers;
    providers.face_locator = "mtcnn";
    EXPECT_FALSE(providers.validate().empty());
}

/**
 * Test 7: Shipped configuration file parses into valid settings
 */
TEST_F(ConfigurationTest, ShippedConfigurationIsValid) {
    ASSERT_TRUE(config().load("config/facegate.yaml"));

    EXPECT_TRUE(face::LivenessConfig::fromConfiguration(config()).validate().empty());
    EXPECT_TRUE(face::MatcherConfig::fromConfiguration(config()).validate().empty());
    EXPECT_TRUE(face::ProviderConfig::fromConfiguration(config()).validate().empty());
    EXPECT_EQ(core::parseLogLevel(config().getString("logging.level")), core::LogLevel::INFO);
}
