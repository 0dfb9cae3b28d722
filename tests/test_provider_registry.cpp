/**
 * @file test_provider_registry.cpp
 * @brief Once-only provider initialization and depth fallback
 *
 * Validates:
 * - Concurrent first use runs each factory exactly once
 * - Mandatory provider failures surface as ProviderInitException
 * - Depth resolves to unavailable once and is never retried
 * - Configured registry with missing model files
 * - Invalid provider configuration is rejected before any model is touched
 */

#include <gtest/gtest.h>
#include <facegate/face/ProviderRegistry.hpp>
#include <facegate/face/FaceException.hpp>
#include <facegate/core/Logger.hpp>
#include <facegate/core/exception.h>
#include "test_frames.hpp"
#include <chrono>
#include <filesystem>
#include <stdexcept>
#include <system_error>
#include <thread>

using namespace facegate::face;
using namespace facegate::test;

class ProviderRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        facegate::core::Logger::getInstance().setLevel(facegate::core::LogLevel::CRITICAL);
    }

    ProviderRegistry::LocatorFactory countingLocator(std::chrono::milliseconds delay = std::chrono::milliseconds(0)) {
        return [this, delay]() -> std::shared_ptr<FaceLocator> {
            ++locator_builds_;
            std::this_thread::sleep_for(delay);
            return std::make_shared<FixedLocator>(FaceRegion(0, 0, 10, 10));
        };
    }

    ProviderRegistry::ExtractorFactory countingExtractor() {
        return [this]() -> std::shared_ptr<EmbeddingExtractor> {
            ++extractor_builds_;
            return std::make_shared<FixedExtractor>(basisEmbedding(0));
        };
    }

    std::atomic<int> locator_builds_{0};
    std::atomic<int> extractor_builds_{0};
    std::atomic<int> depth_builds_{0};
};

/**
 * Test 1: Concurrent first use loads the locator once
 */
TEST_F(ProviderRegistryTest, ConcurrentFirstUseCreatesOnce) {
    ProviderRegistry registry(countingLocator(std::chrono::milliseconds(50)), countingExtractor());

    const int thread_count = 8;
    std::vector<std::shared_ptr<FaceLocator>> results(thread_count);
    std::vector<std::thread> threads;
    for (int i = 0; i < thread_count; ++i) {
        threads.emplace_back([&registry, &results, i]() {
            results[i] = registry.faceLocator();
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(locator_builds_.load(), 1);
    for (const auto& r : results) {
        ASSERT_NE(r, nullptr);
        EXPECT_EQ(r.get(), results.front().get());
    }

    // Later calls reuse the instance
    EXPECT_EQ(registry.faceLocator().get(), results.front().get());
    EXPECT_EQ(locator_builds_.load(), 1);
    EXPECT_EQ(registry.providersCreated(), 1);
}

/**
 * Test 2: Extractor is resolved independently of the locator
 */
TEST_F(ProviderRegistryTest, ProvidersResolveIndependently) {
    ProviderRegistry registry(countingLocator(), countingExtractor());

    auto extractor = registry.embeddingExtractor();
    ASSERT_NE(extractor, nullptr);
    EXPECT_EQ(extractor->dimension(), EMBEDDING_DIMENSION);
    EXPECT_EQ(locator_builds_.load(), 0);
    EXPECT_EQ(extractor_builds_.load(), 1);

    registry.embeddingExtractor();
    EXPECT_EQ(extractor_builds_.load(), 1);
}

/**
 * Test 3: A failing mandatory factory throws, every time it is asked
 */
TEST_F(ProviderRegistryTest, MandatoryFailureThrows) {
    int attempts = 0;
    ProviderRegistry registry(
        [&attempts]() -> std::shared_ptr<FaceLocator> {
            ++attempts;
            throw ProviderInitException("yunet", "model not found");
        },
        countingExtractor());

    try {
        registry.faceLocator();
        FAIL() << "Expected ProviderInitException";
    } catch (const ProviderInitException& e) {
        EXPECT_EQ(e.getProviderName(), "yunet");
        EXPECT_EQ(e.getFaceErrorCode(), FaceResultCode::ERROR_PROVIDER_INIT_FAILED);
    }

    EXPECT_THROW(registry.faceLocator(), ProviderInitException);
    EXPECT_EQ(attempts, 2);
}

/**
 * Test 4: A factory producing nothing is a failure for mandatory providers
 */
TEST_F(ProviderRegistryTest, NullMandatoryProviderThrows) {
    ProviderRegistry registry(
        []() -> std::shared_ptr<FaceLocator> { return nullptr; },
        ProviderRegistry::ExtractorFactory());

    EXPECT_THROW(registry.faceLocator(), ProviderInitException);
    EXPECT_THROW(registry.embeddingExtractor(), ProviderInitException);
}

/**
 * Test 5: Missing depth resolves to nullptr once
 */
TEST_F(ProviderRegistryTest, UnavailableDepthIsNotRetried) {
    ProviderRegistry registry(countingLocator(), countingExtractor(),
        [this]() -> std::shared_ptr<DepthEstimator> {
            ++depth_builds_;
            return nullptr;
        });

    EXPECT_EQ(registry.depthEstimator(), nullptr);
    EXPECT_EQ(registry.depthEstimator(), nullptr);
    EXPECT_EQ(depth_builds_.load(), 1);
}

/**
 * Test 6: A throwing depth factory degrades to unavailable
 */
TEST_F(ProviderRegistryTest, ThrowingDepthDegrades) {
    ProviderRegistry registry(countingLocator(), countingExtractor(),
        [this]() -> std::shared_ptr<DepthEstimator> {
            ++depth_builds_;
            throw ProviderInitException("midas", "bad model");
        });

    EXPECT_NO_THROW({
        EXPECT_EQ(registry.depthEstimator(), nullptr);
    });
    EXPECT_EQ(registry.depthEstimator(), nullptr);
    EXPECT_EQ(depth_builds_.load(), 1);
}

/**
 * Test 7: No depth factory at all
 */
TEST_F(ProviderRegistryTest, NoDepthFactory) {
    ProviderRegistry registry(countingLocator(), countingExtractor());
    EXPECT_EQ(registry.depthEstimator(), nullptr);
}

/**
 * Test 8: Available depth is created once under concurrency
 */
TEST_F(ProviderRegistryTest, DepthCreatedOnce) {
    ProviderRegistry registry(countingLocator(), countingExtractor(),
        [this]() -> std::shared_ptr<DepthEstimator> {
            ++depth_builds_;
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            return std::make_shared<FixedDepth>(domeDepthMap(32));
        });

    std::vector<std::thread> threads;
    for (int i = 0; i < 6; ++i) {
        threads.emplace_back([&registry]() { registry.depthEstimator(); });
    }
    for (auto& t : threads) {
        t.join();
    }

    ASSERT_NE(registry.depthEstimator(), nullptr);
    EXPECT_EQ(depth_builds_.load(), 1);
}

/**
 * Test 9: Registry from configuration with no model files on disk
 */
TEST_F(ProviderRegistryTest, ConfiguredRegistryWithMissingModels) {
    ProviderConfig config;
    config.models_dir = "/nonexistent/facegate/models";

    auto registry = ProviderRegistry::fromConfig(config);
    ASSERT_NE(registry, nullptr);

    EXPECT_THROW(registry->faceLocator(), ProviderInitException);
    EXPECT_THROW(registry->embeddingExtractor(), ProviderInitException);
    EXPECT_EQ(registry->depthEstimator(), nullptr);
}

/**
 * Test 10: Depth disabled in configuration
 */
TEST_F(ProviderRegistryTest, DepthDisabledInConfig) {
    ProviderConfig config;
    config.depth_enabled = false;

    auto registry = ProviderRegistry::fromConfig(config);
    EXPECT_EQ(registry->depthEstimator(), nullptr);
}

/**
 * Test 11: Depth factories failing with non-face errors still degrade
 */
TEST_F(ProviderRegistryTest, DepthDegradesOnAnyStandardException) {
    ProviderRegistry runtime_failure(countingLocator(), countingExtractor(),
        [this]() -> std::shared_ptr<DepthEstimator> {
            ++depth_builds_;
            throw std::runtime_error("onnx session aborted");
        });
    EXPECT_NO_THROW({
        EXPECT_EQ(runtime_failure.depthEstimator(), nullptr);
    });
    EXPECT_EQ(runtime_failure.depthEstimator(), nullptr);

    ProviderRegistry filesystem_failure(countingLocator(), countingExtractor(),
        [this]() -> std::shared_ptr<DepthEstimator> {
            ++depth_builds_;
            throw std::filesystem::filesystem_error(
                "status", "/models/midas_small.onnx",
                std::make_error_code(std::errc::permission_denied));
        });
    EXPECT_NO_THROW({
        EXPECT_EQ(filesystem_failure.depthEstimator(), nullptr);
    });

    EXPECT_EQ(depth_builds_.load(), 2);
}

/**
 * Test 12: A depth model path that is not a regular file means no depth
 */
TEST_F(ProviderRegistryTest, DepthModelPathIsDirectory) {
    ProviderConfig config;
    config.midas_model = std::filesystem::temp_directory_path().string();

    auto registry = ProviderRegistry::fromConfig(config);
    EXPECT_NO_THROW({
        EXPECT_EQ(registry->depthEstimator(), nullptr);
    });
}

/**
 * Test 13: Unknown locator names and out-of-range values are rejected
 */
TEST_F(ProviderRegistryTest, InvalidProviderConfigRejected) {
    ProviderConfig misspelled;
    misspelled.face_locator = "hare";
    EXPECT_THROW(ProviderRegistry::fromConfig(misspelled), facegate::core::ConfigurationException);

    ProviderConfig wrong_case;
    wrong_case.face_locator = "Haar";
    EXPECT_THROW(ProviderRegistry::fromConfig(wrong_case), facegate::core::ConfigurationException);

    ProviderConfig bad_values;
    bad_values.yunet_top_k = 0;
    bad_values.depth_input_size = 8;
    try {
        ProviderRegistry::fromConfig(bad_values);
        FAIL() << "Expected ConfigurationException";
    } catch (const facegate::core::ConfigurationException& e) {
        const std::string message = e.what();
        EXPECT_NE(message.find("yunet_top_k"), std::string::npos) << message;
        EXPECT_NE(message.find("depth_input_size"), std::string::npos) << message;
    }
}

TEST(ProviderConfigTest, ResolveAgainstModelsDir) {
    ProviderConfig config;
    config.models_dir = "/opt/models/";
    EXPECT_EQ(config.resolve("a.onnx"), "/opt/models/a.onnx");

    config.models_dir = "/opt/models";
    EXPECT_EQ(config.resolve("a.onnx"), "/opt/models/a.onnx");
    EXPECT_EQ(config.resolve("/abs/b.onnx"), "/abs/b.onnx");
}
