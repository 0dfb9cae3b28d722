/**
 * @file test_depth_estimator.cpp
 * @brief MiDaS input preparation and model loading failures
 *
 * Tests:
 * 1. Uniform frame maps to the ImageNet-normalized value per RGB plane
 * 2. Resize is bilinear, planes are in R, G, B order
 * 3. Missing model file or directory path is a provider init failure
 */

#include <gtest/gtest.h>
#include <facegate/face/MidasDepthEstimator.hpp>
#include <facegate/face/FaceException.hpp>
#include <facegate/core/Logger.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <filesystem>

using namespace facegate::face;

class MidasPreprocessTest : public ::testing::Test {
protected:
    void SetUp() override {
        facegate::core::Logger::getInstance().setLevel(facegate::core::LogLevel::CRITICAL);
    }
};

/**
 * Test 1: Constant BGR(0, 128, 255) gives one constant value per plane
 */
TEST_F(MidasPreprocessTest, UniformFrameNormalization) {
    const cv::Mat frame(40, 60, CV_8UC3, cv::Scalar(0, 128, 255));
    const int size = 16;
    const std::vector<float> input = MidasDepthEstimator::preprocess(frame, size);
    ASSERT_EQ(input.size(), static_cast<size_t>(3 * size * size));

    const float expected_r = static_cast<float>((255.0 / 255.0 - 0.485) / 0.229);
    const float expected_g = static_cast<float>((128.0 / 255.0 - 0.456) / 0.224);
    const float expected_b = static_cast<float>((0.0 / 255.0 - 0.406) / 0.225);

    const size_t plane = static_cast<size_t>(size) * size;
    for (size_t i = 0; i < plane; ++i) {
        EXPECT_NEAR(input[i], expected_r, 1e-5f);
        EXPECT_NEAR(input[plane + i], expected_g, 1e-5f);
        EXPECT_NEAR(input[2 * plane + i], expected_b, 1e-5f);
    }
}

/**
 * Test 2: Step-edge frame matches a bilinear reference, not a bicubic one
 */
TEST_F(MidasPreprocessTest, BilinearResize) {
    cv::Mat frame(8, 8, CV_8UC3, cv::Scalar(0, 0, 0));
    frame(cv::Rect(4, 0, 4, 8)).setTo(cv::Scalar(40, 120, 200));
    const int size = 20;

    const std::vector<float> input = MidasDepthEstimator::preprocess(frame, size);

    cv::Mat rgb, linear, cubic;
    cv::cvtColor(frame, rgb, cv::COLOR_BGR2RGB);
    cv::resize(rgb, linear, cv::Size(size, size), 0, 0, cv::INTER_LINEAR);
    cv::resize(rgb, cubic, cv::Size(size, size), 0, 0, cv::INTER_CUBIC);

    const double mean[3] = {0.485, 0.456, 0.406};
    const double stdev[3] = {0.229, 0.224, 0.225};
    const size_t plane = static_cast<size_t>(size) * size;

    double linear_error = 0.0;
    double cubic_error = 0.0;
    for (int c = 0; c < 3; ++c) {
        for (int y = 0; y < size; ++y) {
            for (int x = 0; x < size; ++x) {
                const double got = input[c * plane + static_cast<size_t>(y) * size + x];
                const double lin = (linear.at<cv::Vec3b>(y, x)[c] / 255.0 - mean[c]) / stdev[c];
                const double cub = (cubic.at<cv::Vec3b>(y, x)[c] / 255.0 - mean[c]) / stdev[c];
                linear_error = std::max(linear_error, std::abs(got - lin));
                cubic_error = std::max(cubic_error, std::abs(got - cub));
            }
        }
    }

    EXPECT_LT(linear_error, 1e-5);
    EXPECT_GT(cubic_error, 1e-3);
}

/**
 * Test 3: Paths that are not model files fail at construction
 */
TEST_F(MidasPreprocessTest, RejectsMissingOrDirectoryModel) {
    EXPECT_THROW(MidasDepthEstimator("/nonexistent/facegate/midas_small.onnx"), ProviderInitException);
    EXPECT_THROW(MidasDepthEstimator(std::filesystem::temp_directory_path().string()),
                 ProviderInitException);
}
