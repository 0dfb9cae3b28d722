/**
 * @file MidasDepthEstimator.cpp
 * @brief MiDaS relative depth using ONNX Runtime
 */

#include "facegate/face/MidasDepthEstimator.hpp"
#include "facegate/face/FaceException.hpp"
#include "facegate/core/Logger.hpp"

#include <onnxruntime_cxx_api.h>
#include <opencv2/imgproc.hpp>

#include <cstring>
#include <filesystem>
#include <system_error>
#include <vector>

namespace facegate {
namespace face {

namespace fs = std::filesystem;

namespace {
// ImageNet normalization, RGB order
const cv::Scalar IMAGENET_MEAN(0.485, 0.456, 0.406);
const cv::Scalar IMAGENET_STD(0.229, 0.224, 0.225);
}

class MidasDepthEstimator::Impl {
public:
    std::unique_ptr<Ort::Env> ort_env;
    std::unique_ptr<Ort::Session> ort_session;
    Ort::MemoryInfo memory_info{nullptr};

    // Names stay owned here; the pointer vectors are what Run() takes
    std::vector<Ort::AllocatedStringPtr> name_storage;
    std::vector<const char*> input_names;
    std::vector<const char*> output_names;
};

MidasDepthEstimator::MidasDepthEstimator(const std::string& model_path, int input_size)
    : pImpl(std::make_unique<Impl>())
    , input_size_(input_size) {
    std::error_code ec;
    if (!fs::is_regular_file(model_path, ec)) {
        throw ProviderInitException(name(), "model not found at " + model_path);
    }

    try {
        pImpl->ort_env = std::make_unique<Ort::Env>(ORT_LOGGING_LEVEL_WARNING, "MidasDepthEstimator");

        Ort::SessionOptions session_options;
        session_options.SetIntraOpNumThreads(2);
        session_options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);

        pImpl->ort_session = std::make_unique<Ort::Session>(*pImpl->ort_env, model_path.c_str(),
                                                            session_options);

        if (pImpl->ort_session->GetInputCount() != 1 || pImpl->ort_session->GetOutputCount() < 1) {
            throw ProviderInitException(name(), "expected one input and at least one output");
        }

        Ort::AllocatorWithDefaultOptions allocator;
        pImpl->name_storage.push_back(pImpl->ort_session->GetInputNameAllocated(0, allocator));
        pImpl->input_names.push_back(pImpl->name_storage.back().get());
        pImpl->name_storage.push_back(pImpl->ort_session->GetOutputNameAllocated(0, allocator));
        pImpl->output_names.push_back(pImpl->name_storage.back().get());

        pImpl->memory_info = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);

    } catch (const Ort::Exception& e) {
        throw ProviderInitException(name(), std::string("ONNX Runtime error: ") + e.what());
    }

    LOG_INFO("MiDaS depth estimator loaded from " + model_path +
             " (input " + std::to_string(input_size_) + "x" + std::to_string(input_size_) + ")");
}

MidasDepthEstimator::~MidasDepthEstimator() = default;

std::vector<float> MidasDepthEstimator::preprocess(const cv::Mat& bgr_frame, int size) {
    cv::Mat rgb;
    cv::cvtColor(bgr_frame, rgb, cv::COLOR_BGR2RGB);
    cv::resize(rgb, rgb, cv::Size(size, size), 0, 0, cv::INTER_LINEAR);

    cv::Mat input;
    rgb.convertTo(input, CV_32FC3, 1.0 / 255.0);
    cv::subtract(input, IMAGENET_MEAN, input);
    cv::divide(input, IMAGENET_STD, input);

    std::vector<cv::Mat> channels(3);
    cv::split(input, channels);

    const size_t plane = static_cast<size_t>(size) * size;
    std::vector<float> values(3 * plane);
    for (int c = 0; c < 3; ++c) {
        std::memcpy(values.data() + c * plane, channels[c].ptr<float>(), plane * sizeof(float));
    }
    return values;
}

std::optional<cv::Mat> MidasDepthEstimator::estimateDepth(const cv::Mat& bgr_frame) {
    if (bgr_frame.empty() || bgr_frame.channels() != 3) {
        return std::nullopt;
    }

    std::vector<float> input_values = preprocess(bgr_frame, input_size_);
    const std::vector<int64_t> input_shape = {1, 3, input_size_, input_size_};

    cv::Mat depth;
    try {
        std::lock_guard<std::mutex> lock(mutex_);

        Ort::Value input_tensor = Ort::Value::CreateTensor<float>(
            pImpl->memory_info,
            input_values.data(),
            input_values.size(),
            input_shape.data(),
            input_shape.size());

        std::vector<Ort::Value> outputs = pImpl->ort_session->Run(
            Ort::RunOptions{nullptr},
            pImpl->input_names.data(),
            &input_tensor,
            1,
            pImpl->output_names.data(),
            pImpl->output_names.size());

        // Output is (1, H, W) or (1, 1, H, W)
        const std::vector<int64_t> shape = outputs.front().GetTensorTypeAndShapeInfo().GetShape();
        if (shape.size() < 2) {
            LOG_ERROR("MiDaS output has unexpected rank " + std::to_string(shape.size()));
            return std::nullopt;
        }
        const int rows = static_cast<int>(shape[shape.size() - 2]);
        const int cols = static_cast<int>(shape[shape.size() - 1]);

        const float* data = outputs.front().GetTensorData<float>();
        depth = cv::Mat(rows, cols, CV_32F, const_cast<float*>(data)).clone();

    } catch (const Ort::Exception& e) {
        LOG_ERROR(std::string("MiDaS inference failed: ") + e.what());
        return std::nullopt;
    }

    return depth;
}

} // namespace face
} // namespace facegate
