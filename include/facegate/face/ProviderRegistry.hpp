#pragma once

#include "facegate/face/FaceProviders.hpp"
#include "facegate/face/FaceConfig.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>

namespace facegate {
namespace face {

/**
 * @brief Owns the model-backed providers and creates each one at most once
 *
 * Each accessor runs its factory on first use under a per-provider lock;
 * later calls return the cached instance without locking. Concurrent first
 * use loads a model only once.
 *
 * The face locator and embedding extractor are mandatory: a factory failure
 * propagates as ProviderInitException and is retried on the next call. The
 * depth estimator is optional: a factory that returns nullptr or throws marks
 * depth as unavailable for the lifetime of the registry.
 */
class ProviderRegistry {
public:
    using LocatorFactory = std::function<std::shared_ptr<FaceLocator>()>;
    using ExtractorFactory = std::function<std::shared_ptr<EmbeddingExtractor>()>;
    using DepthFactory = std::function<std::shared_ptr<DepthEstimator>()>;

    /**
     * @param depth_factory May be empty, meaning no depth provider is configured
     */
    ProviderRegistry(LocatorFactory locator_factory,
                     ExtractorFactory extractor_factory,
                     DepthFactory depth_factory = DepthFactory());

    ProviderRegistry(const ProviderRegistry&) = delete;
    ProviderRegistry& operator=(const ProviderRegistry&) = delete;

    /**
     * @brief Registry with the OpenCV-backed providers described by the config
     * @throws core::ConfigurationException if the provider section is invalid
     */
    static std::shared_ptr<ProviderRegistry> fromConfig(const ProviderConfig& config);

    /**
     * @throws ProviderInitException if the locator cannot be created
     */
    std::shared_ptr<FaceLocator> faceLocator();

    /**
     * @throws ProviderInitException if the extractor cannot be created
     */
    std::shared_ptr<EmbeddingExtractor> embeddingExtractor();

    /**
     * @return Depth estimator, or nullptr when depth is unavailable
     */
    std::shared_ptr<DepthEstimator> depthEstimator();

    /// Number of factory invocations that produced a provider
    int providersCreated() const { return providers_created_.load(); }

private:
    template<typename T>
    struct Slot {
        std::atomic<bool> resolved{false};
        std::shared_ptr<T> instance;
        std::mutex mutex;
    };

    template<typename T, typename Factory>
    std::shared_ptr<T> resolveMandatory(Slot<T>& slot, const Factory& factory, const char* role);

    LocatorFactory locator_factory_;
    ExtractorFactory extractor_factory_;
    DepthFactory depth_factory_;

    Slot<FaceLocator> locator_;
    Slot<EmbeddingExtractor> extractor_;
    Slot<DepthEstimator> depth_;

    std::atomic<int> providers_created_{0};
};

} // namespace face
} // namespace facegate
