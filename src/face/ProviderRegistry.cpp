#include "facegate/face/ProviderRegistry.hpp"
#include "facegate/face/FaceLocators.hpp"
#include "facegate/face/SFaceEmbeddingExtractor.hpp"
#include "facegate/face/MidasDepthEstimator.hpp"
#include "facegate/face/FaceException.hpp"
#include "facegate/core/Logger.hpp"
#include <exception>

namespace facegate {
namespace face {

ProviderRegistry::ProviderRegistry(LocatorFactory locator_factory,
                                   ExtractorFactory extractor_factory,
                                   DepthFactory depth_factory)
    : locator_factory_(std::move(locator_factory))
    , extractor_factory_(std::move(extractor_factory))
    , depth_factory_(std::move(depth_factory)) {
}

template<typename T, typename Factory>
std::shared_ptr<T> ProviderRegistry::resolveMandatory(Slot<T>& slot, const Factory& factory,
                                                      const char* role) {
    if (slot.resolved.load(std::memory_order_acquire)) {
        return slot.instance;
    }

    std::lock_guard<std::mutex> lock(slot.mutex);
    if (slot.resolved.load(std::memory_order_relaxed)) {
        return slot.instance;
    }

    if (!factory) {
        throw ProviderInitException(role, "no factory configured");
    }

    std::shared_ptr<T> instance;
    try {
        instance = factory();
    } catch (const ProviderInitException& e) {
        FACEGATE_LOG_CRITICAL("ProviderRegistry") << role << " initialization failed: " << e.what();
        throw;
    }
    if (!instance) {
        FACEGATE_LOG_CRITICAL("ProviderRegistry") << role << " factory returned no provider";
        throw ProviderInitException(role, "factory returned no provider");
    }

    slot.instance = std::move(instance);
    slot.resolved.store(true, std::memory_order_release);
    providers_created_.fetch_add(1);

    FACEGATE_LOG_INFO("ProviderRegistry") << role << " ready: " << slot.instance->name();
    return slot.instance;
}

std::shared_ptr<FaceLocator> ProviderRegistry::faceLocator() {
    return resolveMandatory(locator_, locator_factory_, "face_locator");
}

std::shared_ptr<EmbeddingExtractor> ProviderRegistry::embeddingExtractor() {
    return resolveMandatory(extractor_, extractor_factory_, "embedding_extractor");
}

std::shared_ptr<DepthEstimator> ProviderRegistry::depthEstimator() {
    if (depth_.resolved.load(std::memory_order_acquire)) {
        return depth_.instance;
    }

    std::lock_guard<std::mutex> lock(depth_.mutex);
    if (depth_.resolved.load(std::memory_order_relaxed)) {
        return depth_.instance;
    }

    std::string reason = depth_factory_ ? "factory returned no provider" : "no depth estimator configured";
    if (depth_factory_) {
        try {
            depth_.instance = depth_factory_();
        } catch (const std::exception& e) {
            depth_.instance.reset();
            reason = e.what();
        }
    }

    if (depth_.instance) {
        providers_created_.fetch_add(1);
        FACEGATE_LOG_INFO("ProviderRegistry") << "depth_estimator ready: " << depth_.instance->name();
    } else {
        FACEGATE_LOG_WARNING("ProviderRegistry")
            << "Depth estimator unavailable, depth signal will be skipped (" << reason << ")";
    }

    depth_.resolved.store(true, std::memory_order_release);
    return depth_.instance;
}

std::shared_ptr<ProviderRegistry> ProviderRegistry::fromConfig(const ProviderConfig& config) {
    requireValid("providers", config.validate());

    LocatorFactory locator_factory;
    if (config.face_locator == "haar") {
        locator_factory = [config]() -> std::shared_ptr<FaceLocator> {
            return std::make_shared<HaarFaceLocator>(config.resolve(config.haar_cascade),
                                                     config.haar_min_face_size);
        };
    } else {
        locator_factory = [config]() -> std::shared_ptr<FaceLocator> {
            return std::make_shared<YuNetFaceLocator>(config.resolve(config.yunet_model),
                                                      config.yunet_score_threshold,
                                                      config.yunet_nms_threshold,
                                                      config.yunet_top_k);
        };
    }

    ExtractorFactory extractor_factory = [config]() -> std::shared_ptr<EmbeddingExtractor> {
        return std::make_shared<SFaceEmbeddingExtractor>(config.resolve(config.yunet_model),
                                                         config.resolve(config.sface_model),
                                                         config.yunet_score_threshold,
                                                         config.yunet_nms_threshold,
                                                         config.yunet_top_k);
    };

    DepthFactory depth_factory;
    if (config.depth_enabled) {
        depth_factory = [config]() -> std::shared_ptr<DepthEstimator> {
            return std::make_shared<MidasDepthEstimator>(config.resolve(config.midas_model),
                                                         config.depth_input_size);
        };
    }

    return std::make_shared<ProviderRegistry>(std::move(locator_factory),
                                              std::move(extractor_factory),
                                              std::move(depth_factory));
}

} // namespace face
} // namespace facegate
