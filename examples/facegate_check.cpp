/**
 * @file facegate_check.cpp
 * @brief Command-line liveness check on image files
 *
 * Usage:
 *   facegate_check [--config config/facegate.yaml] enroll.jpg
 *   facegate_check [--config config/facegate.yaml] f1.jpg f2.jpg f3.jpg f4.jpg
 *
 * One image runs the enrollment flow (single-frame liveness and template
 * extraction). Several images run sequence liveness as used at login.
 */

#include <facegate/core/Configuration.hpp>
#include <facegate/core/Logger.hpp>
#include <facegate/face/FaceAuthService.hpp>
#include <facegate/face/FaceException.hpp>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

using namespace facegate;

namespace {

bool readFile(const std::string& path, face::ImageBytes& out) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return false;
    }
    out.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    return true;
}

void configureLogging(const core::Configuration& config) {
    const core::LogSettings settings = core::LogSettings::fromConfiguration(config);
    if (!core::Logger::getInstance().configure(settings)) {
        std::cerr << "Warning: file logging disabled (" << settings.directory << ")" << std::endl;
    }
}

void printVerdict(const face::LivenessVerdict& verdict) {
    std::cout << "Liveness: " << (verdict.passed ? "PASS" : "FAIL") << std::endl;
    std::cout << "  Reason: " << verdict.reason << std::endl;
    std::cout << "  Code:   " << face::faceResultCodeToString(verdict.result_code) << std::endl;
    std::cout << "  Blur:   " << face::formatDecimal(verdict.blur_score, 1) << std::endl;
    std::cout << "  Motion: " << face::formatDecimal(verdict.motion_score, 3) << std::endl;
    for (const auto& signal : verdict.signals) {
        std::cout << "  Signal " << signal.name << ": " << signal.diagnostic
                  << (signal.failed ? " [FAILED]" : "") << std::endl;
    }
}

} // anonymous namespace

int main(int argc, char** argv) {
    std::string config_path = "config/facegate.yaml";
    std::vector<std::string> image_paths;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: " << argv[0] << " [--config file.yaml] image [image ...]" << std::endl;
            return 0;
        } else {
            image_paths.push_back(arg);
        }
    }

    if (image_paths.empty()) {
        std::cerr << "Usage: " << argv[0] << " [--config file.yaml] image [image ...]" << std::endl;
        return 1;
    }

    auto& config = core::Configuration::getInstance();
    if (!config.load(config_path)) {
        std::cerr << "Could not load " << config_path << ", using built-in defaults" << std::endl;
    }
    configureLogging(config);

    std::vector<face::ImageBytes> images;
    for (const auto& path : image_paths) {
        face::ImageBytes bytes;
        if (!readFile(path, bytes)) {
            std::cerr << "Cannot read " << path << std::endl;
            return 1;
        }
        images.push_back(std::move(bytes));
    }

    try {
        const auto provider_config = face::ProviderConfig::fromConfiguration(config);
        face::FaceAuthService service(face::LivenessConfig::fromConfiguration(config),
                                      face::MatcherConfig::fromConfiguration(config),
                                      face::ProviderRegistry::fromConfig(provider_config));
        service.initialize();

        std::cout << "=== facegate " << face::FACEGATE_VERSION.toString() << " ===" << std::endl;

        if (images.size() == 1) {
            face::EnrollmentOutcome outcome = service.enroll(images.front());
            printVerdict(outcome.verdict);
            std::cout << "Enrollment: " << face::faceResultCodeToString(outcome.result_code) << std::endl;
            if (outcome.embedding) {
                std::cout << "  Template: " << outcome.embedding->size() << " values, norm "
                          << face::formatDecimal(face::embeddingNorm(*outcome.embedding), 4) << std::endl;
            }
            return outcome.succeeded() ? 0 : 2;
        }

        face::LivenessVerdict verdict = service.checkSequenceLiveness(images);
        printVerdict(verdict);
        return verdict.passed ? 0 : 2;

    } catch (const face::ProviderInitException& e) {
        LOG_CRITICAL(e.what());
        std::cerr << "Provider '" << e.getProviderName() << "' failed to initialize: "
                  << e.getMessage() << std::endl;
        return 1;
    } catch (const core::Exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
