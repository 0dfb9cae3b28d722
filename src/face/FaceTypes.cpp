#include "facegate/face/FaceTypes.hpp"
#include <cmath>

namespace facegate {
namespace face {

double embeddingNorm(const Embedding& embedding) {
    double sum = 0.0;
    for (float v : embedding) {
        sum += static_cast<double>(v) * static_cast<double>(v);
    }
    return std::sqrt(sum);
}

std::optional<Embedding> normalizeEmbedding(const Embedding& embedding) {
    const double norm = embeddingNorm(embedding);
    if (embedding.empty() || !(norm > 0.0) || !std::isfinite(norm)) {
        return std::nullopt;
    }

    Embedding normalized(embedding.size());
    for (size_t i = 0; i < embedding.size(); ++i) {
        normalized[i] = static_cast<float>(embedding[i] / norm);
    }
    return normalized;
}

std::string faceResultCodeToString(FaceResultCode code) {
    switch (code) {
        case FaceResultCode::SUCCESS:
            return "Success";

        case FaceResultCode::ERROR_DECODE_FAILED:
            return "Input is not a decodable image";
        case FaceResultCode::ERROR_IMAGE_TOO_BLURRY:
            return "Image too blurry";
        case FaceResultCode::ERROR_INSUFFICIENT_FRAMES:
            return "Not enough usable frames";

        case FaceResultCode::ERROR_NO_FACE_DETECTED:
            return "No face detected";

        case FaceResultCode::ERROR_PRESENTATION_ATTACK_DETECTED:
            return "Presentation attack detected";
        case FaceResultCode::ERROR_MOTION_LIVENESS_FAILED:
            return "Motion-based liveness check failed";

        case FaceResultCode::ERROR_NO_MATCH:
            return "Face does not match enrolled identity";
        case FaceResultCode::ERROR_EMBEDDING_DIMENSION_MISMATCH:
            return "Embedding dimensions differ";
        case FaceResultCode::ERROR_EMBEDDING_DEGENERATE:
            return "Embedding has zero norm";
        case FaceResultCode::ERROR_INVALID_ADAPTIVE_ALPHA:
            return "Adaptive update weight outside (0, 1]";

        case FaceResultCode::ERROR_PROVIDER_UNAVAILABLE:
            return "Provider unavailable";
        case FaceResultCode::ERROR_PROVIDER_INIT_FAILED:
            return "Provider initialization failed";

        default:
            return "Unknown face result code: " + std::to_string(static_cast<int>(code));
    }
}

} // namespace face
} // namespace facegate
