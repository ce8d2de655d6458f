#include "signal/VisionProducer.hpp"

#include <algorithm>
#include <string>

using namespace tribunal;

VisionProducer::VisionProducer(std::shared_ptr<FaceDetector> detector)
    : detector_(std::move(detector)) {}

ProducerOutcome VisionProducer::produce(const EvaluationInput& input,
                                        std::chrono::milliseconds /*timeout*/) {
    if (input.image.empty() || !detector_) return ProducerOutcome::skipped(SignalSource::VISION);

    std::size_t faces = 0;
    try {
        faces = detector_->count_faces(input.image);
    } catch (const std::exception& e) {
        return ProducerOutcome::failed(SignalSource::VISION,
                                       std::string("face detection failed: ") + e.what());
    }

    if (faces == 0) {
        return ProducerOutcome::nothing(SignalSource::VISION,
                                        {{"faces_detected", 0},
                                         {"image_bytes", input.image.size()}});
    }

    EvaluationSignal sig;
    sig.source     = SignalSource::VISION;
    sig.risk_level = RiskLevel::HIGH;
    sig.tags       = {FACE_TAG};
    sig.confidence = std::min(0.9, 0.3 + 0.2 * static_cast<double>(faces));
    sig.rationale  = "Detected " + std::to_string(faces) + " face(s) in supplied image";
    sig.raw_evidence = {
        {"faces_detected", faces},
        {"image_bytes",    input.image.size()}
    };
    return ProducerOutcome::produced(std::move(sig));
}
