#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include "signal/SignalProducer.hpp"

namespace tribunal {

// External face detector (computer-vision backend lives outside this core).
// May throw; VisionProducer turns that into an ERROR outcome.
class FaceDetector {
public:
    virtual ~FaceDetector() = default;
    virtual std::size_t count_faces(const std::vector<uint8_t>& image) = 0;
};

// ---------------------------------------------------------------------------
// VisionProducer - the `vision` producer.
// No image → SKIPPED. Zero faces → NO_SIGNAL. Otherwise one `high` signal
// tagged FaceDetection with confidence min(0.9, 0.3 + 0.2 * faces).
// ---------------------------------------------------------------------------
class VisionProducer : public SignalProducer {
public:
    static constexpr const char* FACE_TAG = "FaceDetection";

    explicit VisionProducer(std::shared_ptr<FaceDetector> detector);

    SignalSource source() const override { return SignalSource::VISION; }

    ProducerOutcome produce(const EvaluationInput& input,
                            std::chrono::milliseconds timeout) override;

private:
    std::shared_ptr<FaceDetector> detector_;
};

} // namespace tribunal
