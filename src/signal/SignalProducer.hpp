#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "signal/EvaluationSignal.hpp"

namespace tribunal {

// Content handed to every producer for one evaluation.
struct EvaluationInput {
    std::string          text;
    std::vector<uint8_t> image;          // empty = no image supplied
    std::string          content_type;   // "text", "text_with_image", ...
    std::string          context;        // free-form hints for the classifier
};

// ---------------------------------------------------------------------------
// SignalProducer - black-box detector behind a fixed contract.
//
// produce() returns zero-or-one signal wrapped in a ProducerOutcome and must
// not throw. SignalCollector still guards every call: an escaped exception or
// a missed deadline becomes an ERROR outcome for that source.
// ---------------------------------------------------------------------------
class SignalProducer {
public:
    virtual ~SignalProducer() = default;

    virtual SignalSource source() const = 0;

    virtual ProducerOutcome produce(const EvaluationInput& input,
                                    std::chrono::milliseconds timeout) = 0;
};

// Capability seam for the external classifier. Three outcomes: SIGNAL,
// NO_SIGNAL, ERROR. Implementations bound their own I/O by the timeout.
class ClassifierSignalProducer : public SignalProducer {
public:
    SignalSource source() const override { return SignalSource::CLASSIFIER; }
};

} // namespace tribunal
