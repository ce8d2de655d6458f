#pragma once

#include <chrono>
#include <string>

#include "signal/SignalProducer.hpp"

namespace tribunal {

struct ClassifierConfig {
    std::string               endpoint;
    std::string               api_key;
    std::string               model;
    std::chrono::milliseconds timeout{5000};
};

// ---------------------------------------------------------------------------
// HttpClassifier - external classifier reached over HTTP (libcurl).
//
// Wire contract:
//   POST <endpoint>  {"model","content","content_type","context"}
//   200 → {"risk_level","policy_tags":[..],"confidence_score":0..1,
//          "explanation","decision"?,"evidence"?}
//   204 → classifier had nothing to say (NO_SIGNAL)
//
// Every failure (transport, timeout, status, malformed verdict) is returned
// as an ERROR outcome. No retry: one attempt per evaluation, bounded by the
// caller's timeout.
//
// Threading: one curl easy handle per call, so concurrent evaluations never
// share a handle.
// ---------------------------------------------------------------------------
class HttpClassifier : public ClassifierSignalProducer {
public:
    explicit HttpClassifier(ClassifierConfig cfg);

    ProducerOutcome produce(const EvaluationInput& input,
                            std::chrono::milliseconds timeout) override;

    // Verdict body → outcome. Exposed for tests.
    static ProducerOutcome parse_verdict(const std::string& body);

    const ClassifierConfig& config() const { return cfg_; }

private:
    static size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata);

    ClassifierConfig cfg_;
};

} // namespace tribunal
