#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <vector>
#include <boost/asio/thread_pool.hpp>

#include "signal/SignalProducer.hpp"

namespace tribunal {

struct CollectorProducers {
    std::shared_ptr<SignalProducer>           pattern;
    std::shared_ptr<SignalProducer>           vision;
    std::shared_ptr<ClassifierSignalProducer> classifier;
};

struct CollectorTimeouts {
    std::chrono::milliseconds producer{3000};     // pattern + vision
    std::chrono::milliseconds classifier{5000};
};

// ---------------------------------------------------------------------------
// SignalCollector - fans one evaluation out to every configured producer.
//
// Each producer runs on the shared Asio pool with its own deadline. The
// caller waits at most max(deadlines); a producer that misses its deadline or
// throws becomes an ERROR outcome for its source. A late result is dropped:
// the task owns copies of everything it touches.
//
// Output is always three outcomes in fixed order: pattern, vision, classifier.
// ---------------------------------------------------------------------------
class SignalCollector {
public:
    SignalCollector(CollectorProducers producers, std::size_t threads = 4);
    ~SignalCollector();

    SignalCollector(const SignalCollector&) = delete;
    SignalCollector& operator=(const SignalCollector&) = delete;

    std::vector<ProducerOutcome> collect(const EvaluationInput& input,
                                         const CollectorTimeouts& timeouts);

    bool has_classifier() const { return static_cast<bool>(producers_.classifier); }

private:
    CollectorProducers       producers_;
    boost::asio::thread_pool pool_;
};

} // namespace tribunal
