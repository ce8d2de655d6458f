// =============================================================================
// src/collector_test.cpp - Signal Collector Tests
// =============================================================================
// Fake producers only. Checks fixed outcome order, per-producer deadlines,
// exception containment and parallel execution.
// =============================================================================

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <stdexcept>
#include <thread>

#include "signal/SignalCollector.hpp"
#include "testing/TestSuite.hpp"

using namespace tribunal;
using namespace std::chrono_literals;

namespace {

using Behaviour = std::function<ProducerOutcome(const EvaluationInput&)>;

class FakeProducer : public SignalProducer {
public:
    FakeProducer(SignalSource src, Behaviour b) : src_(src), behaviour_(std::move(b)) {}

    SignalSource source() const override { return src_; }

    ProducerOutcome produce(const EvaluationInput& input, std::chrono::milliseconds) override {
        return behaviour_(input);
    }

private:
    SignalSource src_;
    Behaviour    behaviour_;
};

class FakeClassifier : public ClassifierSignalProducer {
public:
    explicit FakeClassifier(Behaviour b) : behaviour_(std::move(b)) {}

    ProducerOutcome produce(const EvaluationInput& input, std::chrono::milliseconds) override {
        return behaviour_(input);
    }

private:
    Behaviour behaviour_;
};

EvaluationSignal signal_from(SignalSource src, RiskLevel risk) {
    EvaluationSignal s;
    s.source     = src;
    s.risk_level = risk;
    s.tags       = {signalSourceToString(src)};
    s.confidence = 0.5;
    s.rationale  = "fake";
    return s;
}

Behaviour returns_signal(SignalSource src, RiskLevel risk) {
    return [src, risk](const EvaluationInput&) { return ProducerOutcome::produced(signal_from(src, risk)); };
}

Behaviour sleeps_then_signals(SignalSource src, std::chrono::milliseconds d) {
    return [src, d](const EvaluationInput&) {
        std::this_thread::sleep_for(d);
        return ProducerOutcome::produced(signal_from(src, RiskLevel::HIGH));
    };
}

} // namespace

class CollectorTest : public testing::TestSuite {
public:
    CollectorTest() : TestSuite("SIGNAL COLLECTOR - UNIT TESTS") {}

    void run_all_tests() {
        print_banner();

        test_order_and_skips();
        test_timeout();
        test_exception_contained();
        test_wrong_source();
        test_parallel_execution();
        test_expired_in_queue();
        test_input_reaches_producers();

        print_summary();
    }

private:
    void test_order_and_skips() {
        std::cout << "Testing Outcome Order + Skips...\n";

        CollectorProducers p;
        p.pattern = std::make_shared<FakeProducer>(SignalSource::PATTERN,
                                                   returns_signal(SignalSource::PATTERN, RiskLevel::HIGH));
        SignalCollector collector(p);

        auto out = collector.collect(EvaluationInput{}, CollectorTimeouts{});
        CHECK(out.size() == 3, "always three outcomes");
        CHECK(out[0].source == SignalSource::PATTERN && out[0].status == OutcomeStatus::SIGNAL, "pattern first");
        CHECK(out[1].source == SignalSource::VISION && out[1].status == OutcomeStatus::SKIPPED,
              "unconfigured vision skipped");
        CHECK(out[2].source == SignalSource::CLASSIFIER && out[2].status == OutcomeStatus::SKIPPED,
              "unconfigured classifier skipped");
        CHECK(!collector.has_classifier(), "no classifier configured");
        std::cout << "\n";
    }

    void test_timeout() {
        std::cout << "Testing Producer Deadline...\n";

        CollectorProducers p;
        p.pattern    = std::make_shared<FakeProducer>(SignalSource::PATTERN,
                                                      returns_signal(SignalSource::PATTERN, RiskLevel::LIMITED));
        p.classifier = std::make_shared<FakeClassifier>(sleeps_then_signals(SignalSource::CLASSIFIER, 800ms));
        SignalCollector collector(p);

        CollectorTimeouts t;
        t.producer   = 500ms;
        t.classifier = 100ms;

        auto start = std::chrono::steady_clock::now();
        auto out = collector.collect(EvaluationInput{}, t);
        auto took = std::chrono::steady_clock::now() - start;

        CHECK(out[2].status == OutcomeStatus::ERROR && out[2].error == "timeout", "late classifier → error");
        CHECK(out[0].status == OutcomeStatus::SIGNAL, "other producers unaffected");
        CHECK(took < 700ms, "caller not held past the deadline");
        std::cout << "\n";
    }

    void test_exception_contained() {
        std::cout << "Testing Exception Containment...\n";

        CollectorProducers p;
        p.vision = std::make_shared<FakeProducer>(SignalSource::VISION, [](const EvaluationInput&) -> ProducerOutcome {
            throw std::runtime_error("gpu lost");
        });
        p.classifier = std::make_shared<FakeClassifier>([](const EvaluationInput&) -> ProducerOutcome {
            throw 42;
        });
        SignalCollector collector(p);

        auto out = collector.collect(EvaluationInput{}, CollectorTimeouts{});
        CHECK(out[1].status == OutcomeStatus::ERROR && out[1].error.find("gpu lost") != std::string::npos,
              "std::exception → error outcome");
        CHECK(out[2].status == OutcomeStatus::ERROR, "non-standard throw → error outcome");
        std::cout << "\n";
    }

    void test_wrong_source() {
        std::cout << "Testing Source Mismatch...\n";

        CollectorProducers p;
        p.pattern = std::make_shared<FakeProducer>(SignalSource::PATTERN,
                                                   returns_signal(SignalSource::CLASSIFIER, RiskLevel::UNACCEPTABLE));
        SignalCollector collector(p);

        auto out = collector.collect(EvaluationInput{}, CollectorTimeouts{});
        CHECK(out[0].status == OutcomeStatus::ERROR, "pattern slot cannot smuggle a classifier signal");
        std::cout << "\n";
    }

    void test_parallel_execution() {
        std::cout << "Testing Parallel Execution...\n";

        CollectorProducers p;
        p.pattern    = std::make_shared<FakeProducer>(SignalSource::PATTERN,
                                                      sleeps_then_signals(SignalSource::PATTERN, 300ms));
        p.vision     = std::make_shared<FakeProducer>(SignalSource::VISION,
                                                      sleeps_then_signals(SignalSource::VISION, 300ms));
        p.classifier = std::make_shared<FakeClassifier>(sleeps_then_signals(SignalSource::CLASSIFIER, 300ms));
        SignalCollector collector(p, 3);

        CollectorTimeouts t;
        t.producer   = 2000ms;
        t.classifier = 2000ms;

        auto start = std::chrono::steady_clock::now();
        auto out = collector.collect(EvaluationInput{}, t);
        auto took = std::chrono::steady_clock::now() - start;

        bool all = out[0].status == OutcomeStatus::SIGNAL &&
                   out[1].status == OutcomeStatus::SIGNAL &&
                   out[2].status == OutcomeStatus::SIGNAL;
        CHECK(all, "all three produced");
        CHECK(took < 800ms, "producers ran concurrently");
        std::cout << "\n";
    }

    void test_expired_in_queue() {
        std::cout << "Testing Queued Producer Past Its Deadline...\n";

        auto vision_runs = std::make_shared<std::atomic<int>>(0);

        CollectorProducers p;
        p.pattern = std::make_shared<FakeProducer>(SignalSource::PATTERN,
                                                   sleeps_then_signals(SignalSource::PATTERN, 300ms));
        p.vision  = std::make_shared<FakeProducer>(SignalSource::VISION, [vision_runs](const EvaluationInput&) {
            ++*vision_runs;
            return ProducerOutcome::nothing(SignalSource::VISION);
        });
        SignalCollector collector(p, 1);

        CollectorTimeouts t;
        t.producer = 100ms;

        auto out = collector.collect(EvaluationInput{}, t);
        CHECK(out[0].status == OutcomeStatus::ERROR && out[1].status == OutcomeStatus::ERROR,
              "both miss the deadline on a single busy thread");

        std::this_thread::sleep_for(500ms);
        CHECK(vision_runs->load() == 0, "expired queued task never runs");

        t.producer = 2000ms;
        auto again = collector.collect(EvaluationInput{}, t);
        CHECK(again[1].status == OutcomeStatus::NO_SIGNAL && vision_runs->load() == 1,
              "pool is free for the next collection");
        std::cout << "\n";
    }

    void test_input_reaches_producers() {
        std::cout << "Testing Input Delivery...\n";

        CollectorProducers p;
        p.pattern = std::make_shared<FakeProducer>(SignalSource::PATTERN, [](const EvaluationInput& in) {
            if (in.text == "ping") return ProducerOutcome::produced(signal_from(SignalSource::PATTERN, RiskLevel::LIMITED));
            return ProducerOutcome::nothing(SignalSource::PATTERN);
        });
        SignalCollector collector(p);

        EvaluationInput in;
        in.text = "ping";
        CHECK(collector.collect(in, CollectorTimeouts{})[0].status == OutcomeStatus::SIGNAL, "text delivered");
        in.text = "pong";
        CHECK(collector.collect(in, CollectorTimeouts{})[0].status == OutcomeStatus::NO_SIGNAL, "no-signal passed through");
        std::cout << "\n";
    }
};

int main() {
    CollectorTest tester;
    tester.run_all_tests();
    return tester.exit_code();
}
