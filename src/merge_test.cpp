// =============================================================================
// src/merge_test.cpp - Decision Merge Engine Unit Tests
// =============================================================================
// Pure tests: no I/O, no clock. Covers precedence, confidence scaling,
// tag/explanation accumulation and the source-error evidence marker.
// =============================================================================

#include <cmath>
#include <limits>
#include <vector>

#include "decision/DecisionMerger.hpp"
#include "testing/TestSuite.hpp"

using namespace tribunal;

namespace {

EvaluationSignal make_signal(SignalSource src, RiskLevel risk,
                             std::vector<std::string> tags, double conf,
                             const std::string& rationale) {
    EvaluationSignal s;
    s.source     = src;
    s.risk_level = risk;
    s.tags       = std::move(tags);
    s.confidence = conf;
    s.rationale  = rationale;
    return s;
}

} // namespace

class MergeTest : public testing::TestSuite {
public:
    MergeTest() : TestSuite("DECISION MERGE ENGINE - UNIT TESTS") {}

    void run_all_tests() {
        print_banner();

        test_empty_input();
        test_risk_precedence();
        test_classifier_precedence();
        test_source_tie_break();
        test_tag_accumulation();
        test_confidence_scaling();
        test_determinism();
        test_outcomes_and_evidence();

        print_summary();
    }

private:
    DecisionMerger merger_;

    void test_empty_input() {
        std::cout << "Testing Empty Input...\n";

        PolicyDecision d = merger_.merge({}, "v1");
        CHECK(d.decision == Decision::ALLOW, "empty input allows");
        CHECK(d.risk_level == RiskLevel::MINIMAL, "empty input is minimal risk");
        CHECK(d.confidence_score >= 10 && d.confidence_score <= 20, "baseline confidence in [10,20]");
        CHECK(d.confidence_score != 0, "checked-clean differs from unchecked 0");
        CHECK(d.policy_tags.empty(), "no tags");
        CHECK(d.policy_version == "v1", "policy version stamped");
        std::cout << "\n";
    }

    void test_risk_precedence() {
        std::cout << "Testing Risk Precedence...\n";

        std::vector<EvaluationSignal> sigs = {
            make_signal(SignalSource::PATTERN, RiskLevel::HIGH, {"PII"}, 0.8, "Detected PII"),
            make_signal(SignalSource::VISION, RiskLevel::UNACCEPTABLE, {"Biometric"}, 0.7, "Faces"),
        };
        PolicyDecision d = merger_.merge(sigs, "v1");
        CHECK(d.risk_level == RiskLevel::UNACCEPTABLE, "highest risk wins over source priority");
        CHECK(d.decision == Decision::BLOCK, "unacceptable maps to block");
        CHECK(d.confidence_score == 70, "winner's confidence used");
        CHECK(d.policy_tags == std::vector<std::string>{"Biometric"}, "only signals at or above winner contribute tags");

        CHECK(decisionForRisk(RiskLevel::HIGH) == Decision::FLAG, "high maps to flag");
        CHECK(decisionForRisk(RiskLevel::LIMITED) == Decision::FLAG, "limited maps to flag");
        CHECK(decisionForRisk(RiskLevel::MINIMAL) == Decision::ALLOW, "minimal maps to allow");
        std::cout << "\n";
    }

    void test_classifier_precedence() {
        std::cout << "Testing Classifier Precedence...\n";

        std::vector<EvaluationSignal> sigs = {
            make_signal(SignalSource::PATTERN, RiskLevel::UNACCEPTABLE, {"SocialScoring"}, 0.9, "rule"),
            make_signal(SignalSource::CLASSIFIER, RiskLevel::LIMITED, {"Transparency"}, 0.456, "model says limited"),
            make_signal(SignalSource::VISION, RiskLevel::HIGH, {"FaceDetection"}, 0.5, "faces"),
        };
        PolicyDecision d = merger_.merge(sigs, "v2");
        CHECK(d.risk_level == RiskLevel::LIMITED, "classifier risk used");
        CHECK(d.decision == Decision::FLAG, "classifier limited → flag");
        CHECK(d.policy_tags == std::vector<std::string>{"Transparency"}, "classifier tags only");
        CHECK(d.confidence_score == 46, "round(0.456 * 100) == 46");
        CHECK(d.explanation == "model says limited", "classifier rationale used");
        std::cout << "\n";
    }

    void test_source_tie_break() {
        std::cout << "Testing Source Tie-Break...\n";

        std::vector<EvaluationSignal> sigs = {
            make_signal(SignalSource::VISION, RiskLevel::HIGH, {"FaceDetection"}, 0.5, "faces"),
            make_signal(SignalSource::PATTERN, RiskLevel::HIGH, {"PII"}, 0.8, "pii"),
        };
        PolicyDecision d = merger_.merge(sigs, "v1");
        CHECK(d.confidence_score == 80, "pattern wins a risk tie against vision");
        CHECK(d.policy_tags == (std::vector<std::string>{"PII", "FaceDetection"}),
              "tags in source-priority order");
        CHECK(d.explanation == "pii; faces", "explanation in source-priority order");
        std::cout << "\n";
    }

    void test_tag_accumulation() {
        std::cout << "Testing Tag Accumulation...\n";

        std::vector<EvaluationSignal> sigs = {
            make_signal(SignalSource::PATTERN, RiskLevel::HIGH, {"A", "B"}, 0.8, "one"),
            make_signal(SignalSource::PATTERN, RiskLevel::LIMITED, {"C"}, 0.7, "low"),
            make_signal(SignalSource::PATTERN, RiskLevel::HIGH, {"B", "D"}, 0.6, "two"),
        };
        PolicyDecision d = merger_.merge(sigs, "v1");
        CHECK(d.policy_tags == (std::vector<std::string>{"A", "B", "D"}), "de-duplicated, first-seen order");
        CHECK(d.explanation == "one; two", "below-winner rationale excluded");
        CHECK(d.confidence_score == 80, "first of tied winners kept");
        std::cout << "\n";
    }

    void test_confidence_scaling() {
        std::cout << "Testing Confidence Scaling...\n";

        CHECK(DecisionMerger::scaleConfidence(0.0) == 0, "0 → 0");
        CHECK(DecisionMerger::scaleConfidence(1.0) == 100, "1 → 100");
        CHECK(DecisionMerger::scaleConfidence(0.875) == 88, "0.875 → 88");
        CHECK(DecisionMerger::scaleConfidence(1.7) == 100, "clamped above");
        CHECK(DecisionMerger::scaleConfidence(-0.3) == 0, "clamped below");
        CHECK(DecisionMerger::scaleConfidence(std::numeric_limits<double>::quiet_NaN()) == 0, "NaN → 0");
        std::cout << "\n";
    }

    void test_determinism() {
        std::cout << "Testing Determinism...\n";

        std::vector<EvaluationSignal> sigs = {
            make_signal(SignalSource::PATTERN, RiskLevel::LIMITED, {"X"}, 0.33, "x"),
            make_signal(SignalSource::VISION, RiskLevel::LIMITED, {"Y"}, 0.5, "y"),
        };
        std::string first = merger_.merge(sigs, "v9").to_json().dump();
        bool same = true;
        for (int i = 0; i < 50; ++i) {
            if (merger_.merge(sigs, "v9").to_json().dump() != first) same = false;
        }
        CHECK(same, "identical input → byte-identical decision");
        std::cout << "\n";
    }

    void test_outcomes_and_evidence() {
        std::cout << "Testing Outcomes + Evidence Bundle...\n";

        std::vector<ProducerOutcome> outcomes = {
            ProducerOutcome::produced(make_signal(SignalSource::PATTERN, RiskLevel::HIGH, {"PII"}, 0.8, "pii")),
            ProducerOutcome::skipped(SignalSource::VISION),
            ProducerOutcome::failed(SignalSource::CLASSIFIER, "timeout"),
        };
        MergeResult r = merger_.merge_outcomes(outcomes, "v1");

        CHECK(r.decision.decision == Decision::FLAG, "failed classifier falls back to rules");
        CHECK(r.evidence.items.size() == 3, "one evidence item per outcome");
        CHECK(r.evidence.failed(SignalSource::CLASSIFIER), "classifier marked source-error");
        CHECK(r.evidence.attempted(SignalSource::CLASSIFIER), "failed counts as attempted");
        CHECK(!r.evidence.attempted(SignalSource::VISION), "skipped is not attempted");
        CHECK(r.evidence.items[2].payload.value("status", "") == "source-error", "source-error marker in payload");
        CHECK(r.evidence.items[2].payload.value("error", "") == "timeout", "error text kept");

        std::vector<ProducerOutcome> all_failed = {
            ProducerOutcome::failed(SignalSource::PATTERN, "boom"),
            ProducerOutcome::failed(SignalSource::VISION, "boom"),
            ProducerOutcome::failed(SignalSource::CLASSIFIER, "boom"),
        };
        MergeResult none = merger_.merge_outcomes(all_failed, "v1");
        CHECK(none.decision.decision == Decision::ALLOW, "decision still produced when every producer fails");
        CHECK(none.decision.confidence_score == DecisionMerger::BASELINE_CONFIDENCE, "baseline confidence");
        std::cout << "\n";
    }
};

int main() {
    MergeTest tester;
    tester.run_all_tests();
    return tester.exit_code();
}
