// =============================================================================
// DecisionMerger.hpp - SIGNAL → DECISION MERGE ENGINE
// =============================================================================
// PRECEDENCE:
//   1. A classifier signal, when present, is authoritative. Its risk, tags,
//      confidence and rationale become the decision. No blending.
//   2. Otherwise pattern + vision signals are combined:
//        - winner = highest risk (unacceptable > high > limited > minimal),
//          ties broken pattern > vision
//        - tags   = every signal at or above the winner's risk, de-duplicated
//        - explanation = their rationales joined with "; "
//        - confidence  = winner's confidence scaled to 0..100
//   3. No signal at all → allow / minimal / baseline confidence.
//
// Producer errors never abort the merge: the failed source is absent from the
// decision and recorded as `source-error` in the evidence bundle.
//
// Pure: no I/O, no clock, no randomness. Same input → identical output.
// =============================================================================
#pragma once

#include <string>
#include <vector>

#include "decision/PolicyDecision.hpp"

namespace tribunal {

class DecisionMerger {
public:
    // "Checked, clean" - distinguishable from an unchecked 0.
    static constexpr int BASELINE_CONFIDENCE = 15;

    static constexpr const char* CLEAN_EXPLANATION = "No policy violations detected";

    PolicyDecision merge(const std::vector<EvaluationSignal>& signals,
                         const std::string& active_policy_version) const;

    // Full form: producer outcomes in, decision plus evidence bundle out.
    MergeResult merge_outcomes(const std::vector<ProducerOutcome>& outcomes,
                               const std::string& active_policy_version) const;

    // round(confidence * 100) clamped to [0,100]; NaN → 0.
    static int scaleConfidence(double confidence);

private:
    PolicyDecision from_classifier(const EvaluationSignal& sig) const;
    PolicyDecision from_rules(const std::vector<const EvaluationSignal*>& rules) const;
};

} // namespace tribunal
