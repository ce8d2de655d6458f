// =============================================================================
// DecisionMerger.cpp - MERGE ENGINE IMPLEMENTATION
// =============================================================================
#include "decision/DecisionMerger.hpp"

#include <algorithm>
#include <cmath>

namespace tribunal {

namespace {

void append_unique(std::vector<std::string>& out, const std::vector<std::string>& tags) {
    for (const auto& t : tags) {
        if (std::find(out.begin(), out.end(), t) == out.end()) out.push_back(t);
    }
}

nlohmann::json evidence_payload(const ProducerOutcome& o) {
    nlohmann::json p = {{"status", outcomeStatusToString(o.status)}};
    switch (o.status) {
        case OutcomeStatus::SIGNAL:
            p["risk_level"]   = riskLevelToString(o.signal->risk_level);
            p["tags"]         = o.signal->tags;
            p["confidence"]   = o.signal->confidence;
            p["rationale"]    = o.signal->rationale;
            p["raw_evidence"] = o.signal->raw_evidence;
            break;
        case OutcomeStatus::NO_SIGNAL:
            p["detail"] = o.detail;
            break;
        case OutcomeStatus::ERROR:
            p["error"] = o.error;
            break;
        case OutcomeStatus::SKIPPED:
        default:
            break;
    }
    return p;
}

} // namespace

int DecisionMerger::scaleConfidence(double confidence) {
    if (std::isnan(confidence)) return 0;
    double c = std::clamp(confidence, 0.0, 1.0);
    long scaled = std::lround(c * 100.0);
    return static_cast<int>(std::clamp(scaled, 0L, 100L));
}

PolicyDecision DecisionMerger::merge(const std::vector<EvaluationSignal>& signals,
                                     const std::string& active_policy_version) const {
    // =========================================================================
    // CLASSIFIER PATH (AUTHORITATIVE)
    // =========================================================================
    for (const auto& s : signals) {
        if (s.source == SignalSource::CLASSIFIER) {
            PolicyDecision d = from_classifier(s);
            d.policy_version = active_policy_version;
            return d;
        }
    }

    // =========================================================================
    // RULE-BASED FALLBACK
    // =========================================================================
    std::vector<const EvaluationSignal*> rules;
    for (const auto& s : signals) rules.push_back(&s);

    PolicyDecision d = from_rules(rules);
    d.policy_version = active_policy_version;
    return d;
}

MergeResult DecisionMerger::merge_outcomes(const std::vector<ProducerOutcome>& outcomes,
                                           const std::string& active_policy_version) const {
    MergeResult r;
    std::vector<EvaluationSignal> signals;

    for (const auto& o : outcomes) {
        if (o.status == OutcomeStatus::SIGNAL && o.signal) signals.push_back(*o.signal);
        r.evidence.items.push_back({o.source, o.status, evidence_payload(o)});
    }

    r.decision = merge(signals, active_policy_version);
    return r;
}

PolicyDecision DecisionMerger::from_classifier(const EvaluationSignal& sig) const {
    PolicyDecision d;
    d.risk_level       = sig.risk_level;
    d.decision         = decisionForRisk(sig.risk_level);
    append_unique(d.policy_tags, sig.tags);
    d.confidence_score = scaleConfidence(sig.confidence);
    d.explanation      = sig.rationale.empty() ? std::string(CLEAN_EXPLANATION) : sig.rationale;
    return d;
}

PolicyDecision DecisionMerger::from_rules(const std::vector<const EvaluationSignal*>& rules) const {
    PolicyDecision d;

    if (rules.empty()) {
        d.decision         = Decision::ALLOW;
        d.risk_level       = RiskLevel::MINIMAL;
        d.confidence_score = BASELINE_CONFIDENCE;
        d.explanation      = CLEAN_EXPLANATION;
        return d;
    }

    // Winner: highest risk, then source priority. Strict compare keeps the
    // first-seen signal when both risk and source tie.
    const EvaluationSignal* winner = rules.front();
    for (const auto* s : rules) {
        int byRisk = compareRisk(s->risk_level, winner->risk_level);
        if (byRisk > 0 ||
            (byRisk == 0 && sourcePriority(s->source) > sourcePriority(winner->source))) {
            winner = s;
        }
    }

    std::vector<const EvaluationSignal*> contributing;
    for (const auto* s : rules) {
        if (compareRisk(s->risk_level, winner->risk_level) >= 0) contributing.push_back(s);
    }
    std::stable_sort(contributing.begin(), contributing.end(),
                     [](const EvaluationSignal* a, const EvaluationSignal* b) {
                         return sourcePriority(a->source) > sourcePriority(b->source);
                     });

    d.risk_level       = winner->risk_level;
    d.decision         = decisionForRisk(winner->risk_level);
    d.confidence_score = scaleConfidence(winner->confidence);

    for (const auto* s : contributing) {
        append_unique(d.policy_tags, s->tags);
        if (s->rationale.empty()) continue;
        if (!d.explanation.empty()) d.explanation += "; ";
        d.explanation += s->rationale;
    }
    if (d.explanation.empty()) d.explanation = CLEAN_EXPLANATION;

    return d;
}

} // namespace tribunal
