#include "decision/PolicyDecision.hpp"

using namespace tribunal;

nlohmann::json PolicyDecision::to_json() const {
    return {
        {"decision",         decisionToString(decision)},
        {"risk_level",       riskLevelToString(risk_level)},
        {"policy_tags",      policy_tags},
        {"confidence_score", confidence_score},
        {"explanation",      explanation},
        {"policy_version",   policy_version}
    };
}

bool EvidenceBundle::attempted(SignalSource s) const {
    for (const auto& it : items) {
        if (it.source == s) return it.status != OutcomeStatus::SKIPPED;
    }
    return false;
}

bool EvidenceBundle::failed(SignalSource s) const {
    for (const auto& it : items) {
        if (it.source == s) return it.status == OutcomeStatus::ERROR;
    }
    return false;
}
