// =============================================================================
// PolicyDecision.hpp - MERGED OUTCOME OF ONE EVALUATION
// =============================================================================
// PURPOSE: The single authoritative answer built from every producer signal.
//
// LIFETIME:
//   - Transient. Exists only to be wrapped into an AuditEvent.
//   - Never persisted on its own.
//
// EVIDENCE:
//   - EvidenceBundle carries one entry per producer outcome, including
//     `source-error` entries for producers that were attempted and failed,
//     so the audit trail can tell "failed" from "never attempted".
// =============================================================================
#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "signal/EvaluationSignal.hpp"

namespace tribunal {

struct PolicyDecision {
    Decision                 decision   = Decision::ALLOW;
    RiskLevel                risk_level = RiskLevel::MINIMAL;
    std::vector<std::string> policy_tags;        // de-duplicated, first-seen order
    int                      confidence_score = 0;   // 0..100
    std::string              explanation;
    std::string              policy_version;

    // Deterministic field order; used for logging and the CLI.
    nlohmann::json to_json() const;
};

struct EvidenceItem {
    SignalSource   source = SignalSource::PATTERN;
    OutcomeStatus  status = OutcomeStatus::SKIPPED;
    nlohmann::json payload;
};

struct EvidenceBundle {
    std::vector<EvidenceItem> items;

    bool attempted(SignalSource s) const;
    bool failed(SignalSource s) const;
};

struct MergeResult {
    PolicyDecision decision;
    EvidenceBundle evidence;
};

} // namespace tribunal
