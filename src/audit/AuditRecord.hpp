#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "crypto/Canonicalizer.hpp"
#include "signal/EvaluationSignal.hpp"

namespace tribunal {

// ---------------------------------------------------------------------------
// AuditEvent - permanent signed record of one decision.
//
// Signed subset (exactly these, nothing else):
//   event_id, timestamp, input_hash, user, client_id, decision,
//   policy_tags, risk_level, policy_version
// evidence_refs, explanation, confidence_score and input_type are outside the
// signature: they are advisory or may be regenerated.
// ---------------------------------------------------------------------------
struct AuditEvent {
    std::string              event_id;
    Timestamp                timestamp{};
    std::string              input_hash;
    std::string              user;
    std::string              client_id;
    std::string              input_type;
    Decision                 decision   = Decision::ALLOW;
    RiskLevel                risk_level = RiskLevel::MINIMAL;
    std::vector<std::string> policy_tags;
    std::string              policy_version;
    int                      confidence_score = 0;
    std::string              explanation;
    std::vector<std::string> evidence_refs;
    std::string              signature;
};

// ---------------------------------------------------------------------------
// AuditOverride - correction layered on an AuditEvent; never replaces it.
// duration is in minutes; absent = permanent.
//
// Signed subset: override_id, original_event_id, timestamp, operator,
// new_decision, reason, duration (null when absent).
// ---------------------------------------------------------------------------
struct AuditOverride {
    std::string        override_id;
    std::string        original_event_id;
    Timestamp          timestamp{};
    std::string        operator_name;     // "operator" on the wire
    std::string        reason;
    Decision           new_decision = Decision::ALLOW;
    std::optional<int> duration;
    std::string        signature;
};

nlohmann::json signableFields(const AuditEvent& e);
nlohmann::json signableFields(const AuditOverride& o);

// Full row encoding (storage, export). Decoding throws std::invalid_argument
// on a malformed row.
nlohmann::json auditEventToJson(const AuditEvent& e);
nlohmann::json auditOverrideToJson(const AuditOverride& o);
AuditEvent     auditEventFromJson(const nlohmann::json& j);
AuditOverride  auditOverrideFromJson(const nlohmann::json& j);

// list() filters; unset members match everything.
struct EventFilter {
    std::optional<Decision>    decision;
    std::optional<RiskLevel>   risk_level;
    std::optional<std::string> user;

    bool matches(const AuditEvent& e) const;
};

struct DecisionCounts {
    std::size_t total   = 0;
    std::size_t blocked = 0;
    std::size_t flagged = 0;
    std::size_t allowed = 0;
};

} // namespace tribunal
