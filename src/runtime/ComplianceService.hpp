// =============================================================================
// ComplianceService.hpp - THE CORE'S CONTRACT WITH THE API LAYER
// =============================================================================
//   evaluate(input, metadata)  → PolicyDecision + event_id
//   get_event(event_id)        → AuditEvent            | NotFound
//   list_events(filter, ...)   → [AuditEvent]
//   create_override(id, req)   → AuditOverride         | NotFound
//   export_bundle(event_id)    → ExportBundle          | NotFound
//
// EVALUATE:
//   1. read the active policy version (every call, never cached)
//   2. fan out to producers, each bounded by its own timeout
//   3. merge outcomes into one decision + evidence bundle
//   4. cancellation checkpoint: nothing has been persisted yet
//   5. record in the ledger. LedgerWriteFailure aborts the evaluation;
//      an unrecorded decision is never returned
//
// Errors leaving this class are the core taxonomy only: NotFound,
// IntegrityViolation, InvalidOverrideRequest, LedgerWriteFailure,
// EvaluationCancelled.
// =============================================================================
#pragma once

#include <atomic>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "audit/AuditLedger.hpp"
#include "audit/OverrideProjection.hpp"
#include "decision/DecisionMerger.hpp"
#include "policy/PolicyPack.hpp"
#include "signal/SignalCollector.hpp"

namespace tribunal {

// Caller gave up before the ledger write. Nothing was persisted.
class EvaluationCancelled : public std::runtime_error {
public:
    EvaluationCancelled() : std::runtime_error("evaluation cancelled before recording") {}
};

struct RequestMetadata {
    std::string user;
    std::string client_id;
    std::string input_type;     // empty = input.content_type, else "text"
};

struct EvaluationResult {
    PolicyDecision decision;
    std::string    event_id;
    EvidenceBundle evidence;

    nlohmann::json to_json() const;
};

struct OverrideRequest {
    std::string        operator_name;
    std::string        reason;
    std::string        new_decision;
    std::optional<int> duration_minutes;
};

struct ServiceStats {
    DecisionCounts events;
    PolicyStats    policies;

    nlohmann::json to_json() const;
};

class ComplianceService {
public:
    ComplianceService(const PolicyRegistry& registry,
                      SignalCollector& collector,
                      AuditLedger& ledger,
                      CollectorTimeouts timeouts);

    // `cancel` may be null. When it reads true at a checkpoint the call throws
    // EvaluationCancelled with no persisted side effect.
    EvaluationResult evaluate(const EvaluationInput& input,
                              const RequestMetadata& meta,
                              const std::atomic<bool>* cancel = nullptr);

    AuditEvent              get_event(const std::string& event_id) const;
    std::vector<AuditEvent> list_events(const EventFilter& filter,
                                        std::size_t limit,
                                        std::size_t offset = 0) const;
    AuditOverride           create_override(const std::string& event_id,
                                            const OverrideRequest& req);
    ExportBundle            export_bundle(const std::string& event_id) const;

    // Verified event + its overrides, projected at `now`.
    EffectiveDecision effective_decision(const std::string& event_id, Timestamp now) const;

    ServiceStats stats() const;

    // Bytes that feed input_hash: text, then image bytes if present.
    static std::string digestMaterial(const EvaluationInput& input);

private:
    const PolicyRegistry& registry_;
    SignalCollector&      collector_;
    AuditLedger&          ledger_;
    CollectorTimeouts     timeouts_;
    DecisionMerger        merger_;
};

} // namespace tribunal
