// =============================================================================
// AuditLedger.hpp - SIGNED, APPEND-ONLY DECISION LEDGER
// =============================================================================
// PURPOSE: Turns a PolicyDecision into a permanent AuditEvent, layers
// AuditOverrides on top of it, and builds export bundles that a third party
// can verify with nothing but the signing secret.
//
// WRITE PATH (record):
//   1. fresh event_id  evt-YYYYMMDD-xxxxxxxx
//   2. input_hash = SHA-256(input); the content itself is dropped here
//   3. evidence → sideband, best-effort; failures become sentinel refs
//   4. sign the fixed signable subset
//   5. ONE append to the store. No retry. Failure → LedgerWriteFailure
//
// READ PATH:
//   get() and export_bundle() re-verify every signature they return and throw
//   IntegrityViolation on mismatch. list() returns rows as stored.
//
// THREADING: no lock of its own. Ids need no coordination, the signer is
// read-only, and the store serializes its own inserts.
// =============================================================================
#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "audit/AuditRecord.hpp"
#include "audit/AuditStore.hpp"
#include "audit/EvidenceStore.hpp"
#include "crypto/Canonicalizer.hpp"
#include "crypto/Signer.hpp"
#include "decision/PolicyDecision.hpp"

namespace tribunal {

struct LedgerConfig {
    std::size_t               list_limit_max   = 1000;
    std::chrono::milliseconds evidence_timeout{2000};
};

struct ExportBundle {
    static constexpr const char* SCHEMA_VERSION       = "1.0";
    static constexpr const char* COMPLIANCE_FRAMEWORK = "EU AI Act";

    AuditEvent                 event;
    std::vector<AuditOverride> overrides;     // timestamp ascending
    Timestamp                  exported_at{};

    nlohmann::json to_json() const;
};

class AuditLedger {
public:
    static constexpr const char* EVENT_PREFIX    = "evt";
    static constexpr const char* OVERRIDE_PREFIX = "ovr";
    static constexpr const char* EVIDENCE_FAILED = "evidence-storage-failed:";

    AuditLedger(AuditStore& store,
                EvidenceStore& evidence,
                const Signer& signer,
                LedgerConfig cfg = LedgerConfig{},
                Clock clock = systemNow);

    // Throws LedgerWriteFailure if the row could not be persisted. Evidence
    // failures never throw.
    AuditEvent record(const PolicyDecision& decision,
                      const std::string& input,
                      const std::string& user,
                      const std::string& client_id,
                      const std::string& input_type,
                      const EvidenceBundle& evidence);

    // Validation happens before the lookup, and both before any write:
    // InvalidOverrideRequest, then NotFound, then LedgerWriteFailure.
    AuditOverride override_event(const std::string& original_event_id,
                                 const std::string& operator_name,
                                 const std::string& reason,
                                 const std::string& new_decision,
                                 std::optional<int> duration_minutes = std::nullopt);

    AuditEvent                 get(const std::string& event_id) const;
    std::vector<AuditEvent>    list(const EventFilter& filter,
                                    std::size_t limit,
                                    std::size_t offset = 0) const;
    std::vector<AuditOverride> overrides_for(const std::string& event_id) const;
    ExportBundle               export_bundle(const std::string& event_id) const;

    bool verify_event(const AuditEvent& e) const;
    bool verify_override(const AuditOverride& o) const;

    DecisionCounts stats() const { return store_.decision_counts(); }

    static std::string evidenceKey(const std::string& event_id, SignalSource source);

private:
    std::vector<std::string> store_evidence(const std::string& event_id,
                                            const EvidenceBundle& evidence);

    AuditStore&    store_;
    EvidenceStore& evidence_;
    const Signer&  signer_;
    LedgerConfig   cfg_;
    Clock          clock_;
};

} // namespace tribunal
