#include "audit/AuditLedger.hpp"
#include "audit/LedgerErrors.hpp"
#include "crypto/Digest.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>

using namespace tribunal;
using json = nlohmann::json;

static bool is_blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

json ExportBundle::to_json() const {
    json overrides_json = json::array();
    for (const auto& o : overrides) overrides_json.push_back(auditOverrideToJson(o));

    return {
        {"audit_event", auditEventToJson(event)},
        {"overrides",   overrides_json},
        {"export_metadata", {
            {"exported_at",           Canonicalizer::formatTimestamp(exported_at)},
            {"bundle_schema_version", SCHEMA_VERSION},
            {"signature_algorithm",   Signer::ALGORITHM},
            {"compliance_framework",  COMPLIANCE_FRAMEWORK}
        }}
    };
}

// ============================================================
AuditLedger::AuditLedger(AuditStore& store,
                         EvidenceStore& evidence,
                         const Signer& signer,
                         LedgerConfig cfg,
                         Clock clock)
    : store_(store),
      evidence_(evidence),
      signer_(signer),
      cfg_(cfg),
      clock_(std::move(clock)) {}

std::string AuditLedger::evidenceKey(const std::string& event_id, SignalSource source) {
    return "evidence/" + event_id + "/" + signalSourceToString(source) + ".json";
}

std::vector<std::string> AuditLedger::store_evidence(const std::string& event_id,
                                                     const EvidenceBundle& evidence) {
    std::vector<std::string> refs;
    for (const auto& item : evidence.items) {
        if (item.status == OutcomeStatus::SKIPPED) continue;   // never attempted, nothing to keep

        const std::string key = evidenceKey(event_id, item.source);
        bool ok = false;
        try {
            ok = evidence_.put(key, item.payload.dump(), cfg_.evidence_timeout);
        } catch (const json::exception& e) {
            std::cerr << "[EVIDENCE] Cannot encode " << key << ": " << e.what() << "\n";
        }

        if (ok) {
            refs.push_back(key);
        } else {
            std::cerr << "[LEDGER] Evidence not stored for " << event_id
                      << " source=" << signalSourceToString(item.source) << "\n";
            refs.push_back(std::string(EVIDENCE_FAILED) + signalSourceToString(item.source));
        }
    }
    return refs;
}

AuditEvent AuditLedger::record(const PolicyDecision& decision,
                               const std::string& input,
                               const std::string& user,
                               const std::string& client_id,
                               const std::string& input_type,
                               const EvidenceBundle& evidence) {
    AuditEvent e;
    try {
        e.timestamp = clock_();
        e.event_id  = makeRecordId(EVENT_PREFIX, e.timestamp);
        e.input_hash = sha256Hex(input);
    } catch (const std::runtime_error& ex) {
        throw LedgerWriteFailure(ex.what());
    }

    e.user             = user;
    e.client_id        = client_id;
    e.input_type       = input_type;
    e.decision         = decision.decision;
    e.risk_level       = decision.risk_level;
    e.policy_tags      = decision.policy_tags;
    e.policy_version   = decision.policy_version;
    e.confidence_score = decision.confidence_score;
    e.explanation      = decision.explanation;
    e.evidence_refs    = store_evidence(e.event_id, evidence);

    try {
        e.signature = signer_.sign_fields(signableFields(e));
    } catch (const std::exception& ex) {
        throw LedgerWriteFailure(std::string("signing failed: ") + ex.what());
    }

    // Single attempt. Whatever the store throws becomes LedgerWriteFailure.
    try {
        store_.append_event(e);
    } catch (const LedgerWriteFailure&) {
        throw;
    } catch (const std::exception& ex) {
        throw LedgerWriteFailure(ex.what());
    }

    std::cout << "[LEDGER] Recorded " << e.event_id
              << " decision=" << decisionToString(e.decision)
              << " risk=" << riskLevelToString(e.risk_level)
              << " policy=" << e.policy_version << "\n";
    return e;
}

AuditOverride AuditLedger::override_event(const std::string& original_event_id,
                                          const std::string& operator_name,
                                          const std::string& reason,
                                          const std::string& new_decision,
                                          std::optional<int> duration_minutes) {
    if (is_blank(reason))        throw InvalidOverrideRequest("reason is required");
    if (is_blank(operator_name)) throw InvalidOverrideRequest("operator is required");

    auto decision = parseDecision(new_decision);
    if (!decision) throw InvalidOverrideRequest("unknown decision '" + new_decision + "'");

    if (duration_minutes && *duration_minutes < 0)
        throw InvalidOverrideRequest("duration must not be negative");

    if (!store_.find_event(original_event_id)) throw NotFound(original_event_id);

    AuditOverride o;
    try {
        o.timestamp   = clock_();
        o.override_id = makeRecordId(OVERRIDE_PREFIX, o.timestamp);
    } catch (const std::runtime_error& ex) {
        throw LedgerWriteFailure(ex.what());
    }
    o.original_event_id = original_event_id;
    o.operator_name     = operator_name;
    o.reason            = reason;
    o.new_decision      = *decision;
    o.duration          = duration_minutes;

    try {
        o.signature = signer_.sign_fields(signableFields(o));
    } catch (const std::exception& ex) {
        throw LedgerWriteFailure(std::string("signing failed: ") + ex.what());
    }

    try {
        store_.append_override(o);
    } catch (const LedgerWriteFailure&) {
        throw;
    } catch (const std::exception& ex) {
        throw LedgerWriteFailure(ex.what());
    }

    std::cout << "[LEDGER] Override " << o.override_id << " on " << original_event_id
              << " new_decision=" << decisionToString(o.new_decision)
              << " operator=" << o.operator_name << "\n";
    return o;
}

// ============================================================
bool AuditLedger::verify_event(const AuditEvent& e) const {
    return signer_.verify_fields(signableFields(e), e.signature);
}

bool AuditLedger::verify_override(const AuditOverride& o) const {
    return signer_.verify_fields(signableFields(o), o.signature);
}

AuditEvent AuditLedger::get(const std::string& event_id) const {
    auto e = store_.find_event(event_id);
    if (!e) throw NotFound(event_id);

    if (!verify_event(*e)) {
        std::cerr << "[LEDGER] SIGNATURE MISMATCH on " << event_id << "\n";
        throw IntegrityViolation(event_id, "event signature does not verify");
    }
    return *e;
}

std::vector<AuditEvent> AuditLedger::list(const EventFilter& filter,
                                          std::size_t limit,
                                          std::size_t offset) const {
    return store_.query_events(filter, std::min(limit, cfg_.list_limit_max), offset);
}

std::vector<AuditOverride> AuditLedger::overrides_for(const std::string& event_id) const {
    return store_.overrides_for(event_id);
}

ExportBundle AuditLedger::export_bundle(const std::string& event_id) const {
    ExportBundle b;
    b.event     = get(event_id);
    b.overrides = store_.overrides_for(event_id);

    for (const auto& o : b.overrides) {
        if (!verify_override(o)) {
            std::cerr << "[LEDGER] SIGNATURE MISMATCH on " << o.override_id << "\n";
            throw IntegrityViolation(o.override_id, "override signature does not verify");
        }
    }
    b.exported_at = clock_();
    return b;
}
