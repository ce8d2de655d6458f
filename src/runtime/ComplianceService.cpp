#include "runtime/ComplianceService.hpp"
#include "audit/LedgerErrors.hpp"

#include <iostream>

using namespace tribunal;
using json = nlohmann::json;

json EvaluationResult::to_json() const {
    json ev = json::array();
    for (const auto& item : evidence.items) {
        ev.push_back({{"source", signalSourceToString(item.source)},
                      {"status", outcomeStatusToString(item.status)}});
    }
    json j = decision.to_json();
    j["event_id"] = event_id;
    j["signals"]  = ev;
    return j;
}

json ServiceStats::to_json() const {
    return {
        {"audit_events", {
            {"total",   events.total},
            {"blocked", events.blocked},
            {"flagged", events.flagged},
            {"allowed", events.allowed}
        }},
        {"policies", {
            {"total_packs",  policies.total_packs},
            {"active_packs", policies.active_packs},
            {"total_tags",   policies.total_tags}
        }}
    };
}

// ============================================================
ComplianceService::ComplianceService(const PolicyRegistry& registry,
                                     SignalCollector& collector,
                                     AuditLedger& ledger,
                                     CollectorTimeouts timeouts)
    : registry_(registry),
      collector_(collector),
      ledger_(ledger),
      timeouts_(timeouts) {}

std::string ComplianceService::digestMaterial(const EvaluationInput& input) {
    std::string out = input.text;
    if (!input.image.empty()) {
        out.push_back('\0');
        out.append(reinterpret_cast<const char*>(input.image.data()), input.image.size());
    }
    return out;
}

static bool cancelled(const std::atomic<bool>* cancel) {
    return cancel && cancel->load(std::memory_order_acquire);
}

EvaluationResult ComplianceService::evaluate(const EvaluationInput& input,
                                             const RequestMetadata& meta,
                                             const std::atomic<bool>* cancel) {
    if (cancelled(cancel)) throw EvaluationCancelled();

    // Activation can change between calls.
    const std::string policy_version = registry_.active_version();

    std::vector<ProducerOutcome> outcomes = collector_.collect(input, timeouts_);
    MergeResult merged = merger_.merge_outcomes(outcomes, policy_version);

    for (const auto& o : outcomes) {
        if (o.status == OutcomeStatus::ERROR) {
            std::cerr << "[SERVICE] " << signalSourceToString(o.source)
                      << " producer failed: " << o.error << "\n";
        }
    }

    if (cancelled(cancel)) {
        std::cout << "[SERVICE] Evaluation cancelled before recording\n";
        throw EvaluationCancelled();
    }

    std::string input_type = meta.input_type;
    if (input_type.empty()) input_type = input.content_type.empty() ? "text" : input.content_type;

    AuditEvent event;
    try {
        event = ledger_.record(merged.decision, digestMaterial(input),
                               meta.user, meta.client_id, input_type, merged.evidence);
    } catch (const LedgerWriteFailure& e) {
        std::cerr << "[SERVICE] ABORT: " << e.what() << "\n";
        throw;
    }

    EvaluationResult r;
    r.decision = std::move(merged.decision);
    r.event_id = event.event_id;
    r.evidence = std::move(merged.evidence);
    return r;
}

AuditEvent ComplianceService::get_event(const std::string& event_id) const {
    return ledger_.get(event_id);
}

std::vector<AuditEvent> ComplianceService::list_events(const EventFilter& filter,
                                                       std::size_t limit,
                                                       std::size_t offset) const {
    return ledger_.list(filter, limit, offset);
}

AuditOverride ComplianceService::create_override(const std::string& event_id,
                                                 const OverrideRequest& req) {
    return ledger_.override_event(event_id, req.operator_name, req.reason,
                                  req.new_decision, req.duration_minutes);
}

ExportBundle ComplianceService::export_bundle(const std::string& event_id) const {
    return ledger_.export_bundle(event_id);
}

EffectiveDecision ComplianceService::effective_decision(const std::string& event_id,
                                                        Timestamp now) const {
    ExportBundle b = ledger_.export_bundle(event_id);
    return OverrideProjection::resolve(b.event, b.overrides, now);
}

ServiceStats ComplianceService::stats() const {
    ServiceStats s;
    s.events   = ledger_.stats();
    s.policies = registry_.stats();
    return s;
}
