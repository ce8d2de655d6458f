#include "audit/AuditRecord.hpp"

#include <limits>
#include <stdexcept>

using namespace tribunal;
using json = nlohmann::json;

// ---------------------------------------------------------------------------
static std::string str_field(const json& j, const char* key) {
    if (!j.contains(key) || !j[key].is_string())
        throw std::invalid_argument(std::string("row: missing string field '") + key + "'");
    return j[key].get<std::string>();
}

// Advisory fields may be absent, but when present they must be strings.
static std::string opt_str_field(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return std::string();
    if (!j[key].is_string())
        throw std::invalid_argument(std::string("row: field '") + key + "' must be a string");
    return j[key].get<std::string>();
}

static Timestamp ts_field(const json& j, const char* key) {
    auto ts = Canonicalizer::parseTimestamp(str_field(j, key));
    if (!ts) throw std::invalid_argument(std::string("row: bad timestamp in '") + key + "'");
    return *ts;
}

static std::vector<std::string> str_list(const json& j, const char* key) {
    std::vector<std::string> out;
    if (!j.contains(key)) return out;
    if (!j[key].is_array())
        throw std::invalid_argument(std::string("row: field '") + key + "' must be an array");
    for (const auto& v : j[key]) {
        if (!v.is_string())
            throw std::invalid_argument(std::string("row: field '") + key + "' must hold strings");
        out.push_back(v.get<std::string>());
    }
    return out;
}

static Decision decision_field(const json& j, const char* key) {
    auto d = parseDecision(str_field(j, key));
    if (!d) throw std::invalid_argument(std::string("row: unknown decision in '") + key + "'");
    return *d;
}
// ---------------------------------------------------------------------------

json tribunal::signableFields(const AuditEvent& e) {
    return {
        {"event_id",       e.event_id},
        {"timestamp",      Canonicalizer::formatTimestamp(e.timestamp)},
        {"input_hash",     e.input_hash},
        {"user",           e.user},
        {"client_id",      e.client_id},
        {"decision",       decisionToString(e.decision)},
        {"policy_tags",    e.policy_tags},
        {"risk_level",     riskLevelToString(e.risk_level)},
        {"policy_version", e.policy_version}
    };
}

json tribunal::signableFields(const AuditOverride& o) {
    return {
        {"override_id",       o.override_id},
        {"original_event_id", o.original_event_id},
        {"timestamp",         Canonicalizer::formatTimestamp(o.timestamp)},
        {"operator",          o.operator_name},
        {"new_decision",      decisionToString(o.new_decision)},
        {"reason",            o.reason},
        {"duration",          o.duration ? json(*o.duration) : json(nullptr)}
    };
}

json tribunal::auditEventToJson(const AuditEvent& e) {
    json j = signableFields(e);
    j["input_type"]       = e.input_type;
    j["confidence_score"] = e.confidence_score;
    j["explanation"]      = e.explanation;
    j["evidence_refs"]    = e.evidence_refs;
    j["signature"]        = e.signature;
    return j;
}

json tribunal::auditOverrideToJson(const AuditOverride& o) {
    json j = signableFields(o);
    j["signature"] = o.signature;
    return j;
}

AuditEvent tribunal::auditEventFromJson(const json& j) {
    if (!j.is_object()) throw std::invalid_argument("row: event must be an object");

    AuditEvent e;
    e.event_id       = str_field(j, "event_id");
    e.timestamp      = ts_field(j, "timestamp");
    e.input_hash     = str_field(j, "input_hash");
    e.user           = str_field(j, "user");
    e.client_id      = str_field(j, "client_id");
    e.input_type     = opt_str_field(j, "input_type");
    e.decision       = decision_field(j, "decision");

    auto risk = parseRiskLevel(str_field(j, "risk_level"));
    if (!risk) throw std::invalid_argument("row: unknown risk_level");
    e.risk_level     = *risk;

    e.policy_tags    = str_list(j, "policy_tags");
    e.policy_version = str_field(j, "policy_version");
    if (j.contains("confidence_score") && !j["confidence_score"].is_null()) {
        const json& c = j["confidence_score"];
        if (!c.is_number_integer() || c.get<long long>() < 0 || c.get<long long>() > 100)
            throw std::invalid_argument("row: confidence_score must be an integer in [0, 100]");
        e.confidence_score = c.get<int>();
    }
    e.explanation    = opt_str_field(j, "explanation");
    e.evidence_refs  = str_list(j, "evidence_refs");
    e.signature      = str_field(j, "signature");
    return e;
}

AuditOverride tribunal::auditOverrideFromJson(const json& j) {
    if (!j.is_object()) throw std::invalid_argument("row: override must be an object");

    AuditOverride o;
    o.override_id       = str_field(j, "override_id");
    o.original_event_id = str_field(j, "original_event_id");
    o.timestamp         = ts_field(j, "timestamp");
    o.operator_name     = str_field(j, "operator");
    o.reason            = str_field(j, "reason");
    o.new_decision      = decision_field(j, "new_decision");

    if (j.contains("duration") && !j["duration"].is_null()) {
        const json& d = j["duration"];
        if (!d.is_number_integer() || d.get<long long>() < 0 ||
            d.get<long long>() > std::numeric_limits<int>::max())
            throw std::invalid_argument("row: duration must be a non-negative integer or null");
        o.duration = j["duration"].get<int>();
    }
    o.signature = str_field(j, "signature");
    return o;
}

bool EventFilter::matches(const AuditEvent& e) const {
    if (decision   && e.decision   != *decision)   return false;
    if (risk_level && e.risk_level != *risk_level) return false;
    if (user       && e.user       != *user)       return false;
    return true;
}
