#include "audit/BundleVerifier.hpp"
#include "audit/AuditRecord.hpp"

#include <stdexcept>

using namespace tribunal;
using json = nlohmann::json;

json BundleReport::to_json() const {
    json ovr = json::array();
    for (const auto& c : overrides) {
        ovr.push_back({{"override_id", c.record_id},
                       {"signature_ok", c.signature_ok},
                       {"linked", c.linked}});
    }
    return {
        {"valid",     valid},
        {"event",     {{"event_id", event.record_id}, {"signature_ok", event.signature_ok}}},
        {"overrides", ovr},
        {"ordered",   ordered},
        {"errors",    errors}
    };
}

BundleReport BundleVerifier::verify(const json& bundle) const {
    BundleReport r;

    if (!bundle.is_object() || !bundle.contains("audit_event")) {
        r.errors.push_back("bundle has no audit_event");
        return r;
    }

    AuditEvent e;
    try {
        e = auditEventFromJson(bundle["audit_event"]);
    } catch (const std::invalid_argument& ex) {
        r.errors.push_back(std::string("audit_event: ") + ex.what());
        return r;
    } catch (const json::exception& ex) {
        r.errors.push_back(std::string("audit_event: ") + ex.what());
        return r;
    }
    r.event.record_id    = e.event_id;
    r.event.signature_ok = signer_.verify_fields(signableFields(e), e.signature);
    if (!r.event.signature_ok) r.errors.push_back(e.event_id + ": signature does not verify");

    const json empty = json::array();
    const json& list = bundle.contains("overrides") ? bundle["overrides"] : empty;
    if (!list.is_array()) {
        r.errors.push_back("overrides must be an array");
        return r;
    }

    bool have_prev = false;
    Timestamp prev{};
    for (std::size_t i = 0; i < list.size(); ++i) {
        AuditOverride o;
        try {
            o = auditOverrideFromJson(list[i]);
        } catch (const std::invalid_argument& ex) {
            r.errors.push_back("overrides[" + std::to_string(i) + "]: " + ex.what());
            continue;
        } catch (const json::exception& ex) {
            r.errors.push_back("overrides[" + std::to_string(i) + "]: " + ex.what());
            continue;
        }

        RecordCheck c;
        c.record_id    = o.override_id;
        c.signature_ok = signer_.verify_fields(signableFields(o), o.signature);
        c.linked       = o.original_event_id == e.event_id;
        if (!c.signature_ok) r.errors.push_back(o.override_id + ": signature does not verify");
        if (!c.linked)       r.errors.push_back(o.override_id + ": refers to " + o.original_event_id);

        if (have_prev && o.timestamp < prev) r.ordered = false;
        prev = o.timestamp;
        have_prev = true;

        r.overrides.push_back(c);
    }
    if (!r.ordered) r.errors.push_back("overrides are not in timestamp order");

    r.valid = r.errors.empty();
    return r;
}
