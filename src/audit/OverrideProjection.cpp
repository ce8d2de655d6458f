#include "audit/OverrideProjection.hpp"

using namespace tribunal;

std::optional<Timestamp> OverrideProjection::expiry(const AuditOverride& o) {
    if (!o.duration) return std::nullopt;
    return o.timestamp + std::chrono::minutes(*o.duration);
}

bool OverrideProjection::is_active(const AuditOverride& o, Timestamp now) {
    if (o.timestamp > now) return false;
    auto end = expiry(o);
    return !end || now < *end;
}

EffectiveDecision OverrideProjection::resolve(const AuditEvent& event,
                                              const std::vector<AuditOverride>& overrides,
                                              Timestamp now) {
    EffectiveDecision out;
    out.decision = event.decision;

    // Newest wins; on equal timestamps the later entry in the sequence wins.
    const AuditOverride* best = nullptr;
    for (const auto& o : overrides) {
        if (o.original_event_id != event.event_id) continue;
        if (!is_active(o, now)) continue;
        if (!best || o.timestamp >= best->timestamp) best = &o;
    }

    if (best) {
        out.decision    = best->new_decision;
        out.override_id = best->override_id;
        out.expires_at  = expiry(*best);
    }
    return out;
}
