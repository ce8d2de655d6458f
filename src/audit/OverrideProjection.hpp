#pragma once

#include <optional>
#include <vector>

#include "audit/AuditRecord.hpp"

namespace tribunal {

// ---------------------------------------------------------------------------
// OverrideProjection - read-time view of "what is the decision now".
//
// Lives outside the ledger. The ledger stores facts; this picks the newest
// override still in force at `now`, else the event's own decision. An
// override with a duration stops being in force at timestamp + duration
// minutes. Overrides pointing at another event are ignored.
// ---------------------------------------------------------------------------
struct EffectiveDecision {
    Decision                   decision = Decision::ALLOW;
    std::optional<std::string> override_id;      // unset = original decision
    std::optional<Timestamp>   expires_at;
};

class OverrideProjection {
public:
    static EffectiveDecision resolve(const AuditEvent& event,
                                     const std::vector<AuditOverride>& overrides,
                                     Timestamp now);

    static bool is_active(const AuditOverride& o, Timestamp now);
    static std::optional<Timestamp> expiry(const AuditOverride& o);
};

} // namespace tribunal
