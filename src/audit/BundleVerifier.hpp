#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "crypto/Signer.hpp"

namespace tribunal {

struct RecordCheck {
    std::string record_id;
    bool        signature_ok = false;
    bool        linked       = true;    // overrides only: points at the bundled event
};

struct BundleReport {
    bool                     valid = false;
    RecordCheck              event;
    std::vector<RecordCheck> overrides;
    bool                     ordered = true;   // overrides ascending by timestamp
    std::vector<std::string> errors;

    nlohmann::json to_json() const;
};

// ---------------------------------------------------------------------------
// BundleVerifier - checks an exported bundle on its own, no ledger access.
//
// Rebuilds each record's signable subset from the bundle JSON and re-runs
// Signer::verify. A structurally broken bundle yields valid=false with an
// error entry; it never throws.
// ---------------------------------------------------------------------------
class BundleVerifier {
public:
    explicit BundleVerifier(const Signer& signer) : signer_(signer) {}

    BundleReport verify(const nlohmann::json& bundle) const;

private:
    const Signer& signer_;
};

} // namespace tribunal
