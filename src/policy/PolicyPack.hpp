#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "signal/EvaluationSignal.hpp"

namespace tribunal {

// ---------------------------------------------------------------------------
// PolicyTag / PolicyPack - externally managed rule configuration.
// Read-only to the evaluation core. The merger only stamps the active
// pack's version; the pattern producer scans the active pack's tags.
// ---------------------------------------------------------------------------
struct PolicyTag {
    std::string              name;
    std::string              description;
    RiskLevel                risk_level = RiskLevel::MINIMAL;
    std::vector<std::string> patterns;
    Decision                 action = Decision::ALLOW;
};

struct PolicyPack {
    std::string            name;
    std::string            version;
    std::string            description;
    bool                   active = false;
    std::vector<PolicyTag> tags;
};

// Throws std::invalid_argument on unknown risk/action names or missing fields.
PolicyPack  policyPackFromJson(const nlohmann::json& j);
nlohmann::json policyPackToJson(const PolicyPack& p);

struct PolicyStats {
    std::size_t total_packs  = 0;
    std::size_t active_packs = 0;
    std::size_t total_tags   = 0;
};

// ---------------------------------------------------------------------------
// PolicyRegistry - holds the known packs and which one is active.
//
// Activation can change between evaluations, so callers read
// active_version() / active_pack() once per evaluation and never cache it.
// Threading: every method takes mtx_; snapshots are returned by value.
// ---------------------------------------------------------------------------
class PolicyRegistry {
public:
    static constexpr const char* FALLBACK_VERSION = "fallback";

    PolicyRegistry() = default;

    // Loads packs from a JSON file: either an array of packs or {"packs": [...]}.
    // Returns false (and logs) if the file is missing or malformed.
    bool load_file(const std::string& path);

    // Adds or replaces a pack by version. If the pack is marked active, every
    // other pack is deactivated so at most one is active.
    void upsert(PolicyPack pack);

    // Makes `version` the only active pack. False if unknown.
    bool activate(const std::string& version);

    void deactivate_all();

    std::string               active_version() const;
    std::optional<PolicyPack> active_pack() const;
    std::vector<PolicyPack>   packs() const;
    PolicyStats               stats() const;

private:
    mutable std::mutex      mtx_;
    std::vector<PolicyPack> packs_;
};

} // namespace tribunal
