#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace tribunal {

// Record timestamps are whole seconds, UTC. Everything that is signed carries
// exactly this precision so a row re-read from storage re-encodes identically.
using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::seconds>;
using Clock     = std::function<Timestamp()>;

Timestamp systemNow();

// ---------------------------------------------------------------------------
// Canonicalizer - deterministic byte encoding of a signable field subset.
//
//   - compact JSON, object keys sorted lexicographically at every depth
//   - absent optional values are encoded as an explicit null
//   - timestamps as ISO-8601 UTC, second precision: 2025-01-28T09:15:00Z
//   - strings as UTF-8; invalid UTF-8 is rejected (std::invalid_argument)
//
// Same logical content → byte-identical output, whatever the insertion order.
// ---------------------------------------------------------------------------
class Canonicalizer {
public:
    static std::string canonicalize(const nlohmann::json& fields);

    static std::string              formatTimestamp(Timestamp ts);
    static std::optional<Timestamp> parseTimestamp(const std::string& s);
};

} // namespace tribunal
