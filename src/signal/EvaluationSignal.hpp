#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace tribunal {

// ---------------------------------------------------------------------------
// Closed vocabularies shared by producers, the merger and the ledger.
// Wire names are lower-case and stable: they are part of the signed payload.
// ---------------------------------------------------------------------------

enum class SignalSource : uint8_t {
    PATTERN    = 0,
    VISION     = 1,
    CLASSIFIER = 2
};

// Ordered low → high so that a plain integer compare is the risk total order.
enum class RiskLevel : uint8_t {
    MINIMAL      = 0,
    LIMITED      = 1,
    HIGH         = 2,
    UNACCEPTABLE = 3
};

enum class Decision : uint8_t {
    ALLOW = 0,
    FLAG  = 1,
    BLOCK = 2
};

inline const char* signalSourceToString(SignalSource s) {
    switch (s) {
        case SignalSource::PATTERN:    return "pattern";
        case SignalSource::VISION:     return "vision";
        case SignalSource::CLASSIFIER: return "classifier";
        default:                       return "unknown";
    }
}

inline const char* riskLevelToString(RiskLevel r) {
    switch (r) {
        case RiskLevel::MINIMAL:      return "minimal";
        case RiskLevel::LIMITED:      return "limited";
        case RiskLevel::HIGH:         return "high";
        case RiskLevel::UNACCEPTABLE: return "unacceptable";
        default:                      return "unknown";
    }
}

inline const char* decisionToString(Decision d) {
    switch (d) {
        case Decision::ALLOW: return "allow";
        case Decision::FLAG:  return "flag";
        case Decision::BLOCK: return "block";
        default:              return "unknown";
    }
}

std::optional<SignalSource> parseSignalSource(const std::string& s);
std::optional<RiskLevel>    parseRiskLevel(const std::string& s);
std::optional<Decision>     parseDecision(const std::string& s);

// Total order unacceptable > high > limited > minimal.
inline int compareRisk(RiskLevel a, RiskLevel b) {
    return static_cast<int>(a) - static_cast<int>(b);
}

// Tie-break rank among rule-based sources: pattern > vision.
// Classifier never competes in the fallback path but ranks highest overall.
inline int sourcePriority(SignalSource s) {
    switch (s) {
        case SignalSource::CLASSIFIER: return 3;
        case SignalSource::PATTERN:    return 2;
        case SignalSource::VISION:     return 1;
        default:                       return 0;
    }
}

// unacceptable → block, high/limited → flag, minimal → allow.
inline Decision decisionForRisk(RiskLevel r) {
    switch (r) {
        case RiskLevel::UNACCEPTABLE: return Decision::BLOCK;
        case RiskLevel::HIGH:
        case RiskLevel::LIMITED:      return Decision::FLAG;
        case RiskLevel::MINIMAL:
        default:                      return Decision::ALLOW;
    }
}

// ---------------------------------------------------------------------------
// EvaluationSignal - one producer's opinion about one piece of content.
// Immutable once produced. raw_evidence goes to the evidence sideband, never
// into the signed ledger row.
// ---------------------------------------------------------------------------
struct EvaluationSignal {
    SignalSource             source     = SignalSource::PATTERN;
    RiskLevel                risk_level = RiskLevel::MINIMAL;
    std::vector<std::string> tags;
    double                   confidence = 0.0;   // 0..1
    std::string              rationale;
    nlohmann::json           raw_evidence;
};

// ---------------------------------------------------------------------------
// ProducerOutcome - what a producer hands back across the boundary.
// Errors are values here, never exceptions.
//   SIGNAL    - produced a signal
//   NO_SIGNAL - checked, nothing to report
//   ERROR     - attempted and failed (error, timeout)
//   SKIPPED   - never attempted (disabled, no input for this producer)
// ---------------------------------------------------------------------------
enum class OutcomeStatus : uint8_t {
    SIGNAL    = 0,
    NO_SIGNAL = 1,
    ERROR     = 2,
    SKIPPED   = 3
};

inline const char* outcomeStatusToString(OutcomeStatus s) {
    switch (s) {
        case OutcomeStatus::SIGNAL:    return "signal";
        case OutcomeStatus::NO_SIGNAL: return "no-signal";
        case OutcomeStatus::ERROR:     return "source-error";
        case OutcomeStatus::SKIPPED:   return "skipped";
        default:                       return "unknown";
    }
}

struct ProducerOutcome {
    SignalSource                    source = SignalSource::PATTERN;
    OutcomeStatus                   status = OutcomeStatus::SKIPPED;
    std::optional<EvaluationSignal> signal;
    std::string                     error;    // set when status == ERROR

    // Evidence recorded when nothing was detected (e.g. which pack was scanned).
    nlohmann::json                  detail;

    static ProducerOutcome produced(EvaluationSignal sig);
    static ProducerOutcome nothing(SignalSource src, nlohmann::json detail = nullptr);
    static ProducerOutcome failed(SignalSource src, std::string error);
    static ProducerOutcome skipped(SignalSource src);
};

} // namespace tribunal
