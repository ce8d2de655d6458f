#include "signal/EvaluationSignal.hpp"

#include <utility>

namespace tribunal {

std::optional<SignalSource> parseSignalSource(const std::string& s) {
    if (s == "pattern")    return SignalSource::PATTERN;
    if (s == "vision")     return SignalSource::VISION;
    if (s == "classifier") return SignalSource::CLASSIFIER;
    return std::nullopt;
}

std::optional<RiskLevel> parseRiskLevel(const std::string& s) {
    if (s == "minimal")      return RiskLevel::MINIMAL;
    if (s == "limited")      return RiskLevel::LIMITED;
    if (s == "high")         return RiskLevel::HIGH;
    if (s == "unacceptable") return RiskLevel::UNACCEPTABLE;
    return std::nullopt;
}

std::optional<Decision> parseDecision(const std::string& s) {
    if (s == "allow") return Decision::ALLOW;
    if (s == "flag")  return Decision::FLAG;
    if (s == "block") return Decision::BLOCK;
    return std::nullopt;
}

ProducerOutcome ProducerOutcome::produced(EvaluationSignal sig) {
    ProducerOutcome o;
    o.source = sig.source;
    o.status = OutcomeStatus::SIGNAL;
    o.signal = std::move(sig);
    return o;
}

ProducerOutcome ProducerOutcome::nothing(SignalSource src, nlohmann::json detail) {
    ProducerOutcome o;
    o.source = src;
    o.status = OutcomeStatus::NO_SIGNAL;
    o.detail = std::move(detail);
    return o;
}

ProducerOutcome ProducerOutcome::failed(SignalSource src, std::string error) {
    ProducerOutcome o;
    o.source = src;
    o.status = OutcomeStatus::ERROR;
    o.error  = std::move(error);
    return o;
}

ProducerOutcome ProducerOutcome::skipped(SignalSource src) {
    ProducerOutcome o;
    o.source = src;
    o.status = OutcomeStatus::SKIPPED;
    return o;
}

} // namespace tribunal
