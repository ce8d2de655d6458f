#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <boost/regex.hpp>

#include "signal/SignalProducer.hpp"
#include "policy/PolicyPack.hpp"

namespace tribunal {

// ---------------------------------------------------------------------------
// PatternDetector - the `pattern` producer.
//
// Scans input text with the active pack's tag patterns (case-insensitive
// Perl-syntax boost::regex). The active pack is re-read from the registry on
// every call; compiled regexes are cached per pack version.
//
// boost::regex matches without recursion and raises on its complexity limit,
// so hostile input ends in an ERROR outcome rather than a blown stack. The
// timeout is checked between matches: a scan past its deadline stops and
// reports "timeout", which frees the pool thread for the next evaluation.
//
// Output: NO_SIGNAL when nothing matches, otherwise one signal whose risk is
// the highest matched tag risk and whose tags are the matched tag names in
// pack order.
// ---------------------------------------------------------------------------
class PatternDetector : public SignalProducer {
public:
    explicit PatternDetector(const PolicyRegistry& registry);

    SignalSource source() const override { return SignalSource::PATTERN; }

    ProducerOutcome produce(const EvaluationInput& input,
                            std::chrono::milliseconds timeout) override;

    // Per-match confidence by tag risk.
    static double confidenceFor(RiskLevel r);

private:
    struct CompiledTag {
        std::size_t               tag_index;
        std::vector<boost::regex> regexes;
        std::vector<std::string>  sources;   // pattern text, parallel to regexes
    };

    struct CompiledPack {
        PolicyPack               pack;
        std::vector<CompiledTag> tags;
    };

    std::shared_ptr<const CompiledPack> compiled_for(const PolicyPack& pack);

    const PolicyRegistry& registry_;

    std::mutex                          cache_mtx_;
    std::shared_ptr<const CompiledPack> cache_;
};

} // namespace tribunal
