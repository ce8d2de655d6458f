#include "signal/PatternDetector.hpp"

#include <chrono>
#include <iostream>

using namespace tribunal;
using json = nlohmann::json;

PatternDetector::PatternDetector(const PolicyRegistry& registry)
    : registry_(registry) {}

double PatternDetector::confidenceFor(RiskLevel r) {
    switch (r) {
        case RiskLevel::UNACCEPTABLE: return 0.9;
        case RiskLevel::HIGH:         return 0.8;
        case RiskLevel::LIMITED:      return 0.7;
        case RiskLevel::MINIMAL:
        default:                      return 0.6;
    }
}

// ---------------------------------------------------------------------------
// Compile once per pack content. A pack replaced under the same version is
// detected by comparing its serialized form.
// ---------------------------------------------------------------------------
std::shared_ptr<const PatternDetector::CompiledPack>
PatternDetector::compiled_for(const PolicyPack& pack) {
    std::lock_guard<std::mutex> lock(cache_mtx_);

    if (cache_ && cache_->pack.version == pack.version &&
        policyPackToJson(cache_->pack) == policyPackToJson(pack)) {
        return cache_;
    }

    auto built = std::make_shared<CompiledPack>();
    built->pack = pack;
    for (std::size_t i = 0; i < pack.tags.size(); ++i) {
        CompiledTag ct;
        ct.tag_index = i;
        for (const auto& pat : pack.tags[i].patterns) {
            try {
                ct.regexes.emplace_back(pat, boost::regex::perl | boost::regex::icase);
                ct.sources.push_back(pat);
            } catch (const boost::regex_error& e) {
                std::cerr << "[PATTERN] Skipping invalid pattern in tag "
                          << pack.tags[i].name << ": " << e.what() << "\n";
            }
        }
        built->tags.push_back(std::move(ct));
    }

    cache_ = built;
    return cache_;
}

ProducerOutcome PatternDetector::produce(const EvaluationInput& input,
                                         std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    auto pack = registry_.active_pack();
    if (!pack) {
        return ProducerOutcome::nothing(SignalSource::PATTERN,
                                        {{"scanned_pack", PolicyRegistry::FALLBACK_VERSION},
                                         {"matches", json::array()}});
    }

    std::shared_ptr<const CompiledPack> compiled;
    try {
        compiled = compiled_for(*pack);
    } catch (const std::exception& e) {
        return ProducerOutcome::failed(SignalSource::PATTERN,
                                       std::string("pattern compile failed: ") + e.what());
    }

    json matches = json::array();
    std::vector<std::size_t> hit_tags;
    RiskLevel top = RiskLevel::MINIMAL;

    try {
        for (const auto& ct : compiled->tags) {
            const PolicyTag& tag = compiled->pack.tags[ct.tag_index];
            bool hit = false;

            for (std::size_t r = 0; r < ct.regexes.size(); ++r) {
                boost::sregex_iterator begin(input.text.begin(), input.text.end(), ct.regexes[r]);
                for (auto it = begin; it != boost::sregex_iterator(); ++it) {
                    if (std::chrono::steady_clock::now() >= deadline)
                        return ProducerOutcome::failed(SignalSource::PATTERN, "timeout");
                    const boost::smatch& m = *it;
                    if (m.length(0) == 0) continue;
                    matches.push_back({
                        {"tag",     tag.name},
                        {"pattern", ct.sources[r]},
                        {"match",   m.str(0)},
                        {"start",   static_cast<int64_t>(m.position())},
                        {"end",     static_cast<int64_t>(m.position() + m.length(0))}
                    });
                    hit = true;
                }
                if (std::chrono::steady_clock::now() >= deadline)
                    return ProducerOutcome::failed(SignalSource::PATTERN, "timeout");
            }

            if (hit) {
                hit_tags.push_back(ct.tag_index);
                if (compareRisk(tag.risk_level, top) > 0) top = tag.risk_level;
            }
        }
    } catch (const std::runtime_error& e) {
        // boost::regex_error: the matcher hit its complexity or memory limit.
        return ProducerOutcome::failed(SignalSource::PATTERN,
                                       std::string("pattern scan failed: ") + e.what());
    }

    if (hit_tags.empty()) {
        return ProducerOutcome::nothing(SignalSource::PATTERN,
                                        {{"scanned_pack", compiled->pack.version},
                                         {"matches", json::array()}});
    }

    EvaluationSignal sig;
    sig.source     = SignalSource::PATTERN;
    sig.risk_level = top;
    sig.confidence = confidenceFor(top);

    for (std::size_t idx : hit_tags) {
        const PolicyTag& tag = compiled->pack.tags[idx];
        sig.tags.push_back(tag.name);
        if (!sig.rationale.empty()) sig.rationale += "; ";
        sig.rationale += "Detected " + tag.name;
        if (!tag.description.empty()) sig.rationale += ": " + tag.description;
    }

    sig.raw_evidence = {
        {"scanned_pack", compiled->pack.version},
        {"matches",      matches}
    };
    return ProducerOutcome::produced(std::move(sig));
}
