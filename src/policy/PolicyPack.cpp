#include "policy/PolicyPack.hpp"

#include <fstream>
#include <iostream>
#include <stdexcept>

using namespace tribunal;
using json = nlohmann::json;

// ---------------------------------------------------------------------------
static std::string require_string(const json& j, const char* key) {
    if (!j.contains(key) || !j[key].is_string())
        throw std::invalid_argument(std::string("policy: missing string field '") + key + "'");
    return j[key].get<std::string>();
}

static PolicyTag tag_from_json(const json& j) {
    PolicyTag t;
    t.name        = require_string(j, "name");
    t.description = j.value("description", std::string());

    auto risk = parseRiskLevel(require_string(j, "risk_level"));
    if (!risk) throw std::invalid_argument("policy: tag '" + t.name + "' has unknown risk_level");
    t.risk_level = *risk;

    auto action = parseDecision(require_string(j, "action"));
    if (!action) throw std::invalid_argument("policy: tag '" + t.name + "' has unknown action");
    t.action = *action;

    if (j.contains("patterns") && j["patterns"].is_array()) {
        for (const auto& p : j["patterns"]) {
            if (p.is_string()) t.patterns.push_back(p.get<std::string>());
        }
    }
    return t;
}
// ---------------------------------------------------------------------------

PolicyPack tribunal::policyPackFromJson(const json& j) {
    if (!j.is_object()) throw std::invalid_argument("policy: pack must be an object");

    PolicyPack p;
    p.name        = require_string(j, "name");
    p.version     = require_string(j, "version");
    p.description = j.value("description", std::string());
    p.active      = j.value("active", j.value("is_active", false));

    if (j.contains("tags") && j["tags"].is_array()) {
        for (const auto& t : j["tags"]) p.tags.push_back(tag_from_json(t));
    }
    return p;
}

json tribunal::policyPackToJson(const PolicyPack& p) {
    json tags = json::array();
    for (const auto& t : p.tags) {
        tags.push_back({
            {"name",        t.name},
            {"description", t.description},
            {"risk_level",  riskLevelToString(t.risk_level)},
            {"patterns",    t.patterns},
            {"action",      decisionToString(t.action)}
        });
    }
    return {
        {"name",        p.name},
        {"version",     p.version},
        {"description", p.description},
        {"active",      p.active},
        {"tags",        tags}
    };
}

// ============================================================
bool PolicyRegistry::load_file(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        std::cerr << "[POLICY] Pack file not found: " << path << "\n";
        return false;
    }

    std::vector<PolicyPack> loaded;
    try {
        json doc = json::parse(f);
        const json& arr = doc.is_object() && doc.contains("packs") ? doc["packs"] : doc;
        if (!arr.is_array()) throw std::invalid_argument("policy: expected an array of packs");
        for (const auto& pj : arr) loaded.push_back(policyPackFromJson(pj));
    } catch (const std::exception& e) {
        std::cerr << "[POLICY] Failed to load " << path << ": " << e.what() << "\n";
        return false;
    }

    for (auto& p : loaded) upsert(std::move(p));

    std::cout << "[POLICY] Loaded " << loaded.size() << " pack(s) from " << path
              << " active=" << active_version() << "\n";
    return true;
}

void PolicyRegistry::upsert(PolicyPack pack) {
    std::lock_guard<std::mutex> lock(mtx_);

    if (pack.active) {
        for (auto& p : packs_) p.active = false;
    }
    for (auto& p : packs_) {
        if (p.version == pack.version) {
            p = std::move(pack);
            return;
        }
    }
    packs_.push_back(std::move(pack));
}

bool PolicyRegistry::activate(const std::string& version) {
    std::lock_guard<std::mutex> lock(mtx_);

    bool found = false;
    for (const auto& p : packs_) {
        if (p.version == version) { found = true; break; }
    }
    if (!found) return false;

    for (auto& p : packs_) p.active = (p.version == version);
    std::cout << "[POLICY] Activated pack " << version << "\n";
    return true;
}

void PolicyRegistry::deactivate_all() {
    std::lock_guard<std::mutex> lock(mtx_);
    for (auto& p : packs_) p.active = false;
}

std::string PolicyRegistry::active_version() const {
    std::lock_guard<std::mutex> lock(mtx_);
    for (const auto& p : packs_) {
        if (p.active) return p.version;
    }
    return FALLBACK_VERSION;
}

std::optional<PolicyPack> PolicyRegistry::active_pack() const {
    std::lock_guard<std::mutex> lock(mtx_);
    for (const auto& p : packs_) {
        if (p.active) return p;
    }
    return std::nullopt;
}

std::vector<PolicyPack> PolicyRegistry::packs() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return packs_;
}

PolicyStats PolicyRegistry::stats() const {
    std::lock_guard<std::mutex> lock(mtx_);
    PolicyStats s;
    s.total_packs = packs_.size();
    for (const auto& p : packs_) {
        if (p.active) ++s.active_packs;
        s.total_tags += p.tags.size();
    }
    return s;
}
