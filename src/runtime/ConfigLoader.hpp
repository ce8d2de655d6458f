// =============================================================================
// ConfigLoader.hpp - INI Parser for Tribunal Configuration
// =============================================================================
// Loads settings from config.ini. The signing secret may come from the
// environment instead (TRIBUNAL_HMAC_SECRET wins over the file).
//
// Not a singleton: load() hands back an immutable EngineConfig that main()
// passes into the Signer, ledger, collector and service at construction.
// =============================================================================
#pragma once

#include <cstddef>
#include <istream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include "audit/AuditLedger.hpp"
#include "crypto/Signer.hpp"
#include "signal/HttpClassifier.hpp"
#include "signal/SignalCollector.hpp"

namespace tribunal {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what)
        : std::runtime_error("config error: " + what) {}
};

struct EngineConfig {
    SignerConfig      signing;

    std::string       journal_path  = "audit_journal.jsonl";   // empty = in-memory
    LedgerConfig      ledger;

    std::string       evidence_dir  = "evidence";              // empty = in-memory

    std::string       policy_pack_file = "policy_packs.json";

    CollectorTimeouts timeouts;
    std::size_t       producer_threads = 4;

    bool              classifier_enabled = false;
    ClassifierConfig  classifier;

    std::string       source_path;    // where it was loaded from, for logs
};

class ConfigLoader {
public:
    static constexpr const char* SECRET_ENV = "TRIBUNAL_HMAC_SECRET";

    ConfigLoader() = default;

    // Searches `path`, ../config.ini, ../../config.ini, $HOME/Tribunal/config.ini.
    // Returns false (and logs the searched paths) if none can be opened.
    bool load(const std::string& path = "config.ini");

    // Parses INI text directly; used by load() and by tests.
    void parse(std::istream& in);

    bool        has(const std::string& section, const std::string& key) const;
    std::string get(const std::string& section, const std::string& key,
                    const std::string& defaultVal = "") const;

    // Throw ConfigError on a value that does not parse.
    long long getInt(const std::string& section, const std::string& key, long long defaultVal = 0) const;
    bool      getBool(const std::string& section, const std::string& key, bool defaultVal = false) const;

    // Builds the immutable engine configuration. Throws ConfigError when the
    // signing secret is missing (file and environment) or a value is invalid.
    EngineConfig build() const;

    const std::string& getConfigPath() const { return configPath_; }

    // Secrets masked.
    void dump() const;

    static bool isSecretKey(const std::string& key);

private:
    std::unordered_map<std::string, std::string> values_;
    std::vector<std::string>                     order_;
    std::string                                  configPath_;
};

} // namespace tribunal
