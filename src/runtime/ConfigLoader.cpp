#include "runtime/ConfigLoader.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>

using namespace tribunal;

static std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

bool ConfigLoader::load(const std::string& path) {
    const char* home = std::getenv("HOME");
    std::vector<std::string> paths = {
        path,
        "../config.ini",
        "../../config.ini",
        std::string(home ? home : ".") + "/Tribunal/config.ini"
    };

    for (const auto& p : paths) {
        std::ifstream file(p);
        if (file.is_open()) {
            configPath_ = p;
            parse(file);
            std::cout << "[CONFIG] Loaded " << p << " (" << values_.size() << " keys)\n";
            return true;
        }
    }

    std::cerr << "[CONFIG] ERROR: config.ini not found!\n";
    std::cerr << "[CONFIG] Searched paths:\n";
    for (const auto& p : paths) std::cerr << "  - " << p << "\n";
    return false;
}

void ConfigLoader::parse(std::istream& in) {
    std::string line;
    std::string currentSection;

    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;

        if (line[0] == '[') {
            size_t closePos = line.find(']');
            if (closePos != std::string::npos)
                currentSection = trim(line.substr(1, closePos - 1));
            continue;
        }

        size_t eqPos = line.find('=');
        if (eqPos == std::string::npos) continue;

        std::string key   = trim(line.substr(0, eqPos));
        std::string value = trim(line.substr(eqPos + 1));
        if (key.empty()) continue;

        std::string fullKey = currentSection + "." + key;
        if (!values_.count(fullKey)) order_.push_back(fullKey);
        values_[fullKey] = value;
    }
}

bool ConfigLoader::has(const std::string& section, const std::string& key) const {
    return values_.count(section + "." + key) != 0;
}

std::string ConfigLoader::get(const std::string& section, const std::string& key,
                              const std::string& defaultVal) const {
    auto it = values_.find(section + "." + key);
    return it != values_.end() ? it->second : defaultVal;
}

long long ConfigLoader::getInt(const std::string& section, const std::string& key,
                               long long defaultVal) const {
    std::string val = get(section, key);
    if (val.empty()) return defaultVal;

    size_t used = 0;
    long long out = 0;
    try {
        out = std::stoll(val, &used);
    } catch (const std::exception&) {
        throw ConfigError(section + "." + key + " is not an integer: '" + val + "'");
    }
    if (used != val.size())
        throw ConfigError(section + "." + key + " is not an integer: '" + val + "'");
    return out;
}

bool ConfigLoader::getBool(const std::string& section, const std::string& key,
                           bool defaultVal) const {
    std::string val = get(section, key);
    if (val.empty()) return defaultVal;
    if (val == "true" || val == "1" || val == "yes" || val == "on")  return true;
    if (val == "false" || val == "0" || val == "no" || val == "off") return false;
    throw ConfigError(section + "." + key + " is not a boolean: '" + val + "'");
}

static std::chrono::milliseconds positive_ms(long long v, const char* name) {
    if (v <= 0) throw ConfigError(std::string(name) + " must be positive");
    return std::chrono::milliseconds(v);
}

EngineConfig ConfigLoader::build() const {
    EngineConfig cfg;
    cfg.source_path = configPath_;

    const char* env_secret = std::getenv(SECRET_ENV);
    if (env_secret && *env_secret) {
        cfg.signing.secret = env_secret;
    } else {
        cfg.signing.secret = get("signing", "secret");
    }
    if (cfg.signing.secret.empty())
        throw ConfigError(std::string("signing secret missing: set signing.secret or ") + SECRET_ENV);

    // Present-but-empty means "use the in-memory variant".
    cfg.journal_path = get("ledger", "journal_path", cfg.journal_path);

    long long cap = getInt("ledger", "list_limit_max", 1000);
    if (cap <= 0) throw ConfigError("ledger.list_limit_max must be positive");
    cfg.ledger.list_limit_max = static_cast<std::size_t>(cap);

    cfg.evidence_dir = get("evidence", "dir", cfg.evidence_dir);
    cfg.ledger.evidence_timeout =
        positive_ms(getInt("evidence", "timeout_ms", 2000), "evidence.timeout_ms");

    cfg.policy_pack_file = get("policy", "pack_file", cfg.policy_pack_file);

    cfg.timeouts.producer =
        positive_ms(getInt("producers", "timeout_ms", 3000), "producers.timeout_ms");
    long long threads = getInt("producers", "threads", 4);
    if (threads <= 0) throw ConfigError("producers.threads must be positive");
    cfg.producer_threads = static_cast<std::size_t>(threads);

    cfg.classifier_enabled  = getBool("classifier", "enabled", false);
    cfg.classifier.endpoint = get("classifier", "endpoint");
    cfg.classifier.api_key  = get("classifier", "api_key");
    cfg.classifier.model    = get("classifier", "model");
    cfg.classifier.timeout  =
        positive_ms(getInt("classifier", "timeout_ms", 5000), "classifier.timeout_ms");
    cfg.timeouts.classifier = cfg.classifier.timeout;

    if (cfg.classifier_enabled && cfg.classifier.endpoint.empty())
        throw ConfigError("classifier.enabled is set but classifier.endpoint is empty");

    return cfg;
}

bool ConfigLoader::isSecretKey(const std::string& key) {
    return key.find("password") != std::string::npos ||
           key.find("secret")   != std::string::npos ||
           key.find("api_key")  != std::string::npos;
}

void ConfigLoader::dump() const {
    std::cout << "[CONFIG] Loaded from: " << (configPath_.empty() ? "<none>" : configPath_) << "\n";
    std::cout << "[CONFIG] Values:\n";
    for (const auto& k : order_) {
        if (isSecretKey(k)) {
            std::cout << "  " << k << " = ********\n";
        } else {
            std::cout << "  " << k << " = " << values_.at(k) << "\n";
        }
    }
}
