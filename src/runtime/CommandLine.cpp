#include "runtime/CommandLine.hpp"

using namespace tribunal;

std::string Args::opt(const std::string& name, const std::string& def) const {
    auto it = opts.find(name);
    return it != opts.end() ? it->second : def;
}

std::string Args::require(const std::string& name) const {
    auto it = opts.find(name);
    if (it == opts.end()) throw UsageError("missing --" + name);
    return it->second;
}

const std::string& Args::arg(std::size_t i, const char* what) const {
    if (i >= positional.size()) throw UsageError(std::string("missing ") + what);
    return positional[i];
}

Args tribunal::parseArgs(const std::vector<std::string>& raw) {
    Args a;
    for (std::size_t i = 0; i < raw.size(); ++i) {
        const std::string& s = raw[i];
        if (s.size() > 2 && s.compare(0, 2, "--") == 0) {
            if (i + 1 >= raw.size()) throw UsageError("option " + s + " needs a value");
            a.opts[s.substr(2)] = raw[++i];
        } else {
            a.positional.push_back(s);
        }
    }
    return a;
}

long long tribunal::parseInteger(const std::string& s, const char* what, long long min, long long max) {
    std::size_t used = 0;
    long long v = 0;
    try {
        v = std::stoll(s, &used);
    } catch (const std::invalid_argument&) {
        throw UsageError(std::string(what) + " must be an integer");
    } catch (const std::out_of_range&) {
        throw UsageError(std::string(what) + " is out of range");
    }
    if (used != s.size()) throw UsageError(std::string(what) + " must be an integer");
    if (v < min || v > max) {
        throw UsageError(std::string(what) + " must be between " + std::to_string(min) +
                         " and " + std::to_string(max));
    }
    return v;
}
