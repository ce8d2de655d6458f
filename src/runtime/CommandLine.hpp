#pragma once

#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace tribunal {

// Bad invocation: reported with the usage text, exit code 1.
class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& what) : std::runtime_error(what) {}
};

// --name value pairs plus positionals, in order.
struct Args {
    std::map<std::string, std::string> opts;
    std::vector<std::string>           positional;

    std::string opt(const std::string& name, const std::string& def = "") const;
    bool        has(const std::string& name) const { return opts.count(name) != 0; }

    // Throw UsageError when absent.
    std::string        require(const std::string& name) const;
    const std::string& arg(std::size_t i, const char* what) const;
};

Args parseArgs(const std::vector<std::string>& raw);

// Whole-string decimal integer within [min, max]; anything else is a
// UsageError naming `what`. Never narrows silently.
long long parseInteger(const std::string& s, const char* what, long long min, long long max);

} // namespace tribunal
