#include "crypto/Canonicalizer.hpp"

#include <cstdio>
#include <ctime>
#include <stdexcept>

using namespace tribunal;
using json = nlohmann::json;

Timestamp tribunal::systemNow() {
    return std::chrono::time_point_cast<std::chrono::seconds>(std::chrono::system_clock::now());
}

std::string Canonicalizer::canonicalize(const json& fields) {
    if (!fields.is_object())
        throw std::invalid_argument("canonicalize: signable subset must be an object");

    // nlohmann::json objects are std::map-backed: keys iterate in sorted
    // order, so a compact dump is already canonical.
    try {
        return fields.dump(-1, ' ', false, json::error_handler_t::strict);
    } catch (const json::type_error& e) {
        throw std::invalid_argument(std::string("canonicalize: ") + e.what());
    }
}

std::string Canonicalizer::formatTimestamp(Timestamp ts) {
    std::time_t t = std::chrono::system_clock::to_time_t(ts);
    std::tm utc{};
    gmtime_r(&t, &utc);

    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return buf;
}

std::optional<Timestamp> Canonicalizer::parseTimestamp(const std::string& s) {
    if (s.size() != 20 || s[10] != 'T' || s[19] != 'Z') return std::nullopt;

    std::tm utc{};
    int consumed = 0;
    if (std::sscanf(s.c_str(), "%4d-%2d-%2dT%2d:%2d:%2dZ%n",
                    &utc.tm_year, &utc.tm_mon, &utc.tm_mday,
                    &utc.tm_hour, &utc.tm_min, &utc.tm_sec, &consumed) != 6 ||
        consumed != 20) {
        return std::nullopt;
    }
    utc.tm_year -= 1900;
    utc.tm_mon  -= 1;

    std::time_t t = timegm(&utc);
    if (t == static_cast<std::time_t>(-1)) return std::nullopt;

    Timestamp ts = std::chrono::time_point_cast<std::chrono::seconds>(
        std::chrono::system_clock::from_time_t(t));

    // Reject out-of-range fields that timegm silently normalized (e.g. 25:00:00).
    if (formatTimestamp(ts) != s) return std::nullopt;
    return ts;
}
