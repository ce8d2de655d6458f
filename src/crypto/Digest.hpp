#pragma once

#include <string>

#include "crypto/Canonicalizer.hpp"

namespace tribunal {

// SHA-256 of arbitrary bytes, lower-case hex. One-way: the ledger stores this,
// never the content.
std::string sha256Hex(const std::string& bytes);

// Identifiers: <prefix>-<YYYYMMDD>-<8 symbols>. The suffix is 48 bits from the
// OpenSSL CSPRNG in base64url, so concurrent writers need no shared counter.
// Throws std::runtime_error if the CSPRNG fails.
std::string makeRecordId(const std::string& prefix, Timestamp now);

} // namespace tribunal
