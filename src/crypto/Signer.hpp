#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace tribunal {

struct SignerConfig {
    std::string secret;
};

// ---------------------------------------------------------------------------
// Signer - keyed digest over canonical bytes.
//
// Output is tagged with its scheme, `hmac-sha256:<64 lower-case hex>`, so the
// algorithm can be rotated without ambiguity. verify() rejects unknown tags
// and compares digests in constant time.
//
// THREAD-SAFE: the secret is read-only after construction and each call uses
// a stack-local digest buffer. No locking.
// ---------------------------------------------------------------------------
class Signer {
public:
    static constexpr const char* ALGORITHM = "hmac-sha256";

    // Throws std::invalid_argument on an empty secret.
    explicit Signer(SignerConfig cfg);

    std::string sign(const std::string& bytes) const;
    bool        verify(const std::string& bytes, const std::string& signature) const;

    // canonicalize + sign / verify in one step.
    std::string sign_fields(const nlohmann::json& fields) const;
    bool        verify_fields(const nlohmann::json& fields, const std::string& signature) const;

private:
    std::string hex_digest(const std::string& bytes) const;

    std::string secret_;
};

} // namespace tribunal
