#include "crypto/Signer.hpp"
#include "crypto/Canonicalizer.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

using namespace tribunal;

Signer::Signer(SignerConfig cfg)
    : secret_(std::move(cfg.secret)) {
    if (secret_.empty()) throw std::invalid_argument("[SIGNER] empty signing secret");
}

std::string Signer::hex_digest(const std::string& bytes) const {
    unsigned char digest[EVP_MAX_MD_SIZE];   // stack-local, one per call frame
    unsigned int  digest_len = 0;

    if (!HMAC(EVP_sha256(),
              secret_.data(), static_cast<int>(secret_.size()),
              reinterpret_cast<const unsigned char*>(bytes.data()), bytes.size(),
              digest, &digest_len)) {
        throw std::runtime_error("[SIGNER] HMAC computation failed");
    }

    std::ostringstream out;
    for (unsigned int i = 0; i < digest_len; ++i)
        out << std::hex << std::setw(2) << std::setfill('0')
            << static_cast<int>(digest[i]);
    return out.str();
}

std::string Signer::sign(const std::string& bytes) const {
    return std::string(ALGORITHM) + ":" + hex_digest(bytes);
}

bool Signer::verify(const std::string& bytes, const std::string& signature) const {
    const std::string prefix = std::string(ALGORITHM) + ":";
    if (signature.compare(0, prefix.size(), prefix) != 0) return false;

    std::string expected = hex_digest(bytes);
    std::string given    = signature.substr(prefix.size());

    // Lengths are public (fixed by the scheme); only the content compare must
    // not short-circuit.
    if (given.size() != expected.size()) return false;
    return CRYPTO_memcmp(expected.data(), given.data(), expected.size()) == 0;
}

std::string Signer::sign_fields(const nlohmann::json& fields) const {
    return sign(Canonicalizer::canonicalize(fields));
}

bool Signer::verify_fields(const nlohmann::json& fields, const std::string& signature) const {
    std::string bytes;
    try {
        bytes = Canonicalizer::canonicalize(fields);
    } catch (const std::invalid_argument&) {
        return false;   // a record that cannot be encoded cannot carry a valid signature
    }
    return verify(bytes, signature);
}
