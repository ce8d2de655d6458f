#include "crypto/Digest.hpp"

#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <openssl/evp.h>
#include <openssl/rand.h>

using namespace tribunal;

std::string tribunal::sha256Hex(const std::string& bytes) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int  digest_len = 0;

    if (EVP_Digest(bytes.data(), bytes.size(), digest, &digest_len, EVP_sha256(), nullptr) != 1)
        throw std::runtime_error("sha256: EVP_Digest failed");

    std::ostringstream out;
    for (unsigned int i = 0; i < digest_len; ++i)
        out << std::hex << std::setw(2) << std::setfill('0')
            << static_cast<int>(digest[i]);
    return out.str();
}

std::string tribunal::makeRecordId(const std::string& prefix, Timestamp now) {
    static constexpr char ALPHABET[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

    unsigned char rnd[6];
    if (RAND_bytes(rnd, sizeof(rnd)) != 1)
        throw std::runtime_error("record id: RAND_bytes failed");

    // 6 bytes = 48 bits = 8 symbols of 6 bits.
    std::string suffix;
    suffix.reserve(8);
    for (int group = 0; group < 2; ++group) {
        uint32_t v = (static_cast<uint32_t>(rnd[group * 3])     << 16) |
                     (static_cast<uint32_t>(rnd[group * 3 + 1]) << 8)  |
                      static_cast<uint32_t>(rnd[group * 3 + 2]);
        suffix += ALPHABET[(v >> 18) & 0x3F];
        suffix += ALPHABET[(v >> 12) & 0x3F];
        suffix += ALPHABET[(v >> 6)  & 0x3F];
        suffix += ALPHABET[v & 0x3F];
    }

    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm utc{};
    gmtime_r(&t, &utc);
    char date[16];
    std::strftime(date, sizeof(date), "%Y%m%d", &utc);

    return prefix + "-" + date + "-" + suffix;
}
