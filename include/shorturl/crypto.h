#pragma once
// ═══════════════════════════════════════════════════════════════════
//  shorturl/crypto.h — Content hashing (OpenSSL)
// ═══════════════════════════════════════════════════════════════════

#include <iomanip>
#include <sstream>
#include <string>

#include <openssl/sha.h>

namespace shorturl::crypto {

inline std::string toHex(const unsigned char* data, std::size_t len) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < len; i++) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
    }
    return oss.str();
}

inline std::string sha256(const std::string& input) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(input.data()), input.size(), hash);
    return toHex(hash, SHA256_DIGEST_LENGTH);
}

// Strong entity tag for a response body: quoted, first 32 hex digits
inline std::string etag(const std::string& body) {
    return "\"" + sha256(body).substr(0, 32) + "\"";
}

} // namespace shorturl::crypto
