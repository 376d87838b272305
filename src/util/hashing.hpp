#ifndef TRIAGEGUARD_UTIL_HASHING_HPP
#define TRIAGEGUARD_UTIL_HASHING_HPP

#include <string>
#include <stdexcept>
#include <vector>
#include <sstream>
#include <iomanip>
#include <cstdint>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>

/**
 * @file hashing.hpp
 * @brief Keyed hashing and randomness helpers for TriageGuard.
 *
 * REQUIREMENTS:
 *   - Links against OpenSSL (libcrypto).
 *
 * DESIGN:
 *   - hmacSha256Hex() is the keyed deterministic function behind placeholder tags.
 *   - randomHex() backs session identifiers.
 *
 * USAGE:
 *   @code
 *   using namespace triageguard::util::hashing;
 *   std::string tag = hmacSha256Hex(keyBytes, "session\x1fTICKET\x1fPROJ-1");
 *   @endcode
 */

namespace triageguard {
namespace util {
namespace hashing {

/**
 * @brief Lowercase hex encoding of raw bytes.
 */
inline std::string toHex(const unsigned char *data, size_t len)
{
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<unsigned>(data[i]);
    }
    return oss.str();
}

/**
 * @brief HMAC-SHA256 of message under key, returned as 64 lowercase hex characters.
 * @throw std::runtime_error if the key is empty or OpenSSL fails.
 */
inline std::string hmacSha256Hex(const std::vector<uint8_t> &key, const std::string &message)
{
    if (key.empty()) {
        throw std::runtime_error("hashing::hmacSha256Hex: empty key.");
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLen = 0;
    if (!HMAC(EVP_sha256(),
              key.data(), static_cast<int>(key.size()),
              reinterpret_cast<const unsigned char*>(message.data()), message.size(),
              digest, &digestLen))
    {
        throw std::runtime_error("hashing::hmacSha256Hex: HMAC computation failed.");
    }
    return toHex(digest, digestLen);
}

/**
 * @brief Cryptographically random bytes, hex encoded (2 * byteCount characters).
 * @throw std::runtime_error if the OpenSSL RNG is not seeded.
 */
inline std::string randomHex(size_t byteCount)
{
    std::vector<unsigned char> buf(byteCount);
    if (RAND_bytes(buf.data(), static_cast<int>(buf.size())) != 1) {
        throw std::runtime_error("hashing::randomHex: RAND_bytes failed.");
    }
    return toHex(buf.data(), buf.size());
}

} // namespace hashing
} // namespace util
} // namespace triageguard

#endif // TRIAGEGUARD_UTIL_HASHING_HPP
