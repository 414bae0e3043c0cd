#ifndef PIIANON_UTIL_HASHING_HPP
#define PIIANON_UTIL_HASHING_HPP

#include <string>
#include <stdexcept>
#include <sstream>
#include <iomanip>
#include <cstddef>
#include <openssl/evp.h>

/**
 * @file hashing.hpp
 * @brief Cryptographic hashing routines used for hash tokens.
 *
 * REQUIREMENTS:
 *   - Links against OpenSSL libcrypto.
 *
 * DESIGN:
 *   - sha256Hex() returns the lowercase hex SHA-256 of a byte string.
 *   - shortDigest() keeps the first N hex characters; hash tokens use 8.
 *   - Both are pure functions of their input, so identical text always hashes identically
 *     without any per-request state.
 *
 * USAGE:
 *   @code
 *   using namespace piianon::util::hashing;
 *
 *   std::string full = sha256Hex("Hello World");   // 64 hex chars
 *   std::string tag  = shortDigest("Hello World"); // "a591a6d4"
 *   @endcode
 */

namespace piianon {
namespace util {
namespace hashing {

/// Hex characters kept by shortDigest() unless the caller asks otherwise.
constexpr std::size_t kShortDigestLength = 8;

/**
 * @brief Compute a SHA-256 hash of the input string, return as lowercase hex.
 * @throw std::runtime_error if OpenSSL fails.
 */
inline std::string sha256Hex(const std::string &input)
{
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hashLen = 0;

    if (EVP_Digest(input.data(), input.size(), hash, &hashLen, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("hashing::sha256Hex: EVP_Digest failed.");
    }

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < hashLen; ++i) {
        oss << std::setw(2) << static_cast<unsigned>(hash[i]);
    }
    return oss.str();
}

/**
 * @brief First @p length hex characters of sha256Hex(input).
 */
inline std::string shortDigest(const std::string &input, std::size_t length = kShortDigestLength)
{
    return sha256Hex(input).substr(0, length);
}

} // namespace hashing
} // namespace util
} // namespace piianon

#endif // PIIANON_UTIL_HASHING_HPP
