#ifndef PIIANON_UTIL_CRYPTO_HPP
#define PIIANON_UTIL_CRYPTO_HPP

#include <string>
#include <vector>
#include <memory>
#include <stdexcept>
#include <cstdint>
#include <cstddef>
#include <openssl/evp.h>
#include <openssl/rand.h>

/**
 * @file crypto.hpp
 * @brief AES-128-CBC encryption for the encrypt operator.
 *
 * REQUIREMENTS:
 *   - Links against OpenSSL libcrypto.
 *
 * DESIGN:
 *   - A fresh random IV is drawn with RAND_bytes for every call.
 *   - Output is base64(IV || ciphertext), PKCS#7 padded, so it can be embedded in JSON text.
 *   - Only encryption lives here; the anonymizer never reverses its output.
 *
 * USAGE:
 *   @code
 *   std::vector<uint8_t> key(16, 0x2a);
 *   std::string token = piianon::util::crypto::aesEncryptToBase64("555-1234", key);
 *   @endcode
 */

namespace piianon {
namespace util {
namespace crypto {

constexpr std::size_t kAesKeySize = 16;
constexpr std::size_t kAesBlockSize = 16;

/**
 * @brief Standard base64 (with padding) of a byte buffer.
 */
inline std::string base64Encode(const std::vector<uint8_t> &data)
{
    if (data.empty()) {
        return std::string();
    }
    // EVP_EncodeBlock writes 4 chars per 3 bytes plus a NUL terminator.
    std::string out(4 * ((data.size() + 2) / 3) + 1, '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                  data.data(), static_cast<int>(data.size()));
    if (written < 0) {
        throw std::runtime_error("crypto::base64Encode: EVP_EncodeBlock failed.");
    }
    out.resize(static_cast<std::size_t>(written));
    return out;
}

/**
 * @brief Encrypt @p plaintext with AES-128-CBC under @p key and a random IV.
 * @return base64(IV || ciphertext)
 * @throw std::invalid_argument if the key is not 16 bytes.
 * @throw std::runtime_error if OpenSSL fails.
 */
inline std::string aesEncryptToBase64(const std::string &plaintext, const std::vector<uint8_t> &key)
{
    if (key.size() != kAesKeySize) {
        throw std::invalid_argument("crypto::aesEncryptToBase64: key must be 16 bytes, got " +
                                    std::to_string(key.size()));
    }

    std::vector<uint8_t> out(kAesBlockSize + plaintext.size() + kAesBlockSize);
    if (RAND_bytes(out.data(), static_cast<int>(kAesBlockSize)) != 1) {
        throw std::runtime_error("crypto::aesEncryptToBase64: RAND_bytes failed.");
    }

    std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)> ctx(EVP_CIPHER_CTX_new(),
                                                                        &EVP_CIPHER_CTX_free);
    if (!ctx) {
        throw std::runtime_error("crypto::aesEncryptToBase64: Failed to create EVP_CIPHER_CTX.");
    }

    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_128_cbc(), nullptr, key.data(), out.data()) != 1) {
        throw std::runtime_error("crypto::aesEncryptToBase64: EVP_EncryptInit_ex failed.");
    }

    int len = 0;
    int total = 0;
    unsigned char *cipherStart = out.data() + kAesBlockSize;
    if (EVP_EncryptUpdate(ctx.get(), cipherStart, &len,
                          reinterpret_cast<const unsigned char*>(plaintext.data()),
                          static_cast<int>(plaintext.size())) != 1) {
        throw std::runtime_error("crypto::aesEncryptToBase64: EVP_EncryptUpdate failed.");
    }
    total = len;

    if (EVP_EncryptFinal_ex(ctx.get(), cipherStart + total, &len) != 1) {
        throw std::runtime_error("crypto::aesEncryptToBase64: EVP_EncryptFinal_ex failed.");
    }
    total += len;

    out.resize(kAesBlockSize + static_cast<std::size_t>(total));
    return base64Encode(out);
}

} // namespace crypto
} // namespace util
} // namespace piianon

#endif // PIIANON_UTIL_CRYPTO_HPP
