#ifndef PRIVGATE_UTIL_CRYPTO_HPP
#define PRIVGATE_UTIL_CRYPTO_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <stdexcept>
#include <memory>
#include <openssl/evp.h>
#include <openssl/rand.h>

/**
 * @file crypto.hpp
 * @brief Reversible span encryption for the Encrypt anonymization method.
 *
 * DESIGN:
 *   - AES-CBC with PKCS#7 padding; key size selects AES-128/192/256.
 *   - A fresh random IV per call (RAND_bytes). The token is base64(IV || ciphertext),
 *     so repeated encryption of the same span yields different tokens.
 *   - decryptToken() exists for key holders and tests; the engine itself never decrypts.
 *
 * USAGE:
 *   @code
 *   std::vector<uint8_t> key(32, 0x42);
 *   std::string token = privgate::util::crypto::encryptToken("555-123-4567", key);
 *   std::string plain = privgate::util::crypto::decryptToken(token, key);
 *   @endcode
 */

namespace privgate {
namespace util {
namespace crypto {

constexpr size_t kIvSize = 16;

/**
 * @brief True when the key length selects one of AES-128/192/256.
 */
inline bool isValidKeySize(size_t keyBytes)
{
    return keyBytes == 16 || keyBytes == 24 || keyBytes == 32;
}

namespace detail {

struct CipherCtxDeleter
{
    void operator()(EVP_CIPHER_CTX *ctx) const { EVP_CIPHER_CTX_free(ctx); }
};
using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

inline const EVP_CIPHER* cipherForKey(size_t keyBytes)
{
    switch (keyBytes) {
        case 16: return EVP_aes_128_cbc();
        case 24: return EVP_aes_192_cbc();
        case 32: return EVP_aes_256_cbc();
        default:
            throw std::invalid_argument("crypto: key must be 16, 24 or 32 bytes, got "
                                        + std::to_string(keyBytes));
    }
}

} // namespace detail

/**
 * @brief Standard base64 (with padding) of a byte buffer.
 */
inline std::string base64Encode(const std::vector<uint8_t> &data)
{
    if (data.empty()) {
        return std::string();
    }
    std::string out(4 * ((data.size() + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                  data.data(), static_cast<int>(data.size()));
    if (written < 0) {
        throw std::runtime_error("crypto::base64Encode: EVP_EncodeBlock failed.");
    }
    out.resize(static_cast<size_t>(written));
    return out;
}

/**
 * @brief Decode standard base64. EVP_DecodeBlock keeps padding bytes, so they are trimmed here.
 */
inline std::vector<uint8_t> base64Decode(const std::string &text)
{
    if (text.empty()) {
        return {};
    }
    if (text.size() % 4 != 0) {
        throw std::invalid_argument("crypto::base64Decode: length is not a multiple of 4");
    }
    std::vector<uint8_t> out(3 * text.size() / 4);
    int written = EVP_DecodeBlock(out.data(),
                                  reinterpret_cast<const unsigned char*>(text.data()),
                                  static_cast<int>(text.size()));
    if (written < 0) {
        throw std::invalid_argument("crypto::base64Decode: invalid base64 input");
    }
    size_t padding = 0;
    if (text[text.size() - 1] == '=') ++padding;
    if (text[text.size() - 2] == '=') ++padding;
    out.resize(static_cast<size_t>(written) - padding);
    return out;
}

/**
 * @brief Encrypt plaintext under key, return base64(IV || ciphertext).
 * @throw std::invalid_argument on a bad key size, std::runtime_error if OpenSSL fails.
 */
inline std::string encryptToken(const std::string &plaintext, const std::vector<uint8_t> &key)
{
    const EVP_CIPHER *cipher = detail::cipherForKey(key.size());

    std::vector<uint8_t> iv(kIvSize);
    if (RAND_bytes(iv.data(), static_cast<int>(iv.size())) != 1) {
        throw std::runtime_error("crypto::encryptToken: RAND_bytes failed.");
    }

    detail::CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        throw std::runtime_error("crypto::encryptToken: Failed to create EVP_CIPHER_CTX.");
    }
    if (EVP_EncryptInit_ex(ctx.get(), cipher, nullptr, key.data(), iv.data()) != 1) {
        throw std::runtime_error("crypto::encryptToken: EVP_EncryptInit_ex failed.");
    }

    std::vector<uint8_t> out(iv);
    out.resize(kIvSize + plaintext.size() + EVP_CIPHER_block_size(cipher));
    int len1 = 0;
    int len2 = 0;
    if (EVP_EncryptUpdate(ctx.get(), out.data() + kIvSize, &len1,
                          reinterpret_cast<const unsigned char*>(plaintext.data()),
                          static_cast<int>(plaintext.size())) != 1) {
        throw std::runtime_error("crypto::encryptToken: EVP_EncryptUpdate failed.");
    }
    if (EVP_EncryptFinal_ex(ctx.get(), out.data() + kIvSize + len1, &len2) != 1) {
        throw std::runtime_error("crypto::encryptToken: EVP_EncryptFinal_ex failed.");
    }
    out.resize(kIvSize + static_cast<size_t>(len1 + len2));
    return base64Encode(out);
}

/**
 * @brief Inverse of encryptToken().
 * @throw std::invalid_argument on malformed tokens, std::runtime_error on a wrong key or corrupt data.
 */
inline std::string decryptToken(const std::string &token, const std::vector<uint8_t> &key)
{
    const EVP_CIPHER *cipher = detail::cipherForKey(key.size());
    std::vector<uint8_t> raw = base64Decode(token);
    if (raw.size() <= kIvSize) {
        throw std::invalid_argument("crypto::decryptToken: token too short");
    }

    detail::CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        throw std::runtime_error("crypto::decryptToken: Failed to create EVP_CIPHER_CTX.");
    }
    if (EVP_DecryptInit_ex(ctx.get(), cipher, nullptr, key.data(), raw.data()) != 1) {
        throw std::runtime_error("crypto::decryptToken: EVP_DecryptInit_ex failed.");
    }

    std::string plain(raw.size(), '\0');
    int len1 = 0;
    int len2 = 0;
    if (EVP_DecryptUpdate(ctx.get(), reinterpret_cast<unsigned char*>(&plain[0]), &len1,
                          raw.data() + kIvSize, static_cast<int>(raw.size() - kIvSize)) != 1) {
        throw std::runtime_error("crypto::decryptToken: EVP_DecryptUpdate failed.");
    }
    if (EVP_DecryptFinal_ex(ctx.get(), reinterpret_cast<unsigned char*>(&plain[0]) + len1,
                            &len2) != 1) {
        throw std::runtime_error("crypto::decryptToken: bad key or corrupt ciphertext.");
    }
    plain.resize(static_cast<size_t>(len1 + len2));
    return plain;
}

} // namespace crypto
} // namespace util
} // namespace privgate

#endif // PRIVGATE_UTIL_CRYPTO_HPP
