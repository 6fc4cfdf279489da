#ifndef PRIVGATE_UTIL_HASHING_HPP
#define PRIVGATE_UTIL_HASHING_HPP

#include <string>
#include <stdexcept>
#include <vector>
#include <cstdint>
#include <sstream>
#include <iomanip>
#include <openssl/evp.h>
#include <openssl/sha.h>

/**
 * @file hashing.hpp
 * @brief SHA-256 digests and hex helpers for privgate.
 *
 * REQUIREMENTS:
 *   - Links against OpenSSL libcrypto.
 *
 * USAGE:
 *   @code
 *   #include "util/hashing.hpp"
 *   using namespace privgate::util::hashing;
 *
 *   std::string digest = sha256Hex("john@example.com");
 *   // digest is a 64-hex-character string, identical on every call.
 *   @endcode
 */

namespace privgate {
namespace util {
namespace hashing {

/**
 * @brief Lowercase hex encoding of a byte buffer.
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
 * @brief Decode a hex string into bytes.
 * @throw std::invalid_argument on odd length or non-hex characters.
 */
inline std::vector<uint8_t> fromHex(const std::string &hex)
{
    if (hex.size() % 2 != 0) {
        throw std::invalid_argument("hashing::fromHex: odd number of hex digits");
    }
    auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };
    std::vector<uint8_t> out;
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        int hi = nibble(hex[i]);
        int lo = nibble(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            throw std::invalid_argument("hashing::fromHex: invalid hex digit");
        }
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return out;
}

/**
 * @brief Compute a SHA-256 hash of the input, return as lowercase hex.
 * @param input The data to be hashed (any bytes, usually UTF-8 text).
 * @return A 64-character hex string representing the SHA-256 digest.
 * @throw std::runtime_error if OpenSSL fails.
 */
inline std::string sha256Hex(const std::string &input)
{
    EVP_MD_CTX* mdctx = EVP_MD_CTX_new();
    if (mdctx == nullptr) {
        throw std::runtime_error("hashing::sha256Hex: Failed to create EVP_MD_CTX.");
    }

    unsigned char hash[SHA256_DIGEST_LENGTH];
    unsigned int hashLen = 0;
    if (EVP_DigestInit_ex(mdctx, EVP_sha256(), nullptr) != 1
        || EVP_DigestUpdate(mdctx, input.data(), input.size()) != 1
        || EVP_DigestFinal_ex(mdctx, hash, &hashLen) != 1)
    {
        EVP_MD_CTX_free(mdctx);
        throw std::runtime_error("hashing::sha256Hex: digest computation failed.");
    }
    EVP_MD_CTX_free(mdctx);

    return toHex(hash, hashLen);
}

} // namespace hashing
} // namespace util
} // namespace privgate

#endif // PRIVGATE_UTIL_HASHING_HPP
