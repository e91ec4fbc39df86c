#ifndef XPECONOMY_UTIL_HASHING_HPP
#define XPECONOMY_UTIL_HASHING_HPP

#include <string>
#include <stdexcept>
#include <vector>
#include <sstream>
#include <iomanip>
#include <cstdint>
#include <openssl/evp.h>
#include <openssl/sha.h>

/**
 * @file hashing.hpp
 * @brief SHA-256 helpers used to chain the audit trail.
 *
 * REQUIREMENTS:
 *   - Links against OpenSSL (libcrypto).
 *
 * Every transaction row carries entry_hash = sha256(prev_hash || canonical row),
 * so editing or removing a row breaks the chain of every later row of that account.
 *
 * USAGE:
 *   @code
 *   using namespace xpeconomy::util::hashing;
 *   std::string h = chainHash(previousHash, {"alice", "EARN", "120"});
 *   @endcode
 */

namespace xpeconomy {
namespace util {
namespace hashing {

/// Hash that starts every account's chain.
inline const std::string& genesisHash()
{
    static const std::string zero(64, '0');
    return zero;
}

inline std::string toHex(const unsigned char *digest, size_t len)
{
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<unsigned>(digest[i]);
    }
    return oss.str();
}

/**
 * @brief Compute a SHA-256 hash of the input bytes, return as lowercase hex.
 * @throw std::runtime_error if OpenSSL fails.
 */
inline std::string sha256(const std::string &input)
{
    EVP_MD_CTX* mdctx = EVP_MD_CTX_new();
    if (mdctx == nullptr) {
        throw std::runtime_error("hashing::sha256: Failed to create EVP_MD_CTX.");
    }

    unsigned char hash[SHA256_DIGEST_LENGTH];
    unsigned int hashLen = 0;
    if (EVP_DigestInit_ex(mdctx, EVP_sha256(), nullptr) != 1
        || EVP_DigestUpdate(mdctx, input.data(), input.size()) != 1
        || EVP_DigestFinal_ex(mdctx, hash, &hashLen) != 1)
    {
        EVP_MD_CTX_free(mdctx);
        throw std::runtime_error("hashing::sha256: digest computation failed.");
    }
    EVP_MD_CTX_free(mdctx);
    return toHex(hash, hashLen);
}

/**
 * @brief Hash the previous link together with the fields of a new entry.
 *
 * Fields are length-prefixed so that ("ab","c") and ("a","bc") never collide.
 */
inline std::string chainHash(const std::string &prevHash, const std::vector<std::string> &fields)
{
    std::string canonical = prevHash;
    for (const auto &field : fields) {
        canonical += '|';
        canonical += std::to_string(field.size());
        canonical += ':';
        canonical += field;
    }
    return sha256(canonical);
}

} // namespace hashing
} // namespace util
} // namespace xpeconomy

#endif // XPECONOMY_UTIL_HASHING_HPP
