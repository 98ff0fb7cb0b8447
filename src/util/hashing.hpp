#ifndef PIIGUARD_UTIL_HASHING_HPP
#define PIIGUARD_UTIL_HASHING_HPP

#include <string>
#include <stdexcept>
#include <sstream>
#include <iomanip>
#include <openssl/evp.h>
#include <openssl/sha.h>

/**
 * @file hashing.hpp
 * @brief SHA-256 digests used to fingerprint documents in log lines.
 *
 * REQUIREMENTS:
 *   - Links against OpenSSL (libcrypto).
 *
 * DESIGN:
 *   - sha256() returns the lowercase hex digest of a byte string.
 *   - fingerprint() returns a short prefix of that digest. It lets an operator
 *     correlate the inbound and outbound log lines of one document without
 *     the document text ever reaching the log.
 *
 * USAGE:
 *   @code
 *   using namespace piiguard::util::hashing;
 *   std::string fp = fingerprint(resumeText); // e.g. "9f86d081884c"
 *   @endcode
 */

namespace piiguard {
namespace util {
namespace hashing {

/**
 * @brief Compute a SHA-256 hash of the input string, return as lowercase hex.
 * @throw std::runtime_error if OpenSSL fails.
 */
inline std::string sha256(const std::string &input)
{
    EVP_MD_CTX* mdctx = EVP_MD_CTX_new();
    if (mdctx == nullptr) {
        throw std::runtime_error("hashing::sha256: Failed to create EVP_MD_CTX.");
    }

    if (EVP_DigestInit_ex(mdctx, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(mdctx);
        throw std::runtime_error("hashing::sha256: EVP_DigestInit_ex failed.");
    }

    if (EVP_DigestUpdate(mdctx, input.data(), input.size()) != 1) {
        EVP_MD_CTX_free(mdctx);
        throw std::runtime_error("hashing::sha256: EVP_DigestUpdate failed.");
    }

    unsigned char hash[SHA256_DIGEST_LENGTH];
    if (EVP_DigestFinal_ex(mdctx, hash, nullptr) != 1) {
        EVP_MD_CTX_free(mdctx);
        throw std::runtime_error("hashing::sha256: EVP_DigestFinal_ex failed.");
    }
    EVP_MD_CTX_free(mdctx);

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i) {
        oss << std::setw(2) << static_cast<unsigned>(hash[i]);
    }
    return oss.str();
}

/**
 * @brief First @p length hex characters of sha256(input).
 */
inline std::string fingerprint(const std::string &input, size_t length = 12)
{
    return sha256(input).substr(0, length);
}

} // namespace hashing
} // namespace util
} // namespace piiguard

#endif // PIIGUARD_UTIL_HASHING_HPP
