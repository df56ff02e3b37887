#include "lode/platform.hpp"

#include <memory>

#include <openssl/evp.h>

namespace lode {

// ============================================================================
// Package Digest
// ============================================================================

namespace {

using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

constexpr char HEX_DIGITS[] = "0123456789abcdef";

} // namespace

HashResult compute_sha256(const std::vector<uint8_t>& data) {
    HashResult result;

    DigestContext ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx) {
        result.error = "cannot allocate digest context";
        return result;
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;

    bool digested = EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) == 1 &&
                    EVP_DigestUpdate(ctx.get(), data.data(), data.size()) == 1 &&
                    EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) == 1;
    if (!digested) {
        result.error = "sha256 digest failed";
        return result;
    }

    result.hex_digest.resize(digest_len * 2);
    for (unsigned int i = 0; i < digest_len; ++i) {
        result.hex_digest[2 * i] = HEX_DIGITS[digest[i] >> 4];
        result.hex_digest[2 * i + 1] = HEX_DIGITS[digest[i] & 0x0F];
    }
    result.ok = true;
    return result;
}

} // namespace lode
