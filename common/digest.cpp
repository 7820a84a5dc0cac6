// ============================================================================
// digest.cpp - SHA-256 and random identifiers over OpenSSL libcrypto
// ============================================================================

#include "common/digest.h"
#include "common/logging.h"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/err.h>
#include <cstdio>

namespace Trace::Common {

namespace {

void toHex(const unsigned char* bytes, size_t len, char* hex_out) noexcept {
    for (size_t i = 0; i < len; ++i) {
        snprintf(hex_out + (i * 2), 3, "%02x", bytes[i]);
    }
    hex_out[len * 2] = '\0';
}

} // namespace

bool sha256Hex(const void* data, size_t len, char* hex_out, size_t hex_size) noexcept {
    if (!hex_out || hex_size < SHA256_HEX_LENGTH + 1) {
        return false;
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        LOG_ERROR("EVP_MD_CTX_new failed");
        return false;
    }

    bool ok = EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) == 1 &&
              EVP_DigestUpdate(ctx, data, len) == 1 &&
              EVP_DigestFinal_ex(ctx, hash, &hash_len) == 1;
    EVP_MD_CTX_free(ctx);

    if (!ok) {
        LOG_ERROR("SHA-256 digest failed: %lu", ERR_get_error());
        return false;
    }

    toHex(hash, hash_len, hex_out);
    return true;
}

bool randomHex(size_t num_bytes, char* hex_out, size_t hex_size) noexcept {
    unsigned char bytes[32];
    if (!hex_out || num_bytes == 0 || num_bytes > sizeof(bytes) || hex_size < num_bytes * 2 + 1) {
        return false;
    }

    if (RAND_bytes(bytes, static_cast<int>(num_bytes)) != 1) {
        LOG_ERROR("RAND_bytes failed: %lu", ERR_get_error());
        return false;
    }

    toHex(bytes, num_bytes, hex_out);
    return true;
}

} // namespace Trace::Common
