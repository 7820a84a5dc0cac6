// ============================================================================
// digest.h - SHA-256 and random identifiers over OpenSSL libcrypto
// ============================================================================

#pragma once

#include <cstddef>
#include <cstdint>

namespace Trace::Common {

constexpr size_t SHA256_HEX_LENGTH = 64;

// Hex SHA-256 of data into hex_out (needs SHA256_HEX_LENGTH + 1 bytes)
bool sha256Hex(const void* data, size_t len, char* hex_out, size_t hex_size) noexcept;

// num_bytes of cryptographic randomness rendered as lowercase hex
bool randomHex(size_t num_bytes, char* hex_out, size_t hex_size) noexcept;

} // namespace Trace::Common
