// ZKCOUPON - Secure Random Number Generation Header
// Copyright (c) 2024 ZKCOUPON Developers
// MIT License
//
// Cryptographically secure randomness for confirmation tokens and
// identifiers, drawn from OpenSSL's CSPRNG.

#ifndef ZKCOUPON_CORE_RANDOM_H
#define ZKCOUPON_CORE_RANDOM_H

#include "zkcoupon/core/types.h"

#include <cstddef>
#include <cstdint>
#include <string>

namespace zkcoupon {

/// Fill buffer with cryptographically secure random bytes.
/// Throws std::runtime_error if the CSPRNG cannot be seeded.
void GetRandBytes(uint8_t* buf, size_t len);

/// Generate random 64-bit unsigned integer
uint64_t GetRandUint64();

/// Generate random 256-bit value
Hash256 GetRandHash256();

/// Generate `bytes` random bytes encoded as hex (2 * bytes characters)
std::string GenerateSecureHex(size_t bytes);

} // namespace zkcoupon

#endif // ZKCOUPON_CORE_RANDOM_H
