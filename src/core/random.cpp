// ZKCOUPON - Secure Random Number Generation Implementation
// Copyright (c) 2024 ZKCOUPON Developers
// MIT License

#include "zkcoupon/core/random.h"
#include "zkcoupon/core/hex.h"

#include <openssl/rand.h>

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <vector>

namespace zkcoupon {

void GetRandBytes(uint8_t* buf, size_t len) {
    while (len > 0) {
        // RAND_bytes takes an int length
        size_t chunk = std::min<size_t>(len, static_cast<size_t>(std::numeric_limits<int>::max()));
        if (RAND_bytes(buf, static_cast<int>(chunk)) != 1) {
            throw std::runtime_error("Failed to get random bytes from OpenSSL");
        }
        buf += chunk;
        len -= chunk;
    }
}

uint64_t GetRandUint64() {
    uint64_t result;
    GetRandBytes(reinterpret_cast<uint8_t*>(&result), sizeof(result));
    return result;
}

Hash256 GetRandHash256() {
    Hash256 result;
    GetRandBytes(result.data(), Hash256::SIZE);
    return result;
}

std::string GenerateSecureHex(size_t bytes) {
    std::vector<uint8_t> buffer(bytes);
    GetRandBytes(buffer.data(), buffer.size());
    return BytesToHex(buffer);
}

} // namespace zkcoupon
