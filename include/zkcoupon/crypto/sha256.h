// ZKCOUPON - SHA-256 and HMAC-SHA-256
// Copyright (c) 2024 ZKCOUPON Developers
// MIT License
//
// Thin wrappers over OpenSSL's EVP interface. Every digest that feeds an
// identifier or a proof binding goes through TaggedHash so that values from
// different contexts can never collide.

#ifndef ZKCOUPON_CRYPTO_SHA256_H
#define ZKCOUPON_CRYPTO_SHA256_H

#include "zkcoupon/core/types.h"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace zkcoupon {

/// Incremental SHA-256 hasher
class SHA256 {
public:
    static constexpr size_t OUTPUT_SIZE = 32;

    SHA256();
    ~SHA256();

    SHA256(const SHA256&) = delete;
    SHA256& operator=(const SHA256&) = delete;

    /// Write data to the hasher
    SHA256& Write(const Byte* data, size_t len);

    SHA256& Write(const std::vector<Byte>& data) { return Write(data.data(), data.size()); }

    SHA256& Write(const std::string& data) {
        return Write(reinterpret_cast<const Byte*>(data.data()), data.size());
    }

    /// Finalize and return the digest; the hasher is reset afterwards
    Hash256 Finalize();

    /// Reset hasher to initial state
    SHA256& Reset();

private:
    struct Ctx;
    std::unique_ptr<Ctx> ctx_;
};

/// One-shot SHA-256
Hash256 SHA256Hash(const Byte* data, size_t len);

inline Hash256 SHA256Hash(const std::vector<Byte>& data) {
    return SHA256Hash(data.data(), data.size());
}

/// SHA-256 over a length-prefixed domain tag followed by data
Hash256 TaggedHash(const std::string& tag, const std::vector<Byte>& data);

/// One-shot HMAC-SHA-256
Hash256 HMACSHA256(const Byte* key, size_t keyLen, const Byte* data, size_t len);

inline Hash256 HMACSHA256(const std::vector<Byte>& key, const std::vector<Byte>& data) {
    return HMACSHA256(key.data(), key.size(), data.data(), data.size());
}

/// Constant-time comparison of two byte ranges; false when lengths differ
bool ConstantTimeEqual(const Byte* a, size_t aLen, const Byte* b, size_t bLen);

inline bool ConstantTimeEqual(const Hash256& a, const Hash256& b) {
    return ConstantTimeEqual(a.data(), a.size(), b.data(), b.size());
}

/// Overwrite memory in a way the optimizer will not elide
void SecureClear(void* ptr, size_t len);

} // namespace zkcoupon

#endif // ZKCOUPON_CRYPTO_SHA256_H
