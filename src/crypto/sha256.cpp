// ZKCOUPON - SHA-256 and HMAC-SHA-256 Implementation
// Copyright (c) 2024 ZKCOUPON Developers
// MIT License

#include "zkcoupon/crypto/sha256.h"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <stdexcept>

namespace zkcoupon {

// ============================================================================
// SHA256
// ============================================================================

struct SHA256::Ctx {
    EVP_MD_CTX* md{nullptr};

    Ctx() : md(EVP_MD_CTX_new()) {
        if (!md) {
            throw std::runtime_error("EVP_MD_CTX_new failed");
        }
    }

    ~Ctx() { EVP_MD_CTX_free(md); }
};

SHA256::SHA256() : ctx_(std::make_unique<Ctx>()) {
    Reset();
}

SHA256::~SHA256() = default;

SHA256& SHA256::Reset() {
    if (EVP_DigestInit_ex(ctx_->md, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("EVP_DigestInit_ex failed");
    }
    return *this;
}

SHA256& SHA256::Write(const Byte* data, size_t len) {
    if (len > 0 && EVP_DigestUpdate(ctx_->md, data, len) != 1) {
        throw std::runtime_error("EVP_DigestUpdate failed");
    }
    return *this;
}

Hash256 SHA256::Finalize() {
    Hash256 out;
    unsigned int outLen = 0;
    if (EVP_DigestFinal_ex(ctx_->md, out.data(), &outLen) != 1 || outLen != OUTPUT_SIZE) {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
    Reset();
    return out;
}

// ============================================================================
// Convenience Functions
// ============================================================================

Hash256 SHA256Hash(const Byte* data, size_t len) {
    SHA256 hasher;
    hasher.Write(data, len);
    return hasher.Finalize();
}

Hash256 TaggedHash(const std::string& tag, const std::vector<Byte>& data) {
    std::vector<Byte> prefix;
    AppendString(prefix, tag);

    SHA256 hasher;
    hasher.Write(prefix);
    hasher.Write(data);
    return hasher.Finalize();
}

Hash256 HMACSHA256(const Byte* key, size_t keyLen, const Byte* data, size_t len) {
    Hash256 out;
    unsigned int outLen = 0;
    // HMAC() rejects a null key pointer even for an empty key
    static const Byte EMPTY = 0;
    const Byte* k = key ? key : &EMPTY;
    if (!HMAC(EVP_sha256(), k, static_cast<int>(keyLen), data, len, out.data(), &outLen) ||
        outLen != SHA256::OUTPUT_SIZE) {
        throw std::runtime_error("HMAC-SHA256 failed");
    }
    return out;
}

bool ConstantTimeEqual(const Byte* a, size_t aLen, const Byte* b, size_t bLen) {
    if (aLen != bLen) {
        return false;
    }
    if (aLen == 0) {
        return true;
    }
    return CRYPTO_memcmp(a, b, aLen) == 0;
}

void SecureClear(void* ptr, size_t len) {
    OPENSSL_cleanse(ptr, len);
}

} // namespace zkcoupon
