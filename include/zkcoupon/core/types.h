// ZKCOUPON - Core Types Header
// Copyright (c) 2024 ZKCOUPON Developers
// MIT License
//
// Fundamental value types shared by every module: bytes, timestamps and
// the 256-bit identifiers used for wallets, commitments and coupons.

#ifndef ZKCOUPON_CORE_TYPES_H
#define ZKCOUPON_CORE_TYPES_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <string>
#include <vector>

namespace zkcoupon {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Timestamp (Unix epoch seconds)
using Timestamp = int64_t;

/// Duration in seconds
using Seconds = int64_t;

/// Merchant identifier (chosen by merchant tooling, unique in the registry)
using MerchantId = std::string;

/// Program identifier (assigned by the registry, never reused)
using ProgramId = uint64_t;

/// Monotonic version of a program's verification key (first key is 1)
using KeyVersion = uint32_t;

// ============================================================================
// Hash256
// ============================================================================

/**
 * A 256-bit value stored in natural byte order.
 *
 * Used for digests and for every opaque 32-byte identifier in the system.
 * Hex form is the bytes in storage order, lower case.
 */
class Hash256 {
public:
    static constexpr size_t SIZE = 32;

    /// Null (all zero) value
    Hash256() noexcept { data_.fill(0); }

    explicit Hash256(const std::array<Byte, SIZE>& data) noexcept : data_(data) {}

    /// Copy up to SIZE bytes, zero-padding short input
    Hash256(const Byte* data, size_t len) noexcept;

    bool IsNull() const noexcept;
    void SetNull() noexcept { data_.fill(0); }

    constexpr size_t size() const noexcept { return SIZE; }
    Byte* data() noexcept { return data_.data(); }
    const Byte* data() const noexcept { return data_.data(); }
    const Byte* begin() const noexcept { return data_.data(); }
    const Byte* end() const noexcept { return data_.data() + SIZE; }

    Byte& operator[](size_t idx) { return data_[idx]; }
    const Byte& operator[](size_t idx) const { return data_[idx]; }

    bool operator==(const Hash256& other) const noexcept { return data_ == other.data_; }
    bool operator!=(const Hash256& other) const noexcept { return data_ != other.data_; }
    bool operator<(const Hash256& other) const noexcept { return data_ < other.data_; }

    std::string ToHex() const;

    /// First `chars` hex characters, for log lines
    std::string ShortHex(size_t chars = 12) const;

    /// Parse 64 hex characters; nullopt on any malformed input
    static std::optional<Hash256> FromHex(const std::string& hex);

protected:
    std::array<Byte, SIZE> data_;
};

// ============================================================================
// Type-safe Identifiers
// ============================================================================

/// Wallet address (derived from an identity commitment)
class WalletAddress : public Hash256 {
public:
    using Hash256::Hash256;
    WalletAddress() = default;
    explicit WalletAddress(const Hash256& h) : Hash256(h) {}
};

/// One-way commitment (identity, recovery or coupon metadata)
class Commitment : public Hash256 {
public:
    using Hash256::Hash256;
    Commitment() = default;
    explicit Commitment(const Hash256& h) : Hash256(h) {}
};

/// Coupon identifier
class CouponId : public Hash256 {
public:
    using Hash256::Hash256;
    CouponId() = default;
    explicit CouponId(const Hash256& h) : Hash256(h) {}
};

/// Hasher for unordered containers keyed by any Hash256-derived type.
/// Values are uniformly distributed, so the leading bytes suffice.
struct Hash256Hasher {
    size_t operator()(const Hash256& h) const noexcept {
        size_t v;
        std::memcpy(&v, h.data(), sizeof(v));
        return v;
    }
};

// ============================================================================
// Little-endian helpers for canonical encodings
// ============================================================================

inline void AppendUint32(std::vector<Byte>& out, uint32_t v) {
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<Byte>(v >> (i * 8)));
    }
}

inline void AppendUint64(std::vector<Byte>& out, uint64_t v) {
    for (int i = 0; i < 8; ++i) {
        out.push_back(static_cast<Byte>(v >> (i * 8)));
    }
}

inline void AppendHash(std::vector<Byte>& out, const Hash256& h) {
    out.insert(out.end(), h.begin(), h.end());
}

/// Length-prefixed string
inline void AppendString(std::vector<Byte>& out, const std::string& s) {
    AppendUint32(out, static_cast<uint32_t>(s.size()));
    out.insert(out.end(), s.begin(), s.end());
}

} // namespace zkcoupon

#endif // ZKCOUPON_CORE_TYPES_H
