// ZKCOUPON - Proof Objects and Public Inputs
// Copyright (c) 2024 ZKCOUPON Developers
// MIT License
//
// Defines the three proof kinds that gate coupon state transitions and the
// public inputs each one is bound to:
//
// - Issuance:   the holder is eligible for a coupon of a program
// - Redemption: the holder controls the wallet that owns a coupon
// - Recovery:   the holder knows the recovery secret of a wallet
//
// A proof carries the digest of the public inputs it was produced for. The
// verifier never trusts that digest: it recomputes one from the state the
// caller is about to act on and requires an exact match.

#ifndef ZKCOUPON_PROOF_PROOF_H
#define ZKCOUPON_PROOF_PROOF_H

#include "zkcoupon/core/types.h"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace zkcoupon {
namespace proof {

// ============================================================================
// Proof Kinds
// ============================================================================

enum class ProofKind : uint8_t {
    Issuance = 1,
    Redemption = 2,
    Recovery = 3
};

const char* ProofKindToString(ProofKind kind);

// ============================================================================
// Public Inputs
// ============================================================================

/// Bound by an issuance proof
struct IssuanceInputs {
    ProgramId programId{0};
    WalletAddress ownerWallet;
    Commitment metadataCommitment;
    KeyVersion keyVersion{0};

    bool operator==(const IssuanceInputs& other) const {
        return programId == other.programId &&
               ownerWallet == other.ownerWallet &&
               metadataCommitment == other.metadataCommitment &&
               keyVersion == other.keyVersion;
    }
    bool operator!=(const IssuanceInputs& other) const { return !(*this == other); }
};

/// Bound by a redemption proof
struct RedemptionInputs {
    CouponId tokenId;
    WalletAddress ownerWallet;
    KeyVersion keyVersion{0};

    bool operator==(const RedemptionInputs& other) const {
        return tokenId == other.tokenId &&
               ownerWallet == other.ownerWallet &&
               keyVersion == other.keyVersion;
    }
    bool operator!=(const RedemptionInputs& other) const { return !(*this == other); }
};

/// Bound by a wallet recovery proof. The binding generation makes a proof
/// single-use: it goes stale as soon as any recovery succeeds.
struct RecoveryInputs {
    WalletAddress walletAddress;
    Commitment recoveryCommitment;
    Commitment newIdentityCommitment;
    uint64_t bindingGeneration{0};

    bool operator==(const RecoveryInputs& other) const {
        return walletAddress == other.walletAddress &&
               recoveryCommitment == other.recoveryCommitment &&
               newIdentityCommitment == other.newIdentityCommitment &&
               bindingGeneration == other.bindingGeneration;
    }
    bool operator!=(const RecoveryInputs& other) const { return !(*this == other); }
};

using PublicInputs = std::variant<IssuanceInputs, RedemptionInputs, RecoveryInputs>;

/// Kind implied by the active alternative
ProofKind GetProofKind(const PublicInputs& inputs);

/// Canonical, domain-separated digest of the inputs
Hash256 PublicInputHash(const PublicInputs& inputs);

// ============================================================================
// Verification Key
// ============================================================================

/**
 * Verification key for one proof circuit.
 *
 * `systemId` selects the proving backend; `keyData` is opaque to
 * everything except that backend.
 */
struct VerificationKey {
    static constexpr size_t MIN_KEY_SIZE = 16;
    static constexpr size_t MAX_KEY_SIZE = 4096;

    std::string systemId;
    std::vector<Byte> keyData;

    bool IsValid() const;

    /// Short identifier for logs and listings; never reveals key material
    Hash256 Fingerprint() const;

    bool operator==(const VerificationKey& other) const {
        return systemId == other.systemId && keyData == other.keyData;
    }
    bool operator!=(const VerificationKey& other) const { return !(*this == other); }
};

// ============================================================================
// Proof
// ============================================================================

/**
 * An opaque proof together with the kind and input digest it claims.
 *
 * Wire format: version(1) kind(1) inputHash(32) len(u32 LE) data(len).
 */
class Proof {
public:
    static constexpr uint8_t VERSION = 1;
    static constexpr size_t MAX_PROOF_SIZE = 16384;

    Proof() = default;
    Proof(ProofKind kind, const Hash256& inputHash, std::vector<Byte> data)
        : kind_(kind), inputHash_(inputHash), data_(std::move(data)) {}

    ProofKind GetKind() const { return kind_; }
    const Hash256& GetInputHash() const { return inputHash_; }
    const std::vector<Byte>& GetData() const { return data_; }

    /// Structural check only
    bool IsWellFormed() const;

    std::vector<Byte> ToBytes() const;
    static std::optional<Proof> FromBytes(const Byte* data, size_t len);

    std::string ToHex() const;
    static std::optional<Proof> FromHex(const std::string& hex);

    /// Digest of the serialized proof, used for idempotency keys
    Hash256 GetHash() const;

private:
    ProofKind kind_{ProofKind::Issuance};
    Hash256 inputHash_;
    std::vector<Byte> data_;
};

} // namespace proof
} // namespace zkcoupon

#endif // ZKCOUPON_PROOF_PROOF_H
