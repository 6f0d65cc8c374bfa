// ZKCOUPON - Proof Objects Implementation
// Copyright (c) 2024 ZKCOUPON Developers
// MIT License

#include "zkcoupon/proof/proof.h"
#include "zkcoupon/core/hex.h"
#include "zkcoupon/crypto/sha256.h"

namespace zkcoupon {
namespace proof {

namespace {

constexpr const char* ISSUANCE_TAG = "zkcoupon/inputs/issuance";
constexpr const char* REDEMPTION_TAG = "zkcoupon/inputs/redemption";
constexpr const char* RECOVERY_TAG = "zkcoupon/inputs/recovery";
constexpr const char* KEY_FINGERPRINT_TAG = "zkcoupon/vk-fingerprint";

constexpr size_t HEADER_SIZE = 1 + 1 + Hash256::SIZE + 4;

bool IsKnownKind(uint8_t kind) {
    return kind >= static_cast<uint8_t>(ProofKind::Issuance) &&
           kind <= static_cast<uint8_t>(ProofKind::Recovery);
}

uint32_t ReadUint32(const Byte* p) {
    return static_cast<uint32_t>(p[0]) |
           (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

struct InputHasher {
    Hash256 operator()(const IssuanceInputs& in) const {
        std::vector<Byte> buf;
        AppendUint64(buf, in.programId);
        AppendHash(buf, in.ownerWallet);
        AppendHash(buf, in.metadataCommitment);
        AppendUint32(buf, in.keyVersion);
        return TaggedHash(ISSUANCE_TAG, buf);
    }

    Hash256 operator()(const RedemptionInputs& in) const {
        std::vector<Byte> buf;
        AppendHash(buf, in.tokenId);
        AppendHash(buf, in.ownerWallet);
        AppendUint32(buf, in.keyVersion);
        return TaggedHash(REDEMPTION_TAG, buf);
    }

    Hash256 operator()(const RecoveryInputs& in) const {
        std::vector<Byte> buf;
        AppendHash(buf, in.walletAddress);
        AppendHash(buf, in.recoveryCommitment);
        AppendHash(buf, in.newIdentityCommitment);
        AppendUint64(buf, in.bindingGeneration);
        return TaggedHash(RECOVERY_TAG, buf);
    }
};

} // namespace

const char* ProofKindToString(ProofKind kind) {
    switch (kind) {
        case ProofKind::Issuance:   return "issuance";
        case ProofKind::Redemption: return "redemption";
        case ProofKind::Recovery:   return "recovery";
        default:                    return "unknown";
    }
}

ProofKind GetProofKind(const PublicInputs& inputs) {
    switch (inputs.index()) {
        case 0: return ProofKind::Issuance;
        case 1: return ProofKind::Redemption;
        default: return ProofKind::Recovery;
    }
}

Hash256 PublicInputHash(const PublicInputs& inputs) {
    return std::visit(InputHasher{}, inputs);
}

// ============================================================================
// VerificationKey
// ============================================================================

bool VerificationKey::IsValid() const {
    return !systemId.empty() &&
           keyData.size() >= MIN_KEY_SIZE &&
           keyData.size() <= MAX_KEY_SIZE;
}

Hash256 VerificationKey::Fingerprint() const {
    std::vector<Byte> buf;
    AppendString(buf, systemId);
    buf.insert(buf.end(), keyData.begin(), keyData.end());
    return TaggedHash(KEY_FINGERPRINT_TAG, buf);
}

// ============================================================================
// Proof
// ============================================================================

bool Proof::IsWellFormed() const {
    return IsKnownKind(static_cast<uint8_t>(kind_)) &&
           !data_.empty() &&
           data_.size() <= MAX_PROOF_SIZE &&
           !inputHash_.IsNull();
}

std::vector<Byte> Proof::ToBytes() const {
    std::vector<Byte> out;
    out.reserve(HEADER_SIZE + data_.size());
    out.push_back(VERSION);
    out.push_back(static_cast<Byte>(kind_));
    AppendHash(out, inputHash_);
    AppendUint32(out, static_cast<uint32_t>(data_.size()));
    out.insert(out.end(), data_.begin(), data_.end());
    return out;
}

std::optional<Proof> Proof::FromBytes(const Byte* data, size_t len) {
    if (data == nullptr || len < HEADER_SIZE) {
        return std::nullopt;
    }
    if (data[0] != VERSION || !IsKnownKind(data[1])) {
        return std::nullopt;
    }

    Hash256 inputHash(data + 2, Hash256::SIZE);
    uint32_t dataLen = ReadUint32(data + 2 + Hash256::SIZE);
    if (dataLen > MAX_PROOF_SIZE || len != HEADER_SIZE + dataLen) {
        return std::nullopt;
    }

    std::vector<Byte> body(data + HEADER_SIZE, data + HEADER_SIZE + dataLen);
    return Proof(static_cast<ProofKind>(data[1]), inputHash, std::move(body));
}

std::string Proof::ToHex() const {
    return BytesToHex(ToBytes());
}

std::optional<Proof> Proof::FromHex(const std::string& hex) {
    auto bytes = ParseHex(hex);
    if (!bytes) {
        return std::nullopt;
    }
    return FromBytes(bytes->data(), bytes->size());
}

Hash256 Proof::GetHash() const {
    return SHA256Hash(ToBytes());
}

} // namespace proof
} // namespace zkcoupon
