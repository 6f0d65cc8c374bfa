// ZKCOUPON - Merchant and Program Registry
// Copyright (c) 2024 ZKCOUPON Developers
// MIT License
//
// Owns merchant records, coupon programs, their issuance caps and the
// verification keys that gate issuance and redemption.
//
// Issuance slots are handed out through reservations so that the ledger can
// make "take a slot" and "mint the coupon" one logical step:
//
//   ReserveIssuance -> (ledger inserts coupon) -> CommitIssuance
//                   \-> (any failure)          -> ReleaseIssuance
//
// At all times issuedCount + reserved <= maxIssuance.

#ifndef ZKCOUPON_REGISTRY_REGISTRY_H
#define ZKCOUPON_REGISTRY_REGISTRY_H

#include "zkcoupon/core/errors.h"
#include "zkcoupon/core/types.h"
#include "zkcoupon/proof/proof.h"

#include <cstdint>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace zkcoupon {
namespace registry {

// ============================================================================
// Records
// ============================================================================

/// Free-form merchant details, editable after registration
struct MerchantDetails {
    std::string name;
    std::string contact;
};

struct Merchant {
    MerchantId merchantId;
    WalletAddress walletAddress;
    bool active{true};
    MerchantDetails details;
    Timestamp registeredAt{0};
};

struct Program {
    ProgramId programId{0};
    MerchantId merchantId;
    Seconds validityPeriod{0};
    uint64_t maxIssuance{0};
    uint64_t issuedCount{0};
    uint64_t reservedCount{0};
    /// Current key; meaningful only when keyVersion > 0
    proof::VerificationKey verificationKey;
    KeyVersion keyVersion{0};
    Timestamp createdAt{0};
    std::string description;

    bool HasKey() const { return keyVersion > 0; }

    /// Slots neither issued nor reserved
    uint64_t Remaining() const {
        uint64_t taken = issuedCount + reservedCount;
        return taken >= maxIssuance ? 0 : maxIssuance - taken;
    }
};

/// Parameters for CreateProgram
struct ProgramParams {
    Seconds validityPeriod{0};
    uint64_t maxIssuance{0};
    std::string description;
    /// Optional initial key (becomes version 1)
    std::optional<proof::VerificationKey> verificationKey;
};

/// A held issuance slot
struct IssuanceReservation {
    uint64_t reservationId{0};
    ProgramId programId{0};
    MerchantId merchantId;
    KeyVersion keyVersion{0};
    Seconds validityPeriod{0};
    Timestamp reservedAt{0};
};

struct RegistryStats {
    size_t merchants{0};
    size_t activeMerchants{0};
    size_t programs{0};
    size_t pendingReservations{0};
    uint64_t totalIssued{0};
};

// ============================================================================
// Merchant Registry
// ============================================================================

class MerchantRegistry {
public:
    MerchantRegistry() = default;

    MerchantRegistry(const MerchantRegistry&) = delete;
    MerchantRegistry& operator=(const MerchantRegistry&) = delete;

    // --- Merchants ---

    /// MerchantExists if the id is taken, InvalidArgument on an empty id or
    /// null wallet
    OpStatus RegisterMerchant(const MerchantId& merchantId,
                              const WalletAddress& walletAddress,
                              const MerchantDetails& details = {});

    /// Merchants are deactivated, never deleted
    OpStatus DeactivateMerchant(const MerchantId& merchantId);

    OpStatus UpdateMerchantDetails(const MerchantId& merchantId,
                                   const MerchantDetails& details);

    std::optional<Merchant> GetMerchant(const MerchantId& merchantId) const;
    bool IsMerchantActive(const MerchantId& merchantId) const;
    std::vector<Merchant> ListMerchants() const;

    // --- Programs ---

    /**
     * Create a program owned by `merchantId`.
     *
     * MerchantNotFound, MerchantInactive, or InvalidProgramParams when
     * maxIssuance or validityPeriod is not strictly positive or the initial
     * key is malformed.
     */
    OpResult<ProgramId> CreateProgram(const MerchantId& merchantId,
                                      const ProgramParams& params);

    /**
     * Install a new verification key for a program and bump its version.
     * Only the owning merchant may call this (Unauthorized otherwise).
     * Earlier versions stay retrievable for coupons issued under them.
     */
    OpResult<KeyVersion> RegisterVerificationKey(const MerchantId& caller,
                                                 ProgramId programId,
                                                 const proof::VerificationKey& key);

    std::optional<Program> GetProgram(ProgramId programId) const;

    /// Key recorded under `version`, current or historical
    std::optional<proof::VerificationKey> GetVerificationKey(ProgramId programId,
                                                             KeyVersion version) const;

    std::vector<Program> ListPrograms() const;
    std::vector<Program> ListProgramsByMerchant(const MerchantId& merchantId) const;

    // --- Issuance slots (coupon ledger only) ---

    /// ProgramNotFound, MerchantInactive or IssuanceCapReached on failure
    OpResult<IssuanceReservation> ReserveIssuance(ProgramId programId, Timestamp now);

    /// Turn a held slot into an issued coupon
    OpStatus CommitIssuance(uint64_t reservationId);

    /// Return a held slot
    OpStatus ReleaseIssuance(uint64_t reservationId);

    /// Release every reservation taken before `olderThan`; returns the count
    size_t ReconcileReservations(Timestamp olderThan);

    RegistryStats GetStats() const;

private:
    struct ProgramEntry {
        Program program;
        /// keyHistory[v - 1] is version v
        std::vector<proof::VerificationKey> keyHistory;
    };

    struct PendingReservation {
        ProgramId programId;
        Timestamp reservedAt;
    };

    bool ReleaseLocked(uint64_t reservationId);

    mutable std::shared_mutex mutex_;
    std::map<MerchantId, Merchant> merchants_;
    std::map<ProgramId, ProgramEntry> programs_;
    std::unordered_map<uint64_t, PendingReservation> reservations_;
    ProgramId nextProgramId_{1};
    uint64_t nextReservationId_{1};
};

} // namespace registry
} // namespace zkcoupon

#endif // ZKCOUPON_REGISTRY_REGISTRY_H
