// ZKCOUPON - Coupon Ledger
// Copyright (c) 2024 ZKCOUPON Developers
// MIT License
//
// Owns coupon records and enforces the issuance/redemption state machine.
// It is the only writer of a program's issued count and the only consumer
// of Redeem confirmation tokens.
//
// Cross-component steps use reservations:
// - Issue:  reserve a cap slot -> insert coupon -> commit the slot
// - Redeem: reserve the coupon -> reserve the token -> commit both
// Any failure releases whatever was reserved, so a rejected call leaves no
// trace. Proofs are verified outside every lock.
//
// Lock order is ledger -> registry / gateway. Neither of those calls back
// into the ledger.

#ifndef ZKCOUPON_LEDGER_LEDGER_H
#define ZKCOUPON_LEDGER_LEDGER_H

#include "zkcoupon/core/errors.h"
#include "zkcoupon/core/types.h"
#include "zkcoupon/ledger/coupon.h"
#include "zkcoupon/proof/proof.h"

#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace zkcoupon {

namespace registry {
class MerchantRegistry;
}
namespace gateway {
class ConfirmationGateway;
}
namespace wallet {
class WalletDirectory;
}
namespace proof {
class ProofVerifier;
}

namespace ledger {

// ============================================================================
// Requests and Results
// ============================================================================

struct IssueRequest {
    ProgramId programId{0};
    WalletAddress ownerWallet;
    Commitment metadataCommitment;
    proof::Proof issuanceProof;
    /// What the prover claims to have proven; must match the ledger's view
    proof::IssuanceInputs publicInputs;
};

struct RedeemRequest {
    CouponId tokenId;
    proof::Proof redemptionProof;
    std::string confirmationToken;
};

/// What one Reconcile pass did
struct ReconcileSummary {
    size_t couponsExpired{0};
    size_t couponReservationsReleased{0};
    size_t issuanceReservationsReleased{0};
    size_t tokenReservationsReleased{0};
    size_t tokensPruned{0};
};

struct LedgerStats {
    uint64_t issued{0};
    uint64_t redeemed{0};
    uint64_t expired{0};
    uint64_t rejected{0};
    size_t coupons{0};
};

struct LedgerConfig {
    /// Reservations older than this are rolled back by Reconcile
    Seconds reservationTimeout{60};
};

// ============================================================================
// Listener
// ============================================================================

class ILedgerListener {
public:
    virtual ~ILedgerListener() = default;
    virtual void OnCouponIssued(const Coupon& /*coupon*/) {}
    virtual void OnCouponRedeemed(const Coupon& /*coupon*/) {}
    virtual void OnCouponExpired(const Coupon& /*coupon*/) {}
};

// ============================================================================
// Coupon Ledger
// ============================================================================

class CouponLedger {
public:
    CouponLedger(registry::MerchantRegistry& registry,
                 gateway::ConfirmationGateway& gateway,
                 wallet::WalletDirectory& wallets,
                 const proof::ProofVerifier& verifier,
                 const LedgerConfig& config = LedgerConfig{});
    ~CouponLedger();

    CouponLedger(const CouponLedger&) = delete;
    CouponLedger& operator=(const CouponLedger&) = delete;

    /**
     * Mint a coupon.
     *
     * Errors, in check order: ProgramNotFound, MerchantInactive,
     * IssuanceCapReached, InvalidProof, WalletNotFound. Retrying a request
     * that already succeeded returns the same coupon without a second
     * mutation.
     */
    OpResult<Coupon> Issue(const IssueRequest& request);

    /// state == Issued && now < expiryDate, computed at call time
    bool IsValidCoupon(const CouponId& tokenId) const;

    /**
     * Start a redemption: issue a Redeem token bound to the coupon's owner
     * with the tokenId as payload. Only the coupon's merchant may call this.
     */
    OpResult<std::string> InitiateRedemption(const CouponId& tokenId,
                                             const MerchantId& caller,
                                             Seconds ttl = 0);

    /**
     * Redeem a coupon.
     *
     * Errors, in check order: CouponNotFound, CouponAlreadyRedeemed,
     * CouponExpired, RedemptionInProgress, InvalidProof, then the token
     * errors from the gateway (TokenNotFound, TokenExpired, TokenAlreadyUsed,
     * TokenMismatch). On success the coupon is Redeemed and the token used.
     */
    OpResult<Coupon> Redeem(const RedeemRequest& request);

    /// Coupon as of now; lapsed coupons are reported as Expired
    std::optional<Coupon> GetCouponDetails(const CouponId& tokenId) const;
    std::vector<Coupon> GetUserCoupons(const WalletAddress& wallet) const;
    std::vector<Coupon> GetMerchantCoupons(const MerchantId& merchantId) const;

    /// Number of coupons minted for a program
    size_t CountProgramCoupons(ProgramId programId) const;

    /// Materialize expiries, roll back stale reservations and prune tokens
    ReconcileSummary Reconcile(Timestamp now);

    LedgerStats GetStats() const;

    void AddListener(ILedgerListener* listener);
    void RemoveListener(ILedgerListener* listener);

private:
    struct CouponReservation {
        uint64_t id;
        Timestamp reservedAt;
    };

    enum class Event { Issued, Redeemed, Expired };

    static Hash256 IssueRequestKey(const IssueRequest& request);

    void Reject(CouponError err, const char* op) const;
    void ReleaseSlot(uint64_t reservationId);
    bool ReleaseCoupon(const CouponId& tokenId, uint64_t reservationId);
    void ExpireLocked(Coupon& coupon, std::vector<Coupon>& expired);
    void Notify(Event event, const std::vector<Coupon>& coupons);
    Coupon Snapshot(const Coupon& coupon, Timestamp now) const;

    registry::MerchantRegistry& registry_;
    gateway::ConfirmationGateway& gateway_;
    wallet::WalletDirectory& wallets_;
    const proof::ProofVerifier& verifier_;
    const LedgerConfig config_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<CouponId, Coupon, Hash256Hasher> coupons_;
    std::unordered_map<WalletAddress, std::vector<CouponId>, Hash256Hasher> byOwner_;
    std::map<MerchantId, std::vector<CouponId>> byMerchant_;
    std::unordered_map<ProgramId, size_t> perProgram_;
    std::unordered_map<Hash256, CouponId, Hash256Hasher> completedIssues_;
    std::unordered_map<CouponId, CouponReservation, Hash256Hasher> reservations_;
    uint64_t nextReservationId_{1};

    std::atomic<uint64_t> issuedCount_{0};
    std::atomic<uint64_t> redeemedCount_{0};
    std::atomic<uint64_t> expiredCount_{0};
    mutable std::atomic<uint64_t> rejectedCount_{0};

    std::mutex listenersMutex_;
    std::vector<ILedgerListener*> listeners_;
};

} // namespace ledger
} // namespace zkcoupon

#endif // ZKCOUPON_LEDGER_LEDGER_H
