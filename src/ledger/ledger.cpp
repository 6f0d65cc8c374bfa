// ZKCOUPON - Coupon Ledger Implementation
// Copyright (c) 2024 ZKCOUPON Developers
// MIT License

#include "zkcoupon/ledger/ledger.h"
#include "zkcoupon/crypto/sha256.h"
#include "zkcoupon/gateway/gateway.h"
#include "zkcoupon/proof/verifier.h"
#include "zkcoupon/registry/registry.h"
#include "zkcoupon/util/logging.h"
#include "zkcoupon/util/time.h"
#include "zkcoupon/wallet/wallet.h"

#include <algorithm>

namespace zkcoupon {
namespace ledger {

namespace LogCategory = util::LogCategory;

CouponLedger::CouponLedger(registry::MerchantRegistry& registry,
                           gateway::ConfirmationGateway& gateway,
                           wallet::WalletDirectory& wallets,
                           const proof::ProofVerifier& verifier,
                           const LedgerConfig& config)
    : registry_(registry)
    , gateway_(gateway)
    , wallets_(wallets)
    , verifier_(verifier)
    , config_(config) {}

CouponLedger::~CouponLedger() = default;

Hash256 CouponLedger::IssueRequestKey(const IssueRequest& request) {
    std::vector<Byte> buf;
    AppendUint64(buf, request.programId);
    AppendHash(buf, request.ownerWallet);
    AppendHash(buf, request.metadataCommitment);
    AppendHash(buf, request.issuanceProof.GetHash());
    return TaggedHash("zkcoupon/issue-request", buf);
}

void CouponLedger::Reject(CouponError err, const char* op) const {
    rejectedCount_.fetch_add(1, std::memory_order_relaxed);
    LOG_DEBUG(LogCategory::LEDGER) << op << " rejected: " << CouponErrorToString(err);
}

Coupon CouponLedger::Snapshot(const Coupon& coupon, Timestamp now) const {
    Coupon copy = coupon;
    copy.state = coupon.EffectiveState(now);
    return copy;
}

// ============================================================================
// Issuance
// ============================================================================

OpResult<Coupon> CouponLedger::Issue(const IssueRequest& request) {
    using Result = OpResult<Coupon>;

    Hash256 requestKey = IssueRequestKey(request);
    Timestamp now = util::GetTime();

    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto done = completedIssues_.find(requestKey);
        if (done != completedIssues_.end()) {
            return Result::Success(Snapshot(coupons_.at(done->second), now));
        }
    }

    auto program = registry_.GetProgram(request.programId);
    if (!program) {
        Reject(CouponError::ProgramNotFound, "issue");
        return Result::Failure(CouponError::ProgramNotFound);
    }
    if (!registry_.IsMerchantActive(program->merchantId)) {
        Reject(CouponError::MerchantInactive, "issue");
        return Result::Failure(CouponError::MerchantInactive);
    }
    // Early exit only; the authoritative check is the reservation below
    if (program->Remaining() == 0) {
        Reject(CouponError::IssuanceCapReached, "issue");
        return Result::Failure(CouponError::IssuanceCapReached);
    }

    proof::IssuanceInputs expected;
    expected.programId = request.programId;
    expected.ownerWallet = request.ownerWallet;
    expected.metadataCommitment = request.metadataCommitment;
    expected.keyVersion = program->keyVersion;

    if (!program->HasKey() || request.publicInputs != expected ||
        !verifier_.Verify(request.issuanceProof, expected, program->verificationKey)) {
        Reject(CouponError::InvalidProof, "issue");
        return Result::Failure(CouponError::InvalidProof);
    }

    if (!wallets_.Exists(request.ownerWallet)) {
        Reject(CouponError::WalletNotFound, "issue");
        return Result::Failure(CouponError::WalletNotFound);
    }

    auto slot = registry_.ReserveIssuance(request.programId, now);
    if (!slot.IsValid()) {
        Reject(slot.error, "issue");
        return Result::Failure(slot.error);
    }
    if (slot.value->keyVersion != expected.keyVersion) {
        // Key rotated while the proof was being checked
        ReleaseSlot(slot.value->reservationId);
        Reject(CouponError::InvalidProof, "issue");
        return Result::Failure(CouponError::InvalidProof);
    }

    Coupon coupon;
    coupon.tokenId = ComputeCouponId(request.programId, slot.value->reservationId,
                                     request.ownerWallet, request.metadataCommitment);
    coupon.merchantId = slot.value->merchantId;
    coupon.programId = request.programId;
    coupon.ownerWallet = request.ownerWallet;
    coupon.metadataCommitment = request.metadataCommitment;
    coupon.issuedAt = now;
    coupon.expiryDate = now + slot.value->validityPeriod;
    coupon.keyVersion = expected.keyVersion;
    coupon.state = CouponState::Issued;

    {
        std::unique_lock<std::shared_mutex> lock(mutex_);

        // An identical request may have finished while this one was verifying
        auto done = completedIssues_.find(requestKey);
        if (done != completedIssues_.end()) {
            ReleaseSlot(slot.value->reservationId);
            return Result::Success(Snapshot(coupons_.at(done->second), now));
        }

        OpStatus committed = registry_.CommitIssuance(slot.value->reservationId);
        if (!committed.IsValid()) {
            // Reconciliation rolled the slot back; try to take a fresh one
            LOG_WARN(LogCategory::LEDGER) << "Issuance slot for program " << request.programId
                                          << " expired before commit";
            auto retry = registry_.ReserveIssuance(request.programId, now);
            if (!retry.IsValid()) {
                Reject(retry.error, "issue");
                return Result::Failure(retry.error);
            }
            if (retry.value->keyVersion != expected.keyVersion) {
                ReleaseSlot(retry.value->reservationId);
                Reject(CouponError::InvalidProof, "issue");
                return Result::Failure(CouponError::InvalidProof);
            }
            committed = registry_.CommitIssuance(retry.value->reservationId);
            if (!committed.IsValid()) {
                Reject(CouponError::IssuanceCapReached, "issue");
                return Result::Failure(CouponError::IssuanceCapReached);
            }
        }

        coupons_.emplace(coupon.tokenId, coupon);
        byOwner_[coupon.ownerWallet].push_back(coupon.tokenId);
        byMerchant_[coupon.merchantId].push_back(coupon.tokenId);
        ++perProgram_[coupon.programId];
        completedIssues_.emplace(requestKey, coupon.tokenId);
    }

    issuedCount_.fetch_add(1, std::memory_order_relaxed);
    LOG_INFO(LogCategory::LEDGER) << "Issued " << coupon.ToString();

    Notify(Event::Issued, {coupon});
    return Result::Success(coupon);
}

// ============================================================================
// Validity
// ============================================================================

bool CouponLedger::IsValidCoupon(const CouponId& tokenId) const {
    Timestamp now = util::GetTime();
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = coupons_.find(tokenId);
    return it != coupons_.end() && it->second.IsValidAt(now);
}

// ============================================================================
// Redemption
// ============================================================================

OpResult<std::string> CouponLedger::InitiateRedemption(const CouponId& tokenId,
                                                       const MerchantId& caller,
                                                       Seconds ttl) {
    using Result = OpResult<std::string>;
    Timestamp now = util::GetTime();

    Coupon coupon;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = coupons_.find(tokenId);
        if (it == coupons_.end()) {
            return Result::Failure(CouponError::CouponNotFound);
        }
        coupon = it->second;
    }

    if (coupon.merchantId != caller) {
        LOG_WARN(LogCategory::LEDGER) << "Merchant " << caller << " tried to redeem "
                                      << coupon.tokenId.ShortHex() << " of merchant "
                                      << coupon.merchantId;
        return Result::Failure(CouponError::Unauthorized);
    }
    if (!registry_.IsMerchantActive(caller)) {
        return Result::Failure(CouponError::MerchantInactive);
    }
    if (coupon.state == CouponState::Redeemed) {
        return Result::Failure(CouponError::CouponAlreadyRedeemed);
    }
    if (!coupon.IsValidAt(now)) {
        return Result::Failure(CouponError::CouponExpired);
    }

    std::vector<Byte> payload(tokenId.begin(), tokenId.end());
    return gateway_.Issue(gateway::TokenAction::Redeem, coupon.ownerWallet, payload, ttl);
}

OpResult<Coupon> CouponLedger::Redeem(const RedeemRequest& request) {
    using Result = OpResult<Coupon>;
    Timestamp now = util::GetTime();

    Coupon coupon;
    uint64_t couponReservation = 0;
    std::vector<Coupon> expired;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = coupons_.find(request.tokenId);
        if (it == coupons_.end()) {
            Reject(CouponError::CouponNotFound, "redeem");
            return Result::Failure(CouponError::CouponNotFound);
        }

        Coupon& stored = it->second;
        if (stored.state == CouponState::Redeemed) {
            Reject(CouponError::CouponAlreadyRedeemed, "redeem");
            return Result::Failure(CouponError::CouponAlreadyRedeemed);
        }
        bool inFlight = reservations_.count(request.tokenId) > 0;
        if (!stored.IsValidAt(now)) {
            if (inFlight) {
                // The holder of the reservation settles the coupon
                Reject(CouponError::RedemptionInProgress, "redeem");
                return Result::Failure(CouponError::RedemptionInProgress);
            }
            if (stored.state == CouponState::Issued) {
                ExpireLocked(stored, expired);
            }
        } else if (inFlight) {
            Reject(CouponError::RedemptionInProgress, "redeem");
            return Result::Failure(CouponError::RedemptionInProgress);
        } else {
            couponReservation = nextReservationId_++;
            reservations_.emplace(request.tokenId, CouponReservation{couponReservation, now});
            coupon = stored;
        }
    }

    if (couponReservation == 0) {
        Notify(Event::Expired, expired);
        Reject(CouponError::CouponExpired, "redeem");
        return Result::Failure(CouponError::CouponExpired);
    }

    // Verify against the key version the coupon was issued under
    proof::RedemptionInputs inputs;
    inputs.tokenId = coupon.tokenId;
    inputs.ownerWallet = coupon.ownerWallet;
    inputs.keyVersion = coupon.keyVersion;

    auto key = registry_.GetVerificationKey(coupon.programId, coupon.keyVersion);
    if (!key || !verifier_.Verify(request.redemptionProof, inputs, *key)) {
        ReleaseCoupon(coupon.tokenId, couponReservation);
        Reject(CouponError::InvalidProof, "redeem");
        return Result::Failure(CouponError::InvalidProof);
    }

    gateway::TokenExpectation expectation;
    expectation.action = gateway::TokenAction::Redeem;
    expectation.targetWallet = coupon.ownerWallet;
    expectation.payload = std::vector<Byte>(coupon.tokenId.begin(), coupon.tokenId.end());

    auto token = gateway_.Reserve(request.confirmationToken, expectation);
    if (!token.IsValid()) {
        ReleaseCoupon(coupon.tokenId, couponReservation);
        Reject(token.error, "redeem");
        return Result::Failure(token.error);
    }

    Timestamp redeemedAt = util::GetTime();
    CouponError failure = CouponError::OK;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto rit = reservations_.find(coupon.tokenId);
        if (rit == reservations_.end() || rit->second.id != couponReservation) {
            // Rolled back by reconciliation; someone else may hold it now
            OpStatus released = gateway_.Release(*token.value);
            if (!released.IsValid()) {
                LOG_DEBUG(LogCategory::LEDGER) << "Token reservation already rolled back";
            }
            Reject(CouponError::RedemptionInProgress, "redeem");
            return Result::Failure(CouponError::RedemptionInProgress);
        }
        reservations_.erase(rit);

        Coupon& stored = coupons_.at(coupon.tokenId);
        if (!IsValidTransition(stored.state, CouponState::Redeemed) ||
            !stored.IsValidAt(redeemedAt)) {
            // Lapsed while the proof and token were being checked
            OpStatus released = gateway_.Release(*token.value);
            if (!released.IsValid()) {
                LOG_DEBUG(LogCategory::LEDGER) << "Token reservation already rolled back";
            }
            if (stored.state == CouponState::Issued) {
                ExpireLocked(stored, expired);
            }
            failure = stored.state == CouponState::Redeemed
                          ? CouponError::CouponAlreadyRedeemed
                          : CouponError::CouponExpired;
        } else {
            OpStatus committed = gateway_.Commit(*token.value);
            if (!committed.IsValid()) {
                Reject(committed.error, "redeem");
                return Result::Failure(committed.error);
            }

            stored.state = CouponState::Redeemed;
            stored.redeemedAt = redeemedAt;
            coupon = stored;
        }
    }

    if (failure != CouponError::OK) {
        Notify(Event::Expired, expired);
        Reject(failure, "redeem");
        return Result::Failure(failure);
    }

    redeemedCount_.fetch_add(1, std::memory_order_relaxed);
    LOG_INFO(LogCategory::LEDGER) << "Redeemed " << coupon.ToString();

    Notify(Event::Redeemed, {coupon});
    return Result::Success(coupon);
}

void CouponLedger::ReleaseSlot(uint64_t reservationId) {
    OpStatus released = registry_.ReleaseIssuance(reservationId);
    if (!released.IsValid()) {
        LOG_DEBUG(LogCategory::LEDGER) << "Issuance slot " << reservationId
                                       << " already rolled back";
    }
}

bool CouponLedger::ReleaseCoupon(const CouponId& tokenId, uint64_t reservationId) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = reservations_.find(tokenId);
    if (it == reservations_.end() || it->second.id != reservationId) {
        return false;
    }
    reservations_.erase(it);
    return true;
}

void CouponLedger::ExpireLocked(Coupon& coupon, std::vector<Coupon>& expired) {
    coupon.state = CouponState::Expired;
    expiredCount_.fetch_add(1, std::memory_order_relaxed);
    expired.push_back(coupon);
}

// ============================================================================
// Reads
// ============================================================================

std::optional<Coupon> CouponLedger::GetCouponDetails(const CouponId& tokenId) const {
    Timestamp now = util::GetTime();
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = coupons_.find(tokenId);
    if (it == coupons_.end()) {
        return std::nullopt;
    }
    return Snapshot(it->second, now);
}

std::vector<Coupon> CouponLedger::GetUserCoupons(const WalletAddress& wallet) const {
    Timestamp now = util::GetTime();
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<Coupon> result;
    auto it = byOwner_.find(wallet);
    if (it != byOwner_.end()) {
        result.reserve(it->second.size());
        for (const auto& id : it->second) {
            result.push_back(Snapshot(coupons_.at(id), now));
        }
    }
    return result;
}

std::vector<Coupon> CouponLedger::GetMerchantCoupons(const MerchantId& merchantId) const {
    Timestamp now = util::GetTime();
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<Coupon> result;
    auto it = byMerchant_.find(merchantId);
    if (it != byMerchant_.end()) {
        result.reserve(it->second.size());
        for (const auto& id : it->second) {
            result.push_back(Snapshot(coupons_.at(id), now));
        }
    }
    return result;
}

size_t CouponLedger::CountProgramCoupons(ProgramId programId) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = perProgram_.find(programId);
    return it == perProgram_.end() ? 0 : it->second;
}

// ============================================================================
// Reconciliation
// ============================================================================

ReconcileSummary CouponLedger::Reconcile(Timestamp now) {
    ReconcileSummary summary;
    Timestamp cutoff = now - config_.reservationTimeout;
    std::vector<Coupon> expired;

    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        for (auto it = reservations_.begin(); it != reservations_.end();) {
            if (it->second.reservedAt < cutoff) {
                it = reservations_.erase(it);
                ++summary.couponReservationsReleased;
            } else {
                ++it;
            }
        }

        for (auto& [id, coupon] : coupons_) {
            if (coupon.state == CouponState::Issued && now >= coupon.expiryDate &&
                reservations_.count(id) == 0) {
                ExpireLocked(coupon, expired);
            }
        }
    }
    summary.couponsExpired = expired.size();

    summary.issuanceReservationsReleased = registry_.ReconcileReservations(cutoff);
    summary.tokenReservationsReleased = gateway_.ReconcileReservations(cutoff);
    summary.tokensPruned = gateway_.PruneExpired(now);

    if (summary.couponsExpired > 0 || summary.couponReservationsReleased > 0) {
        LOG_INFO(LogCategory::LEDGER) << "Reconcile: " << summary.couponsExpired
                                      << " coupons expired, "
                                      << summary.couponReservationsReleased
                                      << " coupon reservations released";
    }

    Notify(Event::Expired, expired);
    return summary;
}

LedgerStats CouponLedger::GetStats() const {
    LedgerStats stats;
    stats.issued = issuedCount_.load();
    stats.redeemed = redeemedCount_.load();
    stats.expired = expiredCount_.load();
    stats.rejected = rejectedCount_.load();
    std::shared_lock<std::shared_mutex> lock(mutex_);
    stats.coupons = coupons_.size();
    return stats;
}

// ============================================================================
// Listeners
// ============================================================================

void CouponLedger::AddListener(ILedgerListener* listener) {
    if (listener == nullptr) {
        return;
    }
    std::lock_guard<std::mutex> lock(listenersMutex_);
    listeners_.push_back(listener);
}

void CouponLedger::RemoveListener(ILedgerListener* listener) {
    std::lock_guard<std::mutex> lock(listenersMutex_);
    listeners_.erase(std::remove(listeners_.begin(), listeners_.end(), listener),
                     listeners_.end());
}

void CouponLedger::Notify(Event event, const std::vector<Coupon>& coupons) {
    if (coupons.empty()) {
        return;
    }
    std::vector<ILedgerListener*> listeners;
    {
        std::lock_guard<std::mutex> lock(listenersMutex_);
        listeners = listeners_;
    }
    for (auto* listener : listeners) {
        for (const auto& coupon : coupons) {
            switch (event) {
                case Event::Issued:   listener->OnCouponIssued(coupon); break;
                case Event::Redeemed: listener->OnCouponRedeemed(coupon); break;
                case Event::Expired:  listener->OnCouponExpired(coupon); break;
            }
        }
    }
}

} // namespace ledger
} // namespace zkcoupon
