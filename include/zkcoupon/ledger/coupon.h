// ZKCOUPON - Coupon Record
// Copyright (c) 2024 ZKCOUPON Developers
// MIT License

#ifndef ZKCOUPON_LEDGER_COUPON_H
#define ZKCOUPON_LEDGER_COUPON_H

#include "zkcoupon/core/types.h"

#include <cstdint>
#include <string>

namespace zkcoupon {
namespace ledger {

/// Coupon lifecycle: Issued -> {Redeemed, Expired}. Invalid marks a rejected
/// attempt and is never stored.
enum class CouponState : uint8_t {
    Issued,
    Redeemed,
    Expired,
    Invalid
};

const char* CouponStateToString(CouponState state);

/// True only for the forward edges of the lifecycle
bool IsValidTransition(CouponState from, CouponState to);

struct Coupon {
    CouponId tokenId;
    MerchantId merchantId;
    ProgramId programId{0};
    WalletAddress ownerWallet;
    Commitment metadataCommitment;
    Timestamp issuedAt{0};
    Timestamp expiryDate{0};
    /// Program key version the coupon was issued under
    KeyVersion keyVersion{0};
    CouponState state{CouponState::Issued};
    Timestamp redeemedAt{0};

    bool IsValidAt(Timestamp now) const {
        return state == CouponState::Issued && now < expiryDate;
    }

    /// Stored state with lapsed Issued coupons reported as Expired
    CouponState EffectiveState(Timestamp now) const {
        if (state == CouponState::Issued && now >= expiryDate) {
            return CouponState::Expired;
        }
        return state;
    }

    std::string ToString() const;
};

/// Identifier of the coupon minted from issuance slot `slot`
CouponId ComputeCouponId(ProgramId programId, uint64_t slot,
                         const WalletAddress& ownerWallet,
                         const Commitment& metadataCommitment);

} // namespace ledger
} // namespace zkcoupon

#endif // ZKCOUPON_LEDGER_COUPON_H
