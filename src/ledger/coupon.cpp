// ZKCOUPON - Coupon Record Implementation
// Copyright (c) 2024 ZKCOUPON Developers
// MIT License

#include "zkcoupon/ledger/coupon.h"
#include "zkcoupon/crypto/sha256.h"
#include "zkcoupon/util/time.h"

#include <sstream>
#include <vector>

namespace zkcoupon {
namespace ledger {

const char* CouponStateToString(CouponState state) {
    switch (state) {
        case CouponState::Issued:   return "issued";
        case CouponState::Redeemed: return "redeemed";
        case CouponState::Expired:  return "expired";
        case CouponState::Invalid:  return "invalid";
        default:                    return "unknown";
    }
}

bool IsValidTransition(CouponState from, CouponState to) {
    return from == CouponState::Issued &&
           (to == CouponState::Redeemed || to == CouponState::Expired);
}

std::string Coupon::ToString() const {
    std::ostringstream oss;
    oss << "Coupon(" << tokenId.ShortHex()
        << ", program=" << programId
        << ", merchant=" << merchantId
        << ", owner=" << ownerWallet.ShortHex()
        << ", state=" << CouponStateToString(state)
        << ", expires=" << util::FormatISO8601(expiryDate) << ")";
    return oss.str();
}

CouponId ComputeCouponId(ProgramId programId, uint64_t slot,
                         const WalletAddress& ownerWallet,
                         const Commitment& metadataCommitment) {
    std::vector<Byte> buf;
    AppendUint64(buf, programId);
    AppendUint64(buf, slot);
    AppendHash(buf, ownerWallet);
    AppendHash(buf, metadataCommitment);
    return CouponId(TaggedHash("zkcoupon/coupon-id", buf));
}

} // namespace ledger
} // namespace zkcoupon
