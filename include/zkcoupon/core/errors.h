// ZKCOUPON - Error Codes
// Copyright (c) 2024 ZKCOUPON Developers
// MIT License
//
// Stable error codes returned by every state-changing operation. Each code
// belongs to exactly one ErrorKind so callers can decide how to react
// without inspecting individual codes:
// - Validation: malformed or unauthorized input, do not retry
// - NotFound: the referenced record does not exist (a Validation failure)
// - Conflict: the slot/credential is gone, obtain a fresh one
// - Expiry: the coupon or token lapsed, restart the flow
// - ProofRejected: cryptographic rejection, reason intentionally withheld

#ifndef ZKCOUPON_CORE_ERRORS_H
#define ZKCOUPON_CORE_ERRORS_H

#include <optional>
#include <string>
#include <utility>

namespace zkcoupon {

/// Operation error codes
enum class CouponError {
    OK = 0,

    // Validation
    InvalidArgument,
    InvalidProgramParams,
    MerchantInactive,
    Unauthorized,
    TokenMismatch,

    // Not found
    MerchantNotFound,
    ProgramNotFound,
    CouponNotFound,
    WalletNotFound,
    TokenNotFound,

    // Conflict
    MerchantExists,
    IssuanceCapReached,
    CouponAlreadyRedeemed,
    RedemptionInProgress,
    TokenAlreadyUsed,
    WalletExists,
    IdentityInUse,
    RecoveryConflict,

    // Expiry
    CouponExpired,
    TokenExpired,

    // Proof
    InvalidProof,
};

/// Error categories
enum class ErrorKind {
    None,
    Validation,
    NotFound,
    Conflict,
    Expiry,
    ProofRejected
};

/// Convert error to its stable name ("IssuanceCapReached")
const char* CouponErrorToString(CouponError err);

/// Parse an error from its stable name
std::optional<CouponError> CouponErrorFromString(const std::string& str);

/// Category of an error code
ErrorKind GetErrorKind(CouponError err);

/// Convert kind to string
const char* ErrorKindToString(ErrorKind kind);

/// True when the caller must start the flow over (expiry) or fetch a fresh
/// credential (conflict); false for validation and proof failures
inline bool IsTerminalForAttempt(CouponError err) {
    ErrorKind kind = GetErrorKind(err);
    return kind == ErrorKind::Conflict || kind == ErrorKind::Expiry;
}

// ============================================================================
// Operation Results
// ============================================================================

/**
 * Outcome of an operation that yields a value on success.
 *
 * A failed result never carries a value; a successful one always does.
 */
template<typename T>
struct OpResult {
    CouponError error{CouponError::OK};
    std::optional<T> value;

    static OpResult Success(T v) {
        OpResult r;
        r.value = std::move(v);
        return r;
    }

    static OpResult Failure(CouponError err) {
        OpResult r;
        r.error = err;
        return r;
    }

    bool IsValid() const { return error == CouponError::OK; }
    const char* ErrorString() const { return CouponErrorToString(error); }
};

/// Outcome of an operation with no value
struct OpStatus {
    CouponError error{CouponError::OK};

    static OpStatus Success() { return {}; }
    static OpStatus Failure(CouponError err) { return {err}; }

    bool IsValid() const { return error == CouponError::OK; }
    const char* ErrorString() const { return CouponErrorToString(error); }
};

} // namespace zkcoupon

#endif // ZKCOUPON_CORE_ERRORS_H
