// ZKCOUPON - Error Codes Implementation
// Copyright (c) 2024 ZKCOUPON Developers
// MIT License

#include "zkcoupon/core/errors.h"

#include <utility>

namespace zkcoupon {

namespace {

constexpr std::pair<CouponError, const char*> ERROR_NAMES[] = {
    {CouponError::OK, "OK"},
    {CouponError::InvalidArgument, "InvalidArgument"},
    {CouponError::InvalidProgramParams, "InvalidProgramParams"},
    {CouponError::MerchantInactive, "MerchantInactive"},
    {CouponError::Unauthorized, "Unauthorized"},
    {CouponError::TokenMismatch, "TokenMismatch"},
    {CouponError::MerchantNotFound, "MerchantNotFound"},
    {CouponError::ProgramNotFound, "ProgramNotFound"},
    {CouponError::CouponNotFound, "CouponNotFound"},
    {CouponError::WalletNotFound, "WalletNotFound"},
    {CouponError::TokenNotFound, "TokenNotFound"},
    {CouponError::MerchantExists, "MerchantExists"},
    {CouponError::IssuanceCapReached, "IssuanceCapReached"},
    {CouponError::CouponAlreadyRedeemed, "CouponAlreadyRedeemed"},
    {CouponError::RedemptionInProgress, "RedemptionInProgress"},
    {CouponError::TokenAlreadyUsed, "TokenAlreadyUsed"},
    {CouponError::WalletExists, "WalletExists"},
    {CouponError::IdentityInUse, "IdentityInUse"},
    {CouponError::RecoveryConflict, "RecoveryConflict"},
    {CouponError::CouponExpired, "CouponExpired"},
    {CouponError::TokenExpired, "TokenExpired"},
    {CouponError::InvalidProof, "InvalidProof"},
};

} // namespace

const char* CouponErrorToString(CouponError err) {
    for (const auto& entry : ERROR_NAMES) {
        if (entry.first == err) {
            return entry.second;
        }
    }
    return "Unknown";
}

std::optional<CouponError> CouponErrorFromString(const std::string& str) {
    for (const auto& entry : ERROR_NAMES) {
        if (str == entry.second) {
            return entry.first;
        }
    }
    return std::nullopt;
}

ErrorKind GetErrorKind(CouponError err) {
    switch (err) {
        case CouponError::OK:
            return ErrorKind::None;

        case CouponError::InvalidArgument:
        case CouponError::InvalidProgramParams:
        case CouponError::MerchantInactive:
        case CouponError::Unauthorized:
        case CouponError::TokenMismatch:
            return ErrorKind::Validation;

        case CouponError::MerchantNotFound:
        case CouponError::ProgramNotFound:
        case CouponError::CouponNotFound:
        case CouponError::WalletNotFound:
        case CouponError::TokenNotFound:
            return ErrorKind::NotFound;

        case CouponError::MerchantExists:
        case CouponError::IssuanceCapReached:
        case CouponError::CouponAlreadyRedeemed:
        case CouponError::RedemptionInProgress:
        case CouponError::TokenAlreadyUsed:
        case CouponError::WalletExists:
        case CouponError::IdentityInUse:
        case CouponError::RecoveryConflict:
            return ErrorKind::Conflict;

        case CouponError::CouponExpired:
        case CouponError::TokenExpired:
            return ErrorKind::Expiry;

        case CouponError::InvalidProof:
            return ErrorKind::ProofRejected;
    }
    return ErrorKind::Validation;
}

const char* ErrorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "none";
        case ErrorKind::Validation: return "validation";
        case ErrorKind::NotFound: return "not_found";
        case ErrorKind::Conflict: return "conflict";
        case ErrorKind::Expiry: return "expiry";
        case ErrorKind::ProofRejected: return "proof_rejected";
        default: return "unknown";
    }
}

} // namespace zkcoupon
