// ZKCOUPON - Confirmation Gateway Implementation
// Copyright (c) 2024 ZKCOUPON Developers
// MIT License

#include "zkcoupon/gateway/gateway.h"
#include "zkcoupon/core/random.h"
#include "zkcoupon/util/logging.h"
#include "zkcoupon/util/time.h"

#include <algorithm>

namespace zkcoupon {
namespace gateway {

namespace LogCategory = util::LogCategory;

namespace {

/// 256 bits of entropy per token
constexpr size_t TOKEN_BYTES = 32;

} // namespace

const char* TokenActionToString(TokenAction action) {
    switch (action) {
        case TokenAction::Register: return "register";
        case TokenAction::Login:    return "login";
        case TokenAction::Redeem:   return "redeem";
        case TokenAction::Recover:  return "recover";
        default:                    return "unknown";
    }
}

const char* TokenStatusToString(TokenStatus status) {
    switch (status) {
        case TokenStatus::Pending:   return "pending";
        case TokenStatus::Reserved:  return "reserved";
        case TokenStatus::Confirmed: return "confirmed";
        case TokenStatus::Expired:   return "expired";
        case TokenStatus::Revoked:   return "revoked";
        default:                     return "unknown";
    }
}

ConfirmationGateway::ConfirmationGateway(const GatewayConfig& config) : config_(config) {}

// ============================================================================
// Issue
// ============================================================================

OpResult<std::string> ConfirmationGateway::Issue(TokenAction action,
                                                 const WalletAddress& targetWallet,
                                                 const std::vector<Byte>& payload,
                                                 Seconds ttl) {
    if (ttl == 0) {
        ttl = config_.defaultTtl;
    }
    if (ttl < 1 || ttl > config_.maxTtl || targetWallet.IsNull()) {
        return OpResult<std::string>::Failure(CouponError::InvalidArgument);
    }

    Timestamp now = util::GetTime();

    Entry entry;
    entry.token.action = action;
    entry.token.targetWallet = targetWallet;
    entry.token.payload = payload;
    entry.token.issuedAt = now;
    entry.token.expiresAt = now + ttl;

    TokenIssuedEvent event;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        // A collision at 256 bits means the CSPRNG is broken; redraw anyway
        do {
            entry.token.token = GenerateSecureHex(TOKEN_BYTES);
        } while (tokens_.count(entry.token.token) > 0);

        event = TokenIssuedEvent{entry.token.token, action, targetWallet,
                                 entry.token.expiresAt};
        tokens_.emplace(entry.token.token, entry);
        ++issuedCount_;
    }

    LOG_DEBUG(LogCategory::GATEWAY) << "Issued " << TokenActionToString(action) << " token "
                                    << util::Redact(event.token) << " for wallet "
                                    << targetWallet.ShortHex() << " (ttl "
                                    << util::FormatDuration(ttl) << ")";

    NotifyIssued(event);
    return OpResult<std::string>::Success(event.token);
}

// ============================================================================
// Consumption
// ============================================================================

CouponError ConfirmationGateway::CheckUsable(Entry* entry, Timestamp now) {
    if (entry == nullptr || entry->token.status == TokenStatus::Revoked) {
        return CouponError::TokenNotFound;
    }

    ConfirmationToken& token = entry->token;
    if (token.status == TokenStatus::Expired) {
        return CouponError::TokenExpired;
    }
    if (now > token.expiresAt) {
        if (token.status == TokenStatus::Pending) {
            Settle(*entry, TokenStatus::Expired, now);
        }
        return CouponError::TokenExpired;
    }
    if (token.used || token.status != TokenStatus::Pending) {
        return CouponError::TokenAlreadyUsed;
    }
    return CouponError::OK;
}

OpResult<ConfirmedAction> ConfirmationGateway::Confirm(const std::string& token) {
    using Result = OpResult<ConfirmedAction>;
    Timestamp now = util::GetTime();

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = tokens_.find(token);
    Entry* entry = it == tokens_.end() ? nullptr : &it->second;

    CouponError err = CheckUsable(entry, now);
    if (err != CouponError::OK) {
        LOG_DEBUG(LogCategory::GATEWAY) << "Confirm of " << util::Redact(token)
                                        << " rejected: " << CouponErrorToString(err);
        return Result::Failure(err);
    }

    Settle(*entry, TokenStatus::Confirmed, now);

    const ConfirmationToken& t = entry->token;
    return Result::Success(ConfirmedAction{t.action, t.targetWallet, t.payload});
}

OpResult<TokenReservation> ConfirmationGateway::Reserve(const std::string& token,
                                                        const TokenExpectation& expectation) {
    using Result = OpResult<TokenReservation>;
    Timestamp now = util::GetTime();

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = tokens_.find(token);
    Entry* entry = it == tokens_.end() ? nullptr : &it->second;

    CouponError err = CheckUsable(entry, now);
    if (err != CouponError::OK) {
        return Result::Failure(err);
    }

    const ConfirmationToken& t = entry->token;
    if (t.action != expectation.action ||
        t.targetWallet != expectation.targetWallet ||
        (expectation.payload && *expectation.payload != t.payload)) {
        LOG_INFO(LogCategory::GATEWAY) << "Token " << util::Redact(token)
                                       << " does not match the requested "
                                       << TokenActionToString(expectation.action) << " action";
        return Result::Failure(CouponError::TokenMismatch);
    }

    entry->token.status = TokenStatus::Reserved;
    entry->reservationId = nextReservationId_++;
    entry->reservedAt = now;
    reservations_.emplace(entry->reservationId, token);

    return Result::Success(TokenReservation{entry->reservationId, token});
}

OpStatus ConfirmationGateway::Commit(const TokenReservation& reservation) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto rit = reservations_.find(reservation.reservationId);
    if (rit == reservations_.end() || rit->second != reservation.token) {
        return OpStatus::Failure(CouponError::TokenNotFound);
    }

    Entry& entry = tokens_.at(rit->second);
    reservations_.erase(rit);
    entry.reservationId = 0;
    Settle(entry, TokenStatus::Confirmed, util::GetTime());
    return OpStatus::Success();
}

OpStatus ConfirmationGateway::Release(const TokenReservation& reservation) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto rit = reservations_.find(reservation.reservationId);
    if (rit == reservations_.end() || rit->second != reservation.token) {
        return OpStatus::Failure(CouponError::TokenNotFound);
    }

    Entry& entry = tokens_.at(rit->second);
    reservations_.erase(rit);
    entry.reservationId = 0;

    Timestamp now = util::GetTime();
    if (now > entry.token.expiresAt) {
        Settle(entry, TokenStatus::Expired, now);
    } else {
        entry.token.status = TokenStatus::Pending;
    }
    return OpStatus::Success();
}

void ConfirmationGateway::Settle(Entry& entry, TokenStatus status, Timestamp now) {
    entry.token.status = status;
    entry.token.settledAt = now;
    switch (status) {
        case TokenStatus::Confirmed:
            entry.token.used = true;
            ++confirmedCount_;
            break;
        case TokenStatus::Expired:
            ++expiredCount_;
            break;
        case TokenStatus::Revoked:
            ++revokedCount_;
            break;
        default:
            break;
    }
}

// ============================================================================
// Maintenance
// ============================================================================

size_t ConfirmationGateway::RevokeWallet(const WalletAddress& wallet) {
    Timestamp now = util::GetTime();
    size_t revoked = 0;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        for (auto& [key, entry] : tokens_) {
            if (entry.token.status == TokenStatus::Pending &&
                entry.token.targetWallet == wallet) {
                Settle(entry, TokenStatus::Revoked, now);
                ++revoked;
            }
        }
    }

    if (revoked > 0) {
        LOG_INFO(LogCategory::GATEWAY) << "Revoked " << revoked << " pending tokens for wallet "
                                       << wallet.ShortHex();
    }
    return revoked;
}

size_t ConfirmationGateway::ReconcileReservations(Timestamp olderThan) {
    Timestamp now = util::GetTime();
    size_t released = 0;

    std::unique_lock<std::shared_mutex> lock(mutex_);
    for (auto rit = reservations_.begin(); rit != reservations_.end();) {
        Entry& entry = tokens_.at(rit->second);
        if (entry.reservedAt >= olderThan) {
            ++rit;
            continue;
        }
        entry.reservationId = 0;
        if (now > entry.token.expiresAt) {
            Settle(entry, TokenStatus::Expired, now);
        } else {
            entry.token.status = TokenStatus::Pending;
        }
        rit = reservations_.erase(rit);
        ++released;
    }

    if (released > 0) {
        LOG_WARN(LogCategory::GATEWAY) << "Released " << released << " stale token reservations";
    }
    return released;
}

size_t ConfirmationGateway::PruneExpired(Timestamp now) {
    size_t pruned = 0;

    std::unique_lock<std::shared_mutex> lock(mutex_);
    for (auto it = tokens_.begin(); it != tokens_.end();) {
        ConfirmationToken& token = it->second.token;
        if (token.status == TokenStatus::Pending && now > token.expiresAt) {
            Settle(it->second, TokenStatus::Expired, token.expiresAt);
        }
        if (token.IsTerminal() && token.settledAt + config_.retention < now) {
            it = tokens_.erase(it);
            ++pruned;
        } else {
            ++it;
        }
    }

    if (pruned > 0) {
        LOG_DEBUG(LogCategory::GATEWAY) << "Pruned " << pruned << " settled tokens";
    }
    return pruned;
}

std::optional<ConfirmationToken> ConfirmationGateway::GetToken(const std::string& token) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = tokens_.find(token);
    if (it == tokens_.end()) {
        return std::nullopt;
    }
    return it->second.token;
}

// ============================================================================
// Listeners
// ============================================================================

void ConfirmationGateway::AddListener(IConfirmationListener* listener) {
    if (listener == nullptr) {
        return;
    }
    std::lock_guard<std::mutex> lock(listenersMutex_);
    listeners_.push_back(listener);
}

void ConfirmationGateway::RemoveListener(IConfirmationListener* listener) {
    std::lock_guard<std::mutex> lock(listenersMutex_);
    listeners_.erase(std::remove(listeners_.begin(), listeners_.end(), listener),
                     listeners_.end());
}

void ConfirmationGateway::NotifyIssued(const TokenIssuedEvent& event) {
    std::vector<IConfirmationListener*> listeners;
    {
        std::lock_guard<std::mutex> lock(listenersMutex_);
        listeners = listeners_;
    }
    for (auto* listener : listeners) {
        listener->OnTokenIssued(event);
    }
}

GatewayStats ConfirmationGateway::GetStats() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    GatewayStats stats;
    stats.issued = issuedCount_;
    stats.confirmed = confirmedCount_;
    stats.expired = expiredCount_;
    stats.revoked = revokedCount_;
    for (const auto& [key, entry] : tokens_) {
        if (!entry.token.IsTerminal()) {
            ++stats.live;
        }
    }
    return stats;
}

} // namespace gateway
} // namespace zkcoupon
