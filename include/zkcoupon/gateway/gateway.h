// ZKCOUPON - Confirmation Gateway
// Copyright (c) 2024 ZKCOUPON Developers
// MIT License
//
// Issues and consumes single-use, time-limited confirmation tokens. A token
// binds one pending action to a wallet and an opaque payload; the holder
// receives it out of band (email link) and presents it to authorize exactly
// one execution of that action.
//
// Token lifecycle:
//
//   Pending --confirm/commit--> Confirmed
//      |  \--reserve--> Reserved --release--> Pending
//      |--expiry------> Expired
//      \--revocation--> Revoked
//
// Confirmed, Expired and Revoked are terminal.

#ifndef ZKCOUPON_GATEWAY_GATEWAY_H
#define ZKCOUPON_GATEWAY_GATEWAY_H

#include "zkcoupon/core/errors.h"
#include "zkcoupon/core/types.h"

#include <cstdint>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace zkcoupon {
namespace gateway {

// ============================================================================
// Token Types
// ============================================================================

enum class TokenAction : uint8_t {
    Register,
    Login,
    Redeem,
    Recover
};

const char* TokenActionToString(TokenAction action);

enum class TokenStatus : uint8_t {
    Pending,
    Reserved,
    Confirmed,
    Expired,
    Revoked
};

const char* TokenStatusToString(TokenStatus status);

struct ConfirmationToken {
    std::string token;
    TokenAction action{TokenAction::Register};
    WalletAddress targetWallet;
    std::vector<Byte> payload;
    Timestamp issuedAt{0};
    Timestamp expiresAt{0};
    bool used{false};
    TokenStatus status{TokenStatus::Pending};
    /// Time the token reached a terminal status (0 while live)
    Timestamp settledAt{0};

    bool IsTerminal() const {
        return status == TokenStatus::Confirmed ||
               status == TokenStatus::Expired ||
               status == TokenStatus::Revoked;
    }
};

/// Published for out-of-band delivery; the gateway never sends messages
struct TokenIssuedEvent {
    std::string token;
    TokenAction action;
    WalletAddress targetWallet;
    Timestamp expiresAt;
};

class IConfirmationListener {
public:
    virtual ~IConfirmationListener() = default;
    virtual void OnTokenIssued(const TokenIssuedEvent& event) = 0;
};

/// Returned by a successful Confirm
struct ConfirmedAction {
    TokenAction action;
    WalletAddress targetWallet;
    std::vector<Byte> payload;
};

/// What the consumer requires of a token it is about to act on
struct TokenExpectation {
    TokenAction action;
    WalletAddress targetWallet;
    /// Checked only when set
    std::optional<std::vector<Byte>> payload;
};

/// Handle for a reserved token
struct TokenReservation {
    uint64_t reservationId{0};
    std::string token;
};

struct GatewayConfig {
    Seconds defaultTtl{900};
    Seconds maxTtl{86400};
    /// How long settled tokens are kept before PruneExpired drops them
    Seconds retention{86400};
};

struct GatewayStats {
    uint64_t issued{0};
    uint64_t confirmed{0};
    uint64_t expired{0};
    uint64_t revoked{0};
    size_t live{0};
};

// ============================================================================
// Confirmation Gateway
// ============================================================================

class ConfirmationGateway {
public:
    explicit ConfirmationGateway(const GatewayConfig& config = GatewayConfig{});

    ConfirmationGateway(const ConfirmationGateway&) = delete;
    ConfirmationGateway& operator=(const ConfirmationGateway&) = delete;

    /**
     * Mint a new token. `ttl` of 0 selects the configured default; any
     * other value must lie in [1, maxTtl] (InvalidArgument otherwise).
     * Listeners are notified after the token is stored.
     */
    OpResult<std::string> Issue(TokenAction action, const WalletAddress& targetWallet,
                                const std::vector<Byte>& payload, Seconds ttl = 0);

    /**
     * Consume a token in one step.
     *
     * Checks in order: TokenNotFound (unknown or revoked), TokenExpired
     * (marks the token Expired), TokenAlreadyUsed (confirmed or reserved).
     * Exactly one of any number of concurrent callers succeeds.
     */
    OpResult<ConfirmedAction> Confirm(const std::string& token);

    /**
     * First phase of a two-phase consumption. Applies the Confirm checks,
     * then TokenMismatch if the token does not satisfy `expectation`. A
     * mismatch leaves the token untouched.
     */
    OpResult<TokenReservation> Reserve(const std::string& token,
                                       const TokenExpectation& expectation);

    /// Mark a reserved token as used
    OpStatus Commit(const TokenReservation& reservation);

    /// Put a reserved token back (or expire it if its time has passed)
    OpStatus Release(const TokenReservation& reservation);

    /// Revoke every pending token targeting `wallet`; returns the count
    size_t RevokeWallet(const WalletAddress& wallet);

    /// Release reservations taken before `olderThan`; returns the count
    size_t ReconcileReservations(Timestamp olderThan);

    /// Drop tokens that settled (or lapsed) more than `retention` before `now`
    size_t PruneExpired(Timestamp now);

    std::optional<ConfirmationToken> GetToken(const std::string& token) const;

    void AddListener(IConfirmationListener* listener);
    void RemoveListener(IConfirmationListener* listener);

    GatewayStats GetStats() const;
    const GatewayConfig& GetConfig() const { return config_; }

private:
    struct Entry {
        ConfirmationToken token;
        uint64_t reservationId{0};
        Timestamp reservedAt{0};
    };

    /// Shared checks for Confirm and Reserve; may expire the entry
    CouponError CheckUsable(Entry* entry, Timestamp now);

    void Settle(Entry& entry, TokenStatus status, Timestamp now);
    void NotifyIssued(const TokenIssuedEvent& event);

    const GatewayConfig config_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Entry> tokens_;
    std::unordered_map<uint64_t, std::string> reservations_;
    uint64_t nextReservationId_{1};

    uint64_t issuedCount_{0};
    uint64_t confirmedCount_{0};
    uint64_t expiredCount_{0};
    uint64_t revokedCount_{0};

    std::mutex listenersMutex_;
    std::vector<IConfirmationListener*> listeners_;
};

} // namespace gateway
} // namespace zkcoupon

#endif // ZKCOUPON_GATEWAY_GATEWAY_H
