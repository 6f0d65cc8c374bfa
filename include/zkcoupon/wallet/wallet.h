// ZKCOUPON - Wallet Directory
// Copyright (c) 2024 ZKCOUPON Developers
// MIT License
//
// Maps identity commitments to wallets. A wallet's address is derived once,
// at creation, from the identity commitment it was created with; recovery
// rebinds the wallet to a new commitment while the address stays fixed.
//
// Raw emails never reach this module. The identity service derives the
// commitment (see DeriveIdentityCommitment) and passes only that in.

#ifndef ZKCOUPON_WALLET_WALLET_H
#define ZKCOUPON_WALLET_WALLET_H

#include "zkcoupon/core/errors.h"
#include "zkcoupon/core/types.h"
#include "zkcoupon/proof/proof.h"

#include <cstdint>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace zkcoupon {

namespace proof {
class ProofVerifier;
}

namespace wallet {

// ============================================================================
// Wallet Record
// ============================================================================

struct Wallet {
    WalletAddress address;
    Commitment identityCommitment;
    Commitment recoveryCommitment;
    Timestamp createdAt{0};
    /// Incremented by every successful recovery
    uint64_t bindingGeneration{0};
    Timestamp lastRecoveredAt{0};
};

// ============================================================================
// Derivations
// ============================================================================

/// Salted one-way commitment to an email (trimmed, lower-cased first)
Commitment DeriveIdentityCommitment(const std::string& email, const std::string& salt);

/// Address a wallet created for `identityCommitment` receives
WalletAddress DeriveWalletAddress(const Commitment& identityCommitment);

// ============================================================================
// Listener
// ============================================================================

class IWalletListener {
public:
    virtual ~IWalletListener() = default;

    virtual void OnWalletCreated(const WalletAddress& /*address*/) {}

    /// The wallet now answers to a new identity; anything authorized by the
    /// previous identity must be invalidated
    virtual void OnIdentityRebound(const WalletAddress& address, uint64_t generation) = 0;
};

// ============================================================================
// Wallet Directory
// ============================================================================

class WalletDirectory {
public:
    /// `recoveryKey` verifies every recovery proof this directory accepts
    WalletDirectory(const proof::ProofVerifier& verifier, proof::VerificationKey recoveryKey);

    WalletDirectory(const WalletDirectory&) = delete;
    WalletDirectory& operator=(const WalletDirectory&) = delete;

    /**
     * Create the wallet for an identity.
     * WalletExists if the commitment is already bound or the derived
     * address is taken; InvalidArgument on null commitments.
     */
    OpResult<WalletAddress> CreateWallet(const Commitment& identityCommitment,
                                         const Commitment& recoveryCommitment);

    std::optional<WalletAddress> GetWalletAddress(const Commitment& identityCommitment) const;
    std::optional<Wallet> GetWallet(const WalletAddress& address) const;
    bool Exists(const WalletAddress& address) const;

    /**
     * Rebind a wallet to a new identity commitment.
     *
     * `recoveryProof` must be a Recovery proof over (address, stored
     * recovery commitment, newIdentityCommitment, bindingGeneration) and
     * `bindingGeneration` must be the wallet's current generation.
     *
     * Errors: WalletNotFound; RecoveryConflict if the generation is stale or
     * another recovery of the same wallet is in flight; IdentityInUse if the
     * new commitment is bound anywhere; InvalidProof.
     */
    OpStatus RecoverWallet(const WalletAddress& address,
                           const Commitment& newIdentityCommitment,
                           const proof::Proof& recoveryProof,
                           uint64_t bindingGeneration);

    const proof::VerificationKey& GetRecoveryKey() const { return recoveryKey_; }

    size_t Size() const;

    void AddListener(IWalletListener* listener);
    void RemoveListener(IWalletListener* listener);

private:
    struct Entry {
        Wallet wallet;
        bool recoveryInFlight{false};
    };

    void FinishRecovery(const WalletAddress& address);

    const proof::ProofVerifier& verifier_;
    const proof::VerificationKey recoveryKey_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<WalletAddress, Entry, Hash256Hasher> wallets_;
    std::unordered_map<Commitment, WalletAddress, Hash256Hasher> byIdentity_;

    std::mutex listenersMutex_;
    std::vector<IWalletListener*> listeners_;
};

} // namespace wallet
} // namespace zkcoupon

#endif // ZKCOUPON_WALLET_WALLET_H
