// ZKCOUPON - Wallet Directory Implementation
// Copyright (c) 2024 ZKCOUPON Developers
// MIT License

#include "zkcoupon/wallet/wallet.h"
#include "zkcoupon/crypto/sha256.h"
#include "zkcoupon/proof/verifier.h"
#include "zkcoupon/util/logging.h"
#include "zkcoupon/util/time.h"

#include <algorithm>
#include <cctype>

namespace zkcoupon {
namespace wallet {

namespace LogCategory = util::LogCategory;

namespace {

constexpr const char* IDENTITY_TAG = "zkcoupon/identity-commitment";
constexpr const char* ADDRESS_TAG = "zkcoupon/wallet-address";

std::string NormalizeEmail(const std::string& email) {
    const char* whitespace = " \t\r\n";
    size_t start = email.find_first_not_of(whitespace);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = email.find_last_not_of(whitespace);
    std::string out = email.substr(start, end - start + 1);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace

Commitment DeriveIdentityCommitment(const std::string& email, const std::string& salt) {
    std::vector<Byte> buf;
    AppendString(buf, salt);
    AppendString(buf, NormalizeEmail(email));
    return Commitment(TaggedHash(IDENTITY_TAG, buf));
}

WalletAddress DeriveWalletAddress(const Commitment& identityCommitment) {
    std::vector<Byte> buf;
    AppendHash(buf, identityCommitment);
    return WalletAddress(TaggedHash(ADDRESS_TAG, buf));
}

// ============================================================================
// WalletDirectory
// ============================================================================

WalletDirectory::WalletDirectory(const proof::ProofVerifier& verifier,
                                 proof::VerificationKey recoveryKey)
    : verifier_(verifier), recoveryKey_(std::move(recoveryKey)) {}

OpResult<WalletAddress> WalletDirectory::CreateWallet(const Commitment& identityCommitment,
                                                      const Commitment& recoveryCommitment) {
    using Result = OpResult<WalletAddress>;

    if (identityCommitment.IsNull() || recoveryCommitment.IsNull()) {
        return Result::Failure(CouponError::InvalidArgument);
    }

    WalletAddress address = DeriveWalletAddress(identityCommitment);
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (byIdentity_.count(identityCommitment) > 0 || wallets_.count(address) > 0) {
            LOG_DEBUG(LogCategory::WALLET) << "Wallet " << address.ShortHex() << " already exists";
            return Result::Failure(CouponError::WalletExists);
        }

        Entry entry;
        entry.wallet.address = address;
        entry.wallet.identityCommitment = identityCommitment;
        entry.wallet.recoveryCommitment = recoveryCommitment;
        entry.wallet.createdAt = util::GetTime();
        wallets_.emplace(address, entry);
        byIdentity_.emplace(identityCommitment, address);
    }

    LOG_INFO(LogCategory::WALLET) << "Created wallet " << address.ShortHex();

    std::vector<IWalletListener*> listeners;
    {
        std::lock_guard<std::mutex> lock(listenersMutex_);
        listeners = listeners_;
    }
    for (auto* listener : listeners) {
        listener->OnWalletCreated(address);
    }

    return Result::Success(address);
}

std::optional<WalletAddress> WalletDirectory::GetWalletAddress(
        const Commitment& identityCommitment) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = byIdentity_.find(identityCommitment);
    if (it == byIdentity_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<Wallet> WalletDirectory::GetWallet(const WalletAddress& address) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = wallets_.find(address);
    if (it == wallets_.end()) {
        return std::nullopt;
    }
    return it->second.wallet;
}

bool WalletDirectory::Exists(const WalletAddress& address) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return wallets_.count(address) > 0;
}

size_t WalletDirectory::Size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return wallets_.size();
}

// ============================================================================
// Recovery
// ============================================================================

OpStatus WalletDirectory::RecoverWallet(const WalletAddress& address,
                                        const Commitment& newIdentityCommitment,
                                        const proof::Proof& recoveryProof,
                                        uint64_t bindingGeneration) {
    if (newIdentityCommitment.IsNull()) {
        return OpStatus::Failure(CouponError::InvalidArgument);
    }

    proof::RecoveryInputs inputs;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = wallets_.find(address);
        if (it == wallets_.end()) {
            return OpStatus::Failure(CouponError::WalletNotFound);
        }

        Entry& entry = it->second;
        if (entry.recoveryInFlight || entry.wallet.bindingGeneration != bindingGeneration) {
            LOG_INFO(LogCategory::WALLET) << "Recovery of " << address.ShortHex()
                                          << " conflicts (generation " << bindingGeneration
                                          << ", current " << entry.wallet.bindingGeneration
                                          << (entry.recoveryInFlight ? ", in flight" : "") << ")";
            return OpStatus::Failure(CouponError::RecoveryConflict);
        }
        if (byIdentity_.count(newIdentityCommitment) > 0) {
            return OpStatus::Failure(CouponError::IdentityInUse);
        }

        // Claim the wallet; concurrent attempts now fail fast
        entry.recoveryInFlight = true;
        inputs.walletAddress = address;
        inputs.recoveryCommitment = entry.wallet.recoveryCommitment;
        inputs.newIdentityCommitment = newIdentityCommitment;
        inputs.bindingGeneration = entry.wallet.bindingGeneration;
    }

    if (!verifier_.Verify(recoveryProof, inputs, recoveryKey_)) {
        FinishRecovery(address);
        LOG_INFO(LogCategory::WALLET) << "Recovery proof for " << address.ShortHex() << " rejected";
        return OpStatus::Failure(CouponError::InvalidProof);
    }

    uint64_t generation = 0;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        Entry& entry = wallets_.at(address);
        entry.recoveryInFlight = false;

        // Another wallet may have been created for the new identity while
        // the proof was being checked
        if (byIdentity_.count(newIdentityCommitment) > 0) {
            return OpStatus::Failure(CouponError::IdentityInUse);
        }

        byIdentity_.erase(entry.wallet.identityCommitment);
        byIdentity_.emplace(newIdentityCommitment, address);
        entry.wallet.identityCommitment = newIdentityCommitment;
        entry.wallet.lastRecoveredAt = util::GetTime();
        generation = ++entry.wallet.bindingGeneration;
    }

    LOG_INFO(LogCategory::WALLET) << "Wallet " << address.ShortHex()
                                  << " rebound to a new identity (generation " << generation << ")";

    std::vector<IWalletListener*> listeners;
    {
        std::lock_guard<std::mutex> lock(listenersMutex_);
        listeners = listeners_;
    }
    for (auto* listener : listeners) {
        listener->OnIdentityRebound(address, generation);
    }

    return OpStatus::Success();
}

void WalletDirectory::FinishRecovery(const WalletAddress& address) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = wallets_.find(address);
    if (it != wallets_.end()) {
        it->second.recoveryInFlight = false;
    }
}

// ============================================================================
// Listeners
// ============================================================================

void WalletDirectory::AddListener(IWalletListener* listener) {
    if (listener == nullptr) {
        return;
    }
    std::lock_guard<std::mutex> lock(listenersMutex_);
    listeners_.push_back(listener);
}

void WalletDirectory::RemoveListener(IWalletListener* listener) {
    std::lock_guard<std::mutex> lock(listenersMutex_);
    listeners_.erase(std::remove(listeners_.begin(), listeners_.end(), listener),
                     listeners_.end());
}

} // namespace wallet
} // namespace zkcoupon
