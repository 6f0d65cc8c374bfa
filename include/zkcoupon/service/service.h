// ZKCOUPON - Coupon Service Context
// Copyright (c) 2024 ZKCOUPON Developers
// MIT License
//
// CouponService owns every component of a running coupon service, wires
// them together and drives periodic maintenance:
// - Proof verifier and its worker pool
// - Merchant/program registry
// - Confirmation gateway
// - Wallet directory (recovery revokes the wallet's pending tokens)
// - Coupon ledger
// - Scheduler running the reconciliation sweep

#ifndef ZKCOUPON_SERVICE_SERVICE_H
#define ZKCOUPON_SERVICE_SERVICE_H

#include "zkcoupon/core/types.h"
#include "zkcoupon/gateway/gateway.h"
#include "zkcoupon/ledger/ledger.h"
#include "zkcoupon/proof/verifier.h"
#include "zkcoupon/registry/registry.h"
#include "zkcoupon/wallet/wallet.h"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace zkcoupon {

namespace util {
class ConfigManager;
class Scheduler;
class ThreadPool;
}

namespace service {

// ============================================================================
// Service Options
// ============================================================================

/**
 * Options for service initialization.
 * Populated from the config file and command line.
 */
struct ServiceOptions {
    /// Confirmation tokens
    Seconds tokenTtl{900};
    Seconds tokenMaxTtl{86400};
    Seconds tokenRetention{86400};

    /// Reservations older than this are rolled back
    Seconds reservationTimeout{60};

    /// Period of the reconciliation sweep (0 disables it)
    Seconds reconcileInterval{300};

    /// Deployment salt for identity commitments
    std::string walletSalt;

    /// Proof verification workers (0 = hardware concurrency)
    size_t verifierThreads{0};

    /// Logging
    std::string logLevel{"info"};
    std::string logFile;
    bool logConsole{true};

    /// Key for wallet recovery proofs; a development key is generated when unset
    std::optional<proof::VerificationKey> recoveryKey;

    static ServiceOptions FromConfig(const util::ConfigManager& config);

    /// Human-readable problems; empty when the options are usable
    std::vector<std::string> Validate() const;
};

/// Install console/file sinks and the level named by `options`
void SetupLogging(const ServiceOptions& options);

struct ServiceStats {
    registry::RegistryStats registry;
    gateway::GatewayStats gateway;
    ledger::LedgerStats ledger;
    proof::ProofVerifier::Stats proofs;
    size_t wallets{0};
    uint64_t reconcileRuns{0};
};

// ============================================================================
// Coupon Service
// ============================================================================

class CouponService {
public:
    /// @throws std::invalid_argument if `options` fail validation
    explicit CouponService(const ServiceOptions& options = ServiceOptions{});
    ~CouponService();

    CouponService(const CouponService&) = delete;
    CouponService& operator=(const CouponService&) = delete;

    // --- Components ---

    proof::ProofVerifier& Verifier() { return *verifier_; }
    registry::MerchantRegistry& Registry() { return *registry_; }
    gateway::ConfirmationGateway& Gateway() { return *gateway_; }
    wallet::WalletDirectory& Wallets() { return *wallets_; }
    ledger::CouponLedger& Ledger() { return *ledger_; }
    util::ThreadPool& Pool() { return *pool_; }

    const ServiceOptions& Options() const { return options_; }

    // --- Identity ---

    /// Identity commitment for an email under this deployment's salt
    Commitment IdentityCommitmentForEmail(const std::string& email) const;

    // --- Proofs ---

    /// Verify many proofs on the service pool
    std::vector<bool> VerifyBatch(const std::vector<proof::ProofVerifier::BatchItem>& items);

    // --- Maintenance ---

    /// One reconciliation pass at the current time
    ledger::ReconcileSummary Reconcile();

    /// Schedule Reconcile every reconcileInterval
    void StartMaintenance();
    void StopMaintenance();
    bool IsMaintenanceRunning() const;

    ServiceStats GetStats() const;

private:
    /// Revokes a wallet's pending tokens when its identity is rebound
    class TokenRevoker : public wallet::IWalletListener {
    public:
        explicit TokenRevoker(gateway::ConfirmationGateway& gateway) : gateway_(gateway) {}
        void OnIdentityRebound(const WalletAddress& address, uint64_t generation) override;

    private:
        gateway::ConfirmationGateway& gateway_;
    };

    ServiceOptions options_;

    std::unique_ptr<util::ThreadPool> pool_;
    std::unique_ptr<proof::ProofVerifier> verifier_;
    std::unique_ptr<registry::MerchantRegistry> registry_;
    std::unique_ptr<gateway::ConfirmationGateway> gateway_;
    std::unique_ptr<wallet::WalletDirectory> wallets_;
    std::unique_ptr<ledger::CouponLedger> ledger_;
    std::unique_ptr<TokenRevoker> revoker_;
    std::unique_ptr<util::Scheduler> scheduler_;

    mutable std::mutex maintenanceMutex_;
    std::optional<uint64_t> reconcileTaskId_;
    std::atomic<uint64_t> reconcileRuns_{0};
};

} // namespace service
} // namespace zkcoupon

#endif // ZKCOUPON_SERVICE_SERVICE_H
