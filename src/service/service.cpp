// ZKCOUPON - Coupon Service Context Implementation
// Copyright (c) 2024 ZKCOUPON Developers
// MIT License

#include "zkcoupon/service/service.h"
#include "zkcoupon/core/hex.h"
#include "zkcoupon/util/config.h"
#include "zkcoupon/util/logging.h"
#include "zkcoupon/util/threadpool.h"
#include "zkcoupon/util/time.h"

#include <chrono>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace zkcoupon {
namespace service {

namespace LogCategory = util::LogCategory;

// ============================================================================
// ServiceOptions
// ============================================================================

ServiceOptions ServiceOptions::FromConfig(const util::ConfigManager& config) {
    namespace keys = util::ConfigKeys;

    ServiceOptions options;
    options.tokenTtl = config.GetInt(keys::TOKEN_TTL, options.tokenTtl);
    options.tokenMaxTtl = config.GetInt(keys::TOKEN_MAX_TTL, options.tokenMaxTtl);
    options.tokenRetention = config.GetInt(keys::TOKEN_RETENTION, options.tokenRetention);
    options.reservationTimeout = config.GetInt(keys::RESERVATION_TIMEOUT,
                                               options.reservationTimeout);
    options.reconcileInterval = config.GetInt(keys::RECONCILE_INTERVAL,
                                              options.reconcileInterval);
    options.walletSalt = config.GetString(keys::WALLET_SALT, options.walletSalt);

    if (auto keyHex = config.TryGetString(keys::RECOVERY_KEY)) {
        // A malformed value leaves an empty key for Validate() to report
        proof::VerificationKey key;
        key.systemId = proof::DigestProofSystem::SYSTEM_ID;
        if (auto bytes = ParseHex(*keyHex)) {
            key.keyData = std::move(*bytes);
        }
        options.recoveryKey = std::move(key);
    }

    int64_t threads = config.GetInt(keys::VERIFIER_THREADS, 0);
    options.verifierThreads = threads > 0 ? static_cast<size_t>(threads) : 0;

    options.logLevel = config.GetString(keys::LOG_LEVEL, options.logLevel);
    options.logFile = config.GetString(keys::LOG_FILE, options.logFile);
    options.logConsole = config.GetBool(keys::LOG_CONSOLE, options.logConsole);
    return options;
}

std::vector<std::string> ServiceOptions::Validate() const {
    std::vector<std::string> problems;
    if (tokenTtl < 1) {
        problems.push_back("token.ttl must be at least 1 second");
    }
    if (tokenMaxTtl < tokenTtl) {
        problems.push_back("token.maxttl must not be below token.ttl");
    }
    if (tokenRetention < 0) {
        problems.push_back("token.retention must not be negative");
    }
    if (reservationTimeout < 1) {
        problems.push_back("reservation.timeout must be at least 1 second");
    }
    if (reconcileInterval < 0) {
        problems.push_back("ledger.reconcileinterval must not be negative");
    }
    if (recoveryKey && !recoveryKey->IsValid()) {
        problems.push_back("recovery verification key is malformed");
    }
    return problems;
}

void SetupLogging(const ServiceOptions& options) {
    auto& logger = util::Logger::Instance();
    logger.Initialize();

    // Replace the default sink installed by Initialize()
    logger.ClearSinks();

    util::LogLevel level = util::LogLevelFromString(options.logLevel);
    logger.SetLevel(level);

    if (options.logConsole) {
        util::ConsoleSink::Config consoleConfig;
        consoleConfig.level = level;
        logger.AddSink(std::make_shared<util::ConsoleSink>(consoleConfig));
    }

    if (!options.logFile.empty()) {
        util::FileSink::Config fileConfig;
        fileConfig.path = options.logFile;
        auto fileSink = std::make_shared<util::FileSink>(fileConfig);
        if (fileSink->IsOpen()) {
            logger.AddSink(fileSink);
        } else {
            LOG_ERROR(LogCategory::SERVICE) << "Cannot open log file " << options.logFile;
        }
    }
}

// ============================================================================
// CouponService
// ============================================================================

void CouponService::TokenRevoker::OnIdentityRebound(const WalletAddress& address,
                                                    uint64_t generation) {
    size_t revoked = gateway_.RevokeWallet(address);
    LOG_DEBUG(LogCategory::SERVICE) << "Identity of " << address.ShortHex()
                                    << " rebound (generation " << generation << "), "
                                    << revoked << " tokens revoked";
}

CouponService::CouponService(const ServiceOptions& options) : options_(options) {
    auto problems = options_.Validate();
    if (!problems.empty()) {
        std::ostringstream oss;
        oss << "Invalid service options:";
        for (const auto& p : problems) {
            oss << " " << p << ";";
        }
        throw std::invalid_argument(oss.str());
    }

    LOG_INFO(LogCategory::SERVICE) << "Initializing coupon service...";

    util::ThreadPool::Config poolConfig;
    poolConfig.numThreads = options_.verifierThreads;
    poolConfig.name = "verifier";
    pool_ = std::make_unique<util::ThreadPool>(poolConfig);

    verifier_ = std::make_unique<proof::ProofVerifier>();
    registry_ = std::make_unique<registry::MerchantRegistry>();

    gateway::GatewayConfig gatewayConfig;
    gatewayConfig.defaultTtl = options_.tokenTtl;
    gatewayConfig.maxTtl = options_.tokenMaxTtl;
    gatewayConfig.retention = options_.tokenRetention;
    gateway_ = std::make_unique<gateway::ConfirmationGateway>(gatewayConfig);

    proof::VerificationKey recoveryKey;
    if (options_.recoveryKey) {
        recoveryKey = *options_.recoveryKey;
    } else {
        recoveryKey = proof::ProofGenerator::GenerateKey();
        LOG_WARN(LogCategory::SERVICE) << "No recovery key configured, generated development key "
                                       << recoveryKey.Fingerprint().ShortHex();
    }
    wallets_ = std::make_unique<wallet::WalletDirectory>(*verifier_, recoveryKey);

    ledger::LedgerConfig ledgerConfig;
    ledgerConfig.reservationTimeout = options_.reservationTimeout;
    ledger_ = std::make_unique<ledger::CouponLedger>(*registry_, *gateway_, *wallets_,
                                                     *verifier_, ledgerConfig);

    revoker_ = std::make_unique<TokenRevoker>(*gateway_);
    wallets_->AddListener(revoker_.get());

    scheduler_ = std::make_unique<util::Scheduler>(*pool_);

    LOG_INFO(LogCategory::SERVICE) << "Coupon service ready (token ttl "
                                   << util::FormatDuration(options_.tokenTtl)
                                   << ", " << pool_->ThreadCount() << " verifier threads)";
}

CouponService::~CouponService() {
    StopMaintenance();
    scheduler_.reset();
    pool_->Shutdown();
    wallets_->RemoveListener(revoker_.get());
    LOG_INFO(LogCategory::SERVICE) << "Coupon service stopped";
}

Commitment CouponService::IdentityCommitmentForEmail(const std::string& email) const {
    return wallet::DeriveIdentityCommitment(email, options_.walletSalt);
}

std::vector<bool> CouponService::VerifyBatch(
        const std::vector<proof::ProofVerifier::BatchItem>& items) {
    return verifier_->VerifyBatch(items, *pool_);
}

ledger::ReconcileSummary CouponService::Reconcile() {
    ledger::ReconcileSummary summary = ledger_->Reconcile(util::GetTime());
    reconcileRuns_.fetch_add(1, std::memory_order_relaxed);
    LOG_DEBUG(LogCategory::SERVICE) << "Reconcile pass: " << summary.couponsExpired
                                    << " expired, " << summary.tokensPruned << " tokens pruned";
    return summary;
}

void CouponService::StartMaintenance() {
    std::lock_guard<std::mutex> lock(maintenanceMutex_);
    if (reconcileTaskId_ || options_.reconcileInterval == 0) {
        return;
    }

    scheduler_->Start();
    auto period = std::chrono::milliseconds(options_.reconcileInterval * 1000);
    reconcileTaskId_ = scheduler_->SchedulePeriodic(period, period, [this]() { Reconcile(); });

    LOG_INFO(LogCategory::SERVICE) << "Reconciliation every "
                                   << util::FormatDuration(options_.reconcileInterval);
}

void CouponService::StopMaintenance() {
    std::lock_guard<std::mutex> lock(maintenanceMutex_);
    if (!reconcileTaskId_) {
        return;
    }
    scheduler_->Cancel(*reconcileTaskId_);
    scheduler_->Stop();
    reconcileTaskId_.reset();
}

bool CouponService::IsMaintenanceRunning() const {
    std::lock_guard<std::mutex> lock(maintenanceMutex_);
    return reconcileTaskId_.has_value();
}

ServiceStats CouponService::GetStats() const {
    ServiceStats stats;
    stats.registry = registry_->GetStats();
    stats.gateway = gateway_->GetStats();
    stats.ledger = ledger_->GetStats();
    stats.proofs = verifier_->GetStats();
    stats.wallets = wallets_->Size();
    stats.reconcileRuns = reconcileRuns_.load();
    return stats;
}

} // namespace service
} // namespace zkcoupon
