// ZKCOUPON - Merchant and Program Registry Implementation
// Copyright (c) 2024 ZKCOUPON Developers
// MIT License

#include "zkcoupon/registry/registry.h"
#include "zkcoupon/util/logging.h"
#include "zkcoupon/util/time.h"

#include <mutex>

namespace zkcoupon {
namespace registry {

namespace LogCategory = util::LogCategory;

// ============================================================================
// Merchants
// ============================================================================

OpStatus MerchantRegistry::RegisterMerchant(const MerchantId& merchantId,
                                            const WalletAddress& walletAddress,
                                            const MerchantDetails& details) {
    if (merchantId.empty() || walletAddress.IsNull()) {
        return OpStatus::Failure(CouponError::InvalidArgument);
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (merchants_.count(merchantId) > 0) {
        LOG_DEBUG(LogCategory::REGISTRY) << "Merchant " << merchantId << " already registered";
        return OpStatus::Failure(CouponError::MerchantExists);
    }

    Merchant merchant;
    merchant.merchantId = merchantId;
    merchant.walletAddress = walletAddress;
    merchant.active = true;
    merchant.details = details;
    merchant.registeredAt = util::GetTime();
    merchants_.emplace(merchantId, std::move(merchant));

    LOG_INFO(LogCategory::REGISTRY) << "Registered merchant " << merchantId;
    return OpStatus::Success();
}

OpStatus MerchantRegistry::DeactivateMerchant(const MerchantId& merchantId) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = merchants_.find(merchantId);
    if (it == merchants_.end()) {
        return OpStatus::Failure(CouponError::MerchantNotFound);
    }
    if (it->second.active) {
        it->second.active = false;
        LOG_INFO(LogCategory::REGISTRY) << "Deactivated merchant " << merchantId;
    }
    return OpStatus::Success();
}

OpStatus MerchantRegistry::UpdateMerchantDetails(const MerchantId& merchantId,
                                                 const MerchantDetails& details) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = merchants_.find(merchantId);
    if (it == merchants_.end()) {
        return OpStatus::Failure(CouponError::MerchantNotFound);
    }
    it->second.details = details;
    return OpStatus::Success();
}

std::optional<Merchant> MerchantRegistry::GetMerchant(const MerchantId& merchantId) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = merchants_.find(merchantId);
    if (it == merchants_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool MerchantRegistry::IsMerchantActive(const MerchantId& merchantId) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = merchants_.find(merchantId);
    return it != merchants_.end() && it->second.active;
}

std::vector<Merchant> MerchantRegistry::ListMerchants() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<Merchant> result;
    result.reserve(merchants_.size());
    for (const auto& [id, merchant] : merchants_) {
        result.push_back(merchant);
    }
    return result;
}

// ============================================================================
// Programs
// ============================================================================

OpResult<ProgramId> MerchantRegistry::CreateProgram(const MerchantId& merchantId,
                                                    const ProgramParams& params) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto mit = merchants_.find(merchantId);
    if (mit == merchants_.end()) {
        return OpResult<ProgramId>::Failure(CouponError::MerchantNotFound);
    }
    if (!mit->second.active) {
        return OpResult<ProgramId>::Failure(CouponError::MerchantInactive);
    }
    if (params.maxIssuance == 0 || params.validityPeriod <= 0) {
        return OpResult<ProgramId>::Failure(CouponError::InvalidProgramParams);
    }
    if (params.verificationKey && !params.verificationKey->IsValid()) {
        return OpResult<ProgramId>::Failure(CouponError::InvalidProgramParams);
    }

    ProgramEntry entry;
    entry.program.programId = nextProgramId_++;
    entry.program.merchantId = merchantId;
    entry.program.validityPeriod = params.validityPeriod;
    entry.program.maxIssuance = params.maxIssuance;
    entry.program.createdAt = util::GetTime();
    entry.program.description = params.description;
    if (params.verificationKey) {
        entry.program.verificationKey = *params.verificationKey;
        entry.program.keyVersion = 1;
        entry.keyHistory.push_back(*params.verificationKey);
    }

    ProgramId id = entry.program.programId;
    programs_.emplace(id, std::move(entry));

    LOG_INFO(LogCategory::REGISTRY) << "Merchant " << merchantId << " created program " << id
                                    << " (cap " << params.maxIssuance
                                    << ", validity " << util::FormatDuration(params.validityPeriod)
                                    << ")";
    return OpResult<ProgramId>::Success(id);
}

OpResult<KeyVersion> MerchantRegistry::RegisterVerificationKey(
        const MerchantId& caller, ProgramId programId, const proof::VerificationKey& key) {
    if (!key.IsValid()) {
        return OpResult<KeyVersion>::Failure(CouponError::InvalidArgument);
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = programs_.find(programId);
    if (it == programs_.end()) {
        return OpResult<KeyVersion>::Failure(CouponError::ProgramNotFound);
    }

    Program& program = it->second.program;
    if (program.merchantId != caller) {
        LOG_WARN(LogCategory::REGISTRY) << "Merchant " << caller
                                        << " tried to rotate key of program " << programId;
        return OpResult<KeyVersion>::Failure(CouponError::Unauthorized);
    }

    it->second.keyHistory.push_back(key);
    program.verificationKey = key;
    program.keyVersion = static_cast<KeyVersion>(it->second.keyHistory.size());

    LOG_INFO(LogCategory::REGISTRY) << "Program " << programId << " key v" << program.keyVersion
                                    << " registered (" << key.Fingerprint().ShortHex() << ")";
    return OpResult<KeyVersion>::Success(program.keyVersion);
}

std::optional<Program> MerchantRegistry::GetProgram(ProgramId programId) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = programs_.find(programId);
    if (it == programs_.end()) {
        return std::nullopt;
    }
    return it->second.program;
}

std::optional<proof::VerificationKey> MerchantRegistry::GetVerificationKey(
        ProgramId programId, KeyVersion version) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = programs_.find(programId);
    if (it == programs_.end() || version == 0 || version > it->second.keyHistory.size()) {
        return std::nullopt;
    }
    return it->second.keyHistory[version - 1];
}

std::vector<Program> MerchantRegistry::ListPrograms() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<Program> result;
    result.reserve(programs_.size());
    for (const auto& [id, entry] : programs_) {
        result.push_back(entry.program);
    }
    return result;
}

std::vector<Program> MerchantRegistry::ListProgramsByMerchant(const MerchantId& merchantId) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<Program> result;
    for (const auto& [id, entry] : programs_) {
        if (entry.program.merchantId == merchantId) {
            result.push_back(entry.program);
        }
    }
    return result;
}

// ============================================================================
// Issuance Slots
// ============================================================================

OpResult<IssuanceReservation> MerchantRegistry::ReserveIssuance(ProgramId programId,
                                                                Timestamp now) {
    using Result = OpResult<IssuanceReservation>;

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = programs_.find(programId);
    if (it == programs_.end()) {
        return Result::Failure(CouponError::ProgramNotFound);
    }

    Program& program = it->second.program;
    auto mit = merchants_.find(program.merchantId);
    if (mit == merchants_.end() || !mit->second.active) {
        return Result::Failure(CouponError::MerchantInactive);
    }
    if (program.Remaining() == 0) {
        LOG_DEBUG(LogCategory::REGISTRY) << "Program " << programId << " cap reached ("
                                         << program.issuedCount << " issued, "
                                         << program.reservedCount << " reserved)";
        return Result::Failure(CouponError::IssuanceCapReached);
    }

    ++program.reservedCount;

    IssuanceReservation reservation;
    reservation.reservationId = nextReservationId_++;
    reservation.programId = programId;
    reservation.merchantId = program.merchantId;
    reservation.keyVersion = program.keyVersion;
    reservation.validityPeriod = program.validityPeriod;
    reservation.reservedAt = now;
    reservations_.emplace(reservation.reservationId, PendingReservation{programId, now});

    return Result::Success(reservation);
}

OpStatus MerchantRegistry::CommitIssuance(uint64_t reservationId) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto rit = reservations_.find(reservationId);
    if (rit == reservations_.end()) {
        return OpStatus::Failure(CouponError::InvalidArgument);
    }

    Program& program = programs_.at(rit->second.programId).program;
    --program.reservedCount;
    ++program.issuedCount;
    reservations_.erase(rit);
    return OpStatus::Success();
}

OpStatus MerchantRegistry::ReleaseIssuance(uint64_t reservationId) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (!ReleaseLocked(reservationId)) {
        return OpStatus::Failure(CouponError::InvalidArgument);
    }
    return OpStatus::Success();
}

bool MerchantRegistry::ReleaseLocked(uint64_t reservationId) {
    auto rit = reservations_.find(reservationId);
    if (rit == reservations_.end()) {
        return false;
    }
    --programs_.at(rit->second.programId).program.reservedCount;
    reservations_.erase(rit);
    return true;
}

size_t MerchantRegistry::ReconcileReservations(Timestamp olderThan) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    std::vector<uint64_t> stale;
    for (const auto& [id, pending] : reservations_) {
        if (pending.reservedAt < olderThan) {
            stale.push_back(id);
        }
    }
    for (uint64_t id : stale) {
        ReleaseLocked(id);
    }

    if (!stale.empty()) {
        LOG_WARN(LogCategory::REGISTRY) << "Released " << stale.size()
                                        << " stale issuance reservations";
    }
    return stale.size();
}

RegistryStats MerchantRegistry::GetStats() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    RegistryStats stats;
    stats.merchants = merchants_.size();
    for (const auto& [id, merchant] : merchants_) {
        if (merchant.active) {
            ++stats.activeMerchants;
        }
    }
    stats.programs = programs_.size();
    stats.pendingReservations = reservations_.size();
    for (const auto& [id, entry] : programs_) {
        stats.totalIssued += entry.program.issuedCount;
    }
    return stats;
}

} // namespace registry
} // namespace zkcoupon
