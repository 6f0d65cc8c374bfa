// ZKCOUPON - Proof Verifier Implementation
// Copyright (c) 2024 ZKCOUPON Developers
// MIT License

#include "zkcoupon/proof/verifier.h"
#include "zkcoupon/core/random.h"
#include "zkcoupon/crypto/sha256.h"
#include "zkcoupon/util/logging.h"
#include "zkcoupon/util/threadpool.h"

#include <future>
#include <mutex>

namespace zkcoupon {
namespace proof {

// ============================================================================
// DigestProofSystem
// ============================================================================

bool DigestProofSystem::Verify(const Hash256& inputHash,
                               const std::vector<Byte>& proofData,
                               const VerificationKey& key) const {
    if (proofData.size() != Hash256::SIZE) {
        return false;
    }
    Hash256 expected = HMACSHA256(key.keyData.data(), key.keyData.size(),
                                  inputHash.data(), inputHash.size());
    return ConstantTimeEqual(expected.data(), expected.size(),
                             proofData.data(), proofData.size());
}

std::vector<Byte> DigestProofSystem::Prove(const Hash256& inputHash,
                                           const VerificationKey& key) {
    Hash256 mac = HMACSHA256(key.keyData.data(), key.keyData.size(),
                             inputHash.data(), inputHash.size());
    return std::vector<Byte>(mac.begin(), mac.end());
}

// ============================================================================
// ProofVerifier
// ============================================================================

ProofVerifier::ProofVerifier() {
    RegisterSystem(std::make_shared<DigestProofSystem>());
}

ProofVerifier::~ProofVerifier() = default;

void ProofVerifier::RegisterSystem(std::shared_ptr<IProofSystem> system) {
    if (!system) {
        return;
    }
    std::string id = system->Id();
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        systems_[id] = std::move(system);
    }
    LOG_INFO(util::LogCategory::PROOF) << "Registered proof system '" << id << "'";
}

bool ProofVerifier::HasSystem(const std::string& systemId) const {
    return FindSystem(systemId) != nullptr;
}

std::shared_ptr<IProofSystem> ProofVerifier::FindSystem(const std::string& systemId) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = systems_.find(systemId);
    return it == systems_.end() ? nullptr : it->second;
}

bool ProofVerifier::Verify(const Proof& proof, const PublicInputs& expected,
                           const VerificationKey& key) const {
    auto reject = [this](const char* stage) {
        rejected_.fetch_add(1, std::memory_order_relaxed);
        LOG_DEBUG(util::LogCategory::PROOF) << "Proof rejected at " << stage;
        return false;
    };

    if (!key.IsValid()) {
        return reject("key check");
    }
    if (!proof.IsWellFormed()) {
        return reject("structure check");
    }
    if (proof.GetKind() != GetProofKind(expected)) {
        return reject("kind check");
    }

    Hash256 inputHash = PublicInputHash(expected);
    if (!ConstantTimeEqual(inputHash, proof.GetInputHash())) {
        return reject("input binding");
    }

    auto system = FindSystem(key.systemId);
    if (!system) {
        return reject("backend lookup");
    }

    bool ok = false;
    try {
        ok = system->Verify(inputHash, proof.GetData(), key);
    } catch (const std::exception& e) {
        LOG_WARN(util::LogCategory::PROOF) << "Proof system '" << key.systemId
                                           << "' threw: " << e.what();
        ok = false;
    }
    if (!ok) {
        return reject("backend");
    }

    accepted_.fetch_add(1, std::memory_order_relaxed);
    return true;
}

std::vector<bool> ProofVerifier::VerifyBatch(const std::vector<BatchItem>& items,
                                             util::ThreadPool& pool) const {
    std::vector<std::future<bool>> futures;
    futures.reserve(items.size());
    for (const auto& item : items) {
        futures.push_back(pool.Submit([this, &item]() {
            return Verify(item.proof, item.inputs, item.key);
        }));
    }

    std::vector<bool> results;
    results.reserve(items.size());
    for (auto& f : futures) {
        results.push_back(f.get());
    }

    LOG_DEBUG(util::LogCategory::PROOF) << "Batch verified " << items.size() << " proofs";
    return results;
}

ProofVerifier::Stats ProofVerifier::GetStats() const {
    Stats stats;
    stats.accepted = accepted_.load();
    stats.rejected = rejected_.load();
    return stats;
}

// ============================================================================
// ProofGenerator
// ============================================================================

VerificationKey ProofGenerator::GenerateKey() {
    VerificationKey key;
    key.systemId = DigestProofSystem::SYSTEM_ID;
    key.keyData.resize(32);
    GetRandBytes(key.keyData.data(), key.keyData.size());
    return key;
}

Proof ProofGenerator::Generate(const PublicInputs& inputs) const {
    Hash256 inputHash = PublicInputHash(inputs);
    return Proof(GetProofKind(inputs), inputHash,
                 DigestProofSystem::Prove(inputHash, key_));
}

} // namespace proof
} // namespace zkcoupon
