// ZKCOUPON - Proof Verifier
// Copyright (c) 2024 ZKCOUPON Developers
// MIT License
//
// Single entry point for checking issuance, redemption and recovery proofs.
// The cryptographic backend is pluggable through IProofSystem; a production
// deployment registers its SNARK verifier under its own system id.
//
// Verification is pure, thread-safe and fails closed. Callers only ever
// learn true or false.

#ifndef ZKCOUPON_PROOF_VERIFIER_H
#define ZKCOUPON_PROOF_VERIFIER_H

#include "zkcoupon/proof/proof.h"

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

namespace zkcoupon {

namespace util {
class ThreadPool;
}

namespace proof {

// ============================================================================
// Proof System Interface
// ============================================================================

/// Backend that checks opaque proof bytes against a key and an input digest
class IProofSystem {
public:
    virtual ~IProofSystem() = default;

    /// Identifier matched against VerificationKey::systemId
    virtual std::string Id() const = 0;

    virtual bool Verify(const Hash256& inputHash,
                        const std::vector<Byte>& proofData,
                        const VerificationKey& key) const = 0;
};

/**
 * Development backend.
 *
 * A proof is HMAC-SHA-256(keyData, inputHash). Anyone holding the key can
 * produce proofs, so it provides no zero-knowledge or soundness against the
 * key holder. It exists so the protocol can run end to end in tests and
 * staging without a SNARK library.
 */
class DigestProofSystem : public IProofSystem {
public:
    static constexpr const char* SYSTEM_ID = "digest-v1";

    std::string Id() const override { return SYSTEM_ID; }

    bool Verify(const Hash256& inputHash,
                const std::vector<Byte>& proofData,
                const VerificationKey& key) const override;

    /// Proof bytes this backend accepts for `inputHash` under `key`
    static std::vector<Byte> Prove(const Hash256& inputHash, const VerificationKey& key);
};

// ============================================================================
// Proof Verifier
// ============================================================================

class ProofVerifier {
public:
    /// One unit of work for VerifyBatch
    struct BatchItem {
        Proof proof;
        PublicInputs inputs;
        VerificationKey key;
    };

    struct Stats {
        uint64_t accepted{0};
        uint64_t rejected{0};
    };

    /// Create a verifier with the development backend registered
    ProofVerifier();
    ~ProofVerifier();

    ProofVerifier(const ProofVerifier&) = delete;
    ProofVerifier& operator=(const ProofVerifier&) = delete;

    /// Register (or replace) a backend under its Id()
    void RegisterSystem(std::shared_ptr<IProofSystem> system);

    bool HasSystem(const std::string& systemId) const;

    /**
     * Verify a proof against the inputs the caller is about to act on.
     *
     * Rejects when the key or proof is malformed, the kinds disagree, the
     * recomputed input digest differs from the one the proof carries, the
     * backend is unknown or the backend rejects the proof.
     */
    bool Verify(const Proof& proof, const PublicInputs& expected,
                const VerificationKey& key) const;

    /// Verify many proofs on `pool`; result[i] belongs to items[i]
    std::vector<bool> VerifyBatch(const std::vector<BatchItem>& items,
                                  util::ThreadPool& pool) const;

    Stats GetStats() const;

private:
    std::shared_ptr<IProofSystem> FindSystem(const std::string& systemId) const;

    mutable std::shared_mutex mutex_;
    std::map<std::string, std::shared_ptr<IProofSystem>> systems_;

    mutable std::atomic<uint64_t> accepted_{0};
    mutable std::atomic<uint64_t> rejected_{0};
};

// ============================================================================
// Proof Generator (for testing/development)
// ============================================================================

/**
 * Produces proofs the development backend accepts.
 *
 * In production, proofs are generated client-side by the proving service;
 * this generator stands in for it in tests and tooling.
 */
class ProofGenerator {
public:
    explicit ProofGenerator(VerificationKey key) : key_(std::move(key)) {}

    /// Fresh random development key
    static VerificationKey GenerateKey();

    Proof Generate(const PublicInputs& inputs) const;

    const VerificationKey& GetKey() const { return key_; }

private:
    VerificationKey key_;
};

} // namespace proof
} // namespace zkcoupon

#endif // ZKCOUPON_PROOF_VERIFIER_H
