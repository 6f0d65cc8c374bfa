// ZKCOUPON - Coupon Ledger Tests
// Copyright (c) 2024 ZKCOUPON Developers
// MIT License

#include <gtest/gtest.h>

#include "zkcoupon/crypto/sha256.h"
#include "zkcoupon/gateway/gateway.h"
#include "zkcoupon/ledger/ledger.h"
#include "zkcoupon/proof/verifier.h"
#include "zkcoupon/registry/registry.h"
#include "zkcoupon/util/time.h"
#include "zkcoupon/wallet/wallet.h"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace zkcoupon {
namespace ledger {
namespace {

Commitment C(const std::string& seed) {
    return Commitment(SHA256Hash(std::vector<Byte>(seed.begin(), seed.end())));
}

class ExpiryRecorder : public ILedgerListener {
public:
    void OnCouponIssued(const Coupon&) override { ++issued; }
    void OnCouponRedeemed(const Coupon&) override { ++redeemed; }
    void OnCouponExpired(const Coupon& coupon) override { expired.push_back(coupon.tokenId); }

    std::atomic<int> issued{0};
    std::atomic<int> redeemed{0};
    std::vector<CouponId> expired;
};

// Backend that parks every Verify call while closed
class GatedProofSystem : public proof::IProofSystem {
public:
    std::string Id() const override { return "gated"; }

    bool Verify(const Hash256&, const std::vector<Byte>& proofData,
                const proof::VerificationKey&) const override {
        std::unique_lock<std::mutex> lock(mutex_);
        entered_ = true;
        cv_.notify_all();
        cv_.wait(lock, [this] { return !closed_; });
        return !proofData.empty();
    }

    void Close() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        entered_ = false;
    }

    void WaitEntered() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return entered_; });
    }

    void Open() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = false;
        cv_.notify_all();
    }

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    mutable bool entered_{false};
    bool closed_{false};
};

class LedgerTest : public ::testing::Test {
protected:
    LedgerTest()
        : prover_(proof::ProofGenerator::GenerateKey()),
          wallets_(verifier_, proof::ProofGenerator::GenerateKey()),
          ledger_(registry_, gateway_, wallets_, verifier_) {}

    void SetUp() override {
        ASSERT_TRUE(registry_.RegisterMerchant("acme", Wallet("acme-treasury")).IsValid());
        alice_ = Wallet("alice");
        bob_ = Wallet("bob");
        programId_ = CreateProgram(100);
    }

    WalletAddress Wallet(const std::string& name) {
        auto result = wallets_.CreateWallet(C(name), C(name + "-recovery"));
        EXPECT_TRUE(result.IsValid());
        return result.value.value_or(WalletAddress());
    }

    ProgramId CreateProgram(uint64_t cap, Seconds validity = 3600,
                            const MerchantId& merchant = "acme") {
        registry::ProgramParams params;
        params.validityPeriod = validity;
        params.maxIssuance = cap;
        params.verificationKey = prover_.GetKey();
        auto result = registry_.CreateProgram(merchant, params);
        EXPECT_TRUE(result.IsValid());
        return result.value.value_or(0);
    }

    IssueRequest MakeIssue(const WalletAddress& owner, const std::string& metadata,
                           ProgramId programId = 0,
                           const proof::ProofGenerator* prover = nullptr,
                           KeyVersion keyVersion = 1) {
        IssueRequest request;
        request.programId = programId == 0 ? programId_ : programId;
        request.ownerWallet = owner;
        request.metadataCommitment = C(metadata);
        request.publicInputs.programId = request.programId;
        request.publicInputs.ownerWallet = owner;
        request.publicInputs.metadataCommitment = request.metadataCommitment;
        request.publicInputs.keyVersion = keyVersion;
        request.issuanceProof = (prover ? *prover : prover_).Generate(request.publicInputs);
        return request;
    }

    Coupon IssueTo(const WalletAddress& owner, const std::string& metadata = "10% off") {
        auto result = ledger_.Issue(MakeIssue(owner, metadata));
        EXPECT_TRUE(result.IsValid()) << result.ErrorString();
        return result.value.value_or(Coupon());
    }

    proof::Proof RedemptionProof(const Coupon& coupon,
                                 const proof::ProofGenerator* prover = nullptr) {
        proof::RedemptionInputs inputs;
        inputs.tokenId = coupon.tokenId;
        inputs.ownerWallet = coupon.ownerWallet;
        inputs.keyVersion = coupon.keyVersion;
        return (prover ? *prover : prover_).Generate(inputs);
    }

    RedeemRequest MakeRedeem(const Coupon& coupon) {
        auto token = ledger_.InitiateRedemption(coupon.tokenId, coupon.merchantId);
        EXPECT_TRUE(token.IsValid()) << token.ErrorString();
        return RedeemRequest{coupon.tokenId, RedemptionProof(coupon), token.value.value_or("")};
    }

    util::ScopedMockTime time_{1700000000};
    proof::ProofVerifier verifier_;
    proof::ProofGenerator prover_;
    registry::MerchantRegistry registry_;
    gateway::ConfirmationGateway gateway_;
    wallet::WalletDirectory wallets_;
    CouponLedger ledger_;

    WalletAddress alice_;
    WalletAddress bob_;
    ProgramId programId_{0};
};

// ============================================================================
// Issuance
// ============================================================================

TEST_F(LedgerTest, IssueCreatesCoupon) {
    Coupon coupon = IssueTo(alice_);
    EXPECT_FALSE(coupon.tokenId.IsNull());
    EXPECT_EQ(coupon.state, CouponState::Issued);
    EXPECT_EQ(coupon.merchantId, "acme");
    EXPECT_EQ(coupon.programId, programId_);
    EXPECT_EQ(coupon.ownerWallet, alice_);
    EXPECT_EQ(coupon.metadataCommitment, C("10% off"));
    EXPECT_EQ(coupon.issuedAt, 1700000000);
    EXPECT_EQ(coupon.expiryDate, 1700000000 + 3600);
    EXPECT_EQ(coupon.keyVersion, 1u);

    auto details = ledger_.GetCouponDetails(coupon.tokenId);
    ASSERT_TRUE(details.has_value());
    EXPECT_EQ(details->tokenId, coupon.tokenId);
    EXPECT_EQ(details->ownerWallet, alice_);
    EXPECT_EQ(details->state, CouponState::Issued);

    EXPECT_TRUE(ledger_.IsValidCoupon(coupon.tokenId));
    EXPECT_EQ(registry_.GetProgram(programId_)->issuedCount, 1u);
    EXPECT_EQ(ledger_.CountProgramCoupons(programId_), 1u);
}

TEST_F(LedgerTest, IssueIsIdempotent) {
    IssueRequest request = MakeIssue(alice_, "retry me");
    auto first = ledger_.Issue(request);
    auto second = ledger_.Issue(request);
    ASSERT_TRUE(first.IsValid());
    ASSERT_TRUE(second.IsValid());
    EXPECT_EQ(first.value->tokenId, second.value->tokenId);
    EXPECT_EQ(ledger_.CountProgramCoupons(programId_), 1u);
    EXPECT_EQ(registry_.GetProgram(programId_)->issuedCount, 1u);
    EXPECT_EQ(ledger_.GetStats().issued, 1u);
}

TEST_F(LedgerTest, DistinctRequestsYieldDistinctCoupons) {
    Coupon a = IssueTo(alice_, "offer");
    Coupon b = IssueTo(bob_, "offer");
    Coupon c = IssueTo(alice_, "other offer");
    EXPECT_NE(a.tokenId, b.tokenId);
    EXPECT_NE(a.tokenId, c.tokenId);
    EXPECT_EQ(ledger_.GetUserCoupons(alice_).size(), 2u);
    EXPECT_EQ(ledger_.GetUserCoupons(bob_).size(), 1u);
    EXPECT_EQ(ledger_.GetMerchantCoupons("acme").size(), 3u);
    EXPECT_TRUE(ledger_.GetMerchantCoupons("ghost").empty());
}

TEST_F(LedgerTest, IssueUnknownProgram) {
    auto result = ledger_.Issue(MakeIssue(alice_, "x", 999));
    EXPECT_EQ(result.error, CouponError::ProgramNotFound);
}

TEST_F(LedgerTest, IssueInactiveMerchant) {
    registry_.DeactivateMerchant("acme");
    EXPECT_EQ(ledger_.Issue(MakeIssue(alice_, "x")).error, CouponError::MerchantInactive);
    EXPECT_EQ(registry_.GetProgram(programId_)->issuedCount, 0u);
}

TEST_F(LedgerTest, IssueRejectsInvalidProof) {
    proof::ProofGenerator forger(proof::ProofGenerator::GenerateKey());
    EXPECT_EQ(ledger_.Issue(MakeIssue(alice_, "x", 0, &forger)).error,
              CouponError::InvalidProof);

    // Public inputs naming a different owner than the request
    IssueRequest swapped = MakeIssue(alice_, "x");
    swapped.ownerWallet = bob_;
    EXPECT_EQ(ledger_.Issue(swapped).error, CouponError::InvalidProof);

    EXPECT_EQ(ledger_.CountProgramCoupons(programId_), 0u);
    EXPECT_EQ(registry_.GetProgram(programId_)->issuedCount, 0u);
    EXPECT_EQ(ledger_.GetStats().rejected, 2u);
}

TEST_F(LedgerTest, IssueWithoutProgramKey) {
    registry::ProgramParams params;
    params.validityPeriod = 60;
    params.maxIssuance = 5;
    ProgramId keyless = *registry_.CreateProgram("acme", params).value;

    EXPECT_EQ(ledger_.Issue(MakeIssue(alice_, "x", keyless)).error, CouponError::InvalidProof);
}

TEST_F(LedgerTest, IssueUnknownWallet) {
    WalletAddress stranger = wallet::DeriveWalletAddress(C("stranger"));
    EXPECT_EQ(ledger_.Issue(MakeIssue(stranger, "x")).error, CouponError::WalletNotFound);
    EXPECT_EQ(registry_.GetProgram(programId_)->Remaining(), 100u);
}

TEST_F(LedgerTest, IssueStopsAtCap) {
    ProgramId small = CreateProgram(2);
    ASSERT_TRUE(ledger_.Issue(MakeIssue(alice_, "1", small)).IsValid());
    ASSERT_TRUE(ledger_.Issue(MakeIssue(alice_, "2", small)).IsValid());
    EXPECT_EQ(ledger_.Issue(MakeIssue(alice_, "3", small)).error,
              CouponError::IssuanceCapReached);
    EXPECT_EQ(ledger_.CountProgramCoupons(small), 2u);
}

TEST_F(LedgerTest, ConcurrentIssueRespectsCap) {
    ProgramId single = CreateProgram(1);

    std::vector<IssueRequest> requests;
    for (int i = 0; i < 12; ++i) {
        requests.push_back(MakeIssue(i % 2 ? alice_ : bob_, "offer-" + std::to_string(i), single));
    }

    std::atomic<int> successes{0};
    std::atomic<int> capReached{0};
    std::vector<std::thread> threads;
    for (const auto& request : requests) {
        threads.emplace_back([&, request]() {
            auto result = ledger_.Issue(request);
            if (result.IsValid()) {
                successes++;
            } else if (result.error == CouponError::IssuanceCapReached) {
                capReached++;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(successes.load(), 1);
    EXPECT_EQ(capReached.load(), 11);
    auto program = registry_.GetProgram(single);
    EXPECT_EQ(program->issuedCount, 1u);
    EXPECT_EQ(program->reservedCount, 0u);
    EXPECT_EQ(ledger_.CountProgramCoupons(single), 1u);
}

// ============================================================================
// Redemption
// ============================================================================

TEST_F(LedgerTest, RedeemFlow) {
    ExpiryRecorder recorder;
    ledger_.AddListener(&recorder);

    Coupon coupon = IssueTo(alice_);
    RedeemRequest request = MakeRedeem(coupon);

    time_.Advance(10);
    auto result = ledger_.Redeem(request);
    ASSERT_TRUE(result.IsValid()) << result.ErrorString();
    EXPECT_EQ(result.value->state, CouponState::Redeemed);
    EXPECT_EQ(result.value->redeemedAt, 1700000010);

    EXPECT_FALSE(ledger_.IsValidCoupon(coupon.tokenId));
    EXPECT_EQ(ledger_.GetCouponDetails(coupon.tokenId)->state, CouponState::Redeemed);
    EXPECT_TRUE(gateway_.GetToken(request.confirmationToken)->used);
    EXPECT_EQ(recorder.issued.load(), 1);
    EXPECT_EQ(recorder.redeemed.load(), 1);
    ledger_.RemoveListener(&recorder);
}

TEST_F(LedgerTest, RedeemTwice) {
    Coupon coupon = IssueTo(alice_);
    RedeemRequest request = MakeRedeem(coupon);
    ASSERT_TRUE(ledger_.Redeem(request).IsValid());

    EXPECT_EQ(ledger_.Redeem(request).error, CouponError::CouponAlreadyRedeemed);
    EXPECT_EQ(ledger_.InitiateRedemption(coupon.tokenId, "acme").error,
              CouponError::CouponAlreadyRedeemed);
    EXPECT_EQ(ledger_.GetStats().redeemed, 1u);
}

TEST_F(LedgerTest, RedeemUnknownCoupon) {
    RedeemRequest request;
    request.tokenId = CouponId(C("nothing"));
    EXPECT_EQ(ledger_.Redeem(request).error, CouponError::CouponNotFound);
}

TEST_F(LedgerTest, RedeemWithInvalidProofKeepsToken) {
    Coupon coupon = IssueTo(alice_);
    RedeemRequest request = MakeRedeem(coupon);

    proof::ProofGenerator forger(proof::ProofGenerator::GenerateKey());
    RedeemRequest forged = request;
    forged.redemptionProof = RedemptionProof(coupon, &forger);
    EXPECT_EQ(ledger_.Redeem(forged).error, CouponError::InvalidProof);

    EXPECT_EQ(gateway_.GetToken(request.confirmationToken)->status,
              gateway::TokenStatus::Pending);
    EXPECT_TRUE(ledger_.IsValidCoupon(coupon.tokenId));
    EXPECT_TRUE(ledger_.Redeem(request).IsValid());
}

TEST_F(LedgerTest, TokenForAnotherWalletIsMismatch) {
    Coupon coupon = IssueTo(alice_);
    std::vector<Byte> payload(coupon.tokenId.begin(), coupon.tokenId.end());
    auto bobsToken = gateway_.Issue(gateway::TokenAction::Redeem, bob_, payload);
    ASSERT_TRUE(bobsToken.IsValid());

    RedeemRequest request{coupon.tokenId, RedemptionProof(coupon), *bobsToken.value};
    EXPECT_EQ(ledger_.Redeem(request).error, CouponError::TokenMismatch);

    auto details = ledger_.GetCouponDetails(coupon.tokenId);
    EXPECT_EQ(details->state, CouponState::Issued);
    EXPECT_EQ(details->redeemedAt, 0);
    EXPECT_EQ(gateway_.GetToken(*bobsToken.value)->status, gateway::TokenStatus::Pending);

    // No reservation was left behind
    EXPECT_TRUE(ledger_.Redeem(MakeRedeem(coupon)).IsValid());
}

TEST_F(LedgerTest, TokenForAnotherCouponIsMismatch) {
    Coupon first = IssueTo(alice_, "first");
    Coupon second = IssueTo(alice_, "second");

    auto token = ledger_.InitiateRedemption(first.tokenId, "acme");
    ASSERT_TRUE(token.IsValid());
    RedeemRequest request{second.tokenId, RedemptionProof(second), *token.value};
    EXPECT_EQ(ledger_.Redeem(request).error, CouponError::TokenMismatch);
}

TEST_F(LedgerTest, TokenErrorsPropagate) {
    Coupon coupon = IssueTo(alice_);

    RedeemRequest unknown{coupon.tokenId, RedemptionProof(coupon), std::string(64, 'f')};
    EXPECT_EQ(ledger_.Redeem(unknown).error, CouponError::TokenNotFound);

    auto shortLived = ledger_.InitiateRedemption(coupon.tokenId, "acme", 5);
    ASSERT_TRUE(shortLived.IsValid());
    time_.Advance(6);
    RedeemRequest late{coupon.tokenId, RedemptionProof(coupon), *shortLived.value};
    EXPECT_EQ(ledger_.Redeem(late).error, CouponError::TokenExpired);
    EXPECT_TRUE(ledger_.IsValidCoupon(coupon.tokenId));
}

TEST_F(LedgerTest, ConcurrentRedeemHasOneWinner) {
    Coupon coupon = IssueTo(alice_);
    RedeemRequest request = MakeRedeem(coupon);

    std::atomic<int> successes{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&]() {
            if (ledger_.Redeem(request).IsValid()) {
                successes++;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(successes.load(), 1);
    EXPECT_EQ(ledger_.GetCouponDetails(coupon.tokenId)->state, CouponState::Redeemed);
}

TEST_F(LedgerTest, InitiateRedemptionChecks) {
    ASSERT_TRUE(registry_.RegisterMerchant("rival", Wallet("rival-treasury")).IsValid());
    Coupon coupon = IssueTo(alice_);

    EXPECT_EQ(ledger_.InitiateRedemption(coupon.tokenId, "rival").error,
              CouponError::Unauthorized);
    EXPECT_EQ(ledger_.InitiateRedemption(CouponId(C("nope")), "acme").error,
              CouponError::CouponNotFound);

    auto token = ledger_.InitiateRedemption(coupon.tokenId, "acme");
    ASSERT_TRUE(token.IsValid());
    auto stored = gateway_.GetToken(*token.value);
    EXPECT_EQ(stored->action, gateway::TokenAction::Redeem);
    EXPECT_EQ(stored->targetWallet, alice_);
    EXPECT_EQ(stored->payload, std::vector<Byte>(coupon.tokenId.begin(), coupon.tokenId.end()));

    registry_.DeactivateMerchant("acme");
    EXPECT_EQ(ledger_.InitiateRedemption(coupon.tokenId, "acme").error,
              CouponError::MerchantInactive);
}

// ============================================================================
// Expiry
// ============================================================================

TEST_F(LedgerTest, CouponLapsesAtExpiryDate) {
    ExpiryRecorder recorder;
    ledger_.AddListener(&recorder);

    Coupon coupon = IssueTo(alice_);
    RedeemRequest request = MakeRedeem(coupon);

    time_.Advance(3599);
    EXPECT_TRUE(ledger_.IsValidCoupon(coupon.tokenId));

    time_.Advance(1);
    EXPECT_FALSE(ledger_.IsValidCoupon(coupon.tokenId));
    EXPECT_EQ(ledger_.GetCouponDetails(coupon.tokenId)->state, CouponState::Expired);
    EXPECT_TRUE(recorder.expired.empty());

    EXPECT_EQ(ledger_.Redeem(request).error, CouponError::CouponExpired);
    ASSERT_EQ(recorder.expired.size(), 1u);
    EXPECT_EQ(recorder.expired[0], coupon.tokenId);
    EXPECT_EQ(ledger_.GetStats().expired, 1u);

    // Materialized once
    EXPECT_EQ(ledger_.Redeem(request).error, CouponError::CouponExpired);
    EXPECT_EQ(recorder.expired.size(), 1u);
    EXPECT_EQ(ledger_.InitiateRedemption(coupon.tokenId, "acme").error,
              CouponError::CouponExpired);
    ledger_.RemoveListener(&recorder);
}

TEST_F(LedgerTest, RedeemedCouponStaysRedeemedAfterExpiry) {
    Coupon coupon = IssueTo(alice_);
    RedeemRequest request = MakeRedeem(coupon);
    ASSERT_TRUE(ledger_.Redeem(request).IsValid());

    time_.Advance(7200);
    EXPECT_EQ(ledger_.GetCouponDetails(coupon.tokenId)->state, CouponState::Redeemed);
    EXPECT_EQ(ledger_.Redeem(request).error, CouponError::CouponAlreadyRedeemed);
}

TEST_F(LedgerTest, ExpiryWaitsForInFlightRedemption) {
    auto gate = std::make_shared<GatedProofSystem>();
    verifier_.RegisterSystem(gate);
    proof::ProofGenerator gatedProver(proof::VerificationKey{"gated", std::vector<Byte>(32, 7)});

    registry::ProgramParams params;
    params.validityPeriod = 3600;
    params.maxIssuance = 10;
    params.verificationKey = gatedProver.GetKey();
    ProgramId programId = *registry_.CreateProgram("acme", params).value;

    auto issued = ledger_.Issue(MakeIssue(alice_, "gated", programId, &gatedProver));
    ASSERT_TRUE(issued.IsValid()) << issued.ErrorString();
    Coupon coupon = *issued.value;

    auto token = ledger_.InitiateRedemption(coupon.tokenId, "acme", 7200);
    ASSERT_TRUE(token.IsValid());
    RedeemRequest request{coupon.tokenId, RedemptionProof(coupon, &gatedProver), *token.value};

    ExpiryRecorder recorder;
    ledger_.AddListener(&recorder);

    gate->Close();
    OpResult<Coupon> inFlight;
    std::thread redeemer([&] { inFlight = ledger_.Redeem(request); });
    gate->WaitEntered();

    // The coupon lapses while its redemption is parked in verification
    time_.Advance(3600);
    EXPECT_EQ(ledger_.GetCouponDetails(coupon.tokenId)->state, CouponState::Expired);
    EXPECT_EQ(ledger_.Redeem(request).error, CouponError::RedemptionInProgress);
    EXPECT_TRUE(recorder.expired.empty());

    gate->Open();
    redeemer.join();

    EXPECT_EQ(inFlight.error, CouponError::CouponExpired);
    EXPECT_EQ(ledger_.GetCouponDetails(coupon.tokenId)->state, CouponState::Expired);
    ASSERT_EQ(recorder.expired.size(), 1u);
    EXPECT_EQ(recorder.expired[0], coupon.tokenId);
    EXPECT_EQ(recorder.redeemed.load(), 0);
    EXPECT_EQ(ledger_.GetStats().redeemed, 0u);
    EXPECT_EQ(ledger_.GetStats().expired, 1u);

    // The confirmation token is handed back unused
    EXPECT_EQ(gateway_.GetToken(*token.value)->status, gateway::TokenStatus::Pending);

    // Settled as expired; a later attempt does not fire the listener again
    EXPECT_EQ(ledger_.Redeem(request).error, CouponError::CouponExpired);
    EXPECT_EQ(recorder.expired.size(), 1u);
    ledger_.RemoveListener(&recorder);
}

// ============================================================================
// Key Rotation
// ============================================================================

TEST_F(LedgerTest, CouponKeepsIssuanceKeyVersion) {
    Coupon old = IssueTo(alice_, "before rotation");

    proof::ProofGenerator rotated(proof::ProofGenerator::GenerateKey());
    auto version = registry_.RegisterVerificationKey("acme", programId_, rotated.GetKey());
    ASSERT_TRUE(version.IsValid());
    EXPECT_EQ(*version.value, 2u);

    // New issuance needs the new key and version
    EXPECT_EQ(ledger_.Issue(MakeIssue(alice_, "after", 0, &prover_, 1)).error,
              CouponError::InvalidProof);
    auto fresh = ledger_.Issue(MakeIssue(alice_, "after", 0, &rotated, 2));
    ASSERT_TRUE(fresh.IsValid());
    EXPECT_EQ(fresh.value->keyVersion, 2u);

    // The old coupon is still redeemed against version 1
    auto token = ledger_.InitiateRedemption(old.tokenId, "acme");
    ASSERT_TRUE(token.IsValid());
    RedeemRequest withNewKey{old.tokenId, RedemptionProof(old, &rotated), *token.value};
    EXPECT_EQ(ledger_.Redeem(withNewKey).error, CouponError::InvalidProof);

    RedeemRequest withOldKey{old.tokenId, RedemptionProof(old), *token.value};
    EXPECT_TRUE(ledger_.Redeem(withOldKey).IsValid());
}

TEST_F(LedgerTest, RotationDuringIssuanceRejectsProof) {
    auto gate = std::make_shared<GatedProofSystem>();
    verifier_.RegisterSystem(gate);
    proof::ProofGenerator gatedProver(proof::VerificationKey{"gated", std::vector<Byte>(32, 7)});

    registry::ProgramParams params;
    params.validityPeriod = 3600;
    params.maxIssuance = 10;
    params.verificationKey = gatedProver.GetKey();
    ProgramId programId = *registry_.CreateProgram("acme", params).value;

    gate->Close();
    OpResult<Coupon> result;
    std::thread issuer([&] {
        result = ledger_.Issue(MakeIssue(alice_, "racing", programId, &gatedProver, 1));
    });
    gate->WaitEntered();

    auto version = registry_.RegisterVerificationKey("acme", programId, prover_.GetKey());
    EXPECT_EQ(version.value.value_or(0), 2u);

    gate->Open();
    issuer.join();

    EXPECT_EQ(result.error, CouponError::InvalidProof);
    auto program = registry_.GetProgram(programId);
    EXPECT_EQ(program->issuedCount, 0u);
    EXPECT_EQ(program->reservedCount, 0u);
    EXPECT_EQ(ledger_.GetStats().issued, 0u);
}

// ============================================================================
// Reconciliation
// ============================================================================

TEST_F(LedgerTest, ReconcileMaterializesExpiry) {
    ExpiryRecorder recorder;
    ledger_.AddListener(&recorder);

    Coupon lapsing = IssueTo(alice_, "short");
    ProgramId longProgram = CreateProgram(5, 100000);
    ASSERT_TRUE(ledger_.Issue(MakeIssue(bob_, "long", longProgram)).IsValid());

    time_.Advance(3600);
    ReconcileSummary summary = ledger_.Reconcile(util::GetTime());
    EXPECT_EQ(summary.couponsExpired, 1u);
    ASSERT_EQ(recorder.expired.size(), 1u);
    EXPECT_EQ(recorder.expired[0], lapsing.tokenId);

    EXPECT_EQ(ledger_.Reconcile(util::GetTime()).couponsExpired, 0u);
    ledger_.RemoveListener(&recorder);
}

TEST_F(LedgerTest, ReconcileRollsBackStaleReservations) {
    Timestamp t0 = util::GetTime();
    auto slot = registry_.ReserveIssuance(programId_, t0);
    ASSERT_TRUE(slot.IsValid());

    std::string token = *gateway_.Issue(gateway::TokenAction::Login, alice_, {}, 3600).value;
    ASSERT_TRUE(gateway_.Reserve(token, {gateway::TokenAction::Login, alice_, {}}).IsValid());

    // Within the reservation timeout nothing is touched
    time_.Advance(30);
    ReconcileSummary early = ledger_.Reconcile(util::GetTime());
    EXPECT_EQ(early.issuanceReservationsReleased, 0u);
    EXPECT_EQ(early.tokenReservationsReleased, 0u);

    time_.Advance(31);
    ReconcileSummary late = ledger_.Reconcile(util::GetTime());
    EXPECT_EQ(late.issuanceReservationsReleased, 1u);
    EXPECT_EQ(late.tokenReservationsReleased, 1u);
    EXPECT_EQ(registry_.GetProgram(programId_)->reservedCount, 0u);
    EXPECT_EQ(gateway_.GetToken(token)->status, gateway::TokenStatus::Pending);
}

TEST_F(LedgerTest, ReconcilePrunesSettledTokens) {
    Coupon coupon = IssueTo(alice_);
    RedeemRequest request = MakeRedeem(coupon);
    ASSERT_TRUE(ledger_.Redeem(request).IsValid());

    time_.Advance(gateway_.GetConfig().retention + 1);
    EXPECT_EQ(ledger_.Reconcile(util::GetTime()).tokensPruned, 1u);
    EXPECT_FALSE(gateway_.GetToken(request.confirmationToken).has_value());
}

// ============================================================================
// Coupon Record
// ============================================================================

TEST(CouponTest, Transitions) {
    EXPECT_TRUE(IsValidTransition(CouponState::Issued, CouponState::Redeemed));
    EXPECT_TRUE(IsValidTransition(CouponState::Issued, CouponState::Expired));
    EXPECT_FALSE(IsValidTransition(CouponState::Redeemed, CouponState::Issued));
    EXPECT_FALSE(IsValidTransition(CouponState::Expired, CouponState::Redeemed));
    EXPECT_FALSE(IsValidTransition(CouponState::Issued, CouponState::Invalid));
    EXPECT_STREQ(CouponStateToString(CouponState::Expired), "expired");
}

TEST(CouponTest, EffectiveState) {
    Coupon coupon;
    coupon.expiryDate = 100;
    EXPECT_TRUE(coupon.IsValidAt(99));
    EXPECT_FALSE(coupon.IsValidAt(100));
    EXPECT_EQ(coupon.EffectiveState(100), CouponState::Expired);

    coupon.state = CouponState::Redeemed;
    EXPECT_EQ(coupon.EffectiveState(500), CouponState::Redeemed);
}

TEST(CouponTest, IdDependsOnSlot) {
    WalletAddress owner(C("owner"));
    EXPECT_NE(ComputeCouponId(1, 1, owner, C("m")), ComputeCouponId(1, 2, owner, C("m")));
    EXPECT_EQ(ComputeCouponId(1, 1, owner, C("m")), ComputeCouponId(1, 1, owner, C("m")));
}

} // namespace
} // namespace ledger
} // namespace zkcoupon
