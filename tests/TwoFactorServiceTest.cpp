#include <gtest/gtest.h>

#include "application/TwoFactorService.hpp"
#include "mocks/InMemoryCredentialRepository.hpp"
#include "mocks/FakeClock.hpp"

using namespace authcore;
using namespace authcore::application;
using namespace authcore::tests::mocks;

// ============================================
// TEST FIXTURE
// ============================================

class TwoFactorServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        codec_ = std::make_shared<security::SecretCodec>();
        clock_ = std::make_shared<FakeClock>();
        challengeRepo_ = std::make_shared<InMemoryCredentialRepository<domain::TwoFactorChallengeKind>>();
        recoveryRepo_ = std::make_shared<InMemoryCredentialRepository<domain::RecoveryCodeKind>>();

        service_ = std::make_shared<TwoFactorService>(
            std::make_shared<CredentialStore<domain::TwoFactorChallengeKind>>(challengeRepo_, codec_, clock_),
            std::make_shared<CredentialStore<domain::RecoveryCodeKind>>(recoveryRepo_, codec_, clock_),
            codec_, clock_);
    }

    void TearDown() override {
        challengeRepo_->clear();
        recoveryRepo_->clear();
    }

    std::string currentCode(const std::string& seed) const {
        return security::Totp::generate(seed, clock_->now()).value();
    }

    std::shared_ptr<security::SecretCodec> codec_;
    std::shared_ptr<FakeClock> clock_;
    std::shared_ptr<InMemoryCredentialRepository<domain::TwoFactorChallengeKind>> challengeRepo_;
    std::shared_ptr<InMemoryCredentialRepository<domain::RecoveryCodeKind>> recoveryRepo_;
    std::shared_ptr<TwoFactorService> service_;
};

// ============================================
// ENROLLMENT
// ============================================

TEST_F(TwoFactorServiceTest, BeginEnrollment_IssuesChallengeAndUri) {
    auto start = service_->beginEnrollment(42, "john@test.com");

    EXPECT_FALSE(start.challenge.empty());
    EXPECT_FALSE(start.totpSeed.empty());
    EXPECT_EQ(start.provisioningUri.rfind("otpauth://totp/AuthCore:", 0), 0u);
    EXPECT_NE(start.provisioningUri.find("secret=" + start.totpSeed), std::string::npos);
    EXPECT_EQ(challengeRepo_->size(), 1u);
}

TEST_F(TwoFactorServiceTest, ConfirmEnrollment_IssuesTenRecoveryCodes) {
    auto start = service_->beginEnrollment(42, "john@test.com");

    auto result = service_->confirmEnrollment(42, start.challenge, currentCode(start.totpSeed));

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.totpSeed, start.totpSeed);
    EXPECT_EQ(result.recoveryCodes.size(), 10u);
    EXPECT_EQ(challengeRepo_->size(), 0u);
    EXPECT_EQ(service_->remainingRecoveryCodes(42), 10u);
}

TEST_F(TwoFactorServiceTest, ConfirmEnrollment_WrongCodeKeepsChallenge) {
    auto start = service_->beginEnrollment(42, "john@test.com");
    auto good = currentCode(start.totpSeed);
    std::string wrong = good == "000000" ? "111111" : "000000";

    auto failed = service_->confirmEnrollment(42, start.challenge, wrong);
    EXPECT_FALSE(failed.success);
    EXPECT_EQ(failed.message, "Invalid verification code");
    EXPECT_EQ(challengeRepo_->size(), 1u);

    EXPECT_TRUE(service_->confirmEnrollment(42, start.challenge, good).success);
}

TEST_F(TwoFactorServiceTest, ConfirmEnrollment_ChallengeOfOtherSubject) {
    auto start = service_->beginEnrollment(42, "john@test.com");
    auto result = service_->confirmEnrollment(43, start.challenge, currentCode(start.totpSeed));
    EXPECT_FALSE(result.success);
    EXPECT_EQ(challengeRepo_->size(), 1u);
}

TEST_F(TwoFactorServiceTest, ConfirmEnrollment_ExpiredChallenge) {
    auto start = service_->beginEnrollment(42, "john@test.com");
    clock_->advance(std::chrono::minutes(5) + std::chrono::seconds(1));

    auto result = service_->confirmEnrollment(42, start.challenge, currentCode(start.totpSeed));
    EXPECT_FALSE(result.success);
    EXPECT_TRUE(result.recoveryCodes.empty());
}

// ============================================
// RECOVERY CODES
// ============================================

TEST_F(TwoFactorServiceTest, RecoveryCode_RedeemedOnce) {
    auto codes = service_->regenerateRecoveryCodes(7);
    ASSERT_EQ(codes.size(), 10u);

    EXPECT_TRUE(service_->redeemRecoveryCode(7, codes[0]));
    EXPECT_FALSE(service_->redeemRecoveryCode(7, codes[0]));
    EXPECT_FALSE(service_->redeemRecoveryCode(8, codes[1]));
    EXPECT_EQ(service_->remainingRecoveryCodes(7), 9u);
}

TEST_F(TwoFactorServiceTest, RecoveryCode_RegenerateInvalidatesOld) {
    auto old = service_->regenerateRecoveryCodes(7);
    auto fresh = service_->regenerateRecoveryCodes(7);

    EXPECT_FALSE(service_->redeemRecoveryCode(7, old[0]));
    EXPECT_TRUE(service_->redeemRecoveryCode(7, fresh[0]));
    EXPECT_EQ(service_->remainingRecoveryCodes(7), 9u);
}
