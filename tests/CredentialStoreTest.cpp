#include <gtest/gtest.h>

#include "application/CredentialStore.hpp"
#include "application/WebAuthnCredentialStore.hpp"
#include "application/OAuthCredentialStore.hpp"
#include "mocks/InMemoryCredentialRepository.hpp"
#include "mocks/FakeClock.hpp"

#include <set>

using namespace authcore;
using namespace authcore::application;
using namespace authcore::tests::mocks;

// ============================================
// TEST FIXTURE
// ============================================

class CredentialStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        codec_ = std::make_shared<security::SecretCodec>();
        clock_ = std::make_shared<FakeClock>();

        resetRepo_ = std::make_shared<InMemoryCredentialRepository<domain::PasswordResetTokenKind>>();
        sessionRepo_ = std::make_shared<InMemoryCredentialRepository<domain::SessionKind>>();
        recoveryRepo_ = std::make_shared<InMemoryCredentialRepository<domain::RecoveryCodeKind>>();
        tempChallengeRepo_ = std::make_shared<InMemoryCredentialRepository<domain::TemporaryTwoFactorChallengeKind>>();
        webAuthnRepo_ = std::make_shared<InMemoryWebAuthnCredentialRepository>();
        oauthRepo_ = std::make_shared<InMemoryCredentialRepository<domain::OAuthCredentialKind>>();

        resetTokens_ = std::make_shared<CredentialStore<domain::PasswordResetTokenKind>>(resetRepo_, codec_, clock_);
        sessions_ = std::make_shared<CredentialStore<domain::SessionKind>>(sessionRepo_, codec_, clock_);
        recoveryCodes_ = std::make_shared<CredentialStore<domain::RecoveryCodeKind>>(recoveryRepo_, codec_, clock_);
        tempChallenges_ = std::make_shared<CredentialStore<domain::TemporaryTwoFactorChallengeKind>>(
            tempChallengeRepo_, codec_, clock_);
        webAuthn_ = std::make_shared<WebAuthnCredentialStore>(webAuthnRepo_, codec_, clock_);
        oauth_ = std::make_shared<OAuthCredentialStore>(oauthRepo_, codec_, clock_);
    }

    void TearDown() override {
        resetRepo_->clear();
        sessionRepo_->clear();
        recoveryRepo_->clear();
        tempChallengeRepo_->clear();
        webAuthnRepo_->clear();
        oauthRepo_->clear();
    }

    static domain::WebAuthnCredentialMetadata key(const std::string& credentialId, uint32_t signCount = 0) {
        domain::WebAuthnCredentialMetadata metadata;
        metadata.credentialId = credentialId;
        metadata.publicKey = "pk-" + credentialId;
        metadata.signCount = signCount;
        metadata.nickname = "YubiKey";
        return metadata;
    }

    std::shared_ptr<security::SecretCodec> codec_;
    std::shared_ptr<FakeClock> clock_;

    std::shared_ptr<InMemoryCredentialRepository<domain::PasswordResetTokenKind>> resetRepo_;
    std::shared_ptr<InMemoryCredentialRepository<domain::SessionKind>> sessionRepo_;
    std::shared_ptr<InMemoryCredentialRepository<domain::RecoveryCodeKind>> recoveryRepo_;
    std::shared_ptr<InMemoryCredentialRepository<domain::TemporaryTwoFactorChallengeKind>> tempChallengeRepo_;
    std::shared_ptr<InMemoryWebAuthnCredentialRepository> webAuthnRepo_;
    std::shared_ptr<InMemoryCredentialRepository<domain::OAuthCredentialKind>> oauthRepo_;

    std::shared_ptr<CredentialStore<domain::PasswordResetTokenKind>> resetTokens_;
    std::shared_ptr<CredentialStore<domain::SessionKind>> sessions_;
    std::shared_ptr<CredentialStore<domain::RecoveryCodeKind>> recoveryCodes_;
    std::shared_ptr<CredentialStore<domain::TemporaryTwoFactorChallengeKind>> tempChallenges_;
    std::shared_ptr<WebAuthnCredentialStore> webAuthn_;
    std::shared_ptr<OAuthCredentialStore> oauth_;
};

// ============================================
// CREATE
// ============================================

TEST_F(CredentialStoreTest, Create_StoresDigestNotSecret) {
    auto issued = resetTokens_->create(42);

    EXPECT_GT(issued.record.id, 0);
    EXPECT_EQ(issued.record.subjectId, 42);
    EXPECT_EQ(issued.record.secretDigest, codec_->digest(issued.secret));
    EXPECT_NE(issued.record.secretDigest, issued.secret);
    EXPECT_EQ(resetRepo_->size(), 1u);
}

TEST_F(CredentialStoreTest, Create_AppliesKindTtl) {
    auto reset = resetTokens_->create(42);
    ASSERT_TRUE(reset.record.expiresAt.has_value());
    EXPECT_EQ(*reset.record.expiresAt - reset.record.issuedAt, std::chrono::hours(1));

    auto session = sessions_->create(42, {"curl/8.0", "10.0.0.1"});
    ASSERT_TRUE(session.record.expiresAt.has_value());
    EXPECT_EQ(*session.record.expiresAt - session.record.issuedAt, std::chrono::hours(24));
    EXPECT_EQ(session.record.metadata.userAgent, "curl/8.0");
    EXPECT_EQ(session.record.metadata.ipAddress, "10.0.0.1");

    auto code = recoveryCodes_->create(42);
    EXPECT_FALSE(code.record.expiresAt.has_value());
}

TEST_F(CredentialStoreTest, Create_RejectsNonPositiveSubject) {
    EXPECT_THROW(resetTokens_->create(0), domain::ValidationException);
    EXPECT_THROW(resetTokens_->create(-1), domain::ValidationException);
    EXPECT_EQ(resetRepo_->size(), 0u);
}

TEST_F(CredentialStoreTest, Create_RetriesOnDigestCollision) {
    resetRepo_->failNextInserts(2);

    auto issued = resetTokens_->create(42);

    EXPECT_EQ(resetRepo_->size(), 1u);
    EXPECT_TRUE(resetTokens_->lookup(issued.secret).found());
}

TEST_F(CredentialStoreTest, Create_GivesUpAfterRepeatedCollisions) {
    resetRepo_->failNextInserts(CredentialStore<domain::PasswordResetTokenKind>::MAX_CREATE_ATTEMPTS);

    try {
        resetTokens_->create(42);
        FAIL() << "expected CredentialException";
    } catch (const domain::CredentialException& e) {
        EXPECT_EQ(e.code(), domain::ErrorCode::ALREADY_EXISTS);
    }
}

TEST_F(CredentialStoreTest, Create_StorageFailureIsReported) {
    resetRepo_->failStorage(true);

    try {
        resetTokens_->create(42);
        FAIL() << "expected CredentialException";
    } catch (const domain::CredentialException& e) {
        EXPECT_EQ(e.code(), domain::ErrorCode::STORAGE_FAILURE);
        EXPECT_STREQ(e.what(), "storage failure");
        EXPECT_NE(e.cause().find("connection lost"), std::string::npos);
    }
}

// ============================================
// LOOKUP / CONSUME
// ============================================

TEST_F(CredentialStoreTest, PasswordReset_LookupConsumeThenNotFound) {
    auto issued = resetTokens_->create(42);

    auto found = resetTokens_->lookup(issued.secret);
    ASSERT_TRUE(found.found());
    EXPECT_EQ(found.record->subjectId, 42);
    EXPECT_EQ(found.record->id, issued.record.id);

    EXPECT_TRUE(resetTokens_->consume(*found.record));

    auto again = resetTokens_->lookup(issued.secret);
    EXPECT_EQ(again.status, domain::LookupStatus::NOT_FOUND);
    EXPECT_FALSE(again.record.has_value());
}

TEST_F(CredentialStoreTest, Lookup_UnknownOrEmptySecret) {
    resetTokens_->create(42);
    EXPECT_EQ(resetTokens_->lookup("deadbeef").status, domain::LookupStatus::NOT_FOUND);
    EXPECT_EQ(resetTokens_->lookup("").status, domain::LookupStatus::NOT_FOUND);
}

TEST_F(CredentialStoreTest, Lookup_ExpiredRecordReportsExpired) {
    auto issued = resetTokens_->create(42);

    clock_->advance(std::chrono::hours(1));
    EXPECT_TRUE(resetTokens_->lookup(issued.secret).found());

    clock_->advance(std::chrono::seconds(1));
    auto result = resetTokens_->lookup(issued.secret);
    EXPECT_EQ(result.status, domain::LookupStatus::EXPIRED);
    EXPECT_FALSE(result.record.has_value());
    // строка остаётся до очистки, но не выдаётся
    EXPECT_EQ(resetRepo_->size(), 1u);
}

TEST_F(CredentialStoreTest, Lookup_StorageFailureThrows) {
    auto issued = resetTokens_->create(42);
    resetRepo_->failStorage(true);

    try {
        resetTokens_->lookup(issued.secret);
        FAIL() << "expected CredentialException";
    } catch (const domain::CredentialException& e) {
        EXPECT_EQ(e.code(), domain::ErrorCode::STORAGE_FAILURE);
    }
}

TEST_F(CredentialStoreTest, LookupForSubject_OtherSubjectIsMismatch) {
    auto issued = resetTokens_->create(42);

    EXPECT_TRUE(resetTokens_->lookupForSubject(42, issued.secret).found());
    EXPECT_EQ(resetTokens_->lookupForSubject(43, issued.secret).status,
              domain::LookupStatus::DIGEST_MISMATCH);
}

TEST_F(CredentialStoreTest, Consume_DeleteFailureIsSwallowed) {
    auto issued = resetTokens_->create(42);
    auto found = resetTokens_->lookup(issued.secret);
    ASSERT_TRUE(found.found());

    resetRepo_->failDeletes(true);
    EXPECT_FALSE(resetTokens_->consume(*found.record));
    EXPECT_EQ(resetRepo_->size(), 1u);
}

TEST_F(CredentialStoreTest, Redeem_IsSingleUse) {
    auto issued = resetTokens_->create(42);

    EXPECT_TRUE(resetTokens_->redeem(issued.secret).found());
    EXPECT_EQ(resetTokens_->redeem(issued.secret).status, domain::LookupStatus::NOT_FOUND);
}

TEST_F(CredentialStoreTest, TemporaryChallenge_BoundToResetToken) {
    auto reset = resetTokens_->create(42);
    auto challenge = tempChallenges_->create(42, {reset.record.id});

    EXPECT_TRUE(tempChallenges_->lookupForResetToken(challenge.secret, reset.record.id).found());
    EXPECT_EQ(tempChallenges_->lookupForResetToken(challenge.secret, reset.record.id + 1).status,
              domain::LookupStatus::DIGEST_MISMATCH);

    clock_->advance(std::chrono::minutes(6));
    EXPECT_EQ(tempChallenges_->lookupForResetToken(challenge.secret, reset.record.id).status,
              domain::LookupStatus::EXPIRED);
}

// ============================================
// RECOVERY CODES (BATCHES)
// ============================================

TEST_F(CredentialStoreTest, RecoveryCodes_TenDistinctCodesForSubject) {
    auto issued = recoveryCodes_->createMany(7);

    ASSERT_EQ(issued.size(), 10u);
    std::set<std::string> codes;
    for (const auto& code : issued) {
        EXPECT_EQ(code.secret.size(), security::SecretCodec::RECOVERY_CODE_LENGTH);
        EXPECT_EQ(code.record.subjectId, 7);
        EXPECT_FALSE(code.record.expiresAt.has_value());
        codes.insert(code.secret);
    }
    EXPECT_EQ(codes.size(), 10u);
    EXPECT_EQ(recoveryCodes_->listAll(7).size(), 10u);

    EXPECT_TRUE(recoveryCodes_->redeemForSubject(7, issued[3].secret).found());
    EXPECT_EQ(recoveryCodes_->redeemForSubject(7, issued[3].secret).status,
              domain::LookupStatus::NOT_FOUND);
    EXPECT_EQ(recoveryCodes_->listAll(7).size(), 9u);
}

TEST_F(CredentialStoreTest, RecoveryCodes_RegenerateReplacesOldBatch) {
    auto first = recoveryCodes_->createMany(7);
    recoveryCodes_->create(8);

    auto second = recoveryCodes_->regenerate(7);

    EXPECT_EQ(second.size(), 10u);
    EXPECT_EQ(recoveryCodes_->listAll(7).size(), 10u);
    EXPECT_EQ(recoveryCodes_->listAll(8).size(), 1u);
    EXPECT_EQ(recoveryCodes_->lookup(first[0].secret).status, domain::LookupStatus::NOT_FOUND);
}

TEST_F(CredentialStoreTest, RecoveryCodes_BatchIsAllOrNothing) {
    recoveryRepo_->failStorage(true);
    EXPECT_THROW(recoveryCodes_->createMany(7), domain::CredentialException);
    recoveryRepo_->failStorage(false);
    EXPECT_EQ(recoveryRepo_->size(), 0u);

    recoveryRepo_->failNextInserts(1);
    auto issued = recoveryCodes_->createMany(7);
    EXPECT_EQ(issued.size(), 10u);
    EXPECT_EQ(recoveryRepo_->size(), 10u);
}

TEST_F(CredentialStoreTest, RecoveryCodes_ZeroBatchRejected) {
    EXPECT_THROW(recoveryCodes_->createMany(7, 0), domain::ValidationException);
}

// ============================================
// LIST / REVOKE
// ============================================

TEST_F(CredentialStoreTest, ListBySubject_ExcludesCurrentAndOthers) {
    auto current = sessions_->create(42);
    for (int i = 0; i < 4; ++i) sessions_->create(42);
    sessions_->create(99);

    pagination::PageArgs args;
    args.first = 10;
    auto page = sessions_->listBySubject(42, args, current.secret);

    EXPECT_EQ(page.items.size(), 4u);
    for (const auto& session : page.items) {
        EXPECT_EQ(session.subjectId, 42);
        EXPECT_NE(session.id, current.record.id);
    }
    EXPECT_FALSE(page.hasNext);
}

TEST_F(CredentialStoreTest, ListBySubject_SkipsExpired) {
    auto old = sessions_->create(42);
    sessions_->create(42);
    sessionRepo_->setExpiresAt(old.record.id, clock_->now() - std::chrono::seconds(1));

    auto page = sessions_->listBySubject(42, {});
    ASSERT_EQ(page.items.size(), 1u);
    EXPECT_NE(page.items[0].id, old.record.id);
}

TEST_F(CredentialStoreTest, ListBySubject_WalksTwentyFiveSessionsForward) {
    std::vector<int64_t> created;
    for (int i = 0; i < 25; ++i) {
        created.push_back(sessions_->create(42).record.id);
        sessions_->create(99);
    }
    auto ids = [](const pagination::Page<domain::Session>& page) {
        std::vector<int64_t> result;
        for (const auto& session : page.items) result.push_back(session.id);
        return result;
    };

    pagination::PageArgs args;
    args.first = 10;
    auto page1 = sessions_->listBySubject(42, args);
    EXPECT_EQ(ids(page1), std::vector<int64_t>(created.begin(), created.begin() + 10));
    EXPECT_TRUE(page1.hasNext);
    EXPECT_FALSE(page1.hasPrevious);

    args.after = page1.endCursor;
    auto page2 = sessions_->listBySubject(42, args);
    EXPECT_EQ(ids(page2), std::vector<int64_t>(created.begin() + 10, created.begin() + 20));
    EXPECT_TRUE(page2.hasNext);
    EXPECT_TRUE(page2.hasPrevious);

    args.after = page2.endCursor;
    auto page3 = sessions_->listBySubject(42, args);
    EXPECT_EQ(ids(page3), std::vector<int64_t>(created.begin() + 20, created.end()));
    EXPECT_FALSE(page3.hasNext);
    EXPECT_TRUE(page3.hasPrevious);
    EXPECT_EQ(page3.endCursor, pagination::CursorPager::cursorFor(created.back()));
}

TEST_F(CredentialStoreTest, ListBySubject_WalksTwentyFiveSessionsBackward) {
    std::vector<int64_t> created;
    for (int i = 0; i < 25; ++i) created.push_back(sessions_->create(42).record.id);
    auto ids = [](const pagination::Page<domain::Session>& page) {
        std::vector<int64_t> result;
        for (const auto& session : page.items) result.push_back(session.id);
        return result;
    };

    pagination::PageArgs args;
    args.last = 10;
    auto newest = sessions_->listBySubject(42, args);
    EXPECT_EQ(ids(newest), std::vector<int64_t>(created.begin() + 15, created.end()));
    EXPECT_TRUE(newest.hasPrevious);
    EXPECT_FALSE(newest.hasNext);

    args.before = newest.startCursor;
    auto middle = sessions_->listBySubject(42, args);
    EXPECT_EQ(ids(middle), std::vector<int64_t>(created.begin() + 5, created.begin() + 15));
    EXPECT_TRUE(middle.hasPrevious);
    EXPECT_TRUE(middle.hasNext);

    args.before = middle.startCursor;
    auto oldest = sessions_->listBySubject(42, args);
    EXPECT_EQ(ids(oldest), std::vector<int64_t>(created.begin(), created.begin() + 5));
    EXPECT_FALSE(oldest.hasPrevious);
    EXPECT_TRUE(oldest.hasNext);
}

TEST_F(CredentialStoreTest, ListBySubject_InvalidArgsFailBeforeStorage) {
    sessionRepo_->failStorage(true);
    pagination::PageArgs args;
    args.first = 5;
    args.last = 5;

    try {
        sessions_->listBySubject(42, args);
        FAIL() << "expected ValidationException";
    } catch (const domain::CredentialException& e) {
        EXPECT_EQ(e.code(), domain::ErrorCode::VALIDATION_ERROR);
    }
}

TEST_F(CredentialStoreTest, Revoke_OnlyOwnAndNotCurrent) {
    auto current = sessions_->create(42);
    auto other = sessions_->create(42);
    auto foreign = sessions_->create(99);

    EXPECT_FALSE(sessions_->revoke(42, foreign.record.id, current.secret));
    EXPECT_FALSE(sessions_->revoke(42, current.record.id, current.secret));
    EXPECT_TRUE(sessions_->revoke(42, other.record.id, current.secret));
    EXPECT_FALSE(sessions_->revoke(42, other.record.id, current.secret));
    EXPECT_EQ(sessionRepo_->size(), 2u);
}

TEST_F(CredentialStoreTest, RevokeAll_KeepsCurrent) {
    auto current = sessions_->create(42);
    sessions_->create(42);
    sessions_->create(42);
    sessions_->create(99);

    EXPECT_EQ(sessions_->revokeAll(42, current.secret), 2u);
    EXPECT_TRUE(sessions_->lookup(current.secret).found());
    EXPECT_EQ(sessions_->listAll(99).size(), 1u);
}

TEST_F(CredentialStoreTest, RevokeMany) {
    auto a = sessions_->create(42);
    auto b = sessions_->create(42);
    sessions_->create(42);

    EXPECT_EQ(sessions_->revokeMany({a.record.id, b.record.id, 12345}), 2u);
    EXPECT_EQ(sessions_->revokeMany({}), 0u);
    EXPECT_EQ(sessionRepo_->size(), 1u);
}

TEST_F(CredentialStoreTest, LatestForSubject) {
    sessions_->create(42);
    auto newest = sessions_->create(42);

    auto latest = sessions_->latestForSubject(42);
    ASSERT_TRUE(latest.has_value());
    EXPECT_EQ(latest->id, newest.record.id);
    EXPECT_FALSE(sessions_->latestForSubject(7).has_value());
}

// ============================================
// WEBAUTHN CREDENTIALS
// ============================================

TEST_F(CredentialStoreTest, WebAuthn_DuplicateCredentialIdRejected) {
    webAuthn_->registerCredential(42, key("cred-1"));

    try {
        webAuthn_->registerCredential(43, key("cred-1"));
        FAIL() << "expected CredentialException";
    } catch (const domain::CredentialException& e) {
        EXPECT_EQ(e.code(), domain::ErrorCode::ALREADY_EXISTS);
    }
}

TEST_F(CredentialStoreTest, WebAuthn_SignCountMustIncrease) {
    webAuthn_->registerCredential(42, key("cred-1", 5));

    EXPECT_EQ(webAuthn_->advanceSignCount("cred-1", 6), SignCountCheck::ACCEPTED);
    EXPECT_EQ(webAuthn_->lookup("cred-1").record->metadata.signCount, 6u);

    EXPECT_EQ(webAuthn_->advanceSignCount("cred-1", 6), SignCountCheck::CLONE_SUSPECTED);
    EXPECT_EQ(webAuthn_->advanceSignCount("cred-1", 3), SignCountCheck::CLONE_SUSPECTED);
    EXPECT_EQ(webAuthn_->lookup("cred-1").record->metadata.signCount, 6u);

    EXPECT_EQ(webAuthn_->advanceSignCount("unknown", 10), SignCountCheck::NOT_FOUND);
}

TEST_F(CredentialStoreTest, WebAuthn_ZeroCounterAuthenticatorAccepted) {
    webAuthn_->registerCredential(42, key("cred-0", 0));
    EXPECT_EQ(webAuthn_->advanceSignCount("cred-0", 0), SignCountCheck::ACCEPTED);
    EXPECT_EQ(webAuthn_->advanceSignCount("cred-0", 0), SignCountCheck::ACCEPTED);
}

TEST_F(CredentialStoreTest, WebAuthn_Rename) {
    auto record = webAuthn_->registerCredential(42, key("cred-1"));

    EXPECT_TRUE(webAuthn_->rename(42, record.id, "Laptop"));
    EXPECT_EQ(webAuthn_->lookup("cred-1").record->metadata.nickname, "Laptop");
    EXPECT_FALSE(webAuthn_->rename(43, record.id, "Stolen"));
    EXPECT_THROW(webAuthn_->rename(42, record.id, ""), domain::ValidationException);
}

// ============================================
// OAUTH CREDENTIALS
// ============================================

TEST_F(CredentialStoreTest, OAuth_LinkIsUniquePerProviderUser) {
    oauth_->link(42, "github", "1001");

    try {
        oauth_->link(43, "github", "1001");
        FAIL() << "expected CredentialException";
    } catch (const domain::CredentialException& e) {
        EXPECT_EQ(e.code(), domain::ErrorCode::ALREADY_EXISTS);
    }

    auto found = oauth_->findByProviderUser("github", "1001");
    ASSERT_TRUE(found.found());
    EXPECT_EQ(found.record->subjectId, 42);
    EXPECT_FALSE(found.record->expiresAt.has_value());
}

TEST_F(CredentialStoreTest, OAuth_Unlink) {
    oauth_->link(42, "github", "1001");
    oauth_->link(42, "google", "abc");

    ASSERT_TRUE(oauth_->findBySubjectProvider(42, "google").has_value());
    EXPECT_TRUE(oauth_->unlink(42, "google"));
    EXPECT_FALSE(oauth_->unlink(42, "google"));
    EXPECT_TRUE(oauth_->findByProviderUser("github", "1001").found());
    EXPECT_THROW(oauth_->link(42, "", "x"), domain::ValidationException);
}
