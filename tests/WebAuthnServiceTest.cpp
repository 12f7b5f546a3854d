#include <gtest/gtest.h>

#include "application/WebAuthnService.hpp"
#include "application/SessionService.hpp"
#include "mocks/InMemoryCredentialRepository.hpp"
#include "mocks/FakeClock.hpp"
#include "adapters/primary/ListWebAuthnCredentialsHandler.hpp"

#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>
#include <nlohmann/json.hpp>

#include <cstdlib>

using namespace authcore;
using namespace authcore::application;
using namespace authcore::tests::mocks;

// ============================================
// TEST FIXTURE
// ============================================

class WebAuthnServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto codec = std::make_shared<security::SecretCodec>();
        clock_ = std::make_shared<FakeClock>();
        challengeRepo_ = std::make_shared<InMemoryCredentialRepository<domain::WebAuthnChallengeKind>>();
        credentialRepo_ = std::make_shared<InMemoryWebAuthnCredentialRepository>();

        service_ = std::make_shared<WebAuthnService>(
            std::make_shared<CredentialStore<domain::WebAuthnChallengeKind>>(challengeRepo_, codec, clock_),
            std::make_shared<WebAuthnCredentialStore>(credentialRepo_, codec, clock_));

        setenv("AUTHCORE_SESSION_SECRET", "webauthn-test-secret", 1);
        sessionRepo_ = std::make_shared<InMemoryCredentialRepository<domain::SessionKind>>();
        sessionService_ = std::make_shared<SessionService>(
            std::make_shared<adapters::secondary::SessionSettings>(),
            std::make_shared<CredentialStore<domain::SessionKind>>(sessionRepo_, codec, clock_),
            clock_);
    }

    void TearDown() override {
        challengeRepo_->clear();
        credentialRepo_->clear();
        sessionRepo_->clear();
    }

    static domain::WebAuthnCredentialMetadata key(const std::string& credentialId) {
        domain::WebAuthnCredentialMetadata metadata;
        metadata.credentialId = credentialId;
        metadata.publicKey = "pQECAyYgASFYIA";
        metadata.signCount = 1;
        metadata.transports = {"usb", "nfc"};
        metadata.nickname = "Security key";
        return metadata;
    }

    domain::WebAuthnCredential enroll(int64_t subjectId, const std::string& credentialId) {
        auto challenge = service_->issueChallenge(subjectId);
        return service_->registerCredential(subjectId, challenge.secret, key(credentialId));
    }

    std::shared_ptr<FakeClock> clock_;
    std::shared_ptr<InMemoryCredentialRepository<domain::WebAuthnChallengeKind>> challengeRepo_;
    std::shared_ptr<InMemoryWebAuthnCredentialRepository> credentialRepo_;
    std::shared_ptr<WebAuthnService> service_;
    std::shared_ptr<InMemoryCredentialRepository<domain::SessionKind>> sessionRepo_;
    std::shared_ptr<SessionService> sessionService_;
};

// ============================================
// REGISTRATION
// ============================================

TEST_F(WebAuthnServiceTest, Register_ConsumesChallenge) {
    auto challenge = service_->issueChallenge(42);
    auto credential = service_->registerCredential(42, challenge.secret, key("cred-1"));

    EXPECT_EQ(credential.subjectId, 42);
    EXPECT_EQ(credential.metadata.credentialId, "cred-1");
    EXPECT_EQ(challengeRepo_->size(), 0u);

    EXPECT_THROW(service_->registerCredential(42, challenge.secret, key("cred-2")),
                 domain::CredentialException);
}

TEST_F(WebAuthnServiceTest, Register_ChallengeOfOtherSubject) {
    auto challenge = service_->issueChallenge(42);
    try {
        service_->registerCredential(43, challenge.secret, key("cred-1"));
        FAIL() << "expected CredentialException";
    } catch (const domain::CredentialException& e) {
        EXPECT_EQ(e.code(), domain::ErrorCode::DIGEST_MISMATCH);
    }
    EXPECT_EQ(credentialRepo_->size(), 0u);
}

TEST_F(WebAuthnServiceTest, Register_ExpiredChallenge) {
    auto challenge = service_->issueChallenge(42);
    clock_->advance(std::chrono::minutes(6));
    try {
        service_->registerCredential(42, challenge.secret, key("cred-1"));
        FAIL() << "expected CredentialException";
    } catch (const domain::CredentialException& e) {
        EXPECT_EQ(e.code(), domain::ErrorCode::EXPIRED);
    }
}

// ============================================
// AUTHENTICATION
// ============================================

TEST_F(WebAuthnServiceTest, Authenticate_AdvancesSignCount) {
    enroll(42, "cred-1");

    auto first = service_->authenticate(service_->issueChallenge(42).secret, "cred-1", 2);
    EXPECT_TRUE(first.success);
    EXPECT_EQ(first.subjectId, 42);

    auto replayed = service_->authenticate(service_->issueChallenge(42).secret, "cred-1", 2);
    EXPECT_FALSE(replayed.success);
    EXPECT_EQ(replayed.message, "Credential sign count did not increase");
}

TEST_F(WebAuthnServiceTest, Authenticate_ChallengeIsSingleUse) {
    enroll(42, "cred-1");
    auto challenge = service_->issueChallenge(42);

    EXPECT_TRUE(service_->authenticate(challenge.secret, "cred-1", 5).success);
    EXPECT_FALSE(service_->authenticate(challenge.secret, "cred-1", 6).success);
}

TEST_F(WebAuthnServiceTest, Authenticate_ForeignCredential) {
    enroll(42, "cred-1");
    auto result = service_->authenticate(service_->issueChallenge(43).secret, "cred-1", 5);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.message, "Unknown credential");
}

// ============================================
// MANAGEMENT
// ============================================

TEST_F(WebAuthnServiceTest, ListRenameRevoke) {
    auto a = enroll(42, "cred-a");
    enroll(42, "cred-b");
    enroll(7, "cred-c");

    pagination::PageArgs args;
    args.first = 1;
    auto page = service_->listCredentials(42, args);
    ASSERT_EQ(page.items.size(), 1u);
    EXPECT_EQ(page.items[0].id, a.id);
    EXPECT_TRUE(page.hasNext);

    EXPECT_TRUE(service_->renameCredential(42, a.id, "Phone"));
    EXPECT_FALSE(service_->renameCredential(7, a.id, "Phone"));

    EXPECT_FALSE(service_->revokeCredential(7, a.id));
    EXPECT_TRUE(service_->revokeCredential(42, a.id));
    EXPECT_EQ(service_->listCredentials(42, {}).items.size(), 1u);
}

// ============================================
// HTTP: GET /api/v1/webauthn/credentials
// ============================================

TEST_F(WebAuthnServiceTest, ListHandler_ReturnsOwnCredentials) {
    enroll(42, "cred-a");
    enroll(7, "cred-b");

    adapters::primary::ListWebAuthnCredentialsHandler handler(sessionService_, service_);
    SimpleRequest req;
    req.setMethod("GET");
    req.setPath("/api/v1/webauthn/credentials");
    SimpleResponse res;
    adapters::primary::RequestContext ctx;
    sessionService_->startSession(ctx.session, 42, "test-agent", "127.0.0.1");

    handler.handle(req, res, ctx);

    ASSERT_EQ(res.getStatus(), 200);
    auto json = nlohmann::json::parse(res.getBody());
    ASSERT_EQ(json["credentials"].size(), 1u);
    EXPECT_EQ(json["credentials"][0]["credential_id"], "cred-a");
    EXPECT_EQ(json["credentials"][0]["nickname"], "Security key");
    EXPECT_EQ(json["credentials"][0]["transports"].size(), 2u);
    EXPECT_FALSE(json["page_info"]["has_next_page"].get<bool>());
}

TEST_F(WebAuthnServiceTest, ListHandler_AnonymousGets401) {
    adapters::primary::ListWebAuthnCredentialsHandler handler(sessionService_, service_);
    SimpleRequest req;
    SimpleResponse res;
    adapters::primary::RequestContext ctx;

    handler.handle(req, res, ctx);

    EXPECT_EQ(res.getStatus(), 401);
}

TEST_F(WebAuthnServiceTest, ListHandler_RevokedSessionGets401AndClearsState) {
    enroll(42, "cred-a");

    adapters::primary::RequestContext revoked;
    sessionService_->startSession(revoked.session, 42, "old-laptop", "10.0.0.3");
    domain::SessionState current;
    sessionService_->startSession(current, 42, "phone", "10.0.0.4");
    sessionService_->revokeOtherSessions(current);

    adapters::primary::ListWebAuthnCredentialsHandler handler(sessionService_, service_);
    SimpleRequest req;
    SimpleResponse res;

    handler.handle(req, res, revoked);

    EXPECT_EQ(res.getStatus(), 401);
    EXPECT_TRUE(revoked.session.empty());
}
