#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>

#include "auth_test_config.hpp"
#include "crypto_utils.hpp"
#include "rsa_test_keys.hpp"

#include "csa/auth/revocation_set.hpp"
#include "csa/auth/token_authority.hpp"
#include "csa/foundation/error_code.hpp"

using namespace csa::auth;
using csa::foundation::ErrorCode;
using csa::foundation::ManualClock;
using namespace std::chrono_literals;

// =============================================================================
// HS256
// =============================================================================

class TokenAuthorityTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_ = csa::test::makeTestConfig();
        clock_ = csa::test::makeTestClock();
        revocations_ = std::make_shared<RevocationSet>(config_.clockSkewTolerance,
                                                       config_.maxTokenTtl, clock_);
        auto created = TokenAuthority::create(config_, clock_, revocations_);
        ASSERT_TRUE(created.hasValue()) << created.error().message();
        authority_ = std::make_unique<TokenAuthority>(std::move(created).value());
    }

    SessionToken issue(std::string_view subject = "alice") {
        auto token = authority_->issue(subject);
        EXPECT_TRUE(token.hasValue());
        return token.value();
    }

    AuthConfig config_;
    std::shared_ptr<ManualClock> clock_;
    std::shared_ptr<RevocationSet> revocations_;
    std::unique_ptr<TokenAuthority> authority_;
};

TEST_F(TokenAuthorityTest, IssueAndVerify) {
    auto token = issue();
    EXPECT_EQ(token.subjectId, "alice");
    EXPECT_EQ(token.expiresAt - token.issuedAt, config_.tokenTtl);
    EXPECT_EQ(token.tokenId.size(), TokenAuthority::kTokenIdBytes * 2);
    EXPECT_FALSE(token.signature.empty());
    EXPECT_EQ(token.algorithm, SigningAlgorithm::HS256);

    auto subject = authority_->verify(authority_->encode(token));
    ASSERT_TRUE(subject.hasValue()) << subject.error().message();
    EXPECT_EQ(subject.value(), "alice");

    auto direct = authority_->verify(token);
    ASSERT_TRUE(direct.hasValue());
    EXPECT_EQ(direct.value(), "alice");
}

TEST_F(TokenAuthorityTest, TokenIdsAreUnique) {
    auto a = issue();
    auto b = issue();
    EXPECT_NE(a.tokenId, b.tokenId);
    EXPECT_NE(a.signature, b.signature);
}

TEST_F(TokenAuthorityTest, IssuedAtHasWholeSeconds) {
    clock_->advance(1500ms);
    auto token = issue();
    EXPECT_EQ(token.issuedAt.time_since_epoch() % std::chrono::seconds(1),
              std::chrono::system_clock::duration::zero());
}

TEST_F(TokenAuthorityTest, VerifyClaimsRoundTripsFields) {
    auto token = issue();
    auto claims = authority_->verifyClaims(authority_->encode(token));
    ASSERT_TRUE(claims.hasValue());
    EXPECT_EQ(claims.value().subjectId, token.subjectId);
    EXPECT_EQ(claims.value().tokenId, token.tokenId);
    EXPECT_EQ(claims.value().issuedAt, token.issuedAt);
    EXPECT_EQ(claims.value().expiresAt, token.expiresAt);
    EXPECT_EQ(claims.value().signature, token.signature);
}

TEST_F(TokenAuthorityTest, CustomTtl) {
    auto token = authority_->issue("alice", 60s);
    ASSERT_TRUE(token.hasValue());
    EXPECT_EQ(token.value().expiresAt - token.value().issuedAt, 60s);
}

TEST_F(TokenAuthorityTest, IssueRejectsBadInput) {
    auto empty = authority_->issue("");
    ASSERT_TRUE(empty.hasError());
    EXPECT_EQ(empty.error().code(), ErrorCode::InvalidInput);

    auto zero = authority_->issue("alice", 0s);
    ASSERT_TRUE(zero.hasError());
    EXPECT_EQ(zero.error().code(), ErrorCode::InvalidInput);

    auto tooLong = authority_->issue("alice", config_.maxTokenTtl + 1s);
    ASSERT_TRUE(tooLong.hasError());
    EXPECT_EQ(tooLong.error().code(), ErrorCode::InvalidInput);
}

// -- Expiry -------------------------------------------------------------------

TEST_F(TokenAuthorityTest, ExpiryHonoursSkewTolerance) {
    auto token = issue();
    auto compact = authority_->encode(token);

    clock_->advance(config_.tokenTtl + config_.clockSkewTolerance);
    EXPECT_TRUE(authority_->verify(compact).hasValue());

    clock_->advance(1s);
    auto expired = authority_->verify(compact);
    ASSERT_TRUE(expired.hasError());
    EXPECT_EQ(expired.error().code(), ErrorCode::TokenExpired);
}

// -- Tampering ----------------------------------------------------------------

TEST_F(TokenAuthorityTest, EverySingleByteMutationIsRejected) {
    auto compact = authority_->encode(issue());
    for (std::size_t i = 0; i < compact.size(); ++i) {
        if (compact[i] == '.') {
            continue;
        }
        std::string mutated = compact;
        mutated[i] = (mutated[i] == 'A') ? 'B' : 'A';
        auto result = authority_->verify(mutated);
        ASSERT_TRUE(result.hasError()) << "position " << i;
        EXPECT_TRUE(result.error().code() == ErrorCode::SignatureMismatch ||
                    result.error().code() == ErrorCode::MalformedToken)
            << "position " << i;
    }
}

TEST_F(TokenAuthorityTest, ModifiedClaimsFailSignature) {
    auto token = issue();
    token.subjectId = "mallory";
    auto result = authority_->verify(token);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::SignatureMismatch);

    token = issue();
    token.expiresAt += std::chrono::hours(24);
    result = authority_->verify(token);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::SignatureMismatch);
}

TEST_F(TokenAuthorityTest, OtherSecretFailsSignature) {
    auto otherConfig = config_;
    otherConfig.secretKey = "another-secret-that-is-long-enough-0123456789";
    auto other = TokenAuthority::create(otherConfig, clock_);
    ASSERT_TRUE(other.hasValue());

    auto result = other.value().verify(authority_->encode(issue()));
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::SignatureMismatch);
}

TEST_F(TokenAuthorityTest, MalformedInputs) {
    const std::string cases[] = {"", "abc", "a.b", "a.b.c.d", "..", "a..c"};
    for (const auto& compact : cases) {
        auto result = authority_->verify(compact);
        ASSERT_TRUE(result.hasError()) << compact;
        EXPECT_TRUE(result.error().code() == ErrorCode::MalformedToken ||
                    result.error().code() == ErrorCode::SignatureMismatch)
            << compact;
    }

    auto oversized = authority_->verify(std::string(TokenAuthority::kMaxCompactLength + 1, 'a'));
    ASSERT_TRUE(oversized.hasError());
    EXPECT_EQ(oversized.error().code(), ErrorCode::MalformedToken);
}

TEST_F(TokenAuthorityTest, DecodeSkipsSignatureCheck) {
    auto token = issue();
    token.signature = "AAAA";
    auto decoded = authority_->decode(authority_->encode(token));
    ASSERT_TRUE(decoded.hasValue());
    EXPECT_EQ(decoded.value().tokenId, token.tokenId);
}

TEST_F(TokenAuthorityTest, ClaimTimesOutsideCalendarRangeAreMalformed) {
    const std::string header = detail::base64urlEncode(R"({"alg":"HS256","typ":"JWT"})");
    const std::string payloads[] = {
        R"({"exp":9223372036854775807,"iat":1,"jti":"x","sub":"mallory"})",
        R"({"exp":253402300800,"iat":1,"jti":"x","sub":"mallory"})",
        R"({"exp":10,"iat":-5,"jti":"x","sub":"mallory"})",
        R"({"exp":-1,"iat":-9223372036854775807,"jti":"x","sub":"mallory"})",
    };
    for (const auto& payload : payloads) {
        auto compact = header + "." + detail::base64urlEncode(payload) + ".AAAA";
        auto decoded = authority_->decode(compact);
        ASSERT_TRUE(decoded.hasError()) << payload;
        EXPECT_EQ(decoded.error().code(), ErrorCode::MalformedToken) << payload;
    }

    auto edge = header + "." +
                detail::base64urlEncode(
                    R"({"exp":253402300799,"iat":0,"jti":"x","sub":"mallory"})") +
                ".AAAA";
    auto decoded = authority_->decode(edge);
    ASSERT_TRUE(decoded.hasValue());
    EXPECT_EQ(std::chrono::duration_cast<std::chrono::seconds>(
                  decoded.value().expiresAt.time_since_epoch())
                  .count(),
              253402300799);
}

// -- Revocation ---------------------------------------------------------------

TEST_F(TokenAuthorityTest, RevokedTokenFailsVerification) {
    auto token = issue();
    auto first = authority_->revoke(token, RevocationReason::Logout);
    ASSERT_TRUE(first.hasValue());
    EXPECT_TRUE(first.value());

    auto result = authority_->verify(token);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::TokenRevoked);

    // Idempotent.
    auto second = authority_->revoke(token);
    ASSERT_TRUE(second.hasValue());
    EXPECT_FALSE(second.value());
    EXPECT_EQ(revocations_->find(token.tokenId)->reason, RevocationReason::Logout);
}

TEST_F(TokenAuthorityTest, RevocationDoesNotAffectOtherTokens) {
    auto a = issue();
    auto b = issue();
    ASSERT_TRUE(authority_->revoke(a).hasValue());
    EXPECT_TRUE(authority_->verify(b).hasValue());
}

TEST_F(TokenAuthorityTest, ExpiryReportedBeforeRevocation) {
    auto token = issue();
    ASSERT_TRUE(authority_->revoke(token).hasValue());
    clock_->advance(config_.tokenTtl + config_.clockSkewTolerance + 1s);
    auto result = authority_->verify(token);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::TokenExpired);
}

TEST_F(TokenAuthorityTest, RevokeWithoutSetFails) {
    auto detached = TokenAuthority::create(config_, clock_);
    ASSERT_TRUE(detached.hasValue());
    auto result = detached.value().revoke(issue());
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidInput);
}

// -- Configuration ------------------------------------------------------------

TEST(TokenAuthorityConfigTest, ShortSecretRejected) {
    auto config = csa::test::makeTestConfig();
    config.secretKey = std::string(kMinSecretKeyBytes - 1, 'k');
    auto result = TokenAuthority::create(config);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigInvalid);
}

TEST(TokenAuthorityConfigTest, Rs256WithoutKeyRejected) {
    auto config = csa::test::makeTestConfig();
    config.signingAlgorithm = SigningAlgorithm::RS256;
    auto result = TokenAuthority::create(config);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigInvalid);

    config.rsaPublicKeyPem = "-----BEGIN PUBLIC KEY-----\nnot a key\n-----END PUBLIC KEY-----\n";
    result = TokenAuthority::create(config);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigInvalid);
}

// =============================================================================
// RS256
// =============================================================================

class Rs256TokenAuthorityTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto& [priv, pub] = csa::test::testRsaKeypair();
        config_ = csa::test::makeTestConfig();
        config_.signingAlgorithm = SigningAlgorithm::RS256;
        config_.rsaPrivateKeyPem = priv;
        config_.rsaPublicKeyPem = pub;
        clock_ = csa::test::makeTestClock();
    }

    AuthConfig config_;
    std::shared_ptr<ManualClock> clock_;
};

TEST_F(Rs256TokenAuthorityTest, SignAndVerify) {
    auto authority = TokenAuthority::create(config_, clock_);
    ASSERT_TRUE(authority.hasValue()) << authority.error().message();
    EXPECT_TRUE(authority.value().canIssue());

    auto token = authority.value().issue("rsa-user");
    ASSERT_TRUE(token.hasValue());
    EXPECT_EQ(token.value().algorithm, SigningAlgorithm::RS256);

    auto subject = authority.value().verify(authority.value().encode(token.value()));
    ASSERT_TRUE(subject.hasValue());
    EXPECT_EQ(subject.value(), "rsa-user");
}

TEST_F(Rs256TokenAuthorityTest, PublicKeyOnlyVerifierCannotIssue) {
    auto issuer = TokenAuthority::create(config_, clock_);
    ASSERT_TRUE(issuer.hasValue());

    auto verifierConfig = config_;
    verifierConfig.rsaPrivateKeyPem.clear();
    auto verifier = TokenAuthority::create(verifierConfig, clock_);
    ASSERT_TRUE(verifier.hasValue());
    EXPECT_FALSE(verifier.value().canIssue());

    auto token = issuer.value().issue("rsa-user").value();
    auto subject = verifier.value().verify(issuer.value().encode(token));
    ASSERT_TRUE(subject.hasValue());
    EXPECT_EQ(subject.value(), "rsa-user");

    auto attempt = verifier.value().issue("rsa-user");
    ASSERT_TRUE(attempt.hasError());
    EXPECT_EQ(attempt.error().code(), ErrorCode::SigningFailed);
}

TEST_F(Rs256TokenAuthorityTest, HsTokenRejectedByRsVerifier) {
    auto hsConfig = csa::test::makeTestConfig();
    auto hs = TokenAuthority::create(hsConfig, clock_);
    auto rs = TokenAuthority::create(config_, clock_);
    ASSERT_TRUE(hs.hasValue());
    ASSERT_TRUE(rs.hasValue());

    auto hsToken = hs.value().issue("alice").value();
    auto result = rs.value().verify(hs.value().encode(hsToken));
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::SignatureMismatch);

    auto rsToken = rs.value().issue("alice").value();
    result = hs.value().verify(rs.value().encode(rsToken));
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::SignatureMismatch);
}
