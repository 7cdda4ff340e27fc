#include <gtest/gtest.h>

#include <chrono>
#include <string>

#include "auth_test_config.hpp"
#include "rsa_test_keys.hpp"

#include "csa/auth/auth_config_loader.hpp"
#include "csa/foundation/config_manager.hpp"
#include "csa/foundation/error_code.hpp"

using namespace csa::auth;
using csa::foundation::ConfigManager;
using csa::foundation::ErrorCode;
using namespace std::chrono_literals;

namespace {

const std::string kHexSecret =
    "hex:000102030405060708090a0b0c0d0e0f101112131415161718191a1b1c1d1e1f";

ConfigManager loadYaml(const std::string& yaml) {
    ConfigManager config;
    auto result = config.loadFromString(yaml);
    EXPECT_TRUE(result.hasValue());
    return config;
}

}  // namespace

// ---------------------------------------------------------------------------
// loadAuthConfig
// ---------------------------------------------------------------------------

TEST(AuthConfigLoaderTest, MinimalConfigUsesDefaults) {
    auto config = loadYaml("auth:\n  secret_key: \"" + kHexSecret + "\"\n");
    auto result = loadAuthConfig(config);
    ASSERT_TRUE(result.hasValue()) << result.error().message();

    const auto& auth = result.value();
    AuthConfig defaults;
    EXPECT_EQ(auth.secretKey.size(), 32u);
    EXPECT_EQ(static_cast<unsigned char>(auth.secretKey[31]), 0x1fu);
    EXPECT_EQ(auth.hashAlgorithm, defaults.hashAlgorithm);
    EXPECT_EQ(auth.workFactor, defaults.workFactor);
    EXPECT_EQ(auth.tokenTtl, defaults.tokenTtl);
    EXPECT_EQ(auth.signingAlgorithm, SigningAlgorithm::HS256);
    EXPECT_EQ(auth.csrfMaxAge, 0s);
}

TEST(AuthConfigLoaderTest, FullConfig) {
    auto config = loadYaml(R"(
auth:
  hash_algorithm: scrypt
  work_factor: 15
  max_password_length: 128
  token_ttl_seconds: 600
  max_token_ttl_seconds: 7200
  clock_skew_tolerance_seconds: 10
  secret_key: AAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAA
  signing_algorithm: HS256
  csrf_max_age_seconds: 3600
  revocation_prune_interval_seconds: 120
  login_rate_limit_max_attempts: 10
  login_rate_limit_window_seconds: 300
)");
    auto result = loadAuthConfig(config);
    ASSERT_TRUE(result.hasValue()) << result.error().message();

    const auto& auth = result.value();
    EXPECT_EQ(auth.hashAlgorithm, HashAlgorithm::Scrypt);
    EXPECT_EQ(auth.workFactor, 15u);
    EXPECT_EQ(auth.maxPasswordLength, 128u);
    EXPECT_EQ(auth.tokenTtl, 600s);
    EXPECT_EQ(auth.maxTokenTtl, 7200s);
    EXPECT_EQ(auth.clockSkewTolerance, 10s);
    EXPECT_EQ(auth.secretKey, std::string(32, '\0'));
    EXPECT_EQ(auth.csrfMaxAge, 3600s);
    EXPECT_EQ(auth.revocationPruneInterval, 120s);
    EXPECT_EQ(auth.loginRateLimitMaxAttempts, 10u);
    EXPECT_EQ(auth.loginRateLimitWindow, 300s);
}

TEST(AuthConfigLoaderTest, MissingSecretRejected) {
    auto config = loadYaml("auth:\n  work_factor: 10\n");
    auto result = loadAuthConfig(config);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigInvalid);
}

TEST(AuthConfigLoaderTest, UndecodableSecretRejected) {
    auto config = loadYaml("auth:\n  secret_key: \"hex:zz\"\n");
    auto result = loadAuthConfig(config);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigInvalid);
}

TEST(AuthConfigLoaderTest, UnknownAlgorithmsRejected) {
    auto hash = loadYaml("auth:\n  secret_key: \"" + kHexSecret + "\"\n  hash_algorithm: md5\n");
    auto result = loadAuthConfig(hash);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigInvalid);

    auto signing =
        loadYaml("auth:\n  secret_key: \"" + kHexSecret + "\"\n  signing_algorithm: none\n");
    result = loadAuthConfig(signing);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigInvalid);
}

TEST(AuthConfigLoaderTest, TypeMismatchReported) {
    auto config = loadYaml("auth:\n  secret_key: \"" + kHexSecret + "\"\n  work_factor: high\n");
    auto result = loadAuthConfig(config);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST(AuthConfigLoaderTest, NegativeDurationRejected) {
    auto config =
        loadYaml("auth:\n  secret_key: \"" + kHexSecret + "\"\n  token_ttl_seconds: -5\n");
    auto result = loadAuthConfig(config);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigInvalid);
}

// ---------------------------------------------------------------------------
// validateAuthConfig
// ---------------------------------------------------------------------------

TEST(AuthConfigValidationTest, TestConfigIsValid) {
    EXPECT_TRUE(validateAuthConfig(csa::test::makeTestConfig()).hasValue());
}

TEST(AuthConfigValidationTest, RejectsInconsistentValues) {
    auto expectInvalid = [](AuthConfig config, const char* what) {
        auto result = validateAuthConfig(config);
        ASSERT_TRUE(result.hasError()) << what;
        EXPECT_EQ(result.error().code(), ErrorCode::ConfigInvalid) << what;
    };

    auto config = csa::test::makeTestConfig();
    config.workFactor = 3;
    expectInvalid(config, "work factor below range");

    config = csa::test::makeTestConfig();
    config.hashAlgorithm = HashAlgorithm::Scrypt;
    config.workFactor = 21;
    expectInvalid(config, "scrypt work factor above range");

    config = csa::test::makeTestConfig();
    config.maxPasswordLength = 0;
    expectInvalid(config, "zero max password length");

    config = csa::test::makeTestConfig();
    config.tokenTtl = config.maxTokenTtl + 1s;
    expectInvalid(config, "ttl above max");

    config = csa::test::makeTestConfig();
    config.clockSkewTolerance = -1s;
    expectInvalid(config, "negative skew");

    config = csa::test::makeTestConfig();
    config.revocationPruneInterval = 0s;
    expectInvalid(config, "zero prune interval");

    config = csa::test::makeTestConfig();
    config.loginRateLimitWindow = 0s;
    expectInvalid(config, "zero rate window");

    config = csa::test::makeTestConfig();
    config.secretKey = std::string(kMinSecretKeyBytes - 1, 'x');
    expectInvalid(config, "short secret");

    config = csa::test::makeTestConfig();
    config.signingAlgorithm = SigningAlgorithm::RS256;
    expectInvalid(config, "RS256 without keys");

    config.rsaPrivateKeyPem = "not a pem";
    expectInvalid(config, "RS256 with bad key");
}

TEST(AuthConfigValidationTest, RateLimitDisabledNeedsNoWindow) {
    auto config = csa::test::makeTestConfig();
    config.loginRateLimitMaxAttempts = 0;
    config.loginRateLimitWindow = 0s;
    EXPECT_TRUE(validateAuthConfig(config).hasValue());
}

TEST(AuthConfigValidationTest, Rs256WithKeysIsValid) {
    const auto& [priv, pub] = csa::test::testRsaKeypair();
    auto config = csa::test::makeTestConfig();
    config.signingAlgorithm = SigningAlgorithm::RS256;
    config.rsaPrivateKeyPem = priv;
    config.rsaPublicKeyPem = pub;
    EXPECT_TRUE(validateAuthConfig(config).hasValue());

    config.rsaPrivateKeyPem.clear();
    EXPECT_TRUE(validateAuthConfig(config).hasValue());
}

// ---------------------------------------------------------------------------
// decodeSecretKey
// ---------------------------------------------------------------------------

TEST(DecodeSecretKeyTest, HexAndBase64Url) {
    auto hex = decodeSecretKey("hex:414243");
    ASSERT_TRUE(hex.hasValue());
    EXPECT_EQ(hex.value(), "ABC");

    auto b64 = decodeSecretKey("QUJD");
    ASSERT_TRUE(b64.hasValue());
    EXPECT_EQ(b64.value(), "ABC");

    EXPECT_TRUE(decodeSecretKey("hex:4").hasError());
    EXPECT_TRUE(decodeSecretKey("not base64!").hasError());
}
