#pragma once

/// @file auth_types.hpp
/// @brief Core value types and configuration of the credential authority.
///
/// Defines credentials, session tokens, CSRF pairs, the session state
/// machine, and the algorithm selectors used across the auth layer.

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace csa::auth {

// -- Algorithms ---------------------------------------------------------------

/// Password derivation algorithm. Selected by configuration; every stored
/// hash carries its own tag so several algorithms can coexist.
enum class HashAlgorithm : uint8_t {
    Pbkdf2Sha256,  ///< PBKDF2-HMAC-SHA256, 2^workFactor iterations.
    Scrypt         ///< scrypt, N = 2^workFactor, r = 8, p = 1 (memory-hard).
};

/// Tag written into encoded hashes ("pbkdf2-sha256", "scrypt").
[[nodiscard]] std::string_view hashAlgorithmTag(HashAlgorithm algorithm);

/// Inverse of hashAlgorithmTag().
[[nodiscard]] std::optional<HashAlgorithm> parseHashAlgorithm(std::string_view tag);

/// Algorithm plus cost, the full parameter set of one derivation.
struct HashParams {
    HashAlgorithm algorithm = HashAlgorithm::Pbkdf2Sha256;
    uint32_t workFactor = 18;
};

/// Token signing algorithm.
enum class SigningAlgorithm : uint8_t {
    HS256,  ///< HMAC-SHA256 with a key derived from the shared secret.
    RS256   ///< RSA-SHA256; verifiers only need the public key.
};

[[nodiscard]] std::string_view signingAlgorithmName(SigningAlgorithm algorithm);

[[nodiscard]] std::optional<SigningAlgorithm> parseSigningAlgorithm(std::string_view name);

// -- Credentials --------------------------------------------------------------

/// Stored credential of one subject.
///
/// passwordHash is the self-describing string produced by PasswordHasher:
/// algorithm tag, work factor, salt and digest. It cannot be reversed.
struct Credential {
    std::string subjectId;
    std::string passwordHash;
};

// -- Tokens -------------------------------------------------------------------

/// Signed session token.
///
/// The signature covers {subjectId, issuedAt, expiresAt, tokenId} in
/// canonical form; changing any field invalidates it. Timestamps have
/// whole-second precision.
struct SessionToken {
    std::string subjectId;
    std::chrono::system_clock::time_point issuedAt{};
    std::chrono::system_clock::time_point expiresAt{};
    std::string tokenId;     ///< Unique per token, key of the revocation set.
    std::string signature;   ///< base64url-encoded signature bytes.
    SigningAlgorithm algorithm = SigningAlgorithm::HS256;
};

/// Double-submit anti-forgery pair: the cookie the browser sends
/// automatically and the header value the page script echoes.
struct CsrfPair {
    std::string cookieValue;
    std::string headerValue;
};

/// Why a token id entered the revocation set.
enum class RevocationReason : uint8_t {
    Logout,   ///< Holder ended the session.
    Revoked   ///< Invalidated by the server (password change, admin action).
};

/// Observable lifecycle of a session.
enum class SessionState : uint8_t {
    Anonymous,      ///< No (valid) token presented.
    Authenticated,  ///< Token verifies.
    Expired,        ///< Token past expiry + skew.
    Revoked,        ///< Token invalidated by the server.
    LoggedOut       ///< Token ended by its holder.
};

[[nodiscard]] std::string_view sessionStateName(SessionState state);

/// Everything a client receives on successful login.
struct LoginResult {
    SessionToken token;
    std::string encodedToken;  ///< Compact form for the Authorization header.
    CsrfPair csrf;
};

// -- Configuration ------------------------------------------------------------

/// Configuration of the authority. Loaded from YAML by loadAuthConfig().
struct AuthConfig {
    /// Password derivation used for new hashes.
    HashAlgorithm hashAlgorithm = HashAlgorithm::Pbkdf2Sha256;

    /// Cost of new hashes; each step doubles the work.
    uint32_t workFactor = 18;

    /// Passwords longer than this are rejected before any derivation.
    uint32_t maxPasswordLength = 256;

    /// Default session token lifetime.
    std::chrono::seconds tokenTtl{900};  // 15 minutes

    /// Upper bound for any requested token lifetime.
    std::chrono::seconds maxTokenTtl{86400};  // 1 day

    /// Leeway applied to expiry checks for issuer/verifier clock drift.
    std::chrono::seconds clockSkewTolerance{30};

    /// Master secret (raw bytes). Token and CSRF keys are derived from it.
    std::string secretKey;

    SigningAlgorithm signingAlgorithm = SigningAlgorithm::HS256;

    /// PEM-encoded RSA private key (RS256 issuers only).
    std::string rsaPrivateKeyPem;

    /// PEM-encoded RSA public key (RS256 verifiers).
    std::string rsaPublicKeyPem;

    /// Maximum age of a CSRF value; zero binds it to the session only.
    std::chrono::seconds csrfMaxAge{0};

    /// Interval between revocation pruning passes.
    std::chrono::seconds revocationPruneInterval{300};  // 5 minutes

    /// Login attempts allowed per client key within the window.
    uint32_t loginRateLimitMaxAttempts = 5;

    std::chrono::seconds loginRateLimitWindow{60};

    [[nodiscard]] HashParams hashParams() const { return {hashAlgorithm, workFactor}; }
};

/// Minimum master secret length accepted for HS256.
inline constexpr std::size_t kMinSecretKeyBytes = 32;

}  // namespace csa::auth
