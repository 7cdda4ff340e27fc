#pragma once

/// @file token_authority.hpp
/// @brief Issues and verifies signed, expiring session tokens.
///
/// Compact form (JWT-compatible layout):
///   base64url(header) . base64url(payload) . base64url(signature)
///
/// Header:  {"alg":"HS256","typ":"JWT"} or {"alg":"RS256","typ":"JWT"}
/// Payload: {"exp":N,"iat":N,"jti":"...","sub":"..."} with keys sorted,
///          integers in whole seconds and no whitespace.

#include <chrono>
#include <memory>
#include <string>
#include <string_view>

#include "csa/auth/auth_types.hpp"
#include "csa/auth/revocation_set.hpp"
#include "csa/foundation/auth_result.hpp"
#include "csa/foundation/clock.hpp"

namespace csa::auth {

/// Signed session token issuer and verifier.
///
/// Only the configured algorithm is accepted; the header's "alg" field is
/// checked against it but never used to pick the verification method.
/// The signature is checked over the raw signing input before anything
/// else in the token is interpreted.
///
/// Example (HS256):
/// @code
///   AuthConfig config;
///   config.secretKey = loadSecret();
///   auto authority = TokenAuthority::create(config, clock, revocations);
///   auto token = authority.value().issue("alice");
///   auto compact = authority.value().encode(token.value());
///   auto subject = authority.value().verify(compact);  // "alice"
/// @endcode
///
/// Example (RS256 verifier holding only the public key):
/// @code
///   config.signingAlgorithm = SigningAlgorithm::RS256;
///   config.rsaPublicKeyPem = publicPem;
///   auto verifier = TokenAuthority::create(config);
///   verifier.value().canIssue();  // false
/// @endcode
class TokenAuthority {
public:
    /// Token id length in random bytes (hex-encoded in the token).
    static constexpr std::size_t kTokenIdBytes = 16;

    /// Compact tokens longer than this are rejected unparsed.
    static constexpr std::size_t kMaxCompactLength = 4096;

    /// Build an authority from configuration. Fails with ConfigInvalid if
    /// the key material for the configured algorithm is missing or unusable.
    [[nodiscard]] static foundation::AuthResult<TokenAuthority> create(
        const AuthConfig& config,
        std::shared_ptr<foundation::IClock> clock = foundation::SystemClock::shared(),
        std::shared_ptr<RevocationSet> revocations = nullptr);

    ~TokenAuthority();
    TokenAuthority(TokenAuthority&&) noexcept;
    TokenAuthority& operator=(TokenAuthority&&) noexcept;
    TokenAuthority(const TokenAuthority&) = delete;
    TokenAuthority& operator=(const TokenAuthority&) = delete;

    /// Issue a token with the configured default lifetime.
    [[nodiscard]] foundation::AuthResult<SessionToken> issue(std::string_view subjectId) const;

    /// Issue a token valid for @p ttl (0 < ttl <= maxTokenTtl).
    [[nodiscard]] foundation::AuthResult<SessionToken> issue(std::string_view subjectId,
                                                             std::chrono::seconds ttl) const;

    /// Verify a compact token and return its subject.
    ///
    /// Errors, in the order they are checked: MalformedToken (layout),
    /// SignatureMismatch, MalformedToken (header/payload), TokenExpired,
    /// TokenRevoked.
    [[nodiscard]] foundation::AuthResult<std::string> verify(std::string_view compact) const;

    /// Verify a structured token (re-encoded, then checked as above).
    [[nodiscard]] foundation::AuthResult<std::string> verify(const SessionToken& token) const;

    /// Like verify() but returns every claim of the token.
    [[nodiscard]] foundation::AuthResult<SessionToken> verifyClaims(
        std::string_view compact) const;

    /// Add the token's id to the attached revocation set.
    /// Returns true if it was not yet revoked. Idempotent.
    foundation::AuthResult<bool> revoke(const SessionToken& token,
                                        RevocationReason reason = RevocationReason::Revoked) const;

    /// Compact form of a token (its signature is carried over unchanged).
    [[nodiscard]] std::string encode(const SessionToken& token) const;

    /// Parse a compact token without checking signature, expiry or
    /// revocation. For diagnostics and for callers that verify separately.
    [[nodiscard]] foundation::AuthResult<SessionToken> decode(std::string_view compact) const;

    void attachRevocations(std::shared_ptr<RevocationSet> revocations);

    [[nodiscard]] const std::shared_ptr<RevocationSet>& revocations() const noexcept {
        return revocations_;
    }

    /// False for an RS256 verifier configured without the private key.
    [[nodiscard]] bool canIssue() const noexcept;

    [[nodiscard]] SigningAlgorithm algorithm() const noexcept { return algorithm_; }

    [[nodiscard]] std::chrono::seconds clockSkewTolerance() const noexcept { return skew_; }

    [[nodiscard]] std::chrono::seconds maxTokenTtl() const noexcept { return maxTtl_; }

private:
    struct Keys;

    TokenAuthority(const AuthConfig& config,
                   std::shared_ptr<foundation::IClock> clock,
                   std::shared_ptr<RevocationSet> revocations,
                   std::unique_ptr<Keys> keys);

    [[nodiscard]] std::string headerSegment(SigningAlgorithm algorithm) const;
    [[nodiscard]] bool signatureValid(std::string_view signingInput,
                                      std::string_view encodedSignature) const;
    [[nodiscard]] foundation::AuthResult<std::string> sign(std::string_view signingInput) const;

    SigningAlgorithm algorithm_;
    std::chrono::seconds defaultTtl_;
    std::chrono::seconds maxTtl_;
    std::chrono::seconds skew_;
    std::shared_ptr<foundation::IClock> clock_;
    std::shared_ptr<RevocationSet> revocations_;
    std::unique_ptr<Keys> keys_;
};

}  // namespace csa::auth
