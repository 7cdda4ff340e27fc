/// @file token_authority.cpp
/// @brief TokenAuthority implementation with HS256 and RS256 signing.

#include "csa/auth/token_authority.hpp"

#include "csa/foundation/auth_logger.hpp"
#include "csa/foundation/error_code.hpp"

#include "canonical_json.hpp"
#include "crypto_utils.hpp"
#include "rsa_utils.hpp"

#include <array>

namespace csa::auth {

using foundation::AuthError;
using foundation::AuthResult;
using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

namespace {

constexpr std::string_view kTokenKeyLabel = "csa/token-signing/v1";

/// Claim times must fit a system_clock time_point: the epoch through
/// 9999-12-31T23:59:59Z.
constexpr int64_t kMaxClaimEpoch = 253402300799;

int64_t toEpoch(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point fromEpoch(int64_t epoch) {
    return std::chrono::system_clock::time_point(std::chrono::seconds(epoch));
}

/// Exactly three non-empty dot-separated segments.
std::optional<std::array<std::string_view, 3>> splitCompact(std::string_view compact) {
    auto first = compact.find('.');
    if (first == std::string_view::npos) {
        return std::nullopt;
    }
    auto second = compact.find('.', first + 1);
    if (second == std::string_view::npos ||
        compact.find('.', second + 1) != std::string_view::npos) {
        return std::nullopt;
    }
    std::array<std::string_view, 3> parts = {compact.substr(0, first),
                                             compact.substr(first + 1, second - first - 1),
                                             compact.substr(second + 1)};
    for (auto part : parts) {
        if (part.empty()) {
            return std::nullopt;
        }
    }
    return parts;
}

AuthError malformed(std::string message) {
    return AuthError(ErrorCode::MalformedToken, std::move(message));
}

std::string payloadJson(const SessionToken& token) {
    detail::FlatJsonObject payload;
    payload.emplace("exp", toEpoch(token.expiresAt));
    payload.emplace("iat", toEpoch(token.issuedAt));
    payload.emplace("jti", token.tokenId);
    payload.emplace("sub", token.subjectId);
    return detail::writeCanonicalJson(payload);
}

/// Interpret decoded header and payload segments.
AuthResult<SessionToken> parseSegments(std::string_view headerSegment,
                                       std::string_view payloadSegment,
                                       std::string_view signatureSegment) {
    auto headerText = detail::base64urlDecode(headerSegment);
    if (!headerText) {
        return AuthResult<SessionToken>::err(malformed("header is not base64url"));
    }
    auto header = detail::parseFlatJson(*headerText);
    if (!header || header->size() != 2) {
        return AuthResult<SessionToken>::err(malformed("header is not {alg, typ}"));
    }
    auto alg = detail::stringField(*header, "alg");
    auto typ = detail::stringField(*header, "typ");
    if (!alg || !typ || *typ != "JWT") {
        return AuthResult<SessionToken>::err(malformed("header is not {alg, typ}"));
    }
    auto algorithm = parseSigningAlgorithm(*alg);
    if (!algorithm) {
        return AuthResult<SessionToken>::err(malformed("unknown signing algorithm"));
    }

    auto payloadText = detail::base64urlDecode(payloadSegment);
    if (!payloadText) {
        return AuthResult<SessionToken>::err(malformed("payload is not base64url"));
    }
    auto payload = detail::parseFlatJson(*payloadText);
    if (!payload || payload->size() != 4) {
        return AuthResult<SessionToken>::err(malformed("payload is not {exp, iat, jti, sub}"));
    }
    auto exp = detail::integerField(*payload, "exp");
    auto iat = detail::integerField(*payload, "iat");
    auto jti = detail::stringField(*payload, "jti");
    auto sub = detail::stringField(*payload, "sub");
    if (!exp || !iat || !jti || !sub) {
        return AuthResult<SessionToken>::err(malformed("payload is not {exp, iat, jti, sub}"));
    }
    if (sub->empty() || jti->empty()) {
        return AuthResult<SessionToken>::err(malformed("empty subject or token id"));
    }
    if (*iat < 0 || *exp < 0 || *iat > kMaxClaimEpoch || *exp > kMaxClaimEpoch) {
        return AuthResult<SessionToken>::err(malformed("claim time out of range"));
    }
    if (*exp <= *iat) {
        return AuthResult<SessionToken>::err(malformed("expiry does not follow issue time"));
    }

    SessionToken token;
    token.subjectId = std::move(*sub);
    token.issuedAt = fromEpoch(*iat);
    token.expiresAt = fromEpoch(*exp);
    token.tokenId = std::move(*jti);
    token.signature = std::string(signatureSegment);
    token.algorithm = *algorithm;
    return AuthResult<SessionToken>::ok(std::move(token));
}

}  // namespace

// ---------------------------------------------------------------------------
// Key material
// ---------------------------------------------------------------------------

struct TokenAuthority::Keys {
    std::string hmacKey;
    detail::PkeyPtr privateKey;
    detail::PkeyPtr publicKey;

    /// Key used to check RS256 signatures: the public key, or the private
    /// key when only that was configured.
    [[nodiscard]] EVP_PKEY* verifyKey() const {
        return publicKey ? publicKey.get() : privateKey.get();
    }
};

AuthResult<TokenAuthority> TokenAuthority::create(const AuthConfig& config,
                                                  std::shared_ptr<foundation::IClock> clock,
                                                  std::shared_ptr<RevocationSet> revocations) {
    auto keys = std::make_unique<Keys>();

    switch (config.signingAlgorithm) {
        case SigningAlgorithm::HS256: {
            if (config.secretKey.size() < kMinSecretKeyBytes) {
                return AuthResult<TokenAuthority>::err(
                    AuthError(ErrorCode::ConfigInvalid,
                              "HS256 requires a secret of at least " +
                                  std::to_string(kMinSecretKeyBytes) + " bytes"));
            }
            auto derived = detail::deriveKey(config.secretKey, kTokenKeyLabel);
            if (!derived) {
                return AuthResult<TokenAuthority>::err(
                    AuthError(ErrorCode::ConfigInvalid, "token key derivation failed"));
            }
            keys->hmacKey = std::move(*derived);
            break;
        }
        case SigningAlgorithm::RS256: {
            if (!config.rsaPrivateKeyPem.empty()) {
                keys->privateKey = detail::loadPrivateKey(config.rsaPrivateKeyPem);
                if (!keys->privateKey) {
                    return AuthResult<TokenAuthority>::err(
                        AuthError(ErrorCode::ConfigInvalid, "RSA private key PEM does not load"));
                }
            }
            if (!config.rsaPublicKeyPem.empty()) {
                keys->publicKey = detail::loadPublicKey(config.rsaPublicKeyPem);
                if (!keys->publicKey) {
                    return AuthResult<TokenAuthority>::err(
                        AuthError(ErrorCode::ConfigInvalid, "RSA public key PEM does not load"));
                }
            }
            if (keys->verifyKey() == nullptr) {
                return AuthResult<TokenAuthority>::err(
                    AuthError(ErrorCode::ConfigInvalid, "RS256 requires an RSA key"));
            }
            break;
        }
    }

    if (!clock) {
        clock = foundation::SystemClock::shared();
    }
    return AuthResult<TokenAuthority>::ok(
        TokenAuthority(config, std::move(clock), std::move(revocations), std::move(keys)));
}

TokenAuthority::TokenAuthority(const AuthConfig& config,
                               std::shared_ptr<foundation::IClock> clock,
                               std::shared_ptr<RevocationSet> revocations,
                               std::unique_ptr<Keys> keys)
    : algorithm_(config.signingAlgorithm),
      defaultTtl_(config.tokenTtl),
      maxTtl_(config.maxTokenTtl),
      skew_(config.clockSkewTolerance),
      clock_(std::move(clock)),
      revocations_(std::move(revocations)),
      keys_(std::move(keys)) {}

TokenAuthority::~TokenAuthority() = default;
TokenAuthority::TokenAuthority(TokenAuthority&&) noexcept = default;
TokenAuthority& TokenAuthority::operator=(TokenAuthority&&) noexcept = default;

bool TokenAuthority::canIssue() const noexcept {
    if (algorithm_ == SigningAlgorithm::HS256) {
        return !keys_->hmacKey.empty();
    }
    return static_cast<bool>(keys_->privateKey);
}

void TokenAuthority::attachRevocations(std::shared_ptr<RevocationSet> revocations) {
    revocations_ = std::move(revocations);
}

// ---------------------------------------------------------------------------
// Signing
// ---------------------------------------------------------------------------

std::string TokenAuthority::headerSegment(SigningAlgorithm algorithm) const {
    detail::FlatJsonObject header;
    header.emplace("alg", std::string(signingAlgorithmName(algorithm)));
    header.emplace("typ", std::string("JWT"));
    return detail::base64urlEncode(detail::writeCanonicalJson(header));
}

AuthResult<std::string> TokenAuthority::sign(std::string_view signingInput) const {
    if (algorithm_ == SigningAlgorithm::RS256) {
        if (!keys_->privateKey) {
            return AuthResult<std::string>::err(
                AuthError(ErrorCode::SigningFailed, "no RSA private key configured"));
        }
        auto sig = detail::rsaSha256Sign(keys_->privateKey.get(), signingInput);
        if (!sig) {
            return AuthResult<std::string>::err(
                AuthError(ErrorCode::SigningFailed, "RSA signing failed"));
        }
        return AuthResult<std::string>::ok(detail::base64urlEncode(*sig));
    }

    auto mac = detail::hmacSha256(keys_->hmacKey, signingInput);
    if (!mac) {
        return AuthResult<std::string>::err(
            AuthError(ErrorCode::SigningFailed, "HMAC computation failed"));
    }
    return AuthResult<std::string>::ok(detail::base64urlEncode(mac->data(), mac->size()));
}

bool TokenAuthority::signatureValid(std::string_view signingInput,
                                    std::string_view encodedSignature) const {
    if (algorithm_ == SigningAlgorithm::RS256) {
        auto sigBytes = detail::base64urlDecode(encodedSignature);
        if (!sigBytes) {
            return false;
        }
        return detail::rsaSha256Verify(keys_->verifyKey(), signingInput, *sigBytes);
    }

    auto mac = detail::hmacSha256(keys_->hmacKey, signingInput);
    if (!mac) {
        return false;
    }
    // Strict base64url makes the encoding canonical, so comparing the
    // encoded form compares the bytes.
    return detail::constantTimeEqual(detail::base64urlEncode(mac->data(), mac->size()),
                                     encodedSignature);
}

// ---------------------------------------------------------------------------
// issue()
// ---------------------------------------------------------------------------

AuthResult<SessionToken> TokenAuthority::issue(std::string_view subjectId) const {
    return issue(subjectId, defaultTtl_);
}

AuthResult<SessionToken> TokenAuthority::issue(std::string_view subjectId,
                                               std::chrono::seconds ttl) const {
    if (subjectId.empty()) {
        return AuthResult<SessionToken>::err(
            AuthError(ErrorCode::InvalidInput, "subject must not be empty"));
    }
    if (ttl.count() <= 0 || ttl > maxTtl_) {
        return AuthResult<SessionToken>::err(
            AuthError(ErrorCode::InvalidInput,
                      "token ttl must be in (0, " + std::to_string(maxTtl_.count()) + "] seconds"));
    }

    auto tokenId = detail::secureRandomHex(kTokenIdBytes);
    if (!tokenId) {
        CSA_LOG_ERROR(LogCategory::Token, "random token id generation failed");
        return AuthResult<SessionToken>::err(
            AuthError(ErrorCode::SigningFailed, "random token id generation failed"));
    }

    SessionToken token;
    token.subjectId = std::string(subjectId);
    token.issuedAt = std::chrono::time_point_cast<std::chrono::seconds>(clock_->now());
    token.expiresAt = token.issuedAt + ttl;
    token.tokenId = std::move(*tokenId);
    token.algorithm = algorithm_;

    auto signingInput =
        headerSegment(algorithm_) + "." + detail::base64urlEncode(payloadJson(token));
    auto signature = sign(signingInput);
    if (!signature) {
        CSA_LOG_ERROR(LogCategory::Token, std::string(signature.error().message()));
        return AuthResult<SessionToken>::err(signature.error());
    }
    token.signature = std::move(signature).value();

    LogContext ctx;
    ctx.subjectId = token.subjectId;
    ctx.tokenId = foundation::redactTokenId(token.tokenId);
    ctx.extra["ttl_s"] = std::to_string(ttl.count());
    CSA_LOG_CTX(LogLevel::Debug, LogCategory::Token, "token issued", ctx);

    return AuthResult<SessionToken>::ok(std::move(token));
}

// ---------------------------------------------------------------------------
// verify()
// ---------------------------------------------------------------------------

AuthResult<SessionToken> TokenAuthority::verifyClaims(std::string_view compact) const {
    if (compact.size() > kMaxCompactLength) {
        return AuthResult<SessionToken>::err(malformed("token too long"));
    }
    auto parts = splitCompact(compact);
    if (!parts) {
        return AuthResult<SessionToken>::err(malformed("expected three dot-separated segments"));
    }

    auto signingInput = compact.substr(0, (*parts)[0].size() + 1 + (*parts)[1].size());
    if (!signatureValid(signingInput, (*parts)[2])) {
        CSA_LOG_DEBUG(LogCategory::Token, "token signature mismatch");
        return AuthResult<SessionToken>::err(
            AuthError(ErrorCode::SignatureMismatch, "token signature mismatch"));
    }

    auto parsed = parseSegments((*parts)[0], (*parts)[1], (*parts)[2]);
    if (!parsed) {
        return parsed;
    }
    auto& token = parsed.value();
    if (token.algorithm != algorithm_) {
        return AuthResult<SessionToken>::err(malformed("unexpected signing algorithm"));
    }

    if (clock_->now() > token.expiresAt + skew_) {
        return AuthResult<SessionToken>::err(
            AuthError(ErrorCode::TokenExpired, "token has expired"));
    }

    if (revocations_ && revocations_->isRevoked(token.tokenId)) {
        return AuthResult<SessionToken>::err(
            AuthError(ErrorCode::TokenRevoked, "token has been revoked"));
    }

    return parsed;
}

AuthResult<std::string> TokenAuthority::verify(std::string_view compact) const {
    auto claims = verifyClaims(compact);
    if (!claims) {
        return AuthResult<std::string>::err(claims.error());
    }
    return AuthResult<std::string>::ok(std::move(claims.value().subjectId));
}

AuthResult<std::string> TokenAuthority::verify(const SessionToken& token) const {
    return verify(encode(token));
}

// ---------------------------------------------------------------------------
// revoke() / encode() / decode()
// ---------------------------------------------------------------------------

AuthResult<bool> TokenAuthority::revoke(const SessionToken& token,
                                        RevocationReason reason) const {
    if (!revocations_) {
        return AuthResult<bool>::err(
            AuthError(ErrorCode::InvalidInput, "no revocation set attached"));
    }
    if (token.tokenId.empty()) {
        return AuthResult<bool>::err(malformed("token has no id"));
    }
    bool added = revocations_->revoke(token.tokenId, token.expiresAt, reason);
    if (added) {
        LogContext ctx;
        ctx.subjectId = token.subjectId;
        ctx.tokenId = foundation::redactTokenId(token.tokenId);
        CSA_LOG_CTX(LogLevel::Info, LogCategory::Token, "token revoked", ctx);
    }
    return AuthResult<bool>::ok(added);
}

std::string TokenAuthority::encode(const SessionToken& token) const {
    return headerSegment(token.algorithm) + "." + detail::base64urlEncode(payloadJson(token)) +
           "." + token.signature;
}

AuthResult<SessionToken> TokenAuthority::decode(std::string_view compact) const {
    if (compact.size() > kMaxCompactLength) {
        return AuthResult<SessionToken>::err(malformed("token too long"));
    }
    auto parts = splitCompact(compact);
    if (!parts) {
        return AuthResult<SessionToken>::err(malformed("expected three dot-separated segments"));
    }
    return parseSegments((*parts)[0], (*parts)[1], (*parts)[2]);
}

}  // namespace csa::auth
