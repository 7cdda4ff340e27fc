/// @file password_hasher.cpp
/// @brief PasswordHasher over OpenSSL PBKDF2-HMAC-SHA256 and scrypt.

#include "csa/auth/password_hasher.hpp"

#include "csa/foundation/auth_logger.hpp"
#include "csa/foundation/error_code.hpp"

#include "crypto_utils.hpp"

#include <charconv>
#include <vector>

namespace csa::auth {

using foundation::AuthError;
using foundation::AuthResult;
using foundation::ErrorCode;
using foundation::LogCategory;

namespace {

constexpr uint64_t kScryptR = 8;
constexpr uint64_t kScryptP = 1;

std::vector<std::string_view> splitDollar(std::string_view s) {
    std::vector<std::string_view> parts;
    std::size_t start = 0;
    while (true) {
        auto pos = s.find('$', start);
        if (pos == std::string_view::npos) {
            parts.push_back(s.substr(start));
            return parts;
        }
        parts.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
}

AuthError malformed(std::string message) {
    return AuthError(ErrorCode::MalformedHash, std::move(message));
}

}  // namespace

PasswordHasher::PasswordHasher(HashParams defaults, uint32_t maxPasswordLength)
    : defaults_(defaults), maxPasswordLength_(maxPasswordLength) {}

std::pair<uint32_t, uint32_t> PasswordHasher::workFactorRange(HashAlgorithm algorithm) {
    switch (algorithm) {
        case HashAlgorithm::Pbkdf2Sha256: return {4, 30};
        case HashAlgorithm::Scrypt:       return {4, 20};
    }
    return {0, 0};
}

AuthResult<std::string> PasswordHasher::hash(std::string_view password) const {
    return hash(password, defaults_);
}

AuthResult<std::string> PasswordHasher::hash(std::string_view password,
                                             uint32_t workFactor) const {
    return hash(password, HashParams{defaults_.algorithm, workFactor});
}

AuthResult<std::string> PasswordHasher::hash(std::string_view password,
                                             const HashParams& params) const {
    if (password.empty()) {
        return AuthResult<std::string>::err(
            AuthError(ErrorCode::InvalidInput, "password must not be empty"));
    }
    if (password.size() > maxPasswordLength_) {
        return AuthResult<std::string>::err(
            AuthError(ErrorCode::InvalidInput,
                      "password exceeds maximum length of " + std::to_string(maxPasswordLength_)));
    }
    auto [minWf, maxWf] = workFactorRange(params.algorithm);
    if (params.workFactor < minWf || params.workFactor > maxWf) {
        return AuthResult<std::string>::err(
            AuthError(ErrorCode::InvalidInput,
                      "work factor " + std::to_string(params.workFactor) + " outside [" +
                          std::to_string(minWf) + ", " + std::to_string(maxWf) + "] for " +
                          std::string(hashAlgorithmTag(params.algorithm))));
    }

    auto salt = detail::secureRandomBytes(kSaltBytes);
    if (!salt) {
        CSA_LOG_ERROR(LogCategory::Hasher, "random salt generation failed");
        return AuthResult<std::string>::err(
            AuthError(ErrorCode::Unknown, "random salt generation failed"));
    }

    auto digest = derive(password, *salt, params);
    if (!digest) {
        return AuthResult<std::string>::err(digest.error());
    }
    return AuthResult<std::string>::ok(
        encode(EncodedHash{params, std::move(*salt), std::move(digest).value()}));
}

AuthResult<bool> PasswordHasher::verify(std::string_view password,
                                        std::string_view encodedHash) const {
    auto decoded = decode(encodedHash);
    if (!decoded) {
        CSA_LOG_WARN(LogCategory::Hasher, "stored password hash is malformed");
        return AuthResult<bool>::err(decoded.error());
    }
    if (password.empty() || password.size() > maxPasswordLength_) {
        return AuthResult<bool>::ok(false);
    }

    const auto& stored = decoded.value();
    auto computed = derive(password, stored.salt, stored.params);
    if (!computed) {
        return AuthResult<bool>::err(computed.error());
    }
    return AuthResult<bool>::ok(detail::constantTimeEqual(computed.value(), stored.digest));
}

AuthResult<bool> PasswordHasher::needsRehash(std::string_view encodedHash) const {
    auto decoded = decode(encodedHash);
    if (!decoded) {
        return AuthResult<bool>::err(decoded.error());
    }
    const auto& params = decoded.value().params;
    return AuthResult<bool>::ok(params.algorithm != defaults_.algorithm ||
                                params.workFactor < defaults_.workFactor);
}

AuthResult<EncodedHash> PasswordHasher::decode(std::string_view encodedHash) {
    // "$tag$wf$salt$digest" splits into ["", tag, wf, salt, digest].
    auto parts = splitDollar(encodedHash);
    if (parts.size() != 5 || !parts[0].empty()) {
        return AuthResult<EncodedHash>::err(malformed("expected $tag$wf$salt$digest"));
    }

    auto algorithm = parseHashAlgorithm(parts[1]);
    if (!algorithm) {
        return AuthResult<EncodedHash>::err(malformed("unknown hash algorithm tag"));
    }

    const auto& wfText = parts[2];
    uint32_t workFactor = 0;
    auto [ptr, ec] = std::from_chars(wfText.data(), wfText.data() + wfText.size(), workFactor);
    if (wfText.empty() || ec != std::errc{} || ptr != wfText.data() + wfText.size() ||
        (wfText.size() > 1 && wfText[0] == '0')) {
        return AuthResult<EncodedHash>::err(malformed("work factor is not a decimal integer"));
    }
    auto [minWf, maxWf] = workFactorRange(*algorithm);
    if (workFactor < minWf || workFactor > maxWf) {
        return AuthResult<EncodedHash>::err(malformed("work factor out of range"));
    }

    auto salt = detail::base64urlDecode(parts[3]);
    if (!salt || salt->size() < kSaltBytes) {
        return AuthResult<EncodedHash>::err(malformed("salt is not valid base64url of >= 16 bytes"));
    }
    auto digest = detail::base64urlDecode(parts[4]);
    if (!digest || digest->size() != kDigestBytes) {
        return AuthResult<EncodedHash>::err(malformed("digest is not valid base64url of 32 bytes"));
    }

    return AuthResult<EncodedHash>::ok(
        EncodedHash{HashParams{*algorithm, workFactor}, std::move(*salt), std::move(*digest)});
}

std::string PasswordHasher::encode(const EncodedHash& hash) {
    std::string out;
    out += '$';
    out += hashAlgorithmTag(hash.params.algorithm);
    out += '$';
    out += std::to_string(hash.params.workFactor);
    out += '$';
    out += detail::base64urlEncode(hash.salt);
    out += '$';
    out += detail::base64urlEncode(hash.digest);
    return out;
}

AuthResult<std::string> PasswordHasher::derive(std::string_view password,
                                               std::string_view salt,
                                               const HashParams& params) const {
    const uint64_t cost = uint64_t{1} << params.workFactor;
    std::optional<std::string> digest;
    switch (params.algorithm) {
        case HashAlgorithm::Pbkdf2Sha256:
            digest = detail::pbkdf2Sha256(password, salt, cost, kDigestBytes);
            break;
        case HashAlgorithm::Scrypt:
            digest = detail::scrypt(password, salt, cost, kScryptR, kScryptP, kDigestBytes);
            break;
    }
    if (!digest) {
        CSA_LOG_ERROR(LogCategory::Hasher,
                      std::string("key derivation failed for ") +
                          std::string(hashAlgorithmTag(params.algorithm)));
        return AuthResult<std::string>::err(
            AuthError(ErrorCode::Unknown, "key derivation failed"));
    }
    return AuthResult<std::string>::ok(std::move(*digest));
}

}  // namespace csa::auth
