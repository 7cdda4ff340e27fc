/// @file auth_config_loader.cpp
/// @brief loadAuthConfig() / validateAuthConfig() implementation.

#include "csa/auth/auth_config_loader.hpp"

#include "csa/auth/password_hasher.hpp"
#include "csa/foundation/auth_logger.hpp"
#include "csa/foundation/error_code.hpp"

#include "crypto_utils.hpp"
#include "rsa_utils.hpp"

#include <cstdint>
#include <limits>

namespace csa::auth {

using foundation::AuthError;
using foundation::AuthResult;
using foundation::ConfigManager;
using foundation::ErrorCode;
using foundation::LogCategory;

namespace {

AuthError invalid(std::string message) {
    return AuthError(ErrorCode::ConfigInvalid, std::move(message));
}

/// Read an optional key into @p out. Missing keys keep the default.
template <typename T>
AuthResult<void> readOptional(const ConfigManager& config, std::string_view key, T& out) {
    if (!config.hasKey(key)) {
        return AuthResult<void>::ok();
    }
    auto value = config.get<T>(key);
    if (!value) {
        return AuthResult<void>::err(value.error());
    }
    out = std::move(value).value();
    return AuthResult<void>::ok();
}

/// Read a non-negative integer no larger than @p max.
AuthResult<void> readBounded(const ConfigManager& config, std::string_view key, int64_t max,
                             int64_t& out) {
    int64_t value = out;
    if (auto r = readOptional(config, key, value); !r) {
        return r;
    }
    if (value < 0 || value > max) {
        return AuthResult<void>::err(
            invalid(std::string(key) + " must be in [0, " + std::to_string(max) + "]"));
    }
    out = value;
    return AuthResult<void>::ok();
}

AuthResult<void> readSeconds(const ConfigManager& config, std::string_view key,
                             std::chrono::seconds& out) {
    int64_t value = out.count();
    if (auto r = readBounded(config, key, std::numeric_limits<int32_t>::max(), value); !r) {
        return r;
    }
    out = std::chrono::seconds(value);
    return AuthResult<void>::ok();
}

AuthResult<void> readUint32(const ConfigManager& config, std::string_view key, uint32_t& out) {
    int64_t value = out;
    if (auto r = readBounded(config, key, std::numeric_limits<uint32_t>::max(), value); !r) {
        return r;
    }
    out = static_cast<uint32_t>(value);
    return AuthResult<void>::ok();
}

}  // namespace

AuthResult<std::string> decodeSecretKey(std::string_view text) {
    constexpr std::string_view kHexPrefix = "hex:";
    std::optional<std::string> decoded;
    if (text.substr(0, kHexPrefix.size()) == kHexPrefix) {
        decoded = detail::fromHex(text.substr(kHexPrefix.size()));
    } else {
        decoded = detail::base64urlDecode(text);
    }
    if (!decoded) {
        return AuthResult<std::string>::err(
            invalid("auth.secret_key is neither base64url nor hex:-prefixed hex"));
    }
    return AuthResult<std::string>::ok(std::move(*decoded));
}

AuthResult<void> validateAuthConfig(const AuthConfig& config) {
    auto [minWf, maxWf] = PasswordHasher::workFactorRange(config.hashAlgorithm);
    if (config.workFactor < minWf || config.workFactor > maxWf) {
        return AuthResult<void>::err(
            invalid("work_factor " + std::to_string(config.workFactor) + " outside [" +
                    std::to_string(minWf) + ", " + std::to_string(maxWf) + "] for " +
                    std::string(hashAlgorithmTag(config.hashAlgorithm))));
    }
    if (config.maxPasswordLength == 0) {
        return AuthResult<void>::err(invalid("max_password_length must be positive"));
    }
    if (config.tokenTtl.count() <= 0 || config.maxTokenTtl.count() <= 0) {
        return AuthResult<void>::err(invalid("token lifetimes must be positive"));
    }
    if (config.tokenTtl > config.maxTokenTtl) {
        return AuthResult<void>::err(
            invalid("token_ttl_seconds exceeds max_token_ttl_seconds"));
    }
    if (config.clockSkewTolerance.count() < 0 || config.csrfMaxAge.count() < 0) {
        return AuthResult<void>::err(invalid("durations must not be negative"));
    }
    if (config.revocationPruneInterval.count() <= 0) {
        return AuthResult<void>::err(
            invalid("revocation_prune_interval_seconds must be positive"));
    }
    if (config.loginRateLimitMaxAttempts > 0 && config.loginRateLimitWindow.count() <= 0) {
        return AuthResult<void>::err(
            invalid("login_rate_limit_window_seconds must be positive"));
    }

    // The secret always keys CSRF MACs, and HS256 tokens as well.
    if (config.secretKey.size() < kMinSecretKeyBytes) {
        return AuthResult<void>::err(
            invalid("secret_key must decode to at least " +
                    std::to_string(kMinSecretKeyBytes) + " bytes"));
    }

    if (config.signingAlgorithm == SigningAlgorithm::RS256) {
        if (config.rsaPrivateKeyPem.empty() && config.rsaPublicKeyPem.empty()) {
            return AuthResult<void>::err(invalid("RS256 requires rsa_private_key_pem or "
                                                 "rsa_public_key_pem"));
        }
        if (!config.rsaPrivateKeyPem.empty() && !detail::loadPrivateKey(config.rsaPrivateKeyPem)) {
            return AuthResult<void>::err(invalid("rsa_private_key_pem does not load"));
        }
        if (!config.rsaPublicKeyPem.empty() && !detail::loadPublicKey(config.rsaPublicKeyPem)) {
            return AuthResult<void>::err(invalid("rsa_public_key_pem does not load"));
        }
    }
    return AuthResult<void>::ok();
}

AuthResult<AuthConfig> loadAuthConfig(const ConfigManager& config) {
    AuthConfig out;

    auto fail = [](const AuthError& error) {
        CSA_LOG_ERROR(LogCategory::Config, std::string(error.message()));
        return AuthResult<AuthConfig>::err(error);
    };

    std::string text;
    if (config.hasKey("auth.hash_algorithm")) {
        if (auto r = readOptional(config, "auth.hash_algorithm", text); !r) {
            return fail(r.error());
        }
        auto algorithm = parseHashAlgorithm(text);
        if (!algorithm) {
            return fail(invalid("auth.hash_algorithm must be pbkdf2-sha256 or scrypt"));
        }
        out.hashAlgorithm = *algorithm;
    }
    if (config.hasKey("auth.signing_algorithm")) {
        if (auto r = readOptional(config, "auth.signing_algorithm", text); !r) {
            return fail(r.error());
        }
        auto algorithm = parseSigningAlgorithm(text);
        if (!algorithm) {
            return fail(invalid("auth.signing_algorithm must be HS256 or RS256"));
        }
        out.signingAlgorithm = *algorithm;
    }
    if (config.hasKey("auth.secret_key")) {
        if (auto r = readOptional(config, "auth.secret_key", text); !r) {
            return fail(r.error());
        }
        auto secret = decodeSecretKey(text);
        if (!secret) {
            return fail(secret.error());
        }
        out.secretKey = std::move(secret).value();
    }

    for (auto r : {readUint32(config, "auth.work_factor", out.workFactor),
                   readUint32(config, "auth.max_password_length", out.maxPasswordLength),
                   readSeconds(config, "auth.token_ttl_seconds", out.tokenTtl),
                   readSeconds(config, "auth.max_token_ttl_seconds", out.maxTokenTtl),
                   readSeconds(config, "auth.clock_skew_tolerance_seconds",
                               out.clockSkewTolerance),
                   readOptional(config, "auth.rsa_private_key_pem", out.rsaPrivateKeyPem),
                   readOptional(config, "auth.rsa_public_key_pem", out.rsaPublicKeyPem),
                   readSeconds(config, "auth.csrf_max_age_seconds", out.csrfMaxAge),
                   readSeconds(config, "auth.revocation_prune_interval_seconds",
                               out.revocationPruneInterval),
                   readUint32(config, "auth.login_rate_limit_max_attempts",
                              out.loginRateLimitMaxAttempts),
                   readSeconds(config, "auth.login_rate_limit_window_seconds",
                               out.loginRateLimitWindow)}) {
        if (!r) {
            return fail(r.error());
        }
    }

    if (auto valid = validateAuthConfig(out); !valid) {
        return fail(valid.error());
    }

    CSA_LOG_INFO(LogCategory::Config,
                 "auth config loaded: hash=" + std::string(hashAlgorithmTag(out.hashAlgorithm)) +
                     " wf=" + std::to_string(out.workFactor) + " alg=" +
                     std::string(signingAlgorithmName(out.signingAlgorithm)) +
                     " ttl=" + std::to_string(out.tokenTtl.count()) + "s");
    return AuthResult<AuthConfig>::ok(std::move(out));
}

}  // namespace csa::auth
