#pragma once

/// @file auth_config_loader.hpp
/// @brief Reads and validates AuthConfig from the "auth" YAML section.
///
/// Recognized keys (all optional, defaults from AuthConfig):
///   auth.hash_algorithm                     pbkdf2-sha256 | scrypt
///   auth.work_factor
///   auth.max_password_length
///   auth.token_ttl_seconds
///   auth.max_token_ttl_seconds
///   auth.clock_skew_tolerance_seconds
///   auth.secret_key                         base64url, or "hex:" + hex
///   auth.signing_algorithm                  HS256 | RS256
///   auth.rsa_private_key_pem
///   auth.rsa_public_key_pem
///   auth.csrf_max_age_seconds
///   auth.revocation_prune_interval_seconds
///   auth.login_rate_limit_max_attempts
///   auth.login_rate_limit_window_seconds

#include <string>
#include <string_view>

#include "csa/auth/auth_types.hpp"
#include "csa/foundation/auth_result.hpp"
#include "csa/foundation/config_manager.hpp"

namespace csa::auth {

/// Build an AuthConfig from @p config and validate it.
/// @return The config, or ConfigTypeMismatch / ConfigInvalid.
[[nodiscard]] foundation::AuthResult<AuthConfig> loadAuthConfig(
    const foundation::ConfigManager& config);

/// Check cross-field constraints: secret length, key material for the
/// signing algorithm, work factor range, TTL ordering.
[[nodiscard]] foundation::AuthResult<void> validateAuthConfig(const AuthConfig& config);

/// Decode a configured secret: "hex:"-prefixed hex, otherwise base64url.
[[nodiscard]] foundation::AuthResult<std::string> decodeSecretKey(std::string_view text);

}  // namespace csa::auth
