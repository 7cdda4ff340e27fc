#pragma once

/// @file csrf_guard.hpp
/// @brief Stateless double-submit CSRF tokens bound to a session.
///
/// Value layout: <issuedAtSeconds>.<nonce b64url>.<mac b64url>
/// where mac = HMAC-SHA256(csrfKey, len(sessionId) ":" sessionId "|"
/// issuedAt "|" nonce). The server keeps no per-session state; a value
/// is valid only for the session it was minted for.

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "csa/auth/auth_types.hpp"
#include "csa/foundation/auth_result.hpp"
#include "csa/foundation/clock.hpp"

namespace csa::auth {

/// Issues and checks anti-forgery pairs.
///
/// Example:
/// @code
///   auto guard = CsrfGuard::create(config);
///   auto pair = guard.value().issue(token.tokenId);
///   // cookie and header both carry pair.value().cookieValue
///   guard.value().verify(token.tokenId, cookie, header);
/// @endcode
class CsrfGuard {
public:
    static constexpr std::size_t kNonceBytes = 16;

    /// Longest value verify() will look at.
    static constexpr std::size_t kMaxValueLength = 256;

    /// Build a guard keyed from config.secretKey. Fails with ConfigInvalid
    /// when the secret is shorter than kMinSecretKeyBytes.
    [[nodiscard]] static foundation::AuthResult<CsrfGuard> create(
        const AuthConfig& config,
        std::shared_ptr<foundation::IClock> clock = foundation::SystemClock::shared());

    /// Mint a fresh pair for @p sessionId (cookie == header).
    [[nodiscard]] foundation::AuthResult<CsrfPair> issue(std::string_view sessionId) const;

    /// True iff both values are present and equal, parse, carry a valid
    /// MAC for @p sessionId and are not older than csrfMaxAge (when set).
    /// Fails closed; never throws.
    [[nodiscard]] bool verify(std::string_view sessionId,
                              std::string_view cookieValue,
                              std::string_view headerValue) const noexcept;

    [[nodiscard]] bool verify(std::string_view sessionId, const CsrfPair& pair) const noexcept {
        return verify(sessionId, pair.cookieValue, pair.headerValue);
    }

    [[nodiscard]] std::chrono::seconds maxAge() const noexcept { return maxAge_; }

private:
    CsrfGuard(std::string key, std::chrono::seconds maxAge,
              std::shared_ptr<foundation::IClock> clock);

    [[nodiscard]] std::optional<std::string> mac(std::string_view sessionId,
                                                 std::string_view issuedAt,
                                                 std::string_view nonce) const;
    [[nodiscard]] bool check(std::string_view sessionId, std::string_view value) const;

    std::string key_;
    std::chrono::seconds maxAge_;
    std::shared_ptr<foundation::IClock> clock_;
};

}  // namespace csa::auth
