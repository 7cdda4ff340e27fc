/// @file csrf_guard.cpp
/// @brief CsrfGuard implementation.

#include "csa/auth/csrf_guard.hpp"

#include "csa/foundation/auth_logger.hpp"
#include "csa/foundation/error_code.hpp"

#include "crypto_utils.hpp"

#include <charconv>
#include <exception>

namespace csa::auth {

using foundation::AuthError;
using foundation::AuthResult;
using foundation::ErrorCode;
using foundation::LogCategory;

namespace {

constexpr std::string_view kCsrfKeyLabel = "csa/csrf/v1";

bool allDigits(std::string_view s) {
    if (s.empty() || (s.size() > 1 && s[0] == '0')) {
        return false;
    }
    for (char c : s) {
        if (c < '0' || c > '9') {
            return false;
        }
    }
    return true;
}

}  // namespace

AuthResult<CsrfGuard> CsrfGuard::create(const AuthConfig& config,
                                        std::shared_ptr<foundation::IClock> clock) {
    if (config.secretKey.size() < kMinSecretKeyBytes) {
        return AuthResult<CsrfGuard>::err(
            AuthError(ErrorCode::ConfigInvalid,
                      "CSRF protection requires a secret of at least " +
                          std::to_string(kMinSecretKeyBytes) + " bytes"));
    }
    auto key = detail::deriveKey(config.secretKey, kCsrfKeyLabel);
    if (!key) {
        return AuthResult<CsrfGuard>::err(
            AuthError(ErrorCode::ConfigInvalid, "CSRF key derivation failed"));
    }
    if (!clock) {
        clock = foundation::SystemClock::shared();
    }
    return AuthResult<CsrfGuard>::ok(
        CsrfGuard(std::move(*key), config.csrfMaxAge, std::move(clock)));
}

CsrfGuard::CsrfGuard(std::string key, std::chrono::seconds maxAge,
                     std::shared_ptr<foundation::IClock> clock)
    : key_(std::move(key)), maxAge_(maxAge), clock_(std::move(clock)) {}

std::optional<std::string> CsrfGuard::mac(std::string_view sessionId,
                                          std::string_view issuedAt,
                                          std::string_view nonce) const {
    // Length-prefixing the session id keeps the encoding unambiguous.
    std::string message;
    message.reserve(sessionId.size() + issuedAt.size() + nonce.size() + 8);
    message += std::to_string(sessionId.size());
    message += ':';
    message += sessionId;
    message += '|';
    message += issuedAt;
    message += '|';
    message += nonce;

    auto digest = detail::hmacSha256(key_, message);
    if (!digest) {
        return std::nullopt;
    }
    return detail::base64urlEncode(digest->data(), digest->size());
}

AuthResult<CsrfPair> CsrfGuard::issue(std::string_view sessionId) const {
    if (sessionId.empty()) {
        return AuthResult<CsrfPair>::err(
            AuthError(ErrorCode::InvalidInput, "session id must not be empty"));
    }
    auto nonceBytes = detail::secureRandomBytes(kNonceBytes);
    if (!nonceBytes) {
        CSA_LOG_ERROR(LogCategory::Csrf, "random nonce generation failed");
        return AuthResult<CsrfPair>::err(
            AuthError(ErrorCode::Unknown, "random nonce generation failed"));
    }
    auto issuedAt = std::to_string(
        std::chrono::duration_cast<std::chrono::seconds>(clock_->now().time_since_epoch())
            .count());
    auto nonce = detail::base64urlEncode(*nonceBytes);
    auto tag = mac(sessionId, issuedAt, nonce);
    if (!tag) {
        CSA_LOG_ERROR(LogCategory::Csrf, "CSRF MAC computation failed");
        return AuthResult<CsrfPair>::err(
            AuthError(ErrorCode::Unknown, "CSRF MAC computation failed"));
    }

    std::string value = issuedAt + "." + nonce + "." + *tag;
    return AuthResult<CsrfPair>::ok(CsrfPair{value, value});
}

bool CsrfGuard::check(std::string_view sessionId, std::string_view value) const {
    auto firstDot = value.find('.');
    if (firstDot == std::string_view::npos) {
        return false;
    }
    auto secondDot = value.find('.', firstDot + 1);
    if (secondDot == std::string_view::npos ||
        value.find('.', secondDot + 1) != std::string_view::npos) {
        return false;
    }
    auto issuedAt = value.substr(0, firstDot);
    auto nonce = value.substr(firstDot + 1, secondDot - firstDot - 1);
    auto tag = value.substr(secondDot + 1);
    if (!allDigits(issuedAt) || nonce.empty() || tag.empty()) {
        return false;
    }

    auto expected = mac(sessionId, issuedAt, nonce);
    if (!expected || !detail::constantTimeEqual(*expected, tag)) {
        return false;
    }

    if (maxAge_.count() > 0) {
        int64_t issuedSeconds = 0;
        auto [ptr, ec] =
            std::from_chars(issuedAt.data(), issuedAt.data() + issuedAt.size(), issuedSeconds);
        if (ec != std::errc{} || ptr != issuedAt.data() + issuedAt.size()) {
            return false;
        }
        auto issued = std::chrono::system_clock::time_point(std::chrono::seconds(issuedSeconds));
        if (clock_->now() - issued > maxAge_) {
            return false;
        }
    }
    return true;
}

bool CsrfGuard::verify(std::string_view sessionId,
                       std::string_view cookieValue,
                       std::string_view headerValue) const noexcept {
    if (sessionId.empty() || cookieValue.empty() || headerValue.empty()) {
        return false;
    }
    if (cookieValue.size() > kMaxValueLength || headerValue.size() > kMaxValueLength) {
        return false;
    }
    if (!detail::constantTimeEqual(cookieValue, headerValue)) {
        return false;
    }
    try {
        return check(sessionId, cookieValue);
    } catch (const std::exception& e) {
        CSA_LOG_WARN(LogCategory::Csrf, std::string("CSRF check failed closed: ") + e.what());
        return false;
    }
}

}  // namespace csa::auth
