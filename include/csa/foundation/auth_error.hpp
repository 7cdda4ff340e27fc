#pragma once

/// @file auth_error.hpp
/// @brief Error type carried by AuthResult<T>.

#include <any>
#include <string>
#include <string_view>
#include <utility>

#include "csa/foundation/error_code.hpp"

namespace csa::foundation {

/// Error carrying a categorized code, a log-safe message, and optional
/// type-erased context.
///
/// Messages must never contain passwords, key material, signatures or
/// full token strings: they end up in logs.
class AuthError {
public:
    AuthError() = default;

    explicit AuthError(ErrorCode code)
        : code_(code) {}

    AuthError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    AuthError(ErrorCode code, std::string message, std::any context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    /// The uniform status to surface to an end client.
    [[nodiscard]] ClientStatus clientStatus() const noexcept {
        return clientStatusFor(code_);
    }

    [[nodiscard]] bool isRetryable() const noexcept {
        return foundation::isRetryable(code_);
    }

    /// Access typed context data (nullptr on type mismatch or when empty).
    template <typename T>
    [[nodiscard]] const T* context() const noexcept {
        return std::any_cast<T>(&context_);
    }

    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
    std::any context_;
};

} // namespace csa::foundation
