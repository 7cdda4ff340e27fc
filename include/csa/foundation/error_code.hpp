#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes and their client-facing classification.

#include <cstdint>
#include <string_view>

namespace csa::foundation {

/// Error codes categorized by subsystem using hex ranges.
///
/// Each subsystem occupies a 256-value range (0x100), so the error source
/// can be read from the code value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidInput = 0x0002,
    NotFound = 0x0003,
    AlreadyExists = 0x0004,

    // Credential (0x0100 - 0x01FF)
    MalformedHash = 0x0100,
    AuthenticationFailed = 0x0101,
    RateLimitExceeded = 0x0102,

    // Token (0x0200 - 0x02FF)
    MalformedToken = 0x0200,
    SignatureMismatch = 0x0201,
    TokenExpired = 0x0202,
    TokenRevoked = 0x0203,
    SigningFailed = 0x0204,

    // Csrf (0x0300 - 0x03FF)
    CsrfValidationFailed = 0x0300,

    // Store (0x0400 - 0x04FF)
    StoreUnavailable = 0x0400,

    // Config (0x0600 - 0x06FF)
    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,
    ConfigInvalid = 0x0603,

    // Thread (0x0700 - 0x07FF)
    ThreadError = 0x0700,
    JobScheduleFailed = 0x0701,
    JobNotFound = 0x0702,
    JobCancelled = 0x0703,

    // Logger (0x0800 - 0x08FF)
    LoggerError = 0x0800,
    LoggerFlushFailed = 0x0801,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0100: return "Credential";
        case 0x0200: return "Token";
        case 0x0300: return "Csrf";
        case 0x0400: return "Store";
        case 0x0600: return "Config";
        case 0x0700: return "Thread";
        case 0x0800: return "Logger";
        default: return "Unknown";
    }
}

/// Coarse status reported to end clients.
///
/// Every verification failure collapses into Unauthorized so a client can
/// never tell which check rejected it.
enum class ClientStatus : uint8_t {
    Ok,
    BadRequest,
    Unauthorized,
    TooManyRequests,
    ServiceUnavailable,
};

/// Map an internal error code onto the client-facing status class.
constexpr ClientStatus clientStatusFor(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success:
            return ClientStatus::Ok;
        case ErrorCode::InvalidInput:
        case ErrorCode::AlreadyExists:
            return ClientStatus::BadRequest;
        case ErrorCode::RateLimitExceeded:
            return ClientStatus::TooManyRequests;
        case ErrorCode::StoreUnavailable:
        case ErrorCode::SigningFailed:
        case ErrorCode::ThreadError:
        case ErrorCode::JobScheduleFailed:
            return ClientStatus::ServiceUnavailable;
        default:
            return ClientStatus::Unauthorized;
    }
}

/// True for dependency faults the caller may retry.
constexpr bool isRetryable(ErrorCode code) {
    return clientStatusFor(code) == ClientStatus::ServiceUnavailable;
}

} // namespace csa::foundation
