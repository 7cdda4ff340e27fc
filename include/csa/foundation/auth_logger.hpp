#pragma once

/// @file auth_logger.hpp
/// @brief AuthLogger wrapping kcenon logger interfaces for category-based,
/// structured logging of authentication events.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "csa/foundation/auth_result.hpp"

namespace csa::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level internally:
///   Trace -> trace, Debug -> debug, Info -> info, Warning -> warning,
///   Error -> error, Critical -> critical, Off -> off
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Log categories, one per component of the authority.
enum class LogCategory : uint8_t {
    Core    = 0, ///< Wiring, lifecycle
    Hasher  = 1, ///< Password hashing
    Token   = 2, ///< Token issuance/verification
    Csrf    = 3, ///< Anti-forgery checks
    Session = 4, ///< Login/authorize/logout
    Store   = 5, ///< Credential and revocation stores
    Config  = 6  ///< Configuration loading
};

inline constexpr std::size_t kLogCategoryCount = 7;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Hasher", "Token", "Csrf", "Session", "Store", "Config"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Shorten a token id to a loggable prefix.
[[nodiscard]] std::string redactTokenId(std::string_view tokenId);

/// Structured context appended to a log entry.
///
/// Only identifiers go here. Passwords, keys, signatures and full token
/// strings are never logged.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.subjectId = "alice";
///   ctx.tokenId = redactTokenId(token.tokenId);
///   logger.logWithContext(LogLevel::Info, LogCategory::Session,
///                         "session revoked", ctx);
/// @endcode
struct LogContext {
    std::optional<std::string> subjectId;
    std::optional<std::string> tokenId;
    std::optional<std::string> clientKey;
    std::optional<std::string> traceId;
    std::unordered_map<std::string, std::string> extra;
};

/// Category-filtered logger over kcenon's GlobalLoggerRegistry.
///
/// Each category forwards to the registry logger named "csa.<Category>",
/// falling back to the registry's default logger. PIMPL keeps the kcenon
/// headers out of the public API.
///
/// Default log levels per category:
/// | Category | Default Level |
/// |----------|---------------|
/// | Core     | Info          |
/// | Hasher   | Info          |
/// | Token    | Info          |
/// | Csrf     | Info          |
/// | Session  | Info          |
/// | Store    | Warning       |
/// | Config   | Info          |
class AuthLogger {
public:
    AuthLogger();
    ~AuthLogger();

    AuthLogger(const AuthLogger&) = delete;
    AuthLogger& operator=(const AuthLogger&) = delete;
    AuthLogger(AuthLogger&&) noexcept;
    AuthLogger& operator=(AuthLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with structured context appended as key=value pairs.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush the default registry logger.
    AuthResult<void> flush();

    /// Process-wide instance used by the CSA_LOG macros.
    static AuthLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace csa::foundation

// ---------------------------------------------------------------------------
// Convenience macros (global, outside the namespace)
// ---------------------------------------------------------------------------

/// CSA_MIN_LOG_LEVEL can be defined before including this header to
/// drop calls below the threshold at compile time.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off

#ifndef CSA_MIN_LOG_LEVEL
    #define CSA_MIN_LOG_LEVEL 0
#endif

#define CSA_LOG(level, cat, msg)                                                  \
    do {                                                                          \
        _Pragma("GCC diagnostic push")                                            \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                       \
        if (static_cast<int>(level) >= CSA_MIN_LOG_LEVEL &&                       \
            ::csa::foundation::AuthLogger::instance().isEnabled((level), (cat)))  \
        {                                                                         \
            ::csa::foundation::AuthLogger::instance().log((level), (cat), (msg)); \
        }                                                                         \
        _Pragma("GCC diagnostic pop")                                             \
    } while (0)

#define CSA_LOG_CTX(level, cat, msg, ctx)                                         \
    do {                                                                          \
        _Pragma("GCC diagnostic push")                                            \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                       \
        if (static_cast<int>(level) >= CSA_MIN_LOG_LEVEL &&                       \
            ::csa::foundation::AuthLogger::instance().isEnabled((level), (cat)))  \
        {                                                                         \
            ::csa::foundation::AuthLogger::instance().logWithContext(             \
                (level), (cat), (msg), (ctx));                                    \
        }                                                                         \
        _Pragma("GCC diagnostic pop")                                             \
    } while (0)

#define CSA_LOG_DEBUG(cat, msg) \
    CSA_LOG(::csa::foundation::LogLevel::Debug, (cat), (msg))

#define CSA_LOG_INFO(cat, msg) \
    CSA_LOG(::csa::foundation::LogLevel::Info, (cat), (msg))

#define CSA_LOG_WARN(cat, msg) \
    CSA_LOG(::csa::foundation::LogLevel::Warning, (cat), (msg))

#define CSA_LOG_ERROR(cat, msg) \
    CSA_LOG(::csa::foundation::LogLevel::Error, (cat), (msg))
