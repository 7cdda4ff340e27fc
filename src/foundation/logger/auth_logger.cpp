/// @file auth_logger.cpp
/// @brief AuthLogger implementation over kcenon's GlobalLoggerRegistry.

#include "csa/foundation/auth_logger.hpp"

#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

#include <array>
#include <atomic>
#include <sstream>
#include <string>

namespace csa::foundation {

namespace kci = kcenon::common::interfaces;

// ---------------------------------------------------------------------------
// Level mapping: CSA -> kcenon
// ---------------------------------------------------------------------------
static kci::log_level mapLevel(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return kci::log_level::trace;
        case LogLevel::Debug:    return kci::log_level::debug;
        case LogLevel::Info:     return kci::log_level::info;
        case LogLevel::Warning:  return kci::log_level::warning;
        case LogLevel::Error:    return kci::log_level::error;
        case LogLevel::Critical: return kci::log_level::critical;
        case LogLevel::Off:      return kci::log_level::off;
    }
    return kci::log_level::info;
}

static constexpr std::array<LogLevel, kLogCategoryCount> kDefaultCategoryLevels = {
    LogLevel::Info,    // Core
    LogLevel::Info,    // Hasher
    LogLevel::Info,    // Token
    LogLevel::Info,    // Csrf
    LogLevel::Info,    // Session
    LogLevel::Warning, // Store
    LogLevel::Info     // Config
};

static constexpr std::size_t kTokenIdPrefixLength = 8;

std::string redactTokenId(std::string_view tokenId) {
    if (tokenId.size() <= kTokenIdPrefixLength) {
        return std::string(tokenId);
    }
    std::string out(tokenId.substr(0, kTokenIdPrefixLength));
    out += "...";
    return out;
}

static std::string formatContext(const LogContext& ctx) {
    std::ostringstream oss;
    bool first = true;

    auto append = [&](std::string_view key, std::string_view val) {
        if (!first) {
            oss << ", ";
        }
        oss << key << '=' << val;
        first = false;
    };

    if (ctx.subjectId && !ctx.subjectId->empty()) {
        append("subject", *ctx.subjectId);
    }
    if (ctx.tokenId && !ctx.tokenId->empty()) {
        append("token_id", *ctx.tokenId);
    }
    if (ctx.clientKey && !ctx.clientKey->empty()) {
        append("client", *ctx.clientKey);
    }
    if (ctx.traceId && !ctx.traceId->empty()) {
        append("trace_id", *ctx.traceId);
    }
    for (const auto& [key, val] : ctx.extra) {
        append(key, val);
    }

    return oss.str();
}

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------
struct AuthLogger::Impl {
    // Atomic so isEnabled() stays lock-free on the request path.
    std::array<std::atomic<LogLevel>, kLogCategoryCount> categoryLevels;
    std::array<std::string, kLogCategoryCount> loggerNames;

    Impl() {
        for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
            categoryLevels[i].store(kDefaultCategoryLevels[i],
                                    std::memory_order_relaxed);
            loggerNames[i] = std::string("csa.") +
                std::string(logCategoryName(static_cast<LogCategory>(i)));
        }
    }

    std::shared_ptr<kci::ILogger> getLogger(LogCategory cat) const {
        auto idx = static_cast<std::size_t>(cat);
        if (idx >= kLogCategoryCount) {
            return kci::GlobalLoggerRegistry::null_logger();
        }
        auto& registry = kci::GlobalLoggerRegistry::instance();
        auto logger = registry.get_logger(loggerNames[idx]);
        if (!logger || logger == kci::GlobalLoggerRegistry::null_logger()) {
            return registry.get_default_logger();
        }
        return logger;
    }

    void emit(LogLevel level, LogCategory cat, std::string_view msg,
              std::string_view suffix) const {
        auto logger = getLogger(cat);
        if (!logger) {
            return;
        }

        // Format: [Category] message {key=val, ...}
        std::string formatted;
        formatted.reserve(msg.size() + suffix.size() + 20);
        formatted += '[';
        formatted += logCategoryName(cat);
        formatted += "] ";
        formatted += msg;
        if (!suffix.empty()) {
            formatted += " {";
            formatted += suffix;
            formatted += '}';
        }

        // A failing sink must not fail the request that logged.
        (void)logger->log(mapLevel(level), formatted);
    }
};

AuthLogger::AuthLogger() : impl_(std::make_unique<Impl>()) {}

AuthLogger::~AuthLogger() = default;

AuthLogger::AuthLogger(AuthLogger&&) noexcept = default;
AuthLogger& AuthLogger::operator=(AuthLogger&&) noexcept = default;

void AuthLogger::log(LogLevel level, LogCategory cat, std::string_view msg) {
    if (!isEnabled(level, cat)) {
        return;
    }
    impl_->emit(level, cat, msg, {});
}

void AuthLogger::logWithContext(LogLevel level, LogCategory cat,
                                std::string_view msg, const LogContext& ctx) {
    if (!isEnabled(level, cat)) {
        return;
    }
    impl_->emit(level, cat, msg, formatContext(ctx));
}

void AuthLogger::setCategoryLevel(LogCategory cat, LogLevel minLevel) {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        impl_->categoryLevels[idx].store(minLevel, std::memory_order_release);
    }
}

LogLevel AuthLogger::getCategoryLevel(LogCategory cat) const {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        return impl_->categoryLevels[idx].load(std::memory_order_acquire);
    }
    return LogLevel::Off;
}

bool AuthLogger::isEnabled(LogLevel level, LogCategory cat) const {
    if (!impl_ || level == LogLevel::Off) {
        return false;
    }
    auto idx = static_cast<std::size_t>(cat);
    if (idx >= kLogCategoryCount) {
        return false;
    }
    auto minLevel = impl_->categoryLevels[idx].load(std::memory_order_acquire);
    return static_cast<uint8_t>(level) >= static_cast<uint8_t>(minLevel);
}

AuthResult<void> AuthLogger::flush() {
    auto logger = kci::GlobalLoggerRegistry::instance().get_default_logger();
    if (!logger) {
        return AuthResult<void>::ok();
    }
    auto result = logger->flush();
    if (result.is_err()) {
        return AuthResult<void>::err(
            AuthError(ErrorCode::LoggerFlushFailed, "failed to flush logger"));
    }
    return AuthResult<void>::ok();
}

AuthLogger& AuthLogger::instance() {
    static AuthLogger inst;
    return inst;
}

} // namespace csa::foundation
