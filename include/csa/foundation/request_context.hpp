#pragma once

/// @file request_context.hpp
/// @brief Per-request deadline and cancellation propagated into store calls.

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "csa/foundation/auth_result.hpp"

namespace csa::foundation {

/// Deadline and cancellation state of the request a call is serving.
///
/// Copies share the same cancellation flag, so a transport layer can hand
/// a copy to the core and cancel it later from another thread.
class RequestContext {
public:
    using Clock = std::chrono::steady_clock;

    /// Context without deadline.
    RequestContext() : cancelled_(std::make_shared<std::atomic<bool>>(false)) {}

    /// Context that expires @p timeout from now.
    static RequestContext withTimeout(std::chrono::milliseconds timeout) {
        RequestContext ctx;
        ctx.deadline_ = Clock::now() + timeout;
        return ctx;
    }

    /// Context expiring at an absolute deadline.
    static RequestContext withDeadline(Clock::time_point deadline) {
        RequestContext ctx;
        ctx.deadline_ = deadline;
        return ctx;
    }

    void cancel() const { cancelled_->store(true, std::memory_order_release); }

    [[nodiscard]] bool isCancelled() const {
        return cancelled_->load(std::memory_order_acquire);
    }

    [[nodiscard]] bool isExpired() const {
        return deadline_.has_value() && Clock::now() >= *deadline_;
    }

    [[nodiscard]] std::optional<Clock::time_point> deadline() const { return deadline_; }

    /// Time left before the deadline (nullopt when unbounded).
    [[nodiscard]] std::optional<std::chrono::milliseconds> remaining() const {
        if (!deadline_) {
            return std::nullopt;
        }
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline_ - Clock::now());
        return left.count() > 0 ? left : std::chrono::milliseconds{0};
    }

    /// Success while the request may proceed, StoreUnavailable otherwise.
    /// @p what names the operation in the error message.
    [[nodiscard]] AuthResult<void> check(const std::string& what) const {
        if (isCancelled()) {
            return AuthResult<void>::err(
                AuthError(ErrorCode::StoreUnavailable, what + ": request cancelled"));
        }
        if (isExpired()) {
            return AuthResult<void>::err(
                AuthError(ErrorCode::StoreUnavailable, what + ": deadline exceeded"));
        }
        return AuthResult<void>::ok();
    }

private:
    std::shared_ptr<std::atomic<bool>> cancelled_;
    std::optional<Clock::time_point> deadline_;
};

} // namespace csa::foundation
