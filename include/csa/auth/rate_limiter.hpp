#pragma once

/// @file rate_limiter.hpp
/// @brief Sliding-window rate limiter for login attempt throttling.
///
/// Tracks timestamps of recent attempts per key (typically the client
/// address handed in by the transport) within a configurable window.

#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "csa/foundation/clock.hpp"

namespace csa::auth {

/// Sliding-window rate limiter.
///
/// Example:
/// @code
///   RateLimiter limiter(5, std::chrono::seconds{60});
///   if (!limiter.allow("192.168.1.1")) {
///       // Rate limit exceeded
///   }
/// @endcode
class RateLimiter {
public:
    /// Construct with max attempts allowed per window duration.
    /// A limit of zero disables throttling.
    RateLimiter(uint32_t maxAttempts, std::chrono::seconds window,
                std::shared_ptr<foundation::IClock> clock = foundation::SystemClock::shared());

    /// Record an attempt for the given key.
    /// Returns true if the attempt is allowed, false if rate limit exceeded.
    [[nodiscard]] bool allow(const std::string& key);

    /// Remaining attempts for the given key within the current window.
    [[nodiscard]] uint32_t remaining(const std::string& key) const;

    /// Forget all tracked attempts for the given key.
    void reset(const std::string& key);

    /// Drop keys whose window is empty. Returns number of keys removed.
    std::size_t purgeIdle();

private:
    using TimePoint = std::chrono::system_clock::time_point;

    void purgeExpired(std::deque<TimePoint>& timestamps, TimePoint now) const;

    uint32_t maxAttempts_;
    std::chrono::seconds window_;
    std::shared_ptr<foundation::IClock> clock_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::deque<TimePoint>> attempts_;
};

}  // namespace csa::auth
