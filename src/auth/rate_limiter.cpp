/// @file rate_limiter.cpp
/// @brief Sliding-window RateLimiter implementation.

#include "csa/auth/rate_limiter.hpp"

namespace csa::auth {

RateLimiter::RateLimiter(uint32_t maxAttempts, std::chrono::seconds window,
                         std::shared_ptr<foundation::IClock> clock)
    : maxAttempts_(maxAttempts), window_(window), clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = foundation::SystemClock::shared();
    }
}

bool RateLimiter::allow(const std::string& key) {
    if (maxAttempts_ == 0) {
        return true;
    }
    auto now = clock_->now();
    std::lock_guard<std::mutex> lock(mutex_);
    auto& timestamps = attempts_[key];
    purgeExpired(timestamps, now);

    if (timestamps.size() >= static_cast<std::size_t>(maxAttempts_)) {
        return false;
    }

    timestamps.push_back(now);
    return true;
}

uint32_t RateLimiter::remaining(const std::string& key) const {
    auto now = clock_->now();
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = attempts_.find(key);
    if (it == attempts_.end()) {
        return maxAttempts_;
    }

    auto timestamps = it->second;  // copy to purge
    purgeExpired(timestamps, now);

    auto used = static_cast<uint32_t>(timestamps.size());
    return (used >= maxAttempts_) ? 0u : (maxAttempts_ - used);
}

void RateLimiter::reset(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    attempts_.erase(key);
}

std::size_t RateLimiter::purgeIdle() {
    auto now = clock_->now();
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t removed = 0;
    for (auto it = attempts_.begin(); it != attempts_.end();) {
        purgeExpired(it->second, now);
        if (it->second.empty()) {
            it = attempts_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

void RateLimiter::purgeExpired(std::deque<TimePoint>& timestamps, TimePoint now) const {
    auto cutoff = now - window_;
    while (!timestamps.empty() && timestamps.front() <= cutoff) {
        timestamps.pop_front();
    }
}

}  // namespace csa::auth
