#pragma once

/// @file clock.hpp
/// @brief Injectable wall clock for expiry and pruning decisions.

#include <atomic>
#include <chrono>
#include <memory>

namespace csa::foundation {

/// Source of the current wall-clock time.
class IClock {
public:
    virtual ~IClock() = default;

    [[nodiscard]] virtual std::chrono::system_clock::time_point now() const = 0;
};

/// Clock backed by std::chrono::system_clock.
class SystemClock : public IClock {
public:
    [[nodiscard]] std::chrono::system_clock::time_point now() const override {
        return std::chrono::system_clock::now();
    }

    /// Shared process-wide instance.
    static std::shared_ptr<IClock> shared() {
        static auto inst = std::make_shared<SystemClock>();
        return inst;
    }
};

/// Manually advanced clock for deterministic tests and replay.
///
/// Safe to advance from one thread while others read it.
class ManualClock : public IClock {
public:
    explicit ManualClock(std::chrono::system_clock::time_point start =
                             std::chrono::system_clock::time_point(std::chrono::seconds(1'700'000'000)))
        : ticks_(start.time_since_epoch().count()) {}

    [[nodiscard]] std::chrono::system_clock::time_point now() const override {
        return std::chrono::system_clock::time_point(
            std::chrono::system_clock::duration(ticks_.load(std::memory_order_acquire)));
    }

    void advance(std::chrono::system_clock::duration delta) {
        ticks_.fetch_add(delta.count(), std::memory_order_acq_rel);
    }

    void set(std::chrono::system_clock::time_point tp) {
        ticks_.store(tp.time_since_epoch().count(), std::memory_order_release);
    }

private:
    std::atomic<std::chrono::system_clock::rep> ticks_;
};

} // namespace csa::foundation
