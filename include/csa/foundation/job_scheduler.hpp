#pragma once

/// @file job_scheduler.hpp
/// @brief AuthJobScheduler wrapping kcenon thread_system for off-loop work.

#include "csa/foundation/auth_result.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <thread>

namespace csa::foundation {

/// Priority levels for scheduled jobs.
///
/// Maps to kcenon::thread::job_priority internally:
///   Critical -> highest, High -> high, Normal -> normal, Low -> low
enum class JobPriority { Critical, High, Normal, Low };

/// Worker pool for CPU-bound authentication work and periodic maintenance.
///
/// Password verification at production work factors takes tens to
/// hundreds of milliseconds; running it here keeps it off any
/// single-threaded dispatch loop. Tick jobs (e.g. revocation pruning) are
/// driven by processTick() from the owner's main loop.
///
/// Example:
/// @code
///   AuthJobScheduler scheduler(4);
///   auto id = scheduler.schedule([&] { verifyLogin(); }, JobPriority::High);
///   scheduler.wait(id.value());
/// @endcode
class AuthJobScheduler {
public:
    using JobId = uint64_t;
    using JobFunc = std::function<void()>;

    explicit AuthJobScheduler(std::size_t numThreads = std::thread::hardware_concurrency());

    ~AuthJobScheduler();

    AuthJobScheduler(const AuthJobScheduler&) = delete;
    AuthJobScheduler& operator=(const AuthJobScheduler&) = delete;
    AuthJobScheduler(AuthJobScheduler&&) noexcept;
    AuthJobScheduler& operator=(AuthJobScheduler&&) noexcept;

    /// Schedule a job with the given priority. The job stays tracked until
    /// wait() collects it.
    /// @return The assigned JobId, or JobScheduleFailed.
    AuthResult<JobId> schedule(JobFunc job, JobPriority priority = JobPriority::Normal);

    /// Fire-and-forget: run @p job on the pool without tracking it.
    /// Exceptions thrown by the job are logged.
    AuthResult<void> post(JobFunc job, JobPriority priority = JobPriority::Normal);

    /// Register a recurring tick job that fires every @p interval of
    /// processTick() time. Each firing is dispatched into the pool.
    AuthResult<JobId> scheduleTick(std::chrono::milliseconds interval, JobFunc job);

    /// Advance tick timers by @p deltaTime and dispatch due tick jobs.
    void processTick(std::chrono::milliseconds deltaTime);

    /// Block until the job identified by @p id completes.
    /// @return Success, JobNotFound, or ThreadError if the job threw.
    AuthResult<void> wait(JobId id);

    /// Request cancellation of a pending job or remove a tick job.
    AuthResult<void> cancel(JobId id);

    /// Scheduled jobs not yet collected by wait().
    [[nodiscard]] std::size_t trackedJobCount() const;

    /// Registered tick jobs.
    [[nodiscard]] std::size_t tickJobCount() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace csa::foundation
