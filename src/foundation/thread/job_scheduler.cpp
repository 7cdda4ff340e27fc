/// @file job_scheduler.cpp
/// @brief AuthJobScheduler implementation over kcenon thread_system.

#include "csa/foundation/job_scheduler.hpp"

#include "csa/foundation/auth_logger.hpp"

#include <kcenon/thread/core/job_builder.h>
#include <kcenon/thread/core/thread_pool.h>
#include <kcenon/thread/core/thread_worker.h>

#include <algorithm>
#include <atomic>
#include <exception>
#include <future>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace csa::foundation {

static kcenon::thread::job_priority mapPriority(JobPriority p) {
    switch (p) {
        case JobPriority::Critical: return kcenon::thread::job_priority::highest;
        case JobPriority::High:     return kcenon::thread::job_priority::high;
        case JobPriority::Normal:   return kcenon::thread::job_priority::normal;
        case JobPriority::Low:      return kcenon::thread::job_priority::low;
    }
    return kcenon::thread::job_priority::normal;
}

struct AuthJobScheduler::Impl {
    struct TickEntry {
        JobId id;
        std::chrono::milliseconds interval;
        std::chrono::milliseconds elapsed{0};
        JobFunc func;
    };

    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::atomic<uint64_t> nextJobId{1};

    std::unordered_map<JobId, std::shared_future<void>> futures;
    std::unordered_map<JobId, std::shared_ptr<std::atomic<bool>>> cancelFlags;
    std::vector<TickEntry> tickJobs;

    std::mutex mutex;
};

AuthJobScheduler::AuthJobScheduler(std::size_t numThreads)
    : impl_(std::make_unique<Impl>())
{
    if (numThreads == 0) {
        numThreads = 1;
    }
    impl_->pool = std::make_shared<kcenon::thread::thread_pool>("AuthJobScheduler");

    std::vector<std::unique_ptr<kcenon::thread::thread_worker>> workers;
    workers.reserve(numThreads);
    for (std::size_t i = 0; i < numThreads; ++i) {
        workers.push_back(std::make_unique<kcenon::thread::thread_worker>());
    }
    impl_->pool->enqueue_batch(std::move(workers));
    impl_->pool->start();
}

AuthJobScheduler::~AuthJobScheduler() {
    if (impl_ && impl_->pool) {
        impl_->pool->stop(false); // graceful: wait for running jobs
    }
}

AuthJobScheduler::AuthJobScheduler(AuthJobScheduler&&) noexcept = default;
AuthJobScheduler& AuthJobScheduler::operator=(AuthJobScheduler&&) noexcept = default;

AuthResult<AuthJobScheduler::JobId> AuthJobScheduler::schedule(
    JobFunc job, JobPriority priority)
{
    auto id = impl_->nextJobId.fetch_add(1, std::memory_order_relaxed);
    auto cancelFlag = std::make_shared<std::atomic<bool>>(false);
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future().share();

    auto threadJob = kcenon::thread::job_builder()
        .name("csa_job_" + std::to_string(id))
        .priority(mapPriority(priority))
        .work([fn = std::move(job), cancelFlag, promise]()
              -> kcenon::common::VoidResult {
            try {
                if (!cancelFlag->load(std::memory_order_acquire)) {
                    fn();
                }
                promise->set_value();
            } catch (const std::exception& e) {
                CSA_LOG_ERROR(LogCategory::Core,
                              std::string("scheduled job threw: ") + e.what());
                promise->set_exception(std::current_exception());
            } catch (...) {
                CSA_LOG_ERROR(LogCategory::Core, "scheduled job threw a non-standard exception");
                promise->set_exception(std::current_exception());
            }
            return kcenon::common::VoidResult::ok(std::monostate{});
        })
        .build();

    // Register before enqueueing so a fast job can always be waited on.
    {
        std::lock_guard lock(impl_->mutex);
        impl_->futures[id] = future;
        impl_->cancelFlags[id] = cancelFlag;
    }

    auto enqResult = impl_->pool->enqueue(std::move(threadJob));
    if (enqResult.is_err()) {
        std::lock_guard lock(impl_->mutex);
        impl_->futures.erase(id);
        impl_->cancelFlags.erase(id);
        return AuthResult<JobId>::err(
            AuthError(ErrorCode::JobScheduleFailed, "failed to enqueue job"));
    }

    return AuthResult<JobId>::ok(id);
}

AuthResult<void> AuthJobScheduler::post(JobFunc job, JobPriority priority) {
    auto id = impl_->nextJobId.fetch_add(1, std::memory_order_relaxed);

    auto threadJob = kcenon::thread::job_builder()
        .name("csa_post_" + std::to_string(id))
        .priority(mapPriority(priority))
        .work([fn = std::move(job), id]() -> kcenon::common::VoidResult {
            try {
                fn();
            } catch (const std::exception& e) {
                CSA_LOG_ERROR(LogCategory::Core, "posted job " + std::to_string(id) +
                                                     " threw: " + e.what());
            } catch (...) {
                CSA_LOG_ERROR(LogCategory::Core, "posted job " + std::to_string(id) +
                                                     " threw a non-standard exception");
            }
            return kcenon::common::VoidResult::ok(std::monostate{});
        })
        .build();

    if (auto enqResult = impl_->pool->enqueue(std::move(threadJob)); enqResult.is_err()) {
        return AuthResult<void>::err(
            AuthError(ErrorCode::JobScheduleFailed, "failed to enqueue job"));
    }
    return AuthResult<void>::ok();
}

AuthResult<AuthJobScheduler::JobId> AuthJobScheduler::scheduleTick(
    std::chrono::milliseconds interval, JobFunc job)
{
    if (interval.count() <= 0) {
        return AuthResult<JobId>::err(
            AuthError(ErrorCode::InvalidInput, "tick interval must be positive"));
    }
    auto id = impl_->nextJobId.fetch_add(1, std::memory_order_relaxed);

    std::lock_guard lock(impl_->mutex);
    impl_->tickJobs.push_back(
        Impl::TickEntry{id, interval, std::chrono::milliseconds{0},
                        std::move(job)});

    return AuthResult<JobId>::ok(id);
}

void AuthJobScheduler::processTick(std::chrono::milliseconds deltaTime) {
    std::vector<std::pair<JobId, JobFunc>> due;
    {
        std::lock_guard lock(impl_->mutex);
        for (auto& tick : impl_->tickJobs) {
            tick.elapsed += deltaTime;
            if (tick.elapsed >= tick.interval) {
                tick.elapsed = std::chrono::milliseconds{0};
                due.emplace_back(tick.id, tick.func);
            }
        }
    }

    for (auto& [tickId, fn] : due) {
        auto threadJob = kcenon::thread::job_builder()
            .name("csa_tick_" + std::to_string(tickId))
            .work([fn = std::move(fn), tickId = tickId]() -> kcenon::common::VoidResult {
                try {
                    fn();
                } catch (const std::exception& e) {
                    CSA_LOG_ERROR(LogCategory::Core, "tick job " + std::to_string(tickId) +
                                                         " threw: " + e.what());
                } catch (...) {
                    CSA_LOG_ERROR(LogCategory::Core, "tick job " + std::to_string(tickId) +
                                                         " threw a non-standard exception");
                }
                return kcenon::common::VoidResult::ok(std::monostate{});
            })
            .build();
        auto enqResult = impl_->pool->enqueue(std::move(threadJob));
        if (enqResult.is_err()) {
            CSA_LOG_WARN(LogCategory::Core,
                         "failed to dispatch tick job " + std::to_string(tickId));
        }
    }
}

AuthResult<void> AuthJobScheduler::wait(JobId id) {
    std::shared_future<void> future;
    {
        std::lock_guard lock(impl_->mutex);
        auto it = impl_->futures.find(id);
        if (it == impl_->futures.end()) {
            return AuthResult<void>::err(
                AuthError(ErrorCode::JobNotFound, "job not found"));
        }
        future = it->second;
    }

    // Collected: the id stops being tracked once its outcome is known.
    auto forget = [this, id] {
        std::lock_guard lock(impl_->mutex);
        impl_->futures.erase(id);
        impl_->cancelFlags.erase(id);
    };

    try {
        future.get();
    } catch (const std::exception& e) {
        forget();
        return AuthResult<void>::err(
            AuthError(ErrorCode::ThreadError, std::string("job execution failed: ") + e.what()));
    } catch (...) {
        forget();
        return AuthResult<void>::err(
            AuthError(ErrorCode::ThreadError, "job execution failed: non-standard exception"));
    }

    forget();
    return AuthResult<void>::ok();
}

AuthResult<void> AuthJobScheduler::cancel(JobId id) {
    std::lock_guard lock(impl_->mutex);

    auto flagIt = impl_->cancelFlags.find(id);
    if (flagIt == impl_->cancelFlags.end()) {
        auto tickIt = std::find_if(impl_->tickJobs.begin(), impl_->tickJobs.end(),
                                   [id](const Impl::TickEntry& tick) { return tick.id == id; });
        if (tickIt != impl_->tickJobs.end()) {
            impl_->tickJobs.erase(tickIt);
            return AuthResult<void>::ok();
        }
        return AuthResult<void>::err(
            AuthError(ErrorCode::JobNotFound, "job not found"));
    }

    auto futIt = impl_->futures.find(id);
    if (futIt != impl_->futures.end()) {
        auto status = futIt->second.wait_for(std::chrono::seconds(0));
        if (status == std::future_status::ready) {
            return AuthResult<void>::err(
                AuthError(ErrorCode::JobCancelled, "job already completed"));
        }
    }

    flagIt->second->store(true, std::memory_order_release);
    return AuthResult<void>::ok();
}

std::size_t AuthJobScheduler::trackedJobCount() const {
    std::lock_guard lock(impl_->mutex);
    return impl_->futures.size();
}

std::size_t AuthJobScheduler::tickJobCount() const {
    std::lock_guard lock(impl_->mutex);
    return impl_->tickJobs.size();
}

} // namespace csa::foundation
