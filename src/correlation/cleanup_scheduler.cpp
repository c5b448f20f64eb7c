/**
 *  @file       cleanup_scheduler.cpp
 *  @author     The causeway contributors
 *
 *  Implementation of periodic background maintenance.
 */

#include "causeway/correlation/cleanup_scheduler.hpp"

#include "causeway/core/errors.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <expected>
#include <glog/logging.h>
#include <mutex>
#include <stop_token>
#include <thread>
#include <utility>

namespace causeway::correlation
{

CleanupScheduler::CleanupScheduler(Task task, std::chrono::milliseconds interval)
    : task_(std::move(task)), interval_(std::max(interval, kMinInterval))
{
}

CleanupScheduler::~CleanupScheduler()
{
    stop();
}

auto CleanupScheduler::start() -> std::expected<void, core::CorrelationError>
{
    if (!task_)
    {
        return std::unexpected(core::CorrelationError::kInvalidState);
    }

    // Only one caller may win the transition to running
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true, std::memory_order_acq_rel))
    {
        return std::unexpected(core::CorrelationError::kInvalidState);
    }

    worker_ = std::jthread(
        [this](const std::stop_token& stop_token)
        {
            runLoop(stop_token);
        });

    VLOG(1) << "Cleanup scheduler started with interval " << interval_.count() << " ms";
    return {};
}

void CleanupScheduler::stop() noexcept
{
    if (!running_.load(std::memory_order_acquire))
    {
        return;
    }

    if (worker_.joinable())
    {
        // request_stop() also wakes the interruptible wait in runLoop()
        worker_.request_stop();
        worker_.join();
    }

    running_.store(false, std::memory_order_release);
    VLOG(1) << "Cleanup scheduler stopped after " << runCount() << " runs";
}

auto CleanupScheduler::isRunning() const noexcept -> bool
{
    return running_.load(std::memory_order_acquire);
}

auto CleanupScheduler::runCount() const noexcept -> std::uint64_t
{
    return run_count_.load(std::memory_order_relaxed);
}

auto CleanupScheduler::interval() const noexcept -> std::chrono::milliseconds
{
    return interval_;
}

void CleanupScheduler::runLoop(const std::stop_token& stop_token)
{
    while (!stop_token.stop_requested())
    {
        {
            std::unique_lock lock(wait_mutex_);

            // Returns early only when a stop is requested
            if (wake_.wait_for(lock, stop_token, interval_, [] { return false; }) ||
                stop_token.stop_requested())
            {
                break;
            }
        }

        task_();
        run_count_.fetch_add(1, std::memory_order_relaxed);
    }
}

}  // namespace causeway::correlation
