/**
 *  @file       cleanup_scheduler.hpp
 *  @author     The causeway contributors
 *
 *  Periodic background maintenance.
 *
 *  Runs a task at a fixed interval on its own thread, independent of the
 *  drain loop. The pipeline uses it for correlation sweeps and store
 *  retention.
 *
 *  Example usage:
 *  @code
 *      CleanupScheduler scheduler([&] { correlator.sweep(); },
 *                                 std::chrono::seconds(1));
 *      if (auto started = scheduler.start(); !started)
 *      {
 *          // handle error
 *      }
 *      // ...
 *      scheduler.stop();  // Or let destructor handle it
 *  @endcode
 */

#ifndef CAUSEWAY_CORRELATION_CLEANUP_SCHEDULER_HPP_
#define CAUSEWAY_CORRELATION_CLEANUP_SCHEDULER_HPP_

#include "causeway/core/errors.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <expected>
#include <functional>
#include <mutex>
#include <stop_token>
#include <thread>

namespace causeway::correlation
{

/**
 *  Runs a task periodically on a background thread.
 *
 *  Stopping interrupts the wait between runs, so stop() returns as soon as a
 *  run in progress finishes.
 */
class CleanupScheduler
{
  public:
    using Task = std::function<void()>;

    /**
     *  Smallest accepted interval. Shorter intervals are raised to it.
     */
    static constexpr std::chrono::milliseconds kMinInterval{1};

    CleanupScheduler(Task task, std::chrono::milliseconds interval);

    /**
     *  Stops the thread if running.
     */
    ~CleanupScheduler();

    CleanupScheduler(const CleanupScheduler&) = delete;
    auto operator=(const CleanupScheduler&) -> CleanupScheduler& = delete;
    CleanupScheduler(CleanupScheduler&&) = delete;
    auto operator=(CleanupScheduler&&) -> CleanupScheduler& = delete;

    /**
     *  Starts the background thread. The first run happens after one interval.
     *
     *  @return     Success, or CorrelationError::kInvalidState if already
     *              running or the task is empty.
     */
    [[nodiscard]] auto start() -> std::expected<void, core::CorrelationError>;

    /**
     *  Signals the thread to stop and waits for it to finish.
     */
    void stop() noexcept;

    [[nodiscard]] auto isRunning() const noexcept -> bool;

    /**
     *  Number of completed task runs since construction.
     */
    [[nodiscard]] auto runCount() const noexcept -> std::uint64_t;

    [[nodiscard]] auto interval() const noexcept -> std::chrono::milliseconds;

  private:
    void runLoop(const std::stop_token& stop_token);

    Task task_;
    std::chrono::milliseconds interval_;

    std::mutex wait_mutex_;
    std::condition_variable_any wake_;

    std::atomic<std::uint64_t> run_count_{0};
    std::atomic<bool> running_{false};

    // Declared last so the thread is joined before the members it uses go away
    std::jthread worker_;
};

}  // namespace causeway::correlation

#endif  // CAUSEWAY_CORRELATION_CLEANUP_SCHEDULER_HPP_
