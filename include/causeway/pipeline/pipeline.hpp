/**
 *  @file       pipeline.hpp
 *  @author     The causeway contributors
 *
 *  End-to-end capture, correlation and storage pipeline.
 *
 *  Wires an Ingestor and RingBuffer to an EventCorrelator and HotStore. A
 *  drain thread moves batches from the buffer through the correlator into
 *  the store, and a maintenance thread sweeps stale correlation state and
 *  applies store retention.
 *
 *  Example usage:
 *  @code
 *      auto pipeline = Pipeline::create(config);
 *      if (!pipeline)
 *      {
 *          // handle error
 *      }
 *      (*pipeline)->start();
 *      auto id = (*pipeline)->ingestor().ingestMetric(producer, "queue_len", 4.0);
 *      (*pipeline)->stop();  // Or let destructor handle it
 *  @endcode
 */

#ifndef CAUSEWAY_PIPELINE_PIPELINE_HPP_
#define CAUSEWAY_PIPELINE_PIPELINE_HPP_

#include "causeway/capture/ingestor.hpp"
#include "causeway/capture/ring_buffer.hpp"
#include "causeway/core/config.hpp"
#include "causeway/core/errors.hpp"
#include "causeway/correlation/cleanup_scheduler.hpp"
#include "causeway/correlation/event_correlator.hpp"
#include "causeway/storage/hot_store.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <mutex>
#include <stop_token>
#include <thread>

namespace causeway::pipeline
{

/**
 *  Observability snapshot of every pipeline stage.
 */
struct PipelineStats
{
    capture::RingBufferStats buffer;

    std::uint64_t ingested{0};
    std::uint64_t ingest_dropped{0};

    correlation::CorrelatorStats correlator;
    storage::HotStoreStats store;

    std::uint64_t batches_correlated{0};
    std::uint64_t events_correlated{0};
    std::uint64_t batch_timeouts{0};
    std::uint64_t batches_dropped{0};
    std::uint64_t events_dropped{0};
    std::uint64_t maintenance_runs{0};
};

/**
 *  Owns every pipeline stage and the threads driving them.
 *
 *  Thread-safety: ingestor() may be used from any number of producer
 *  threads. drainOnce() and drainAll() are serialized with the drain thread.
 */
class Pipeline
{
  public:
    /**
     *  Restricts construction to create().
     */
    class Passkey
    {
        friend class Pipeline;
        Passkey() = default;
    };

    /**
     *  Validates the configuration and builds every stage.
     *
     *  @param      config  Pipeline configuration.
     *  @return     The pipeline (stopped), or ConfigError::kInvalidValue.
     */
    [[nodiscard]] static auto create(const core::PipelineConfig& config)
        -> std::expected<std::unique_ptr<Pipeline>, core::ConfigError>;

    Pipeline(Passkey key, const core::PipelineConfig& config,
             std::unique_ptr<capture::RingBuffer> buffer);

    /**
     *  Stops the threads if running.
     */
    ~Pipeline();

    Pipeline(const Pipeline&) = delete;
    auto operator=(const Pipeline&) -> Pipeline& = delete;
    Pipeline(Pipeline&&) = delete;
    auto operator=(Pipeline&&) -> Pipeline& = delete;

    /**
     *  Starts the drain and maintenance threads.
     *
     *  @return     Success, or CorrelationError::kInvalidState if already running.
     */
    [[nodiscard]] auto start() -> std::expected<void, core::CorrelationError>;

    /**
     *  Stops both threads, then drains what is left in the buffer.
     */
    void stop() noexcept;

    [[nodiscard]] auto isRunning() const noexcept -> bool;

    /**
     *  Moves one batch from the buffer through the correlator into the store.
     *
     *  A batch that times out stays in the buffer and is retried on the next
     *  call; after max_batch_retries timeouts it is dropped.
     *
     *  @return     Number of events stored.
     */
    auto drainOnce() -> std::size_t;

    /**
     *  Calls drainOnce() until the buffer yields nothing more.
     *
     *  @return     Number of events stored.
     */
    auto drainAll() -> std::size_t;

    /**
     *  Sweeps correlation state and applies store retention once.
     */
    void runMaintenance();

    [[nodiscard]] auto stats() const -> PipelineStats;

    [[nodiscard]] auto ingestor() noexcept -> capture::Ingestor&;

    [[nodiscard]] auto buffer() noexcept -> capture::RingBuffer&;

    [[nodiscard]] auto correlator() noexcept -> correlation::EventCorrelator&;

    [[nodiscard]] auto store() noexcept -> storage::HotStore&;

    [[nodiscard]] auto store() const noexcept -> const storage::HotStore&;

    [[nodiscard]] auto config() const noexcept -> const core::PipelineConfig&;

  private:
    void drainLoop(const std::stop_token& stop_token);

    core::PipelineConfig config_;

    std::unique_ptr<capture::RingBuffer> buffer_;
    capture::Ingestor ingestor_;
    correlation::EventCorrelator correlator_;
    storage::HotStore store_;
    correlation::CleanupScheduler maintenance_;

    std::mutex drain_mutex_;
    std::uint64_t read_cursor_{0};
    std::size_t failed_attempts_{0};

    std::atomic<std::uint64_t> batches_correlated_{0};
    std::atomic<std::uint64_t> events_correlated_{0};
    std::atomic<std::uint64_t> batch_timeouts_{0};
    std::atomic<std::uint64_t> batches_dropped_{0};
    std::atomic<std::uint64_t> events_dropped_{0};
    std::atomic<std::uint64_t> maintenance_runs_{0};

    std::atomic<bool> running_{false};

    std::jthread drain_thread_;
};

}  // namespace causeway::pipeline

#endif  // CAUSEWAY_PIPELINE_PIPELINE_HPP_
