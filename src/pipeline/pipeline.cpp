/**
 *  @file       pipeline.cpp
 *  @author     The causeway contributors
 *
 *  Implementation of the end-to-end pipeline.
 */

#include "causeway/pipeline/pipeline.hpp"

#include "causeway/capture/ingestor.hpp"
#include "causeway/capture/ring_buffer.hpp"
#include "causeway/core/clock.hpp"
#include "causeway/core/config.hpp"
#include "causeway/core/errors.hpp"
#include "causeway/core/types.hpp"
#include "causeway/correlation/cleanup_scheduler.hpp"
#include "causeway/correlation/event_correlator.hpp"
#include "causeway/storage/hot_store.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <glog/logging.h>
#include <memory>
#include <mutex>
#include <stop_token>
#include <thread>
#include <utility>

namespace causeway::pipeline
{

Pipeline::Pipeline(Passkey /*key*/, const core::PipelineConfig& config,
                   std::unique_ptr<capture::RingBuffer> buffer)
    : config_(config),
      buffer_(std::move(buffer)),
      ingestor_(*buffer_, config.max_payload_bytes, config.enabled),
      correlator_(correlation::CorrelatorOptions::fromConfig(config)),
      maintenance_([this] { runMaintenance(); }, config.sweep_interval)
{
}

Pipeline::~Pipeline()
{
    stop();
}

auto Pipeline::create(const core::PipelineConfig& config)
    -> std::expected<std::unique_ptr<Pipeline>, core::ConfigError>
{
    if (auto valid = core::validateConfig(config); !valid)
    {
        return std::unexpected(valid.error());
    }

    auto buffer = capture::RingBuffer::create(config.buffer_capacity, config.overflow_policy);
    if (!buffer)
    {
        LOG(ERROR) << "Cannot create ring buffer: " << core::toString(buffer.error());
        return std::unexpected(core::ConfigError::kInvalidValue);
    }

    return std::make_unique<Pipeline>(Passkey{}, config, std::move(*buffer));
}

auto Pipeline::start() -> std::expected<void, core::CorrelationError>
{
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true, std::memory_order_acq_rel))
    {
        return std::unexpected(core::CorrelationError::kInvalidState);
    }

    if (auto started = maintenance_.start(); !started)
    {
        running_.store(false, std::memory_order_release);
        return std::unexpected(started.error());
    }

    drain_thread_ = std::jthread(
        [this](const std::stop_token& stop_token)
        {
            drainLoop(stop_token);
        });

    LOG(INFO) << "Pipeline started: capacity " << buffer_->capacity() << ", policy "
              << core::toString(buffer_->policy()) << ", batch size " << config_.batch_size
              << ", correlation TTL " << config_.correlation_ttl.count() << " ms";
    return {};
}

void Pipeline::stop() noexcept
{
    if (!running_.load(std::memory_order_acquire))
    {
        return;
    }

    if (drain_thread_.joinable())
    {
        drain_thread_.request_stop();
        drain_thread_.join();
    }
    maintenance_.stop();

    // Whatever producers wrote before stop() still reaches the store
    const auto flushed = drainAll();

    running_.store(false, std::memory_order_release);

    const auto buffer_stats = buffer_->stats();
    LOG(INFO) << "Pipeline stopped: flushed " << flushed << " events; " << buffer_stats.writes
              << " written, " << buffer_stats.dropped << " dropped in buffer, "
              << events_correlated_.load(std::memory_order_relaxed) << " correlated";
}

auto Pipeline::isRunning() const noexcept -> bool
{
    return running_.load(std::memory_order_acquire);
}

auto Pipeline::drainOnce() -> std::size_t
{
    std::lock_guard lock(drain_mutex_);

    auto batch = buffer_->readBatch(read_cursor_, config_.batch_size);
    if (batch.events.empty())
    {
        return 0;
    }

    const auto count = batch.events.size();

    auto correlated = correlator_.correlateBatch(batch.events, config_.batch_timeout);
    if (!correlated)
    {
        batch_timeouts_.fetch_add(1, std::memory_order_relaxed);

        // The batch stays in the buffer; the next call re-reads it
        if (++failed_attempts_ < std::max<std::size_t>(config_.max_batch_retries, 1))
        {
            LOG_EVERY_N(WARNING, 10) << "Correlation timed out ("
                                     << core::toString(correlated.error()) << "); retrying batch";
            return 0;
        }

        LOG(WARNING) << "Dropping batch of " << count << " events after " << failed_attempts_
                     << " timed-out correlation attempts";
        batches_dropped_.fetch_add(1, std::memory_order_relaxed);
        events_dropped_.fetch_add(count, std::memory_order_relaxed);

        failed_attempts_ = 0;
        read_cursor_ = batch.next_position;
        buffer_->advanceReadPosition(read_cursor_);
        return 0;
    }

    store_.putBatch(std::move(*correlated));

    failed_attempts_ = 0;
    read_cursor_ = batch.next_position;
    buffer_->advanceReadPosition(read_cursor_);

    batches_correlated_.fetch_add(1, std::memory_order_relaxed);
    events_correlated_.fetch_add(count, std::memory_order_relaxed);
    return count;
}

auto Pipeline::drainAll() -> std::size_t
{
    std::size_t total = 0;
    for (auto drained = drainOnce(); drained > 0; drained = drainOnce())
    {
        total += drained;
    }
    return total;
}

void Pipeline::runMaintenance()
{
    const auto sweep = correlator_.sweep();

    std::size_t pruned = 0;
    if (config_.store_retention.count() > 0)
    {
        const auto retention_ns = static_cast<core::TimestampNs>(
            std::chrono::duration_cast<std::chrono::nanoseconds>(config_.store_retention)
                .count());
        const auto now = core::monotonicNowNs();
        if (now > retention_ns)
        {
            pruned += store_.prune(now - retention_ns);
        }
    }
    if (config_.store_max_events > 0)
    {
        pruned += store_.pruneToSize(config_.store_max_events);
    }

    maintenance_runs_.fetch_add(1, std::memory_order_relaxed);

    VLOG(2) << "Maintenance: " << sweep.removed_correlations << " correlations swept"
            << (sweep.complete ? "" : " (partial)") << ", " << pruned << " events pruned";
}

auto Pipeline::stats() const -> PipelineStats
{
    return PipelineStats{
        .buffer = buffer_->stats(),
        .ingested = ingestor_.ingestedCount(),
        .ingest_dropped = ingestor_.droppedCount(),
        .correlator = correlator_.stats(),
        .store = store_.stats(),
        .batches_correlated = batches_correlated_.load(std::memory_order_relaxed),
        .events_correlated = events_correlated_.load(std::memory_order_relaxed),
        .batch_timeouts = batch_timeouts_.load(std::memory_order_relaxed),
        .batches_dropped = batches_dropped_.load(std::memory_order_relaxed),
        .events_dropped = events_dropped_.load(std::memory_order_relaxed),
        .maintenance_runs = maintenance_runs_.load(std::memory_order_relaxed),
    };
}

auto Pipeline::ingestor() noexcept -> capture::Ingestor&
{
    return ingestor_;
}

auto Pipeline::buffer() noexcept -> capture::RingBuffer&
{
    return *buffer_;
}

auto Pipeline::correlator() noexcept -> correlation::EventCorrelator&
{
    return correlator_;
}

auto Pipeline::store() noexcept -> storage::HotStore&
{
    return store_;
}

auto Pipeline::store() const noexcept -> const storage::HotStore&
{
    return store_;
}

auto Pipeline::config() const noexcept -> const core::PipelineConfig&
{
    return config_;
}

void Pipeline::drainLoop(const std::stop_token& stop_token)
{
    while (!stop_token.stop_requested())
    {
        if (drainOnce() == 0)
        {
            // Buffer empty or batch awaiting retry
            std::this_thread::sleep_for(config_.drain_poll_interval);
        }
    }
}

}  // namespace causeway::pipeline
