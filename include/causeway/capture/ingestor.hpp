/**
 *  @file       ingestor.hpp
 *  @author     The causeway contributors
 *
 *  Producer-facing event ingestion.
 *
 *  Builds normalized event records (ID, monotonic and wall timestamps,
 *  bounded payloads) and writes them into a RingBuffer. Every entry point is
 *  non-blocking and never throws: backpressure is reported as a value and
 *  counted as a drop.
 */

#ifndef CAUSEWAY_CAPTURE_INGESTOR_HPP_
#define CAUSEWAY_CAPTURE_INGESTOR_HPP_

#include "causeway/capture/ring_buffer.hpp"
#include "causeway/core/errors.hpp"
#include "causeway/core/events.hpp"
#include "causeway/core/types.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace causeway::capture
{

/**
 *  A batch entry that could not be enqueued.
 */
struct BatchFailure
{
    /**
     *  Index of the event in the submitted batch.
     */
    std::size_t index{0};

    core::IngestError error{core::IngestError::kBufferFull};
};

/**
 *  Outcome of ingestBatch().
 */
struct BatchIngestResult
{
    std::size_t ok{0};
    std::vector<BatchFailure> failed;
};

/**
 *  Timing of repeated ring buffer writes.
 */
struct IngestBenchmark
{
    double avg_time_ns{0.0};
    std::uint64_t min_time_ns{0};
    std::uint64_t max_time_ns{0};
    std::uint64_t total_time_ns{0};
    std::size_t operations{0};

    /**
     *  Writes refused by the buffer's overflow policy.
     */
    std::size_t rejected{0};

    /**
     *  Checks the average write time against a latency target.
     *
     *  @param      target  Maximum acceptable average time per write.
     *  @return     True if the average is within the target.
     */
    [[nodiscard]] auto validatePerformance(
        std::chrono::nanoseconds target = std::chrono::microseconds{1}) const noexcept -> bool
    {
        return operations > 0 && avg_time_ns <= static_cast<double>(target.count());
    }
};

/**
 *  Builds events and writes them into a ring buffer.
 *
 *  The ingestor holds a reference to the buffer; the buffer must outlive it.
 *
 *  Thread-safety: all ingest methods may be called concurrently from any
 *  number of producer threads.
 */
class Ingestor
{
  public:
    using IngestResult = std::expected<core::EventId, core::IngestError>;

    /**
     *  Pre-bound write path for already built events.
     */
    using FastPath = std::function<std::expected<void, core::BufferError>(core::Event)>;

    /**
     *  Constructs an ingestor writing into a buffer.
     *
     *  @param      buffer             Destination ring buffer.
     *  @param      max_payload_bytes  Payloads larger than this are truncated.
     *  @param      enabled            Initial state of the enable flag.
     */
    Ingestor(RingBuffer& buffer, std::size_t max_payload_bytes, bool enabled = true) noexcept;

    Ingestor(const Ingestor&) = delete;
    auto operator=(const Ingestor&) -> Ingestor& = delete;

    [[nodiscard]] auto ingestFunctionEntry(core::ProducerId producer, std::string_view module,
                                           std::string_view function,
                                           std::span<const std::string> args,
                                           std::optional<core::CorrelationId> correlation_hint =
                                               std::nullopt) -> IngestResult;

    [[nodiscard]] auto ingestFunctionExit(core::ProducerId producer, std::string_view module,
                                          std::string_view function, std::uint32_t arity,
                                          std::string_view return_value,
                                          std::uint64_t duration_ns,
                                          std::optional<core::CorrelationId> correlation_hint =
                                              std::nullopt) -> IngestResult;

    /**
     *  Records a message leaving the sender. The sender is the producer.
     */
    [[nodiscard]] auto ingestMessageSend(core::ProducerId sender, core::ProducerId receiver,
                                         std::string_view content) -> IngestResult;

    /**
     *  Records a message arriving at the receiver. The receiver is the producer.
     */
    [[nodiscard]] auto ingestMessageReceive(core::ProducerId receiver, core::ProducerId sender,
                                            std::string_view content) -> IngestResult;

    [[nodiscard]] auto ingestStateChange(core::ProducerId producer, std::string_view callback,
                                         std::string_view old_state, std::string_view new_state)
        -> IngestResult;

    /**
     *  Records a spawn. The parent is the producer.
     */
    [[nodiscard]] auto ingestProcessSpawn(core::ProducerId parent, core::ProducerId child)
        -> IngestResult;

    [[nodiscard]] auto ingestProcessExit(core::ProducerId producer, std::string_view reason)
        -> IngestResult;

    [[nodiscard]] auto ingestError(core::ProducerId producer, std::string_view error_type,
                                   std::string_view message, std::string_view stacktrace)
        -> IngestResult;

    [[nodiscard]] auto ingestMetric(
        core::ProducerId producer, std::string_view name, double value,
        std::vector<std::pair<std::string, std::string>> metadata = {}) -> IngestResult;

    /**
     *  Ingests pre-built events.
     *
     *  Each event is normalized first: a missing ID or timestamp is
     *  assigned, payloads are bounded and missing message hashes computed.
     *
     *  @param      events  Events to ingest, consumed.
     *  @return     Number enqueued and the failures by batch index.
     */
    [[nodiscard]] auto ingestBatch(std::vector<core::Event> events) -> BatchIngestResult;

    /**
     *  Returns a callable writing pre-built events straight into the buffer.
     *
     *  Skips normalization and the enable flag; intended for hot loops that
     *  already build complete events.
     */
    [[nodiscard]] auto fastPath() -> FastPath;

    void setEnabled(bool enabled) noexcept;

    [[nodiscard]] auto isEnabled() const noexcept -> bool;

    /**
     *  Events enqueued since construction.
     */
    [[nodiscard]] auto ingestedCount() const noexcept -> std::uint64_t;

    /**
     *  Events refused by the buffer since construction.
     */
    [[nodiscard]] auto droppedCount() const noexcept -> std::uint64_t;

    [[nodiscard]] auto maxPayloadBytes() const noexcept -> std::size_t;

  private:
    /**
     *  Stamps and bounds an event, then writes it.
     */
    auto submit(core::ProducerId producer, core::EventData data,
                std::optional<core::CorrelationId> correlation_hint = std::nullopt)
        -> IngestResult;

    /**
     *  Writes a normalized event and accounts for the outcome.
     */
    auto enqueue(core::Event event) -> IngestResult;

    RingBuffer& buffer_;
    std::size_t max_payload_bytes_;
    std::atomic<bool> enabled_;
    std::atomic<std::uint64_t> ingested_{0};
    std::atomic<std::uint64_t> dropped_{0};
};

/**
 *  Measures raw ring buffer write latency.
 *
 *  @param      buffer      Buffer to write into.
 *  @param      sample      Event written on every iteration.
 *  @param      iterations  Number of writes.
 *  @return     Per-write timing statistics.
 */
[[nodiscard]] auto benchmarkIngestion(RingBuffer& buffer, const core::Event& sample,
                                      std::size_t iterations = 1000) -> IngestBenchmark;

}  // namespace causeway::capture

#endif  // CAUSEWAY_CAPTURE_INGESTOR_HPP_
