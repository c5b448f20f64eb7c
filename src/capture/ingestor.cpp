/**
 *  @file       ingestor.cpp
 *  @author     The causeway contributors
 *
 *  Implementation of producer-facing event ingestion.
 */

#include "causeway/capture/ingestor.hpp"

#include "causeway/capture/payload.hpp"
#include "causeway/capture/ring_buffer.hpp"
#include "causeway/core/clock.hpp"
#include "causeway/core/errors.hpp"
#include "causeway/core/events.hpp"
#include "causeway/core/types.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <glog/logging.h>
#include <limits>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace causeway::capture
{

namespace
{

/**
 *  Fills in message hashes for events built outside the ingestor.
 */
void ensureContentHash(core::EventData& data)
{
    if (auto* send = std::get_if<core::MessageSend>(&data))
    {
        if (send->content_hash == 0 && !send->content.truncated)
        {
            send->content_hash = contentHash(send->content.data);
        }
    }
    else if (auto* receive = std::get_if<core::MessageReceive>(&data))
    {
        if (receive->content_hash == 0 && !receive->content.truncated)
        {
            receive->content_hash = contentHash(receive->content.data);
        }
    }
}

}  // namespace

Ingestor::Ingestor(RingBuffer& buffer, std::size_t max_payload_bytes, bool enabled) noexcept
    : buffer_(buffer), max_payload_bytes_(max_payload_bytes), enabled_(enabled)
{
}

auto Ingestor::ingestFunctionEntry(core::ProducerId producer, std::string_view module,
                                   std::string_view function, std::span<const std::string> args,
                                   std::optional<core::CorrelationId> correlation_hint)
    -> IngestResult
{
    if (!isEnabled())
    {
        return std::unexpected(core::IngestError::kDisabled);
    }

    return submit(producer,
                  core::FunctionEntry{
                      .module = std::string(module),
                      .function = std::string(function),
                      .arity = static_cast<std::uint32_t>(args.size()),
                      .args = boundPayload(renderArguments(args), "list", max_payload_bytes_),
                  },
                  correlation_hint);
}

auto Ingestor::ingestFunctionExit(core::ProducerId producer, std::string_view module,
                                  std::string_view function, std::uint32_t arity,
                                  std::string_view return_value, std::uint64_t duration_ns,
                                  std::optional<core::CorrelationId> correlation_hint)
    -> IngestResult
{
    if (!isEnabled())
    {
        return std::unexpected(core::IngestError::kDisabled);
    }

    return submit(producer,
                  core::FunctionExit{
                      .module = std::string(module),
                      .function = std::string(function),
                      .arity = arity,
                      .return_value = boundPayload(return_value, "term", max_payload_bytes_),
                      .duration_ns = duration_ns,
                  },
                  correlation_hint);
}

auto Ingestor::ingestMessageSend(core::ProducerId sender, core::ProducerId receiver,
                                 std::string_view content) -> IngestResult
{
    if (!isEnabled())
    {
        return std::unexpected(core::IngestError::kDisabled);
    }

    return submit(sender, core::MessageSend{
                              .sender = sender,
                              .receiver = receiver,
                              .content = boundPayload(content, "message", max_payload_bytes_),
                              .content_hash = contentHash(content),
                          });
}

auto Ingestor::ingestMessageReceive(core::ProducerId receiver, core::ProducerId sender,
                                    std::string_view content) -> IngestResult
{
    if (!isEnabled())
    {
        return std::unexpected(core::IngestError::kDisabled);
    }

    return submit(receiver, core::MessageReceive{
                                .sender = sender,
                                .receiver = receiver,
                                .content = boundPayload(content, "message", max_payload_bytes_),
                                .content_hash = contentHash(content),
                            });
}

auto Ingestor::ingestStateChange(core::ProducerId producer, std::string_view callback,
                                 std::string_view old_state, std::string_view new_state)
    -> IngestResult
{
    if (!isEnabled())
    {
        return std::unexpected(core::IngestError::kDisabled);
    }

    // Diff is computed on the full states, before either is truncated
    return submit(producer,
                  core::StateChange{
                      .callback = std::string(callback),
                      .old_state = boundPayload(old_state, "state", max_payload_bytes_),
                      .new_state = boundPayload(new_state, "state", max_payload_bytes_),
                      .changed = old_state != new_state,
                      .size_delta = static_cast<std::int64_t>(new_state.size()) -
                                    static_cast<std::int64_t>(old_state.size()),
                  });
}

auto Ingestor::ingestProcessSpawn(core::ProducerId parent, core::ProducerId child)
    -> IngestResult
{
    if (!isEnabled())
    {
        return std::unexpected(core::IngestError::kDisabled);
    }

    return submit(parent, core::ProcessSpawn{.parent = parent, .child = child});
}

auto Ingestor::ingestProcessExit(core::ProducerId producer, std::string_view reason)
    -> IngestResult
{
    if (!isEnabled())
    {
        return std::unexpected(core::IngestError::kDisabled);
    }

    return submit(producer, core::ProcessExit{.reason = std::string(reason)});
}

auto Ingestor::ingestError(core::ProducerId producer, std::string_view error_type,
                           std::string_view message, std::string_view stacktrace)
    -> IngestResult
{
    if (!isEnabled())
    {
        return std::unexpected(core::IngestError::kDisabled);
    }

    return submit(producer,
                  core::ErrorRaised{
                      .error_type = std::string(error_type),
                      .message = boundPayload(message, "string", max_payload_bytes_),
                      .stacktrace = boundPayload(stacktrace, "stacktrace", max_payload_bytes_),
                  });
}

auto Ingestor::ingestMetric(core::ProducerId producer, std::string_view name, double value,
                            std::vector<std::pair<std::string, std::string>> metadata)
    -> IngestResult
{
    if (!isEnabled())
    {
        return std::unexpected(core::IngestError::kDisabled);
    }

    return submit(producer, core::Metric{
                                .name = std::string(name),
                                .value = value,
                                .metadata = std::move(metadata),
                            });
}

auto Ingestor::ingestBatch(std::vector<core::Event> events) -> BatchIngestResult
{
    BatchIngestResult result;

    if (!isEnabled())
    {
        result.failed.reserve(events.size());
        for (std::size_t i = 0; i < events.size(); ++i)
        {
            result.failed.push_back({.index = i, .error = core::IngestError::kDisabled});
        }
        return result;
    }

    for (std::size_t i = 0; i < events.size(); ++i)
    {
        auto& event = events[i];

        if (event.id == 0)
        {
            event.id = core::nextEventId();
        }
        if (event.timestamp_ns == 0)
        {
            event.timestamp_ns = core::monotonicNowNs();
        }
        if (event.wall_time_ns == 0)
        {
            event.wall_time_ns = core::wallNowNs();
        }
        ensureContentHash(event.data);
        boundEventPayloads(event.data, max_payload_bytes_);

        auto written = enqueue(std::move(event));
        if (written)
        {
            ++result.ok;
        }
        else
        {
            result.failed.push_back({.index = i, .error = written.error()});
        }
    }

    return result;
}

auto Ingestor::fastPath() -> FastPath
{
    return [&buffer = buffer_](core::Event event)
    {
        return buffer.write(std::move(event));
    };
}

void Ingestor::setEnabled(bool enabled) noexcept
{
    enabled_.store(enabled, std::memory_order_release);
}

auto Ingestor::isEnabled() const noexcept -> bool
{
    return enabled_.load(std::memory_order_acquire);
}

auto Ingestor::ingestedCount() const noexcept -> std::uint64_t
{
    return ingested_.load(std::memory_order_relaxed);
}

auto Ingestor::droppedCount() const noexcept -> std::uint64_t
{
    return dropped_.load(std::memory_order_relaxed);
}

auto Ingestor::maxPayloadBytes() const noexcept -> std::size_t
{
    return max_payload_bytes_;
}

auto Ingestor::submit(core::ProducerId producer, core::EventData data,
                      std::optional<core::CorrelationId> correlation_hint) -> IngestResult
{
    core::Event event{
        .id = core::nextEventId(),
        .timestamp_ns = core::monotonicNowNs(),
        .wall_time_ns = core::wallNowNs(),
        .producer = producer,
        .correlation_id = correlation_hint,
        .parent_id = std::nullopt,
        .data = std::move(data),
    };

    return enqueue(std::move(event));
}

auto Ingestor::enqueue(core::Event event) -> IngestResult
{
    const auto id = event.id;

    auto written = buffer_.write(std::move(event));
    if (!written)
    {
        auto dropped = dropped_.fetch_add(1, std::memory_order_relaxed) + 1;
        LOG_FIRST_N(WARNING, 1) << "Ring buffer full (policy " << core::toString(buffer_.policy())
                                << "); dropping events";
        LOG_EVERY_N(WARNING, 100000) << "Ring buffer still full; " << dropped
                                     << " events dropped so far";
        return std::unexpected(core::IngestError::kBufferFull);
    }

    ingested_.fetch_add(1, std::memory_order_relaxed);
    return id;
}

auto benchmarkIngestion(RingBuffer& buffer, const core::Event& sample, std::size_t iterations)
    -> IngestBenchmark
{
    IngestBenchmark result;
    if (iterations == 0)
    {
        return result;
    }

    result.min_time_ns = std::numeric_limits<std::uint64_t>::max();

    for (std::size_t i = 0; i < iterations; ++i)
    {
        auto event = sample;

        const auto start = core::monotonicNowNs();
        auto written = buffer.write(std::move(event));
        const auto elapsed = core::monotonicNowNs() - start;

        // Refused writes are timed too; the cost of backpressure is part of the path
        if (!written)
        {
            ++result.rejected;
        }

        result.total_time_ns += elapsed;
        result.min_time_ns = std::min(result.min_time_ns, elapsed);
        result.max_time_ns = std::max(result.max_time_ns, elapsed);
    }

    result.operations = iterations;
    result.avg_time_ns =
        static_cast<double>(result.total_time_ns) / static_cast<double>(iterations);

    return result;
}

}  // namespace causeway::capture
