/**
 *  @file       ring_buffer.cpp
 *  @author     The causeway contributors
 *
 *  Implementation of the lock-free multi-producer ring buffer.
 */

#include "causeway/capture/ring_buffer.hpp"

#include "causeway/core/errors.hpp"
#include "causeway/core/events.hpp"
#include "causeway/core/types.hpp"

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <thread>
#include <utility>
#include <vector>

namespace causeway::capture
{

RingBuffer::RingBuffer(Passkey /*key*/, std::size_t capacity, core::OverflowPolicy policy)
    : capacity_(capacity),
      mask_(static_cast<std::uint64_t>(capacity) - 1),
      policy_(policy),
      slots_(std::make_unique<Slot[]>(capacity))
{
}

auto RingBuffer::create(std::size_t capacity, core::OverflowPolicy policy)
    -> std::expected<std::unique_ptr<RingBuffer>, core::BufferError>
{
    // Power of two lets position & mask replace a modulo on every access
    if (capacity < kMinCapacity || (capacity & (capacity - 1)) != 0)
    {
        return std::unexpected(core::BufferError::kInvalidCapacity);
    }

    return std::make_unique<RingBuffer>(Passkey{}, capacity, policy);
}

auto RingBuffer::write(core::Event event) -> std::expected<void, core::BufferError>
{
    auto shared = std::make_shared<const core::Event>(std::move(event));

    for (;;)
    {
        auto write_pos = write_pos_.load(std::memory_order_acquire);
        auto read_pos = read_pos_.load(std::memory_order_acquire);

        // Stale write_pos observed against a newer read_pos; take a fresh look
        if (read_pos > write_pos)
        {
            continue;
        }

        if (write_pos - read_pos >= capacity_)
        {
            switch (policy_)
            {
                case core::OverflowPolicy::kDropOldest:
                    // Only the producer whose CAS succeeds accounts for the drop
                    if (read_pos_.compare_exchange_weak(read_pos, read_pos + 1,
                                                        std::memory_order_acq_rel,
                                                        std::memory_order_relaxed))
                    {
                        dropped_count_.fetch_add(1, std::memory_order_relaxed);
                    }
                    continue;

                case core::OverflowPolicy::kDropNewest:
                    dropped_count_.fetch_add(1, std::memory_order_relaxed);
                    return std::unexpected(core::BufferError::kFull);

                case core::OverflowPolicy::kReject:
                    return std::unexpected(core::BufferError::kFull);
            }
        }

        if (write_pos_.compare_exchange_weak(write_pos, write_pos + 1, std::memory_order_acq_rel,
                                             std::memory_order_relaxed))
        {
            // Slot at write_pos now belongs to this producer alone
            publish(write_pos, std::move(shared));
            total_writes_.fetch_add(1, std::memory_order_relaxed);
            return {};
        }
    }
}

void RingBuffer::publish(std::uint64_t position, std::shared_ptr<const core::Event> event) noexcept
{
    auto& slot = slots_[position & mask_];
    const auto published = position + 1;

    auto expected = slot.sequence.load(std::memory_order_acquire);
    for (;;)
    {
        if (expected == kSlotBusy)
        {
            // A producer one lap behind is still storing into this slot
            std::this_thread::yield();
            expected = slot.sequence.load(std::memory_order_acquire);
            continue;
        }

        if (expected > published)
        {
            // Lapped before publishing: a newer event owns the slot and the
            // drop of this position was already counted by kDropOldest
            return;
        }

        if (slot.sequence.compare_exchange_weak(expected, kSlotBusy, std::memory_order_acq_rel,
                                                std::memory_order_acquire))
        {
            break;
        }
    }

    slot.event.store(std::move(event), std::memory_order_release);
    slot.sequence.store(published, std::memory_order_release);
}

auto RingBuffer::read(std::uint64_t position) const -> std::optional<ReadResult>
{
    auto pos = position;

    for (;;)
    {
        const auto read_pos = read_pos_.load(std::memory_order_acquire);
        const auto write_pos = write_pos_.load(std::memory_order_acquire);

        // Lapped consumer resumes at the oldest surviving event
        pos = std::max(pos, read_pos);

        if (pos >= write_pos)
        {
            return std::nullopt;
        }

        const auto& slot = slots_[pos & mask_];
        const auto published = pos + 1;
        const auto sequence = slot.sequence.load(std::memory_order_acquire);

        if (sequence == published)
        {
            auto event = slot.event.load(std::memory_order_acquire);

            // Re-check: a writer from the next lap marks the slot busy
            // before replacing the event
            if (event && slot.sequence.load(std::memory_order_acquire) == published)
            {
                // Dropped by kDropOldest after the read_pos check above
                if (read_pos_.load(std::memory_order_acquire) > pos)
                {
                    continue;
                }


                total_reads_.fetch_add(1, std::memory_order_relaxed);
                return ReadResult{.event = *event, .next_position = published};
            }
            continue;
        }

        if (sequence != kSlotBusy && sequence > published)
        {
            // Overwritten by a later lap; read_pos has already moved past pos
            continue;
        }

        // Claimed but not yet published
        return std::nullopt;
    }
}

auto RingBuffer::readBatch(std::uint64_t position, std::size_t max_events) const -> BatchResult
{
    BatchResult batch;
    batch.next_position = position;

    if (max_events == 0)
    {
        return batch;
    }

    batch.events.reserve(std::min(max_events, capacity_));

    while (batch.events.size() < max_events)
    {
        auto result = read(batch.next_position);
        if (!result)
        {
            break;
        }

        batch.events.push_back(std::move(result->event));
        batch.next_position = result->next_position;
    }

    return batch;
}

void RingBuffer::advanceReadPosition(std::uint64_t position) noexcept
{
    auto current = read_pos_.load(std::memory_order_acquire);

    for (;;)
    {
        const auto target = std::min(position, write_pos_.load(std::memory_order_acquire));
        if (target <= current)
        {
            return;
        }

        if (read_pos_.compare_exchange_weak(current, target, std::memory_order_acq_rel,
                                            std::memory_order_acquire))
        {
            return;
        }
    }
}

auto RingBuffer::stats() const noexcept -> RingBufferStats
{
    const auto read_pos = read_pos_.load(std::memory_order_acquire);
    const auto write_pos = write_pos_.load(std::memory_order_acquire);

    return RingBufferStats{
        .writes = total_writes_.load(std::memory_order_relaxed),
        .reads = total_reads_.load(std::memory_order_relaxed),
        .dropped = dropped_count_.load(std::memory_order_relaxed),
        .occupancy = write_pos > read_pos
                         ? static_cast<std::size_t>(std::min<std::uint64_t>(write_pos - read_pos,
                                                                             capacity_))
                         : 0,
        .capacity = capacity_,
    };
}

auto RingBuffer::capacity() const noexcept -> std::size_t
{
    return capacity_;
}

auto RingBuffer::policy() const noexcept -> core::OverflowPolicy
{
    return policy_;
}

auto RingBuffer::writePosition() const noexcept -> std::uint64_t
{
    return write_pos_.load(std::memory_order_acquire);
}

auto RingBuffer::readPosition() const noexcept -> std::uint64_t
{
    return read_pos_.load(std::memory_order_acquire);
}

}  // namespace causeway::capture
