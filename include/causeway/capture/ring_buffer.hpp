/**
 *  @file       ring_buffer.hpp
 *  @author     The causeway contributors
 *
 *  Lock-free multi-producer ring buffer for captured events.
 *
 *  Producers claim slots with a compare-and-swap on the write position. Consumers track their own cursors; reads do not
 *  modify shared state apart from an aggregate read counter.
 */

#ifndef CAUSEWAY_CAPTURE_RING_BUFFER_HPP_
#define CAUSEWAY_CAPTURE_RING_BUFFER_HPP_

#include "causeway/core/errors.hpp"
#include "causeway/core/events.hpp"
#include "causeway/core/types.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <limits>
#include <memory>
#include <optional>
#include <vector>

namespace causeway::capture
{

/**
 *  Snapshot of ring buffer counters.
 */
struct RingBufferStats
{
    /**
     *  Slots claimed by producers since creation.
     */
    std::uint64_t writes{0};

    /**
     *  Events returned by read() and readBatch() across all consumers.
     */
    std::uint64_t reads{0};

    /**
     *  Events lost to the overflow policy.
     */
    std::uint64_t dropped{0};

    /**
     *  Slots between the oldest unconsumed position and the write position.
     */
    std::size_t occupancy{0};

    std::size_t capacity{0};
};

/**
 *  A single event read from the buffer.
 */
struct ReadResult
{
    core::Event event;

    /**
     *  Position the consumer should pass to its next read.
     */
    std::uint64_t next_position{0};
};

/**
 *  Events read in one batch.
 */
struct BatchResult
{
    std::vector<core::Event> events;
    std::uint64_t next_position{0};
};

/**
 *  Fixed-capacity circular buffer accepting events from many producers.
 *
 *  Slot index is position & (capacity - 1). Four counters are managed
 *  atomically: write_pos, read_pos (oldest unconsumed), total writes and
 *  dropped count. The invariant write_pos - read_pos <= capacity holds at
 *  all times, and write_pos never decreases.
 *
 *  Each slot carries a sequence number equal to position + 1 once its
 *  event is published. A claimed slot is marked busy while the event is
 *  stored, so a reader never observes a half-written slot: it either sees
 *  the published event or reports the position as not yet available.
 *
 *  Progress is lock-free on the positions but not on the slots. A producer
 *  whose slot is still marked busy by a producer one lap behind yields
 *  until that store completes; this only happens when the buffer wraps
 *  within one store. Slot events are held in std::atomic<std::shared_ptr>,
 *  which libstdc++ implements with a per-object spin lock held for the
 *  duration of a pointer swap.
 *
 *  Thread-safety: write() may be called concurrently from any number of
 *  threads. read() and readBatch() may be called concurrently with writes
 *  by any number of consumers with independent cursors.
 *  advanceReadPosition() is intended for the single draining consumer.
 */
class RingBuffer
{
  public:
    /**
     *  Restricts construction to create().
     */
    class Passkey
    {
        friend class RingBuffer;
        Passkey() = default;
    };

    /**
     *  Smallest capacity accepted by create().
     */
    static constexpr std::size_t kMinCapacity = 2;

    /**
     *  Creates a ring buffer.
     *
     *  @param      capacity  Number of slots; must be a power of two >= kMinCapacity.
     *  @param      policy    Behaviour when a write finds the buffer full.
     *  @return     The buffer, or BufferError::kInvalidCapacity.
     */
    [[nodiscard]] static auto create(std::size_t capacity, core::OverflowPolicy policy)
        -> std::expected<std::unique_ptr<RingBuffer>, core::BufferError>;

    RingBuffer(Passkey key, std::size_t capacity, core::OverflowPolicy policy);

    ~RingBuffer() = default;

    // Slots hold atomics; the buffer is pinned in memory
    RingBuffer(const RingBuffer&) = delete;
    auto operator=(const RingBuffer&) -> RingBuffer& = delete;
    RingBuffer(RingBuffer&&) = delete;
    auto operator=(RingBuffer&&) -> RingBuffer& = delete;

    /**
     *  Writes an event.
     *
     *  Retries until a slot is claimed. Under kDropOldest a full buffer
     *  advances read_pos by one (counting a drop) and retries; under
     *  kDropNewest and kReject the write fails immediately.
     *
     *  @param      event  The event to store.
     *  @return     Success, or BufferError::kFull.
     */
    [[nodiscard]] auto write(core::Event event) -> std::expected<void, core::BufferError>;

    /**
     *  Reads the event at a consumer position.
     *
     *  A cursor that has fallen behind read_pos is moved forward to it, so
     *  a lapped consumer resumes at the oldest surviving event.
     *
     *  @param      position  The consumer's next position.
     *  @return     The event and next position, or std::nullopt if nothing
     *              is available at or after the position yet.
     */
    [[nodiscard]] auto read(std::uint64_t position) const -> std::optional<ReadResult>;

    /**
     *  Reads up to max_events consecutive events.
     *
     *  Stops early at the first position that is not yet available.
     *
     *  @param      position    The consumer's next position.
     *  @param      max_events  Upper bound on events returned.
     *  @return     The events in write order and the consumer's next position.
     */
    [[nodiscard]] auto readBatch(std::uint64_t position, std::size_t max_events) const
        -> BatchResult;

    /**
     *  Releases slots before a position back to producers.
     *
     *  Moves read_pos forward to position (never backwards, never past
     *  write_pos). Called by the draining consumer after a batch has been
     *  handed off.
     *
     *  @param      position  First position still needed by the consumer.
     */
    void advanceReadPosition(std::uint64_t position) noexcept;

    [[nodiscard]] auto stats() const noexcept -> RingBufferStats;

    [[nodiscard]] auto capacity() const noexcept -> std::size_t;

    [[nodiscard]] auto policy() const noexcept -> core::OverflowPolicy;

    [[nodiscard]] auto writePosition() const noexcept -> std::uint64_t;

    [[nodiscard]] auto readPosition() const noexcept -> std::uint64_t;

  private:
    /**
     *  Sequence value of a slot whose event is being replaced.
     */
    static constexpr std::uint64_t kSlotBusy = std::numeric_limits<std::uint64_t>::max();

    struct alignas(64) Slot
    {
        /**
         *  position + 1 of the published event, 0 if never written, or kSlotBusy.
         */
        std::atomic<std::uint64_t> sequence{0};

        std::atomic<std::shared_ptr<const core::Event>> event;
    };

    /**
     *  Stores an event into the slot claimed for position.
     */
    void publish(std::uint64_t position, std::shared_ptr<const core::Event> event) noexcept;

    const std::size_t capacity_;
    const std::uint64_t mask_;
    const core::OverflowPolicy policy_;

    alignas(64) std::atomic<std::uint64_t> write_pos_{0};
    alignas(64) std::atomic<std::uint64_t> read_pos_{0};
    alignas(64) std::atomic<std::uint64_t> total_writes_{0};
    alignas(64) mutable std::atomic<std::uint64_t> total_reads_{0};
    alignas(64) std::atomic<std::uint64_t> dropped_count_{0};

    std::unique_ptr<Slot[]> slots_;
};

}  // namespace causeway::capture

#endif  // CAUSEWAY_CAPTURE_RING_BUFFER_HPP_
