/**
 *  @file       event_correlator.hpp
 *  @author     The causeway contributors
 *
 *  Causal correlation of drained event batches.
 *
 *  The correlator keeps per-producer call stacks, a registry of sends that
 *  await their receive, and metadata plus causal links per correlation ID.
 *  It stamps every event with a correlation ID, a parent ID and a root ID,
 *  and rates each attribution with a confidence in [0, 1]:
 *
 *  - 1.0: fully matched or definitive (balanced entry/exit, matched
 *    receive, event inside an open call, start of a new chain)
 *  - 0.5: partial match (exit popped a frame with a different symbol)
 *  - 0.0: unmatched (orphan exit, receive without send, malformed event)
 *
 *  All tables live in sharded maps. Correlation is serialized by a single
 *  writer lock; sweep() takes no writer lock and only performs per-key
 *  deletes, so it may run concurrently with correlation.
 */

#ifndef CAUSEWAY_CORRELATION_EVENT_CORRELATOR_HPP_
#define CAUSEWAY_CORRELATION_EVENT_CORRELATOR_HPP_

#include "causeway/core/config.hpp"
#include "causeway/core/errors.hpp"
#include "causeway/core/events.hpp"
#include "causeway/core/types.hpp"
#include "causeway/correlation/sharded_map.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <expected>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace causeway::correlation
{

/**
 *  Tunables of the correlator.
 */
struct CorrelatorOptions
{
    /**
     *  Age after which correlation state is eligible for cleanup.
     */
    std::chrono::milliseconds ttl{std::chrono::minutes(5)};

    /**
     *  Longest a single sweep may run before yielding to the next tick.
     */
    std::chrono::milliseconds sweep_time_budget{10};

    /**
     *  Above this many tracked correlations sweeps use half the TTL.
     */
    std::size_t max_tracked_correlations{1'000'000};

    /**
     *  Extracts the correlator settings of a pipeline configuration.
     */
    [[nodiscard]] static auto fromConfig(const core::PipelineConfig& config) -> CorrelatorOptions;
};

/**
 *  Key pairing a send with its receive.
 */
struct MessageSignature
{
    core::ProducerId sender{core::kInvalidProducerId};
    core::ProducerId receiver{core::kInvalidProducerId};
    std::uint64_t content_hash{0};

    auto operator==(const MessageSignature&) const -> bool = default;

    template <typename H>
    friend auto AbslHashValue(H state, const MessageSignature& signature) -> H
    {
        return H::combine(std::move(state), signature.sender, signature.receiver,
                          signature.content_hash);
    }
};

/**
 *  Bookkeeping kept per correlation ID.
 */
struct CorrelationMetadata
{
    /**
     *  Correlator time (monotonic ns) at which the ID was assigned.
     */
    core::TimestampNs created_at{0};

    core::CorrelationType type{core::CorrelationType::kMalformed};
    double confidence{core::kConfidenceNone};
    std::optional<core::CorrelationId> parent_id;

    /**
     *  Origin of the parent chain, memoized when the ID is assigned.
     */
    core::CorrelationId root_id{core::kNoCorrelation};
};

/**
 *  Outcome of one sweep() call.
 */
struct SweepResult
{
    std::size_t removed_correlations{0};
    std::size_t removed_links{0};
    std::size_t removed_pending{0};
    std::size_t removed_stacks{0};
    std::size_t shards_visited{0};

    /**
     *  False if the time budget ran out before every shard was visited.
     */
    bool complete{true};
};

/**
 *  Counters and table sizes of the correlator.
 */
struct CorrelatorStats
{
    std::size_t tracked_correlations{0};
    std::size_t call_stacks{0};
    std::size_t pending_messages{0};
    std::size_t link_entries{0};

    std::uint64_t correlated{0};
    std::uint64_t full_confidence{0};
    std::uint64_t partial_confidence{0};
    std::uint64_t no_confidence{0};
    std::uint64_t orphan_exits{0};
    std::uint64_t unmatched_receives{0};
    std::uint64_t malformed{0};
    std::uint64_t batch_timeouts{0};

    std::uint64_t sweeps{0};
    std::uint64_t incomplete_sweeps{0};
    std::uint64_t swept_correlations{0};
};

/**
 *  Reconstructs causal relationships among a stream of events.
 *
 *  Thread-safety: correlate() and correlateBatch() may be called from any
 *  thread and are serialized internally. sweep() and the query methods may
 *  run concurrently with them.
 */
class EventCorrelator
{
  public:
    explicit EventCorrelator(CorrelatorOptions options = {});

    EventCorrelator(const EventCorrelator&) = delete;
    auto operator=(const EventCorrelator&) -> EventCorrelator& = delete;

    /**
     *  Correlates one event, waiting for the writer lock as long as needed.
     *
     *  @param      event  Event to correlate.
     *  @return     The event with its causal context.
     */
    auto correlate(core::Event event) -> core::CorrelatedEvent;

    /**
     *  Correlates a batch in order under a single writer lock acquisition.
     *
     *  The timeout bounds only the wait for the writer lock. Once the lock
     *  is held the whole batch is correlated, however long that takes, so
     *  a batch is never left half-correlated.
     *
     *  On success the events are moved into the result. On timeout the
     *  events are left untouched so the caller can retry or drop them.
     *
     *  @param      events   Drained events, in buffer order.
     *  @param      timeout  Longest wait for the writer lock.
     *  @return     Correlated events, or CorrelationError::kTimeout.
     */
    auto correlateBatch(std::span<core::Event> events, std::chrono::milliseconds timeout)
        -> std::expected<std::vector<core::CorrelatedEvent>, core::CorrelationError>;

    /**
     *  Removes correlation state older than the TTL, measured at now.
     *
     *  Metadata and its links, pending sends and call stacks of idle
     *  producers are removed, along with links left without metadata.
     *  Stops after the time budget and resumes at the next shard on the
     *  following call.
     */
    auto sweep(core::TimestampNs now) -> SweepResult;

    /**
     *  Runs sweep() at the current monotonic time.
     */
    auto sweep() -> SweepResult;

    /**
     *  Follows parent links to the origin of a chain.
     *
     *  @return     The root ID, or id itself if it is unknown.
     */
    [[nodiscard]] auto resolveRoot(core::CorrelationId id) const -> core::CorrelationId;

    [[nodiscard]] auto metadataFor(core::CorrelationId id) const
        -> std::optional<CorrelationMetadata>;

    /**
     *  Returns the causal links recorded for a correlation ID.
     */
    [[nodiscard]] auto linksFor(core::CorrelationId id) const -> std::vector<core::CausalLink>;

    /**
     *  Number of open calls on a producer's stack.
     */
    [[nodiscard]] auto stackDepth(core::ProducerId producer) const -> std::size_t;

    /**
     *  Number of sends still awaiting a receive, duplicates included.
     */
    [[nodiscard]] auto pendingMessageCount() const -> std::size_t;

    [[nodiscard]] auto stats() const -> CorrelatorStats;

    [[nodiscard]] auto options() const noexcept -> const CorrelatorOptions&;

    /**
     *  Drops every table entry. Counters are kept.
     */
    void reset();

  private:
    struct Frame
    {
        core::CorrelationId id{core::kNoCorrelation};
        std::optional<core::CorrelationId> parent_id;
        std::string symbol;
    };

    struct CallStack
    {
        std::vector<Frame> frames;
        core::TimestampNs last_activity{0};

        /**
         *  Correlation that spawned this producer, consumed by its first
         *  root-level call.
         */
        std::optional<core::CorrelationId> origin;
    };

    struct PendingMessage
    {
        core::CorrelationId correlation_id{core::kNoCorrelation};
        core::TimestampNs sent_at{0};
    };

    /**
     *  Correlates one event. Caller holds writer_mutex_.
     */
    auto correlateLocked(core::Event event) -> core::CorrelatedEvent;

    void correlateFunctionEntry(core::CorrelatedEvent& result, const core::FunctionEntry& entry,
                                core::TimestampNs now);

    void correlateFunctionExit(core::CorrelatedEvent& result, const core::FunctionExit& exit,
                               core::TimestampNs now);

    void correlateSend(core::CorrelatedEvent& result, const core::MessageSend& send,
                       core::TimestampNs now);

    void correlateReceive(core::CorrelatedEvent& result, const core::MessageReceive& receive,
                          core::TimestampNs now);

    /**
     *  Attributes an event to the producer's innermost open call, or starts
     *  a new chain when there is none.
     */
    void correlateWithinStack(core::CorrelatedEvent& result, core::CorrelationType type,
                              core::TimestampNs now);

    /**
     *  Returns the innermost open call of a producer and marks it active.
     */
    auto touchStack(core::ProducerId producer, core::TimestampNs now) -> std::optional<Frame>;

    auto nextCorrelationId() noexcept -> core::CorrelationId;

    /**
     *  Stamps result with a newly assigned ID and records its metadata.
     */
    void assignCorrelation(core::CorrelatedEvent& result, core::CorrelationId id,
                           std::optional<core::CorrelationId> parent, core::CorrelationType type,
                           double confidence, core::TimestampNs now);

    void addLink(core::CorrelatedEvent& result, core::RelationKind relation,
                 core::CorrelationId target);

    void recordOutcome(const core::CorrelatedEvent& result);

    CorrelatorOptions options_;

    std::atomic<core::CorrelationId> next_id_{1};

    ShardedMap<core::ProducerId, CallStack> stacks_;
    ShardedMap<MessageSignature, std::deque<PendingMessage>> pending_;
    ShardedMap<core::CorrelationId, CorrelationMetadata> metadata_;
    ShardedMap<core::CorrelationId, std::vector<core::CausalLink>> links_;

    std::timed_mutex writer_mutex_;
    std::mutex sweep_mutex_;
    std::size_t next_sweep_shard_{0};

    std::atomic<std::uint64_t> correlated_{0};
    std::atomic<std::uint64_t> full_confidence_{0};
    std::atomic<std::uint64_t> partial_confidence_{0};
    std::atomic<std::uint64_t> no_confidence_{0};
    std::atomic<std::uint64_t> orphan_exits_{0};
    std::atomic<std::uint64_t> unmatched_receives_{0};
    std::atomic<std::uint64_t> malformed_{0};
    std::atomic<std::uint64_t> batch_timeouts_{0};
    std::atomic<std::uint64_t> sweeps_{0};
    std::atomic<std::uint64_t> incomplete_sweeps_{0};
    std::atomic<std::uint64_t> swept_correlations_{0};
};

}  // namespace causeway::correlation

#endif  // CAUSEWAY_CORRELATION_EVENT_CORRELATOR_HPP_
