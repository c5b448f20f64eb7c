/**
 *  @file       event_correlator.cpp
 *  @author     The causeway contributors
 *
 *  Implementation of causal event correlation.
 */

#include "causeway/correlation/event_correlator.hpp"

#include "causeway/core/clock.hpp"
#include "causeway/core/config.hpp"
#include "causeway/core/errors.hpp"
#include "causeway/core/events.hpp"
#include "causeway/core/types.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <expected>
#include <glog/logging.h>
#include <mutex>
#include <optional>
#include <span>
#include <utility>
#include <variant>
#include <vector>

namespace causeway::correlation
{

namespace
{

/**
 *  Checks the fields the correlator relies on for each event kind.
 */
auto isMalformed(const core::Event& event) -> bool
{
    if (event.producer == core::kInvalidProducerId)
    {
        return true;
    }

    switch (event.kind())
    {
        case core::EventKind::kUnknown:
            return true;

        case core::EventKind::kFunctionEntry:
            return std::get<core::FunctionEntry>(event.data).function.empty();

        case core::EventKind::kFunctionExit:
            return std::get<core::FunctionExit>(event.data).function.empty();

        case core::EventKind::kMessageSend:
        {
            const auto& send = std::get<core::MessageSend>(event.data);
            return send.sender == core::kInvalidProducerId ||
                   send.receiver == core::kInvalidProducerId;
        }

        case core::EventKind::kMessageReceive:
        {
            const auto& receive = std::get<core::MessageReceive>(event.data);
            return receive.sender == core::kInvalidProducerId ||
                   receive.receiver == core::kInvalidProducerId;
        }

        case core::EventKind::kProcessSpawn:
            return std::get<core::ProcessSpawn>(event.data).child == core::kInvalidProducerId;

        case core::EventKind::kStateChange:
        case core::EventKind::kProcessExit:
        case core::EventKind::kError:
        case core::EventKind::kMetric:
            return false;
    }

    return true;
}

auto toNanoseconds(std::chrono::milliseconds duration) -> core::TimestampNs
{
    return static_cast<core::TimestampNs>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(duration).count());
}

}  // namespace

auto CorrelatorOptions::fromConfig(const core::PipelineConfig& config) -> CorrelatorOptions
{
    return CorrelatorOptions{
        .ttl = config.correlation_ttl,
        .sweep_time_budget = config.sweep_time_budget,
        .max_tracked_correlations = config.max_tracked_correlations,
    };
}

EventCorrelator::EventCorrelator(CorrelatorOptions options) : options_(options) {}

auto EventCorrelator::correlate(core::Event event) -> core::CorrelatedEvent
{
    std::lock_guard lock(writer_mutex_);
    return correlateLocked(std::move(event));
}

auto EventCorrelator::correlateBatch(std::span<core::Event> events,
                                     std::chrono::milliseconds timeout)
    -> std::expected<std::vector<core::CorrelatedEvent>, core::CorrelationError>
{
    std::unique_lock lock(writer_mutex_, std::defer_lock);
    if (!lock.try_lock_for(timeout))
    {
        batch_timeouts_.fetch_add(1, std::memory_order_relaxed);
        VLOG(1) << "Correlation of " << events.size() << " events timed out after "
                << timeout.count() << " ms";
        return std::unexpected(core::CorrelationError::kTimeout);
    }

    std::vector<core::CorrelatedEvent> correlated;
    correlated.reserve(events.size());

    for (auto& event : events)
    {
        correlated.push_back(correlateLocked(std::move(event)));
    }

    return correlated;
}

auto EventCorrelator::correlateLocked(core::Event event) -> core::CorrelatedEvent
{
    const auto now = core::monotonicNowNs();
    const auto hint = event.correlation_id;

    core::CorrelatedEvent result{.event = std::move(event)};
    const auto& data = result.event.data;

    if (isMalformed(result.event))
    {
        LOG_FIRST_N(WARNING, 5) << "Malformed " << core::toString(result.event.kind())
                                << " event " << result.event.id << " from producer "
                                << result.event.producer;
        assignCorrelation(result, nextCorrelationId(), std::nullopt,
                          core::CorrelationType::kMalformed, core::kConfidenceNone, now);
    }
    else
    {
        switch (result.event.kind())
        {
            case core::EventKind::kFunctionEntry:
                correlateFunctionEntry(result, std::get<core::FunctionEntry>(data), now);
                break;

            case core::EventKind::kFunctionExit:
                correlateFunctionExit(result, std::get<core::FunctionExit>(data), now);
                break;

            case core::EventKind::kMessageSend:
                correlateSend(result, std::get<core::MessageSend>(data), now);
                break;

            case core::EventKind::kMessageReceive:
                correlateReceive(result, std::get<core::MessageReceive>(data), now);
                break;

            case core::EventKind::kStateChange:
                correlateWithinStack(result, core::CorrelationType::kStateChange, now);
                break;

            case core::EventKind::kProcessSpawn:
            {
                correlateWithinStack(result, core::CorrelationType::kProcessLifecycle, now);

                const auto child = std::get<core::ProcessSpawn>(data).child;
                stacks_.update(child,
                               [&](CallStack& stack)
                               {
                                   stack.origin = result.correlation_id;
                                   stack.last_activity = now;
                               });
                break;
            }

            case core::EventKind::kProcessExit:
                correlateWithinStack(result, core::CorrelationType::kProcessLifecycle, now);
                stacks_.erase(result.event.producer);
                break;

            case core::EventKind::kError:
                correlateWithinStack(result, core::CorrelationType::kError, now);
                break;

            case core::EventKind::kMetric:
                correlateWithinStack(result, core::CorrelationType::kMetric, now);
                break;

            case core::EventKind::kUnknown:
                break;
        }
    }

    if (hint && *hint != core::kNoCorrelation && *hint != result.correlation_id)
    {
        addLink(result, core::RelationKind::kRelatedTo, *hint);
    }

    result.event.correlation_id = result.correlation_id;
    result.event.parent_id = result.parent_id;

    recordOutcome(result);
    return result;
}

void EventCorrelator::correlateFunctionEntry(core::CorrelatedEvent& result,
                                             const core::FunctionEntry& entry,
                                             core::TimestampNs now)
{
    const auto id = nextCorrelationId();

    std::optional<core::CorrelationId> parent;
    std::optional<core::CorrelationId> spawned_by;

    stacks_.update(result.event.producer,
                   [&](CallStack& stack)
                   {
                       stack.last_activity = now;

                       if (!stack.frames.empty())
                       {
                           parent = stack.frames.back().id;
                       }
                       else if (stack.origin)
                       {
                           parent = stack.origin;
                           spawned_by = stack.origin;
                           stack.origin.reset();
                       }

                       stack.frames.push_back(Frame{
                           .id = id,
                           .parent_id = parent,
                           .symbol = core::functionSymbol(entry.module, entry.function,
                                                          entry.arity),
                       });
                   });

    assignCorrelation(result, id, parent, core::CorrelationType::kFunctionCall,
                      core::kConfidenceFull, now);

    if (spawned_by)
    {
        addLink(result, core::RelationKind::kSpawnedBy, *spawned_by);
    }
}

void EventCorrelator::correlateFunctionExit(core::CorrelatedEvent& result,
                                            const core::FunctionExit& exit, core::TimestampNs now)
{
    std::optional<Frame> popped;

    stacks_.mutate(result.event.producer,
                   [&](CallStack& stack)
                   {
                       stack.last_activity = now;
                       if (!stack.frames.empty())
                       {
                           popped = std::move(stack.frames.back());
                           stack.frames.pop_back();
                       }
                       return !stack.frames.empty() || stack.origin.has_value();
                   });

    if (!popped)
    {
        result.orphan = true;
        assignCorrelation(result, nextCorrelationId(), std::nullopt,
                          core::CorrelationType::kFunctionCall, core::kConfidenceNone, now);
        return;
    }

    const auto symbol = core::functionSymbol(exit.module, exit.function, exit.arity);
    const auto confidence =
        popped->symbol == symbol ? core::kConfidenceFull : core::kConfidencePartial;

    result.correlation_id = popped->id;
    result.parent_id = popped->parent_id;
    result.correlation_type = core::CorrelationType::kFunctionCall;
    result.confidence = confidence;

    const auto metadata = metadataFor(popped->id);
    if (metadata)
    {
        result.root_id = metadata->root_id;
    }
    else
    {
        // Metadata swept while the call was open
        result.root_id = popped->parent_id ? resolveRoot(*popped->parent_id) : popped->id;
    }

    if (confidence < core::kConfidenceFull)
    {
        metadata_.mutate(popped->id,
                         [confidence](CorrelationMetadata& entry)
                         {
                             entry.confidence = std::min(entry.confidence, confidence);
                             return true;
                         });
    }
}

void EventCorrelator::correlateSend(core::CorrelatedEvent& result, const core::MessageSend& send,
                                    core::TimestampNs now)
{
    const auto top = touchStack(result.event.producer, now);
    const auto parent = top ? std::optional(top->id) : std::nullopt;

    assignCorrelation(result, nextCorrelationId(), parent, core::CorrelationType::kMessage,
                      core::kConfidenceFull, now);

    const MessageSignature signature{
        .sender = send.sender,
        .receiver = send.receiver,
        .content_hash = send.content_hash,
    };

    pending_.update(signature,
                    [&](std::deque<PendingMessage>& queue)
                    {
                        queue.push_back(PendingMessage{
                            .correlation_id = result.correlation_id,
                            .sent_at = now,
                        });
                    });
}

void EventCorrelator::correlateReceive(core::CorrelatedEvent& result,
                                       const core::MessageReceive& receive,
                                       core::TimestampNs now)
{
    const auto top = touchStack(result.event.producer, now);
    const auto parent = top ? std::optional(top->id) : std::nullopt;

    const MessageSignature signature{
        .sender = receive.sender,
        .receiver = receive.receiver,
        .content_hash = receive.content_hash,
    };

    // Identical pending sends are matched oldest first
    std::optional<core::CorrelationId> send_id;
    pending_.mutate(signature,
                    [&](std::deque<PendingMessage>& queue)
                    {
                        if (!queue.empty())
                        {
                            send_id = queue.front().correlation_id;
                            queue.pop_front();
                        }
                        return !queue.empty();
                    });

    if (!send_id)
    {
        result.no_send_match = true;
        assignCorrelation(result, nextCorrelationId(), parent, core::CorrelationType::kMessage,
                          core::kConfidenceNone, now);
        return;
    }

    assignCorrelation(result, nextCorrelationId(), parent, core::CorrelationType::kMessage,
                      core::kConfidenceFull, now);
    addLink(result, core::RelationKind::kReceives, *send_id);
}

void EventCorrelator::correlateWithinStack(core::CorrelatedEvent& result,
                                           core::CorrelationType type, core::TimestampNs now)
{
    const auto top = touchStack(result.event.producer, now);
    if (!top)
    {
        assignCorrelation(result, nextCorrelationId(), std::nullopt, type, core::kConfidenceFull,
                          now);
        return;
    }

    result.correlation_id = top->id;
    result.parent_id = top->parent_id;
    result.root_id = resolveRoot(top->id);
    result.correlation_type = type;
    result.confidence = core::kConfidenceFull;
}

auto EventCorrelator::touchStack(core::ProducerId producer, core::TimestampNs now)
    -> std::optional<Frame>
{
    std::optional<Frame> top;

    stacks_.mutate(producer,
                   [&](CallStack& stack)
                   {
                       stack.last_activity = now;
                       if (!stack.frames.empty())
                       {
                           top = stack.frames.back();
                       }
                       return true;
                   });

    return top;
}

auto EventCorrelator::nextCorrelationId() noexcept -> core::CorrelationId
{
    return next_id_.fetch_add(1, std::memory_order_relaxed);
}

void EventCorrelator::assignCorrelation(core::CorrelatedEvent& result, core::CorrelationId id,
                                        std::optional<core::CorrelationId> parent,
                                        core::CorrelationType type, double confidence,
                                        core::TimestampNs now)
{
    result.correlation_id = id;
    result.parent_id = parent;
    result.root_id = parent ? resolveRoot(*parent) : id;
    result.correlation_type = type;
    result.confidence = confidence;

    metadata_.insertOrAssign(id, CorrelationMetadata{
                                     .created_at = now,
                                     .type = type,
                                     .confidence = confidence,
                                     .parent_id = parent,
                                     .root_id = result.root_id,
                                 });
}

void EventCorrelator::addLink(core::CorrelatedEvent& result, core::RelationKind relation,
                              core::CorrelationId target)
{
    const core::CausalLink link{.relation = relation, .target = target};

    result.links.push_back(link);
    links_.update(result.correlation_id,
                  [&link](std::vector<core::CausalLink>& links) { links.push_back(link); });
}

void EventCorrelator::recordOutcome(const core::CorrelatedEvent& result)
{
    correlated_.fetch_add(1, std::memory_order_relaxed);

    if (result.confidence >= core::kConfidenceFull)
    {
        full_confidence_.fetch_add(1, std::memory_order_relaxed);
    }
    else if (result.confidence > core::kConfidenceNone)
    {
        partial_confidence_.fetch_add(1, std::memory_order_relaxed);
    }
    else
    {
        no_confidence_.fetch_add(1, std::memory_order_relaxed);
    }

    if (result.orphan)
    {
        orphan_exits_.fetch_add(1, std::memory_order_relaxed);
    }
    if (result.no_send_match)
    {
        unmatched_receives_.fetch_add(1, std::memory_order_relaxed);
    }
    if (result.correlation_type == core::CorrelationType::kMalformed)
    {
        malformed_.fetch_add(1, std::memory_order_relaxed);
    }
}

auto EventCorrelator::sweep(core::TimestampNs now) -> SweepResult
{
    std::lock_guard lock(sweep_mutex_);

    const auto started = std::chrono::steady_clock::now();

    auto ttl = options_.ttl;
    const auto tracked = metadata_.size();
    if (tracked > options_.max_tracked_correlations)
    {
        ttl /= 2;
        VLOG(1) << tracked << " tracked correlations exceed the soft cap of "
                << options_.max_tracked_correlations << "; sweeping with TTL " << ttl.count()
                << " ms";
    }

    const auto ttl_ns = toNanoseconds(ttl);
    const core::TimestampNs cutoff = now > ttl_ns ? now - ttl_ns : 0;

    SweepResult result;
    const auto shard_count = metadata_.shardCount();

    for (std::size_t visited = 0; visited < shard_count; ++visited)
    {
        const auto shard = (next_sweep_shard_ + visited) % shard_count;

        const auto expired = metadata_.sweepShard(
            shard, [cutoff](core::CorrelationId /*id*/, const CorrelationMetadata& metadata)
            { return metadata.created_at < cutoff; });
        result.removed_correlations += expired.size();

        for (const auto id : expired)
        {
            if (links_.erase(id))
            {
                ++result.removed_links;
            }
        }

        pending_.sweepShard(shard,
                            [&](const MessageSignature& /*signature*/,
                                std::deque<PendingMessage>& queue)
                            {
                                while (!queue.empty() && queue.front().sent_at <= cutoff)
                                {
                                    queue.pop_front();
                                    ++result.removed_pending;
                                }
                                return queue.empty();
                            });

        result.removed_stacks +=
            stacks_
                .sweepShard(shard, [cutoff](core::ProducerId /*producer*/, const CallStack& stack)
                            { return stack.last_activity < cutoff; })
                .size();

        // Links whose correlation was swept while they were being added
        result.removed_links +=
            links_
                .sweepShard(shard,
                            [this](core::CorrelationId id,
                                   const std::vector<core::CausalLink>& /*links*/)
                            { return !metadata_.contains(id); })
                .size();

        ++result.shards_visited;

        if (visited + 1 < shard_count &&
            std::chrono::steady_clock::now() - started > options_.sweep_time_budget)
        {
            next_sweep_shard_ = (shard + 1) % shard_count;
            result.complete = false;
            break;
        }
    }

    sweeps_.fetch_add(1, std::memory_order_relaxed);
    swept_correlations_.fetch_add(result.removed_correlations, std::memory_order_relaxed);
    if (!result.complete)
    {
        incomplete_sweeps_.fetch_add(1, std::memory_order_relaxed);
        VLOG(1) << "Sweep budget of " << options_.sweep_time_budget.count()
                << " ms exhausted after " << result.shards_visited << " shards";
    }

    VLOG(1) << "Swept " << result.removed_correlations << " correlations, "
            << result.removed_links << " link entries, " << result.removed_pending
            << " pending messages and " << result.removed_stacks << " call stacks";

    return result;
}

auto EventCorrelator::sweep() -> SweepResult
{
    return sweep(core::monotonicNowNs());
}

auto EventCorrelator::resolveRoot(core::CorrelationId id) const -> core::CorrelationId
{
    const auto metadata = metadata_.find(id);
    return metadata ? metadata->root_id : id;
}

auto EventCorrelator::metadataFor(core::CorrelationId id) const
    -> std::optional<CorrelationMetadata>
{
    return metadata_.find(id);
}

auto EventCorrelator::linksFor(core::CorrelationId id) const -> std::vector<core::CausalLink>
{
    return links_.find(id).value_or(std::vector<core::CausalLink>{});
}

auto EventCorrelator::stackDepth(core::ProducerId producer) const -> std::size_t
{
    const auto stack = stacks_.find(producer);
    return stack ? stack->frames.size() : 0;
}

auto EventCorrelator::pendingMessageCount() const -> std::size_t
{
    std::size_t count = 0;
    pending_.forEach([&count](const MessageSignature& /*signature*/,
                              const std::deque<PendingMessage>& queue)
                     { count += queue.size(); });
    return count;
}

auto EventCorrelator::stats() const -> CorrelatorStats
{
    return CorrelatorStats{
        .tracked_correlations = metadata_.size(),
        .call_stacks = stacks_.size(),
        .pending_messages = pendingMessageCount(),
        .link_entries = links_.size(),
        .correlated = correlated_.load(std::memory_order_relaxed),
        .full_confidence = full_confidence_.load(std::memory_order_relaxed),
        .partial_confidence = partial_confidence_.load(std::memory_order_relaxed),
        .no_confidence = no_confidence_.load(std::memory_order_relaxed),
        .orphan_exits = orphan_exits_.load(std::memory_order_relaxed),
        .unmatched_receives = unmatched_receives_.load(std::memory_order_relaxed),
        .malformed = malformed_.load(std::memory_order_relaxed),
        .batch_timeouts = batch_timeouts_.load(std::memory_order_relaxed),
        .sweeps = sweeps_.load(std::memory_order_relaxed),
        .incomplete_sweeps = incomplete_sweeps_.load(std::memory_order_relaxed),
        .swept_correlations = swept_correlations_.load(std::memory_order_relaxed),
    };
}

auto EventCorrelator::options() const noexcept -> const CorrelatorOptions&
{
    return options_;
}

void EventCorrelator::reset()
{
    std::lock_guard writer_lock(writer_mutex_);
    std::lock_guard sweep_lock(sweep_mutex_);

    stacks_.clear();
    pending_.clear();
    metadata_.clear();
    links_.clear();
    next_sweep_shard_ = 0;
}

}  // namespace causeway::correlation
