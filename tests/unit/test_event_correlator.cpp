/**
 *  @file       test_event_correlator.cpp
 *  @author     The causeway contributors
 *
 *  Unit tests for causal event correlation.
 */

#include "causeway/capture/payload.hpp"
#include "causeway/core/clock.hpp"
#include "causeway/core/config.hpp"
#include "causeway/core/errors.hpp"
#include "causeway/core/events.hpp"
#include "causeway/core/types.hpp"
#include "causeway/correlation/event_correlator.hpp"

#include <catch2/catch_test_macros.hpp>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <variant>
#include <vector>

using causeway::core::CausalLink;
using causeway::core::CorrelatedEvent;
using causeway::core::CorrelationError;
using causeway::core::CorrelationType;
using causeway::core::Event;
using causeway::core::kConfidenceFull;
using causeway::core::kConfidenceNone;
using causeway::core::kConfidencePartial;
using causeway::core::ProducerId;
using causeway::core::RelationKind;
using causeway::correlation::CorrelatorOptions;
using causeway::correlation::EventCorrelator;

using namespace std::chrono_literals;

namespace
{

auto makeEvent(ProducerId producer, causeway::core::EventData data) -> Event
{
    return Event{
        .id = causeway::core::nextEventId(),
        .timestamp_ns = causeway::core::monotonicNowNs(),
        .wall_time_ns = causeway::core::wallNowNs(),
        .producer = producer,
        .correlation_id = std::nullopt,
        .parent_id = std::nullopt,
        .data = std::move(data),
    };
}

auto callEntry(ProducerId producer, const std::string& function) -> Event
{
    return makeEvent(producer, causeway::core::FunctionEntry{
                                   .module = "app", .function = function, .arity = 0, .args = {}});
}

auto callExit(ProducerId producer, const std::string& function) -> Event
{
    return makeEvent(producer,
                     causeway::core::FunctionExit{.module = "app", .function = function,
                                                  .arity = 0, .return_value = {},
                                                  .duration_ns = 10});
}

auto sendMessage(ProducerId from, ProducerId to, const std::string& content) -> Event
{
    return makeEvent(from, causeway::core::MessageSend{
                               .sender = from,
                               .receiver = to,
                               .content = causeway::core::Payload{.data = content},
                               .content_hash = causeway::capture::contentHash(content),
                           });
}

auto receiveMessage(ProducerId at, ProducerId from, const std::string& content) -> Event
{
    return makeEvent(at, causeway::core::MessageReceive{
                             .sender = from,
                             .receiver = at,
                             .content = causeway::core::Payload{.data = content},
                             .content_hash = causeway::capture::contentHash(content),
                         });
}

auto metric(ProducerId producer) -> Event
{
    return makeEvent(producer, causeway::core::Metric{.name = "m", .value = 1.0, .metadata = {}});
}

auto hasLink(const CorrelatedEvent& event, RelationKind relation,
             causeway::core::CorrelationId target) -> bool
{
    for (const auto& link : event.links)
    {
        if (link == CausalLink{.relation = relation, .target = target})
        {
            return true;
        }
    }
    return false;
}

}  // namespace

TEST_CASE("EventCorrelator pairs function entry and exit", "[correlator][EventCorrelator]")
{
    EventCorrelator correlator;

    auto opened = correlator.correlate(callEntry(1, "handle"));
    REQUIRE(correlator.stackDepth(1) == 1);

    auto closed = correlator.correlate(callExit(1, "handle"));

    REQUIRE(closed.correlation_id == opened.correlation_id);
    REQUIRE(closed.correlation_type == CorrelationType::kFunctionCall);
    REQUIRE(closed.confidence == kConfidenceFull);
    REQUIRE_FALSE(closed.orphan);
    REQUIRE(correlator.stackDepth(1) == 0);

    // The stamped event carries the same attribution
    REQUIRE(opened.event.correlation_id == opened.correlation_id);
    REQUIRE(closed.event.correlation_id == opened.correlation_id);
}

TEST_CASE("EventCorrelator nests calls into a tree", "[correlator][EventCorrelator]")
{
    EventCorrelator correlator;

    auto a = correlator.correlate(callEntry(1, "a"));
    auto b = correlator.correlate(callEntry(1, "b"));
    auto c = correlator.correlate(callEntry(1, "c"));

    REQUIRE_FALSE(a.parent_id.has_value());
    REQUIRE(b.parent_id == a.correlation_id);
    REQUIRE(c.parent_id == b.correlation_id);

    REQUIRE(a.root_id == a.correlation_id);
    REQUIRE(b.root_id == a.correlation_id);
    REQUIRE(c.root_id == a.correlation_id);
    REQUIRE(correlator.resolveRoot(c.correlation_id) == a.correlation_id);

    REQUIRE(c.event.parent_id == b.correlation_id);
    REQUIRE(correlator.stackDepth(1) == 3);

    SECTION("exits unwind in reverse order")
    {
        auto c_exit = correlator.correlate(callExit(1, "c"));
        auto b_exit = correlator.correlate(callExit(1, "b"));
        auto a_exit = correlator.correlate(callExit(1, "a"));

        REQUIRE(c_exit.correlation_id == c.correlation_id);
        REQUIRE(c_exit.parent_id == b.correlation_id);
        REQUIRE(b_exit.correlation_id == b.correlation_id);
        REQUIRE(a_exit.correlation_id == a.correlation_id);
        REQUIRE(a_exit.root_id == a.correlation_id);
        REQUIRE(correlator.stackDepth(1) == 0);
    }

    SECTION("events inside a call inherit its correlation")
    {
        auto inside = correlator.correlate(metric(1));

        REQUIRE(inside.correlation_id == c.correlation_id);
        REQUIRE(inside.parent_id == b.correlation_id);
        REQUIRE(inside.root_id == a.correlation_id);
        REQUIRE(inside.correlation_type == CorrelationType::kMetric);
    }

    SECTION("stacks are independent per producer")
    {
        auto other = correlator.correlate(callEntry(2, "a"));

        REQUIRE_FALSE(other.parent_id.has_value());
        REQUIRE(other.root_id == other.correlation_id);
        REQUIRE(correlator.stackDepth(2) == 1);
        REQUIRE(correlator.stackDepth(1) == 3);
    }
}

TEST_CASE("EventCorrelator links receives to sends", "[correlator][EventCorrelator]")
{
    EventCorrelator correlator;

    auto sent = correlator.correlate(sendMessage(1, 2, "ping"));
    REQUIRE(correlator.pendingMessageCount() == 1);

    auto received = correlator.correlate(receiveMessage(2, 1, "ping"));

    REQUIRE(received.correlation_id != sent.correlation_id);
    REQUIRE(received.correlation_type == CorrelationType::kMessage);
    REQUIRE(received.confidence == kConfidenceFull);
    REQUIRE_FALSE(received.no_send_match);
    REQUIRE(hasLink(received, RelationKind::kReceives, sent.correlation_id));
    REQUIRE(correlator.linksFor(received.correlation_id) == received.links);
    REQUIRE(correlator.pendingMessageCount() == 0);

    SECTION("a second identical receive finds nothing to match")
    {
        auto again = correlator.correlate(receiveMessage(2, 1, "ping"));

        REQUIRE(again.no_send_match);
        REQUIRE(again.confidence == kConfidenceNone);
        REQUIRE(again.links.empty());
    }
}

TEST_CASE("EventCorrelator matches identical messages oldest first",
          "[correlator][EventCorrelator]")
{
    EventCorrelator correlator;

    auto first = correlator.correlate(sendMessage(1, 2, "tick"));
    auto second = correlator.correlate(sendMessage(1, 2, "tick"));
    REQUIRE(correlator.pendingMessageCount() == 2);

    auto r1 = correlator.correlate(receiveMessage(2, 1, "tick"));
    auto r2 = correlator.correlate(receiveMessage(2, 1, "tick"));

    REQUIRE(hasLink(r1, RelationKind::kReceives, first.correlation_id));
    REQUIRE(hasLink(r2, RelationKind::kReceives, second.correlation_id));
}

TEST_CASE("EventCorrelator message signature", "[correlator][EventCorrelator]")
{
    EventCorrelator correlator;

    auto sent = correlator.correlate(sendMessage(1, 2, "ping"));

    SECTION("different content does not match")
    {
        auto received = correlator.correlate(receiveMessage(2, 1, "pong"));
        REQUIRE(received.no_send_match);
        REQUIRE(correlator.pendingMessageCount() == 1);
    }

    SECTION("different receiver does not match")
    {
        auto received = correlator.correlate(receiveMessage(3, 1, "ping"));
        REQUIRE(received.no_send_match);
    }

    SECTION("a send inside a call is parented to it")
    {
        auto call = correlator.correlate(callEntry(3, "notify"));
        auto nested = correlator.correlate(sendMessage(3, 2, "ping"));

        REQUIRE(nested.parent_id == call.correlation_id);
        REQUIRE(nested.root_id == call.correlation_id);
        REQUIRE(nested.correlation_id != call.correlation_id);
        REQUIRE_FALSE(sent.parent_id.has_value());
    }
}

TEST_CASE("EventCorrelator degrades confidence for unmatched events",
          "[correlator][EventCorrelator]")
{
    EventCorrelator correlator;

    SECTION("exit without an entry is an orphan")
    {
        auto orphan = correlator.correlate(callExit(1, "handle"));

        REQUIRE(orphan.orphan);
        REQUIRE(orphan.confidence == kConfidenceNone);
        REQUIRE(orphan.correlation_id != causeway::core::kNoCorrelation);
        REQUIRE(correlator.stats().orphan_exits == 1);
    }

    SECTION("receive without a send")
    {
        auto received = correlator.correlate(receiveMessage(2, 1, "hello"));

        REQUIRE(received.no_send_match);
        REQUIRE(received.confidence == kConfidenceNone);
        REQUIRE(correlator.stats().unmatched_receives == 1);
    }

    SECTION("exit of a different function is a partial match")
    {
        auto opened = correlator.correlate(callEntry(1, "outer"));
        auto closed = correlator.correlate(callExit(1, "inner"));

        REQUIRE(closed.correlation_id == opened.correlation_id);
        REQUIRE(closed.confidence == kConfidencePartial);
        REQUIRE(correlator.metadataFor(opened.correlation_id)->confidence ==
                kConfidencePartial);
        REQUIRE(correlator.stats().partial_confidence == 1);
    }
}

TEST_CASE("EventCorrelator flags malformed events", "[correlator][EventCorrelator]")
{
    EventCorrelator correlator;

    SECTION("event without payload")
    {
        auto result = correlator.correlate(makeEvent(1, std::monostate{}));

        REQUIRE(result.correlation_type == CorrelationType::kMalformed);
        REQUIRE(result.confidence == kConfidenceNone);
        REQUIRE(result.correlation_id != causeway::core::kNoCorrelation);
    }

    SECTION("event without a producer")
    {
        auto result = correlator.correlate(metric(causeway::core::kInvalidProducerId));
        REQUIRE(result.correlation_type == CorrelationType::kMalformed);
    }

    SECTION("function entry without a name does not open a call")
    {
        auto result = correlator.correlate(callEntry(1, ""));

        REQUIRE(result.correlation_type == CorrelationType::kMalformed);
        REQUIRE(correlator.stackDepth(1) == 0);
    }

    SECTION("send without a receiver is not queued")
    {
        auto result = correlator.correlate(sendMessage(1, causeway::core::kInvalidProducerId, "x"));

        REQUIRE(result.correlation_type == CorrelationType::kMalformed);
        REQUIRE(correlator.pendingMessageCount() == 0);
    }

    REQUIRE(correlator.stats().malformed == 1);
}

TEST_CASE("EventCorrelator follows process lifecycles", "[correlator][EventCorrelator]")
{
    EventCorrelator correlator;

    SECTION("a spawned process's first call is linked to the spawn")
    {
        auto parent_call = correlator.correlate(callEntry(1, "start_worker"));
        auto spawn = correlator.correlate(
            makeEvent(1, causeway::core::ProcessSpawn{.parent = 1, .child = 2}));

        REQUIRE(spawn.correlation_id == parent_call.correlation_id);
        REQUIRE(spawn.correlation_type == CorrelationType::kProcessLifecycle);

        auto child_call = correlator.correlate(callEntry(2, "init"));
        REQUIRE(child_call.parent_id == spawn.correlation_id);
        REQUIRE(child_call.root_id == parent_call.correlation_id);
        REQUIRE(hasLink(child_call, RelationKind::kSpawnedBy, spawn.correlation_id));

        // The origin is consumed by the first call only
        auto second_call = correlator.correlate(callEntry(2, "loop"));
        REQUIRE(second_call.parent_id == child_call.correlation_id);
        REQUIRE(second_call.links.empty());
    }

    SECTION("process exit clears its call stack")
    {
        auto opened = correlator.correlate(callEntry(1, "serve"));
        correlator.correlate(callEntry(1, "recv"));
        REQUIRE(correlator.stackDepth(1) == 2);

        auto exited = correlator.correlate(
            makeEvent(1, causeway::core::ProcessExit{.reason = "killed"}));
        REQUIRE(exited.root_id == opened.correlation_id);
        REQUIRE(correlator.stackDepth(1) == 0);

        // Later exits of the dead call stack are orphans
        REQUIRE(correlator.correlate(callExit(1, "recv")).orphan);
    }

    SECTION("events outside any call start their own chain")
    {
        auto error = correlator.correlate(makeEvent(
            3, causeway::core::ErrorRaised{.error_type = "badarg", .message = {},
                                           .stacktrace = {}}));

        REQUIRE(error.correlation_type == CorrelationType::kError);
        REQUIRE(error.confidence == kConfidenceFull);
        REQUIRE_FALSE(error.parent_id.has_value());
        REQUIRE(error.root_id == error.correlation_id);
    }
}

TEST_CASE("EventCorrelator keeps caller correlation hints as links",
          "[correlator][EventCorrelator]")
{
    EventCorrelator correlator;

    auto event = callEntry(1, "handle");
    event.correlation_id = 424242;

    auto result = correlator.correlate(std::move(event));

    REQUIRE(result.correlation_id != 424242);
    REQUIRE(hasLink(result, RelationKind::kRelatedTo, 424242));
    REQUIRE(result.event.correlation_id == result.correlation_id);
}

TEST_CASE("EventCorrelator sweeps expired state", "[correlator][EventCorrelator]")
{
    SECTION("correlations older than the TTL are removed")
    {
        EventCorrelator correlator(CorrelatorOptions{.ttl = 50ms, .sweep_time_budget = 1s});

        auto sent = correlator.correlate(sendMessage(1, 2, "ping"));
        auto received = correlator.correlate(receiveMessage(2, 1, "ping"));
        REQUIRE_FALSE(correlator.linksFor(received.correlation_id).empty());

        std::this_thread::sleep_for(100ms);
        auto result = correlator.sweep();

        REQUIRE(result.complete);
        REQUIRE(result.removed_correlations == 2);
        REQUIRE_FALSE(correlator.metadataFor(sent.correlation_id).has_value());
        REQUIRE_FALSE(correlator.metadataFor(received.correlation_id).has_value());
        REQUIRE(correlator.linksFor(received.correlation_id).empty());
        REQUIRE(correlator.stats().tracked_correlations == 0);
        REQUIRE(correlator.stats().link_entries == 0);
    }

    SECTION("fresh correlations survive")
    {
        EventCorrelator correlator(CorrelatorOptions{.ttl = 1h});

        auto opened = correlator.correlate(callEntry(1, "long_call"));
        correlator.sweep();

        REQUIRE(correlator.metadataFor(opened.correlation_id).has_value());
        REQUIRE(correlator.stackDepth(1) == 1);
    }

    SECTION("stale pending sends and call stacks are removed")
    {
        EventCorrelator correlator(CorrelatorOptions{.ttl = 1s, .sweep_time_budget = 1s});

        correlator.correlate(sendMessage(1, 2, "lost"));
        correlator.correlate(callEntry(3, "stuck"));
        REQUIRE(correlator.pendingMessageCount() == 1);

        const auto later = causeway::core::monotonicNowNs() + 2'000'000'000ULL;
        auto result = correlator.sweep(later);

        REQUIRE(result.removed_pending == 1);
        REQUIRE(result.removed_stacks == 1);
        REQUIRE(correlator.pendingMessageCount() == 0);
        REQUIRE(correlator.stackDepth(3) == 0);

        // A late receive no longer finds its send
        REQUIRE(correlator.correlate(receiveMessage(2, 1, "lost")).no_send_match);
    }

    SECTION("the soft cap halves the TTL")
    {
        EventCorrelator correlator(
            CorrelatorOptions{.ttl = 10s, .sweep_time_budget = 1s, .max_tracked_correlations = 1});

        correlator.correlate(metric(1));
        correlator.correlate(metric(2));

        // Six seconds on is inside the TTL but outside half of it
        const auto later = causeway::core::monotonicNowNs() + 6'000'000'000ULL;
        auto result = correlator.sweep(later);

        REQUIRE(result.removed_correlations == 2);
    }

    SECTION("an exhausted budget resumes at the next shard")
    {
        constexpr std::size_t kCorrelations = 20000;

        EventCorrelator correlator(CorrelatorOptions{
            .ttl = 1s, .sweep_time_budget = 0ms, .max_tracked_correlations = 1'000'000});

        for (std::size_t i = 0; i < kCorrelations; ++i)
        {
            correlator.correlate(metric(static_cast<ProducerId>(i) + 1));
        }
        REQUIRE(correlator.stats().tracked_correlations == kCorrelations);

        const auto later = causeway::core::monotonicNowNs() + 2'000'000'000ULL;

        auto first = correlator.sweep(later);
        REQUIRE_FALSE(first.complete);
        REQUIRE(first.shards_visited < 16);
        REQUIRE(first.removed_correlations > 0);
        REQUIRE(first.removed_correlations < kCorrelations);
        REQUIRE(correlator.stats().incomplete_sweeps == 1);

        // Each following sweep picks up where the last one stopped
        std::size_t removed = first.removed_correlations;
        std::size_t shards = first.shards_visited;
        while (shards < 16)
        {
            auto next = correlator.sweep(later);
            REQUIRE(next.shards_visited > 0);
            removed += next.removed_correlations;
            shards += next.shards_visited;
        }

        REQUIRE(removed == kCorrelations);
        REQUIRE(correlator.stats().tracked_correlations == 0);
        REQUIRE(correlator.stats().swept_correlations == kCorrelations);
    }

    SECTION("sweeps are counted")
    {
        EventCorrelator correlator;
        correlator.sweep();
        correlator.sweep();

        REQUIRE(correlator.stats().sweeps == 2);
    }
}

TEST_CASE("EventCorrelator sweeps while correlating", "[correlator][EventCorrelator]")
{
    constexpr std::size_t kRounds = 5000;

    EventCorrelator correlator(CorrelatorOptions{.ttl = 1h, .sweep_time_budget = 1s});

    std::atomic<bool> stop{false};
    std::atomic<std::size_t> batch_failures{0};

    {
        std::jthread sweeper(
            [&]
            {
                while (!stop.load(std::memory_order_acquire))
                {
                    correlator.sweep();
                }
            });

        std::jthread batcher(
            [&]
            {
                for (std::size_t i = 0; i < kRounds; ++i)
                {
                    const auto content = "batch-" + std::to_string(i);
                    std::vector<Event> events{callEntry(3, "serve"), sendMessage(3, 4, content),
                                              receiveMessage(4, 3, content), callExit(3, "serve")};
                    if (!correlator.correlateBatch(events, 1h))
                    {
                        batch_failures.fetch_add(1, std::memory_order_relaxed);
                    }
                }
            });

        for (std::size_t i = 0; i < kRounds; ++i)
        {
            const auto content = "single-" + std::to_string(i);
            correlator.correlate(callEntry(1, "handle"));
            correlator.correlate(sendMessage(1, 2, content));
            correlator.correlate(receiveMessage(2, 1, content));
            correlator.correlate(callExit(1, "handle"));
        }

        batcher.join();
        while (correlator.stats().sweeps == 0)
        {
            std::this_thread::yield();
        }
        stop.store(true, std::memory_order_release);
    }

    REQUIRE(batch_failures.load() == 0);

    auto stats = correlator.stats();
    REQUIRE(stats.correlated == 8 * kRounds);
    REQUIRE(stats.full_confidence == 8 * kRounds);
    REQUIRE(stats.orphan_exits == 0);
    REQUIRE(stats.unmatched_receives == 0);
    REQUIRE(stats.swept_correlations == 0);
    REQUIRE(stats.sweeps > 0);

    // Balanced calls leave every stack empty and no send waiting
    REQUIRE(correlator.stackDepth(1) == 0);
    REQUIRE(correlator.stackDepth(3) == 0);
    REQUIRE(correlator.pendingMessageCount() == 0);
}

TEST_CASE("EventCorrelator::correlateBatch", "[correlator][EventCorrelator]")
{
    SECTION("correlates in order")
    {
        EventCorrelator correlator;
        std::vector<Event> events{callEntry(1, "a"), callEntry(1, "b"), callExit(1, "b"), callExit(1, "a")};

        auto result = correlator.correlateBatch(events, 100ms);
        REQUIRE(result.has_value());
        REQUIRE(result->size() == 4);

        const auto& batch = *result;
        REQUIRE(batch[1].parent_id == batch[0].correlation_id);
        REQUIRE(batch[2].correlation_id == batch[1].correlation_id);
        REQUIRE(batch[3].correlation_id == batch[0].correlation_id);
        REQUIRE(correlator.stackDepth(1) == 0);
    }

    SECTION("the timeout bounds only the lock wait")
    {
        EventCorrelator correlator;

        std::vector<Event> events;
        events.reserve(20000);
        for (std::size_t i = 0; i < 20000; ++i)
        {
            events.push_back(metric(static_cast<ProducerId>(i % 8) + 1));
        }

        // An uncontended lock is taken at once and the full batch runs,
        // even when it takes longer than the timeout
        auto result = correlator.correlateBatch(events, 1ms);
        REQUIRE(result.has_value());
        REQUIRE(result->size() == 20000);
        REQUIRE(correlator.stats().correlated == 20000);
        REQUIRE(correlator.stats().batch_timeouts == 0);
    }

    SECTION("times out while another batch holds the correlator")
    {
        EventCorrelator correlator;

        std::vector<Event> large;
        large.reserve(20000);
        for (std::size_t i = 0; i < 20000; ++i)
        {
            large.push_back(metric(static_cast<ProducerId>(i % 8) + 1));
        }

        std::atomic<bool> stop{false};
        std::atomic<std::size_t> worker_failures{0};
        std::jthread worker(
            [&]
            {
                while (!stop.load())
                {
                    auto copy = large;
                    if (!correlator.correlateBatch(copy, 1h))
                    {
                        worker_failures.fetch_add(1);
                    }
                }
            });

        while (correlator.stats().correlated == 0)
        {
            std::this_thread::yield();
        }

        std::optional<CorrelationError> error;
        std::vector<Event> attempt;
        const auto deadline = std::chrono::steady_clock::now() + 10s;
        while (!error && std::chrono::steady_clock::now() < deadline)
        {
            attempt = {metric(100), metric(100)};
            auto result = correlator.correlateBatch(attempt, 0ms);
            if (!result)
            {
                error = result.error();
            }
        }

        stop.store(true);
        worker.join();

        REQUIRE(worker_failures.load() == 0);
        REQUIRE(error == CorrelationError::kTimeout);
        REQUIRE(correlator.stats().batch_timeouts >= 1);

        // A timed-out batch is left for the caller to retry
        for (const auto& event : attempt)
        {
            REQUIRE_FALSE(event.correlation_id.has_value());
        }
    }
}

TEST_CASE("EventCorrelator stats and reset", "[correlator][EventCorrelator]")
{
    EventCorrelator correlator;

    correlator.correlate(callEntry(1, "a"));
    correlator.correlate(sendMessage(1, 2, "x"));
    correlator.correlate(callExit(1, "b"));
    correlator.correlate(receiveMessage(3, 4, "y"));

    auto stats = correlator.stats();
    REQUIRE(stats.correlated == 4);
    REQUIRE(stats.full_confidence == 2);
    REQUIRE(stats.partial_confidence == 1);
    REQUIRE(stats.no_confidence == 1);
    REQUIRE(stats.pending_messages == 1);
    REQUIRE(stats.tracked_correlations == 3);

    correlator.reset();

    stats = correlator.stats();
    REQUIRE(stats.tracked_correlations == 0);
    REQUIRE(stats.pending_messages == 0);
    REQUIRE(stats.call_stacks == 0);
    REQUIRE(correlator.stackDepth(1) == 0);
}

TEST_CASE("CorrelatorOptions from configuration", "[correlator][CorrelatorOptions]")
{
    causeway::core::PipelineConfig config;
    config.correlation_ttl = 250ms;
    config.sweep_time_budget = 3ms;
    config.max_tracked_correlations = 42;

    auto options = CorrelatorOptions::fromConfig(config);

    REQUIRE(options.ttl == 250ms);
    REQUIRE(options.sweep_time_budget == 3ms);
    REQUIRE(options.max_tracked_correlations == 42);
}
