/**
 *  @file       events.hpp
 *  @author     The causeway contributors
 *
 *  Event data structures for capture and correlation.
 *
 *  Defines the tagged event record produced by the ingestor, the bounded
 *  payload it carries, and the correlated form written to the hot store.
 */

#ifndef CAUSEWAY_CORE_EVENTS_HPP_
#define CAUSEWAY_CORE_EVENTS_HPP_

#include "causeway/core/types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace causeway::core
{

/**
 *  Kind of a captured event.
 *
 *  The enumerator values match the alternative indices of EventData.
 */
enum class EventKind : std::uint8_t
{
    /**
     *  The event carries no recognizable payload (malformed input).
     */
    kUnknown = 0,
    kFunctionEntry = 1,
    kFunctionExit = 2,
    kMessageSend = 3,
    kMessageReceive = 4,
    kStateChange = 5,
    kProcessSpawn = 6,
    kProcessExit = 7,
    kError = 8,
    kMetric = 9,
};

/**
 *  Converts an EventKind to its human-readable string representation.
 *
 *  @param      kind  The event kind to convert.
 *  @return     A snake_case name for the kind.
 */
[[nodiscard]] constexpr auto toString(EventKind kind) noexcept -> std::string_view
{
    switch (kind)
    {
        case EventKind::kUnknown:
            return "unknown";
        case EventKind::kFunctionEntry:
            return "function_entry";
        case EventKind::kFunctionExit:
            return "function_exit";
        case EventKind::kMessageSend:
            return "message_send";
        case EventKind::kMessageReceive:
            return "message_receive";
        case EventKind::kStateChange:
            return "state_change";
        case EventKind::kProcessSpawn:
            return "process_spawn";
        case EventKind::kProcessExit:
            return "process_exit";
        case EventKind::kError:
            return "error";
        case EventKind::kMetric:
            return "metric";
    }
    return "invalid";
}

/**
 *  A size-bounded, kind-specific payload value.
 *
 *  When the rendered value exceeds the ingestor's byte threshold, data is
 *  cleared and the payload becomes a truncation marker: truncated is set,
 *  original_size records the rejected size and type_hint is preserved so
 *  downstream consumers still know what was there.
 */
struct Payload
{
    /**
     *  Rendered value. Empty when truncated.
     */
    std::string data;

    /**
     *  Short description of the value's type (e.g. "list", "message").
     */
    std::string type_hint;

    /**
     *  True if the original value was replaced by a truncation marker.
     */
    bool truncated{false};

    /**
     *  Size in bytes of the value before truncation.
     */
    std::size_t original_size{0};

    auto operator==(const Payload&) const -> bool = default;
};

struct FunctionEntry
{
    std::string module;
    std::string function;
    std::uint32_t arity{0};
    Payload args;
};

struct FunctionExit
{
    std::string module;
    std::string function;
    std::uint32_t arity{0};
    Payload return_value;

    /**
     *  Time spent in the call as measured by the producer.
     */
    std::uint64_t duration_ns{0};
};

struct MessageSend
{
    ProducerId sender{kInvalidProducerId};
    ProducerId receiver{kInvalidProducerId};
    Payload content;

    /**
     *  Hash of the full content, computed before truncation.
     */
    std::uint64_t content_hash{0};
};

struct MessageReceive
{
    ProducerId sender{kInvalidProducerId};
    ProducerId receiver{kInvalidProducerId};
    Payload content;

    /**
     *  Hash of the full content, computed before truncation.
     */
    std::uint64_t content_hash{0};
};

struct StateChange
{
    std::string callback;
    Payload old_state;
    Payload new_state;

    /**
     *  False when old and new state rendered identically.
     */
    bool changed{false};

    /**
     *  Size of the new state minus size of the old state, in bytes.
     */
    std::int64_t size_delta{0};
};

struct ProcessSpawn
{
    ProducerId parent{kInvalidProducerId};
    ProducerId child{kInvalidProducerId};
};

struct ProcessExit
{
    std::string reason;
};

struct ErrorRaised
{
    std::string error_type;
    Payload message;
    Payload stacktrace;
};

struct Metric
{
    std::string name;
    double value{0.0};
    std::vector<std::pair<std::string, std::string>> metadata;
};

/**
 *  Kind-specific event payload. std::monostate marks a malformed event.
 */
using EventData = std::variant<std::monostate, FunctionEntry, FunctionExit, MessageSend,
                               MessageReceive, StateChange, ProcessSpawn, ProcessExit,
                               ErrorRaised, Metric>;

/**
 *  A captured trace event.
 *
 *  Built by the ingestor, stamped in place by the correlator and never
 *  mutated after it leaves the correlator.
 */
struct Event
{
    /**
     *  Globally unique, time-sortable identifier.
     */
    EventId id{0};

    /**
     *  Monotonic timestamp (nanoseconds, CLOCK_MONOTONIC).
     */
    TimestampNs timestamp_ns{0};

    /**
     *  Wall-clock timestamp (nanoseconds since the Unix epoch).
     */
    TimestampNs wall_time_ns{0};

    /**
     *  Producer that emitted the event.
     */
    ProducerId producer{kInvalidProducerId};

    /**
     *  Correlation ID. Holds the producer's hint until correlation.
     */
    std::optional<CorrelationId> correlation_id;

    /**
     *  Parent correlation ID, assigned by the correlator.
     */
    std::optional<CorrelationId> parent_id;

    EventData data;

    /**
     *  Returns the kind of this event.
     */
    [[nodiscard]] auto kind() const noexcept -> EventKind
    {
        return static_cast<EventKind>(data.index());
    }

    /**
     *  Returns the symbol key used by the hot store's symbol index.
     *
     *  Function events map to "module.function/arity", metrics to their
     *  name. Other kinds have no symbol.
     *
     *  @return     The symbol key, or std::nullopt for kinds without one.
     */
    [[nodiscard]] auto symbolKey() const -> std::optional<std::string>;
};

/**
 *  Formats the symbol key for a function.
 *
 *  @param      module    Module or namespace of the function.
 *  @param      function  Function name.
 *  @param      arity     Number of arguments.
 *  @return     "module.function/arity".
 */
[[nodiscard]] auto functionSymbol(std::string_view module, std::string_view function,
                                  std::uint32_t arity) -> std::string;

/**
 *  Relation carried by a causal link.
 */
enum class RelationKind : std::uint8_t
{
    /**
     *  A receive event points at the correlation of its matching send.
     */
    kReceives = 1,

    /**
     *  A producer's first call points at the correlation that spawned it.
     */
    kSpawnedBy = 2,

    /**
     *  The producer supplied this correlation ID as a hint.
     */
    kRelatedTo = 3,
};

/**
 *  Converts a RelationKind to its human-readable string representation.
 */
[[nodiscard]] constexpr auto toString(RelationKind relation) noexcept -> std::string_view
{
    switch (relation)
    {
        case RelationKind::kReceives:
            return "receives";
        case RelationKind::kSpawnedBy:
            return "spawned_by";
        case RelationKind::kRelatedTo:
            return "related_to";
    }
    return "invalid";
}

/**
 *  A causal edge from one correlation to another.
 */
struct CausalLink
{
    RelationKind relation;
    CorrelationId target;

    auto operator==(const CausalLink&) const -> bool = default;
};

/**
 *  How the correlator attributed an event.
 */
enum class CorrelationType : std::uint8_t
{
    kFunctionCall = 1,
    kMessage = 2,
    kStateChange = 3,
    kProcessLifecycle = 4,
    kError = 5,
    kMetric = 6,

    /**
     *  The event was malformed and only received a fresh ID.
     */
    kMalformed = 7,
};

/**
 *  Converts a CorrelationType to its human-readable string representation.
 */
[[nodiscard]] constexpr auto toString(CorrelationType type) noexcept -> std::string_view
{
    switch (type)
    {
        case CorrelationType::kFunctionCall:
            return "function_call";
        case CorrelationType::kMessage:
            return "message";
        case CorrelationType::kStateChange:
            return "state_change";
        case CorrelationType::kProcessLifecycle:
            return "process_lifecycle";
        case CorrelationType::kError:
            return "error";
        case CorrelationType::kMetric:
            return "metric";
        case CorrelationType::kMalformed:
            return "malformed";
    }
    return "invalid";
}

/**
 *  Confidence for a fully matched or definitive attribution.
 */
inline constexpr double kConfidenceFull = 1.0;

/**
 *  Confidence for a partial match (exit popped a frame with another symbol).
 */
inline constexpr double kConfidencePartial = 0.5;

/**
 *  Confidence for an unmatched or malformed event.
 */
inline constexpr double kConfidenceNone = 0.0;

/**
 *  An event together with its reconstructed causal context.
 */
struct CorrelatedEvent
{
    Event event;

    CorrelationId correlation_id{kNoCorrelation};

    /**
     *  Correlation of the enclosing call, if any.
     */
    std::optional<CorrelationId> parent_id;

    /**
     *  Correlation at the origin of the parent chain.
     */
    CorrelationId root_id{kNoCorrelation};

    std::vector<CausalLink> links;

    CorrelationType correlation_type{CorrelationType::kMalformed};

    /**
     *  Attribution confidence in [0, 1].
     */
    double confidence{kConfidenceNone};

    /**
     *  Set on an exit observed against an empty call stack.
     */
    bool orphan{false};

    /**
     *  Set on a receive that matched no pending send.
     */
    bool no_send_match{false};
};

}  // namespace causeway::core

#endif  // CAUSEWAY_CORE_EVENTS_HPP_
