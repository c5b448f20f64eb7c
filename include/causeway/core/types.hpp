/**
 *  @file       types.hpp
 *  @author     The causeway contributors
 *
 *  Core type definitions for the Causeway pipeline.
 *
 *  Defines the identifier types shared by every stage of the capture and
 *  correlation pipeline, together with the ring buffer overflow policy.
 */

#ifndef CAUSEWAY_CORE_TYPES_HPP_
#define CAUSEWAY_CORE_TYPES_HPP_

#include <cstdint>
#include <optional>
#include <string_view>

namespace causeway::core
{

/**
 *  Opaque handle identifying an event producer (a thread, task or process).
 *
 *  The value is chosen by the instrumentation layer and only compared for
 *  equality by the pipeline.
 */
using ProducerId = std::uint64_t;

/**
 *  Sentinel value for a missing or unknown producer.
 */
inline constexpr ProducerId kInvalidProducerId = 0;

/**
 *  Globally unique, time-sortable event identifier.
 *
 *  Ordering event IDs orders the events by the moment they were ingested.
 */
using EventId = std::uint64_t;

/**
 *  Identifier grouping all events that belong to one logical operation.
 */
using CorrelationId = std::uint64_t;

/**
 *  Sentinel value for "no correlation".
 */
inline constexpr CorrelationId kNoCorrelation = 0;

/**
 *  Nanosecond timestamp. Monotonic or wall-clock depending on the field.
 */
using TimestampNs = std::uint64_t;

/**
 *  Behaviour of the ring buffer when a write finds it at capacity.
 */
enum class OverflowPolicy : std::uint8_t
{
    /**
     *  Advance the oldest unconsumed position and retry the write.
     */
    kDropOldest = 0,

    /**
     *  Discard the incoming event and count it as dropped.
     */
    kDropNewest = 1,

    /**
     *  Refuse the incoming event and leave accounting to the caller.
     */
    kReject = 2,
};

/**
 *  Converts an OverflowPolicy to its configuration name.
 *
 *  @param      policy  The policy to convert.
 *  @return     "drop_oldest", "drop_newest", "reject", or "invalid".
 */
[[nodiscard]] constexpr auto toString(OverflowPolicy policy) noexcept -> std::string_view
{
    switch (policy)
    {
        case OverflowPolicy::kDropOldest:
            return "drop_oldest";
        case OverflowPolicy::kDropNewest:
            return "drop_newest";
        case OverflowPolicy::kReject:
            return "reject";
    }
    return "invalid";
}

/**
 *  Parses an overflow policy from its configuration name.
 *
 *  @param      name  One of "drop_oldest", "drop_newest" or "reject".
 *  @return     The matching policy, or std::nullopt for an unknown name.
 */
[[nodiscard]] constexpr auto parseOverflowPolicy(std::string_view name) noexcept
    -> std::optional<OverflowPolicy>
{
    if (name == "drop_oldest")
    {
        return OverflowPolicy::kDropOldest;
    }
    if (name == "drop_newest")
    {
        return OverflowPolicy::kDropNewest;
    }
    if (name == "reject")
    {
        return OverflowPolicy::kReject;
    }
    return std::nullopt;
}

}  // namespace causeway::core

#endif  // CAUSEWAY_CORE_TYPES_HPP_
