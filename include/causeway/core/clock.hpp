/**
 *  @file       clock.hpp
 *  @author     The causeway contributors
 *
 *  Timestamp sources and time-sortable identifier generation.
 */

#ifndef CAUSEWAY_CORE_CLOCK_HPP_
#define CAUSEWAY_CORE_CLOCK_HPP_

#include "causeway/core/types.hpp"

#include <atomic>
#include <cstdint>

namespace causeway::core
{

/**
 *  Returns the current monotonic time in nanoseconds (CLOCK_MONOTONIC).
 *
 *  Suitable for intervals and TTLs; unaffected by wall-clock adjustments.
 */
[[nodiscard]] auto monotonicNowNs() noexcept -> TimestampNs;

/**
 *  Returns the current wall-clock time in nanoseconds since the Unix epoch.
 */
[[nodiscard]] auto wallNowNs() noexcept -> TimestampNs;

/**
 *  Lock-free generator of unique, time-sortable 64-bit identifiers.
 *
 *  Each identifier is the current monotonic time in nanoseconds, bumped to
 *  one past the previous identifier when two calls land on the same
 *  nanosecond. Identifiers are therefore strictly increasing across all
 *  threads and approximate the moment they were issued.
 */
class IdGenerator
{
  public:
    IdGenerator() = default;

    IdGenerator(const IdGenerator&) = delete;
    auto operator=(const IdGenerator&) -> IdGenerator& = delete;

    /**
     *  Issues the next identifier.
     *
     *  @return     An identifier strictly greater than any previously issued.
     */
    [[nodiscard]] auto next() noexcept -> std::uint64_t;

  private:
    std::atomic<std::uint64_t> last_{0};
};

/**
 *  Issues a process-wide unique event ID.
 */
[[nodiscard]] auto nextEventId() noexcept -> EventId;

}  // namespace causeway::core

#endif  // CAUSEWAY_CORE_CLOCK_HPP_
