/**
 *  @file       clock.cpp
 *  @author     The causeway contributors
 *
 *  Implementation of timestamp sources and identifier generation.
 */

#include "causeway/core/clock.hpp"

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <time.h>

namespace causeway::core
{

namespace
{

constexpr std::uint64_t kNsPerSecond = 1'000'000'000ULL;

auto readClockNs(clockid_t clock) noexcept -> TimestampNs
{
    timespec ts{};
    clock_gettime(clock, &ts);

    return (static_cast<std::uint64_t>(ts.tv_sec) * kNsPerSecond) +
           static_cast<std::uint64_t>(ts.tv_nsec);
}

}  // namespace

auto monotonicNowNs() noexcept -> TimestampNs
{
    return readClockNs(CLOCK_MONOTONIC);
}

auto wallNowNs() noexcept -> TimestampNs
{
    return readClockNs(CLOCK_REALTIME);
}

auto IdGenerator::next() noexcept -> std::uint64_t
{
    const auto now = monotonicNowNs();
    auto last = last_.load(std::memory_order_relaxed);
    std::uint64_t candidate = 0;

    // Claim max(now, last + 1); on conflict another thread issued an ID first
    do
    {
        candidate = std::max(now, last + 1);
    } while (!last_.compare_exchange_weak(last, candidate, std::memory_order_acq_rel,
                                          std::memory_order_relaxed));

    return candidate;
}

auto nextEventId() noexcept -> EventId
{
    static IdGenerator generator;
    return generator.next();
}

}  // namespace causeway::core
