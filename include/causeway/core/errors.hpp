/**
 *  @file       errors.hpp
 *  @author     The causeway contributors
 *
 *  Error types for the Causeway pipeline.
 *
 *  Defines the error enumerations returned via std::expected at the few
 *  places where a failure is visible to a caller. Producers never see an
 *  exception: backpressure and bad input are recorded through counters.
 */

#ifndef CAUSEWAY_CORE_ERRORS_HPP_
#define CAUSEWAY_CORE_ERRORS_HPP_

#include <cstdint>
#include <string_view>

namespace causeway::core
{

/**
 *  Error conditions reported by the ring buffer.
 */
enum class BufferError : std::uint8_t
{
    /**
     *  The buffer is at capacity and the overflow policy refused the write.
     *
     *  Returned for kDropNewest and kReject; kDropOldest never fails.
     */
    kFull = 1,

    /**
     *  The requested capacity is not a power of two (or is below the minimum).
     */
    kInvalidCapacity = 2,
};

/**
 *  Converts a BufferError to its human-readable string representation.
 *
 *  @param      error  The error to convert.
 *  @return     A string view describing the error condition.
 */
[[nodiscard]] constexpr auto toString(BufferError error) noexcept -> std::string_view
{
    switch (error)
    {
        case BufferError::kFull:
            return "ring buffer full";
        case BufferError::kInvalidCapacity:
            return "ring buffer capacity must be a power of two";
    }
    return "unknown buffer error";
}

/**
 *  Outcome of a producer-facing ingest call that did not enqueue the event.
 */
enum class IngestError : std::uint8_t
{
    /**
     *  The event was dropped because the ring buffer was full.
     */
    kBufferFull = 1,

    /**
     *  Ingestion is currently disabled; the event was not built.
     */
    kDisabled = 2,
};

/**
 *  Converts an IngestError to its human-readable string representation.
 *
 *  @param      error  The error to convert.
 *  @return     A string view describing the error condition.
 */
[[nodiscard]] constexpr auto toString(IngestError error) noexcept -> std::string_view
{
    switch (error)
    {
        case IngestError::kBufferFull:
            return "event dropped: ring buffer full";
        case IngestError::kDisabled:
            return "ingestion disabled";
    }
    return "unknown ingest error";
}

/**
 *  Error conditions reported by the event correlator.
 */
enum class CorrelationError : std::uint8_t
{
    /**
     *  The batch could not be correlated within its timeout.
     *
     *  The batch is left undelivered and may be retried or dropped.
     */
    kTimeout = 1,

    /**
     *  The correlator or one of its helpers is in an invalid state for the call.
     */
    kInvalidState = 2,
};

/**
 *  Converts a CorrelationError to its human-readable string representation.
 *
 *  @param      error  The error to convert.
 *  @return     A string view describing the error condition.
 */
[[nodiscard]] constexpr auto toString(CorrelationError error) noexcept -> std::string_view
{
    switch (error)
    {
        case CorrelationError::kTimeout:
            return "batch correlation timed out";
        case CorrelationError::kInvalidState:
            return "correlator in invalid state";
    }
    return "unknown correlation error";
}

/**
 *  Error conditions reported at the hot store query boundary.
 */
enum class StoreError : std::uint8_t
{
    /**
     *  No event with the requested ID is stored.
     */
    kNotFound = 1,

    /**
     *  The requested time range has its start after its end.
     */
    kInvalidRange = 2,
};

/**
 *  Converts a StoreError to its human-readable string representation.
 *
 *  @param      error  The error to convert.
 *  @return     A string view describing the error condition.
 */
[[nodiscard]] constexpr auto toString(StoreError error) noexcept -> std::string_view
{
    switch (error)
    {
        case StoreError::kNotFound:
            return "event not found";
        case StoreError::kInvalidRange:
            return "invalid time range";
    }
    return "unknown store error";
}

/**
 *  Error conditions that can occur while loading pipeline configuration.
 */
enum class ConfigError : std::uint8_t
{
    /**
     *  The configuration file does not exist or could not be opened.
     */
    kFileNotFound = 1,

    /**
     *  The configuration is not valid YAML or a value has the wrong type.
     */
    kParseError = 2,

    /**
     *  A value is outside its allowed range (e.g. non power-of-two capacity).
     */
    kInvalidValue = 3,
};

/**
 *  Converts a ConfigError to its human-readable string representation.
 *
 *  @param      error  The error to convert.
 *  @return     A string view describing the error condition.
 */
[[nodiscard]] constexpr auto toString(ConfigError error) noexcept -> std::string_view
{
    switch (error)
    {
        case ConfigError::kFileNotFound:
            return "configuration file not found";
        case ConfigError::kParseError:
            return "failed to parse configuration";
        case ConfigError::kInvalidValue:
            return "invalid configuration value";
    }
    return "unknown configuration error";
}

}  // namespace causeway::core

#endif  // CAUSEWAY_CORE_ERRORS_HPP_
