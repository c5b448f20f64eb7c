/**
 *  @file       config.hpp
 *  @author     The causeway contributors
 *
 *  Pipeline configuration surface.
 *
 *  Holds every tunable of the capture and correlation pipeline and loads
 *  overrides from YAML. A configuration file looks like:
 *
 *  @code
 *      causeway:
 *        enabled: true
 *        ring_buffer:
 *          capacity: 65536
 *          overflow_policy: drop_oldest
 *        ingestor:
 *          max_payload_bytes: 4096
 *        correlator:
 *          ttl_ms: 300000
 *          sweep_interval_ms: 1000
 *          sweep_budget_ms: 10
 *          max_tracked_correlations: 1000000
 *          batch_timeout_ms: 100
 *        pipeline:
 *          batch_size: 1024
 *          max_batch_retries: 3
 *          poll_interval_ms: 1
 *        store:
 *          max_events: 1000000
 *          retention_ms: 0
 *  @endcode
 */

#ifndef CAUSEWAY_CORE_CONFIG_HPP_
#define CAUSEWAY_CORE_CONFIG_HPP_

#include "causeway/core/errors.hpp"
#include "causeway/core/types.hpp"

#include <chrono>
#include <cstddef>
#include <expected>
#include <string>
#include <string_view>

namespace causeway::core
{

/**
 *  Tunables for the whole pipeline. Defaults are production values.
 */
struct PipelineConfig
{
    /**
     *  Ring buffer slot count. Must be a power of two.
     */
    std::size_t buffer_capacity{65536};

    OverflowPolicy overflow_policy{OverflowPolicy::kDropOldest};

    /**
     *  Payloads rendered larger than this are replaced by a truncation marker.
     */
    std::size_t max_payload_bytes{4096};

    /**
     *  Maximum age of correlation state before a sweep removes it.
     */
    std::chrono::milliseconds correlation_ttl{std::chrono::minutes(5)};

    std::chrono::milliseconds sweep_interval{std::chrono::seconds(1)};

    /**
     *  Wall time a single sweep may spend before yielding to the next tick.
     */
    std::chrono::milliseconds sweep_time_budget{10};

    /**
     *  Soft cap on tracked correlations; above it sweeps use half the TTL.
     */
    std::size_t max_tracked_correlations{1'000'000};

    /**
     *  Maximum events drained from the ring buffer per correlation batch.
     */
    std::size_t batch_size{1024};

    /**
     *  Timeout for handing one batch to the correlator.
     */
    std::chrono::milliseconds batch_timeout{100};

    /**
     *  Timed-out attempts on one batch before it is dropped.
     */
    std::size_t max_batch_retries{3};

    /**
     *  Drain loop sleep when the ring buffer is empty.
     */
    std::chrono::milliseconds drain_poll_interval{1};

    /**
     *  Hot store soft cap; the oldest events are pruned beyond it. 0 disables.
     */
    std::size_t store_max_events{1'000'000};

    /**
     *  Hot store retention window. 0 disables time-based pruning.
     */
    std::chrono::milliseconds store_retention{0};

    /**
     *  Initial value of the ingestor's enable flag.
     */
    bool enabled{true};
};

/**
 *  Checks a configuration for out-of-range values.
 *
 *  @param      config  The configuration to check.
 *  @return     Success, or ConfigError::kInvalidValue naming no specific field
 *              (the offending field is logged).
 */
[[nodiscard]] auto validateConfig(const PipelineConfig& config) -> std::expected<void, ConfigError>;

/**
 *  Loads a configuration from a YAML document.
 *
 *  Keys absent from the document keep their defaults. The result is
 *  validated before it is returned.
 *
 *  @param      yaml_content  YAML text with a top-level "causeway" map.
 *  @return     The configuration, or ConfigError on parse or validation failure.
 */
[[nodiscard]] auto loadConfigFromString(std::string_view yaml_content)
    -> std::expected<PipelineConfig, ConfigError>;

/**
 *  Loads a configuration from a YAML file.
 *
 *  @param      path  Path to the YAML file.
 *  @return     The configuration, or ConfigError on I/O, parse or validation failure.
 */
[[nodiscard]] auto loadConfigFromFile(const std::string& path)
    -> std::expected<PipelineConfig, ConfigError>;

}  // namespace causeway::core

#endif  // CAUSEWAY_CORE_CONFIG_HPP_
