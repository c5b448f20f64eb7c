/**
 *  @file       test_config.cpp
 *  @author     The causeway contributors
 *
 *  Unit tests for configuration loading and validation.
 */

#include "causeway/core/config.hpp"
#include "causeway/core/errors.hpp"
#include "causeway/core/types.hpp"

#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

using causeway::core::ConfigError;
using causeway::core::loadConfigFromFile;
using causeway::core::loadConfigFromString;
using causeway::core::OverflowPolicy;
using causeway::core::PipelineConfig;
using causeway::core::validateConfig;

using namespace std::chrono_literals;

namespace
{

constexpr const char* kFullConfig = R"(
causeway:
  enabled: false
  ring_buffer:
    capacity: 1024
    overflow_policy: reject
  ingestor:
    max_payload_bytes: 256
  correlator:
    ttl_ms: 50
    sweep_interval_ms: 10
    sweep_budget_ms: 2
    batch_timeout_ms: 20
    max_tracked_correlations: 5000
  pipeline:
    batch_size: 64
    max_batch_retries: 5
    poll_interval_ms: 3
  store:
    max_events: 10000
    retention_ms: 60000
)";

}  // namespace

TEST_CASE("Default configuration is valid", "[config]")
{
    PipelineConfig config;

    REQUIRE(validateConfig(config).has_value());
    REQUIRE(config.buffer_capacity == 65536);
    REQUIRE(config.overflow_policy == OverflowPolicy::kDropOldest);
    REQUIRE(config.correlation_ttl == 5min);
    REQUIRE(config.enabled);
}

TEST_CASE("validateConfig rejects out-of-range values", "[config]")
{
    PipelineConfig config;

    SECTION("capacity must be a power of two")
    {
        config.buffer_capacity = 1000;
        REQUIRE(validateConfig(config).error() == ConfigError::kInvalidValue);
    }

    SECTION("capacity must be at least two")
    {
        config.buffer_capacity = 1;
        REQUIRE(validateConfig(config).error() == ConfigError::kInvalidValue);
    }

    SECTION("zero batch size")
    {
        config.batch_size = 0;
        REQUIRE(validateConfig(config).error() == ConfigError::kInvalidValue);
    }

    SECTION("zero TTL")
    {
        config.correlation_ttl = 0ms;
        REQUIRE(validateConfig(config).error() == ConfigError::kInvalidValue);
    }

    SECTION("zero sweep interval")
    {
        config.sweep_interval = 0ms;
        REQUIRE(validateConfig(config).error() == ConfigError::kInvalidValue);
    }

    SECTION("negative retention")
    {
        config.store_retention = -1ms;
        REQUIRE(validateConfig(config).error() == ConfigError::kInvalidValue);
    }
}

TEST_CASE("loadConfigFromString reads every section", "[config]")
{
    auto config = loadConfigFromString(kFullConfig);

    REQUIRE(config.has_value());
    REQUIRE_FALSE(config->enabled);
    REQUIRE(config->buffer_capacity == 1024);
    REQUIRE(config->overflow_policy == OverflowPolicy::kReject);
    REQUIRE(config->max_payload_bytes == 256);
    REQUIRE(config->correlation_ttl == 50ms);
    REQUIRE(config->sweep_interval == 10ms);
    REQUIRE(config->sweep_time_budget == 2ms);
    REQUIRE(config->batch_timeout == 20ms);
    REQUIRE(config->max_tracked_correlations == 5000);
    REQUIRE(config->batch_size == 64);
    REQUIRE(config->max_batch_retries == 5);
    REQUIRE(config->drain_poll_interval == 3ms);
    REQUIRE(config->store_max_events == 10000);
    REQUIRE(config->store_retention == 60000ms);
}

TEST_CASE("loadConfigFromString keeps defaults for absent keys", "[config]")
{
    SECTION("partial document")
    {
        auto config = loadConfigFromString("causeway:\n  ring_buffer:\n    capacity: 16\n");

        REQUIRE(config.has_value());
        REQUIRE(config->buffer_capacity == 16);
        REQUIRE(config->overflow_policy == OverflowPolicy::kDropOldest);
        REQUIRE(config->batch_size == PipelineConfig{}.batch_size);
    }

    SECTION("document without a causeway section")
    {
        auto config = loadConfigFromString("other:\n  key: 1\n");

        REQUIRE(config.has_value());
        REQUIRE(config->buffer_capacity == PipelineConfig{}.buffer_capacity);
    }
}

TEST_CASE("loadConfigFromString reports bad input", "[config]")
{
    SECTION("unknown overflow policy")
    {
        auto config =
            loadConfigFromString("causeway:\n  ring_buffer:\n    overflow_policy: drop_all\n");
        REQUIRE(config.error() == ConfigError::kInvalidValue);
    }

    SECTION("capacity that is not a power of two")
    {
        auto config = loadConfigFromString("causeway:\n  ring_buffer:\n    capacity: 1000\n");
        REQUIRE(config.error() == ConfigError::kInvalidValue);
    }

    SECTION("value of the wrong type")
    {
        auto config = loadConfigFromString("causeway:\n  pipeline:\n    batch_size: many\n");
        REQUIRE(config.error() == ConfigError::kParseError);
    }

    SECTION("malformed YAML")
    {
        auto config = loadConfigFromString("causeway: [unclosed\n");
        REQUIRE(config.error() == ConfigError::kParseError);
    }
}

TEST_CASE("loadConfigFromFile", "[config]")
{
    SECTION("missing file")
    {
        auto config = loadConfigFromFile("/nonexistent/causeway.yaml");
        REQUIRE(config.error() == ConfigError::kFileNotFound);
    }

    SECTION("file on disk")
    {
        const auto path =
            std::filesystem::temp_directory_path() / "causeway_test_config.yaml";
        {
            std::ofstream out(path);
            out << kFullConfig;
        }

        auto config = loadConfigFromFile(path.string());
        std::filesystem::remove(path);

        REQUIRE(config.has_value());
        REQUIRE(config->buffer_capacity == 1024);
        REQUIRE(config->overflow_policy == OverflowPolicy::kReject);
    }
}
