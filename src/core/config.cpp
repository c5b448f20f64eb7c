/**
 *  @file       config.cpp
 *  @author     The causeway contributors
 *
 *  Implementation of YAML configuration loading and validation.
 */

#include "causeway/core/config.hpp"

#include "causeway/core/errors.hpp"
#include "causeway/core/types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <glog/logging.h>
#include <string>
#include <string_view>
#include <system_error>
#include <yaml-cpp/yaml.h>

namespace causeway::core
{

namespace
{

[[nodiscard]] constexpr auto isPowerOfTwo(std::size_t value) noexcept -> bool
{
    return value != 0 && (value & (value - 1)) == 0;
}

void readMilliseconds(const YAML::Node& node, const char* key, std::chrono::milliseconds& out)
{
    if (node[key])
    {
        out = std::chrono::milliseconds(node[key].as<std::int64_t>());
    }
}

void readSize(const YAML::Node& node, const char* key, std::size_t& out)
{
    if (node[key])
    {
        out = node[key].as<std::size_t>();
    }
}

/**
 *  Applies the keys present under the "causeway" root to a configuration.
 *
 *  yaml-cpp reports type mismatches by throwing YAML::Exception; the caller
 *  translates that into ConfigError::kParseError.
 */
auto applyYaml(const YAML::Node& root, PipelineConfig& config) -> std::expected<void, ConfigError>
{
    if (root["enabled"])
    {
        config.enabled = root["enabled"].as<bool>();
    }

    if (auto buffer = root["ring_buffer"])
    {
        readSize(buffer, "capacity", config.buffer_capacity);
        if (buffer["overflow_policy"])
        {
            auto name = buffer["overflow_policy"].as<std::string>();
            auto policy = parseOverflowPolicy(name);
            if (!policy)
            {
                LOG(ERROR) << "Unknown overflow policy '" << name
                           << "' (expected drop_oldest, drop_newest or reject)";
                return std::unexpected(ConfigError::kInvalidValue);
            }
            config.overflow_policy = *policy;
        }
    }

    if (auto ingestor = root["ingestor"])
    {
        readSize(ingestor, "max_payload_bytes", config.max_payload_bytes);
    }

    if (auto correlator = root["correlator"])
    {
        readMilliseconds(correlator, "ttl_ms", config.correlation_ttl);
        readMilliseconds(correlator, "sweep_interval_ms", config.sweep_interval);
        readMilliseconds(correlator, "sweep_budget_ms", config.sweep_time_budget);
        readMilliseconds(correlator, "batch_timeout_ms", config.batch_timeout);
        readSize(correlator, "max_tracked_correlations", config.max_tracked_correlations);
    }

    if (auto pipeline = root["pipeline"])
    {
        readSize(pipeline, "batch_size", config.batch_size);
        readSize(pipeline, "max_batch_retries", config.max_batch_retries);
        readMilliseconds(pipeline, "poll_interval_ms", config.drain_poll_interval);
    }

    if (auto store = root["store"])
    {
        readSize(store, "max_events", config.store_max_events);
        readMilliseconds(store, "retention_ms", config.store_retention);
    }

    return {};
}

}  // namespace

auto validateConfig(const PipelineConfig& config) -> std::expected<void, ConfigError>
{
    if (config.buffer_capacity < 2 || !isPowerOfTwo(config.buffer_capacity))
    {
        LOG(ERROR) << "ring_buffer.capacity must be a power of two >= 2, got "
                   << config.buffer_capacity;
        return std::unexpected(ConfigError::kInvalidValue);
    }
    if (config.max_payload_bytes == 0)
    {
        LOG(ERROR) << "ingestor.max_payload_bytes must be positive";
        return std::unexpected(ConfigError::kInvalidValue);
    }
    if (config.correlation_ttl.count() <= 0)
    {
        LOG(ERROR) << "correlator.ttl_ms must be positive";
        return std::unexpected(ConfigError::kInvalidValue);
    }
    if (config.sweep_interval.count() <= 0)
    {
        LOG(ERROR) << "correlator.sweep_interval_ms must be positive";
        return std::unexpected(ConfigError::kInvalidValue);
    }
    if (config.sweep_time_budget.count() <= 0)
    {
        LOG(ERROR) << "correlator.sweep_budget_ms must be positive";
        return std::unexpected(ConfigError::kInvalidValue);
    }
    if (config.batch_size == 0)
    {
        LOG(ERROR) << "pipeline.batch_size must be positive";
        return std::unexpected(ConfigError::kInvalidValue);
    }
    if (config.batch_timeout.count() < 0 || config.drain_poll_interval.count() < 0 ||
        config.store_retention.count() < 0)
    {
        LOG(ERROR) << "durations must not be negative";
        return std::unexpected(ConfigError::kInvalidValue);
    }

    return {};
}

namespace
{

auto configFromYaml(const YAML::Node& yaml) -> std::expected<PipelineConfig, ConfigError>
{
    PipelineConfig config;

    if (auto root = yaml["causeway"])
    {
        auto applied = applyYaml(root, config);
        if (!applied)
        {
            return std::unexpected(applied.error());
        }
    }
    else
    {
        LOG(WARNING) << "Configuration has no 'causeway' section; using defaults";
    }

    auto valid = validateConfig(config);
    if (!valid)
    {
        return std::unexpected(valid.error());
    }

    return config;
}

}  // namespace

auto loadConfigFromString(std::string_view yaml_content)
    -> std::expected<PipelineConfig, ConfigError>
{
    try
    {
        return configFromYaml(YAML::Load(std::string(yaml_content)));
    }
    catch (const YAML::Exception& e)
    {
        LOG(ERROR) << "Failed to parse configuration: " << e.what();
        return std::unexpected(ConfigError::kParseError);
    }
}

auto loadConfigFromFile(const std::string& path) -> std::expected<PipelineConfig, ConfigError>
{
    std::error_code ec;
    if (!std::filesystem::exists(path, ec))
    {
        LOG(ERROR) << "Configuration file not found: " << path;
        return std::unexpected(ConfigError::kFileNotFound);
    }

    try
    {
        auto config = configFromYaml(YAML::LoadFile(path));
        if (config)
        {
            LOG(INFO) << "Loaded configuration from " << path;
        }
        return config;
    }
    catch (const YAML::BadFile& e)
    {
        LOG(ERROR) << "Failed to open configuration file " << path << ": " << e.what();
        return std::unexpected(ConfigError::kFileNotFound);
    }
    catch (const YAML::Exception& e)
    {
        LOG(ERROR) << "Failed to parse configuration file " << path << ": " << e.what();
        return std::unexpected(ConfigError::kParseError);
    }
}

}  // namespace causeway::core
