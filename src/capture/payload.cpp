/**
 *  @file       payload.cpp
 *  @author     The causeway contributors
 *
 *  Implementation of payload normalization.
 */

#include "causeway/capture/payload.hpp"

#include "causeway/core/events.hpp"

#include <absl/hash/hash.h>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <variant>

namespace causeway::capture
{

namespace
{

/**
 *  Visitor bounding the payload fields of each event kind.
 */
struct PayloadBounder
{
    std::size_t max_bytes;

    void operator()(std::monostate& /*unused*/) const {}

    void operator()(core::FunctionEntry& entry) const { boundPayload(entry.args, max_bytes); }

    void operator()(core::FunctionExit& exit) const
    {
        boundPayload(exit.return_value, max_bytes);
    }

    void operator()(core::MessageSend& send) const { boundPayload(send.content, max_bytes); }

    void operator()(core::MessageReceive& receive) const
    {
        boundPayload(receive.content, max_bytes);
    }

    void operator()(core::StateChange& change) const
    {
        boundPayload(change.old_state, max_bytes);
        boundPayload(change.new_state, max_bytes);
    }

    void operator()(core::ProcessSpawn& /*unused*/) const {}

    void operator()(core::ProcessExit& /*unused*/) const {}

    void operator()(core::ErrorRaised& error) const
    {
        boundPayload(error.message, max_bytes);
        boundPayload(error.stacktrace, max_bytes);
    }

    void operator()(core::Metric& /*unused*/) const {}
};

}  // namespace

auto boundPayload(std::string_view value, std::string_view type_hint, std::size_t max_bytes)
    -> core::Payload
{
    if (value.size() > max_bytes)
    {
        return core::Payload{
            .data = {},
            .type_hint = std::string(type_hint),
            .truncated = true,
            .original_size = value.size(),
        };
    }

    return core::Payload{
        .data = std::string(value),
        .type_hint = std::string(type_hint),
        .truncated = false,
        .original_size = value.size(),
    };
}

void boundPayload(core::Payload& payload, std::size_t max_bytes)
{
    if (payload.truncated)
    {
        return;
    }

    payload.original_size = payload.data.size();
    if (payload.data.size() > max_bytes)
    {
        payload.data.clear();
        payload.data.shrink_to_fit();
        payload.truncated = true;
    }
}

auto renderArguments(std::span<const std::string> args) -> std::string
{
    std::string rendered = "[";
    for (std::size_t i = 0; i < args.size(); ++i)
    {
        if (i != 0)
        {
            rendered.append(", ");
        }
        rendered.append(args[i]);
    }
    rendered.push_back(']');
    return rendered;
}

auto contentHash(std::string_view content) noexcept -> std::uint64_t
{
    return static_cast<std::uint64_t>(absl::Hash<std::string_view>{}(content));
}

void boundEventPayloads(core::EventData& data, std::size_t max_bytes)
{
    std::visit(PayloadBounder{max_bytes}, data);
}

}  // namespace causeway::capture
