/**
 *  @file       events.cpp
 *  @author     The causeway contributors
 *
 *  Implementation of event helper functions.
 */

#include "causeway/core/events.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace causeway::core
{

static_assert(std::variant_size_v<EventData> == static_cast<std::size_t>(EventKind::kMetric) + 1,
              "EventKind must enumerate every EventData alternative");

auto functionSymbol(std::string_view module, std::string_view function, std::uint32_t arity)
    -> std::string
{
    std::string symbol;
    symbol.reserve(module.size() + function.size() + 8);
    symbol.append(module);
    symbol.push_back('.');
    symbol.append(function);
    symbol.push_back('/');
    symbol.append(std::to_string(arity));
    return symbol;
}

auto Event::symbolKey() const -> std::optional<std::string>
{
    if (const auto* entry = std::get_if<FunctionEntry>(&data))
    {
        return functionSymbol(entry->module, entry->function, entry->arity);
    }
    if (const auto* exit = std::get_if<FunctionExit>(&data))
    {
        return functionSymbol(exit->module, exit->function, exit->arity);
    }
    if (const auto* metric = std::get_if<Metric>(&data))
    {
        return metric->name;
    }
    return std::nullopt;
}

}  // namespace causeway::core
