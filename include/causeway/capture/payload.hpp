/**
 *  @file       payload.hpp
 *  @author     The causeway contributors
 *
 *  Payload normalization for the ingestion hot path.
 *
 *  Renders producer values into size-bounded payloads, hashes message
 *  content for send/receive pairing, and summarizes state changes.
 */

#ifndef CAUSEWAY_CAPTURE_PAYLOAD_HPP_
#define CAUSEWAY_CAPTURE_PAYLOAD_HPP_

#include "causeway/core/events.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace causeway::capture
{

/**
 *  Builds a payload, replacing it with a truncation marker when oversized.
 *
 *  @param      value      Rendered value.
 *  @param      type_hint  Short description of the value's type.
 *  @param      max_bytes  Largest value kept verbatim.
 *  @return     The payload, or a marker carrying the original size and type hint.
 */
[[nodiscard]] auto boundPayload(std::string_view value, std::string_view type_hint,
                                std::size_t max_bytes) -> core::Payload;

/**
 *  Re-applies the size bound to an already built payload.
 *
 *  Used for events that arrive pre-built through batch ingestion.
 *
 *  @param      payload    Payload to bound in place.
 *  @param      max_bytes  Largest value kept verbatim.
 */
void boundPayload(core::Payload& payload, std::size_t max_bytes);

/**
 *  Renders an argument list as "[a, b, c]".
 */
[[nodiscard]] auto renderArguments(std::span<const std::string> args) -> std::string;

/**
 *  Hashes message content for signature matching.
 *
 *  Stable within a process; computed on the full content before truncation.
 */
[[nodiscard]] auto contentHash(std::string_view content) noexcept -> std::uint64_t;

/**
 *  Bounds every payload of an event in place.
 *
 *  @param      data       Event payload to normalize.
 *  @param      max_bytes  Largest value kept verbatim.
 */
void boundEventPayloads(core::EventData& data, std::size_t max_bytes);

}  // namespace causeway::capture

#endif  // CAUSEWAY_CAPTURE_PAYLOAD_HPP_
