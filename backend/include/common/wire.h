#pragma once

#include <array>
#include <cstdint>
#include <optional>

#include <nlohmann/json.hpp>

#include "common/types.h"

namespace kizuna::wire {

using json = nlohmann::json;

/// Every frame on a channel is a 4-byte big-endian length followed by the body.
constexpr std::size_t kHeaderSize = 4;
constexpr std::uint32_t kMaxFrameSize = 16u * 1024u * 1024u;

constexpr int kProtocolVersion = 1;

/// Message channels multiplexed over one session.
constexpr const char* kControl  = "ctl";
constexpr const char* kTransfer = "transfer";
constexpr const char* kStream   = "stream";

std::array<uint8_t, kHeaderSize> encode_header(std::uint32_t length);
std::uint32_t decode_header(const std::array<uint8_t, kHeaderSize>& header);

/// Messages are JSON objects serialized as CBOR so chunk and frame payloads stay binary.
Bytes encode_message(const json& message);
std::optional<json> decode_message(const Bytes& body);

/// Build an envelope {"ch": channel, "t": type}.
json make_message(const char* channel, const char* type);

} // namespace kizuna::wire
