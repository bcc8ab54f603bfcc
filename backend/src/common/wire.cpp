/**
 * Wire framing and CBOR message encoding.
 */

#include "common/wire.h"

namespace kizuna::wire {

std::array<uint8_t, kHeaderSize> encode_header(std::uint32_t length) {
    return {
        static_cast<uint8_t>(length >> 24),
        static_cast<uint8_t>(length >> 16),
        static_cast<uint8_t>(length >> 8),
        static_cast<uint8_t>(length),
    };
}

std::uint32_t decode_header(const std::array<uint8_t, kHeaderSize>& header) {
    return (std::uint32_t{header[0]} << 24)
         | (std::uint32_t{header[1]} << 16)
         | (std::uint32_t{header[2]} << 8)
         |  std::uint32_t{header[3]};
}

Bytes encode_message(const json& message) {
    return json::to_cbor(message);
}

std::optional<json> decode_message(const Bytes& body) {
    auto message = json::from_cbor(body, true, false);
    if (message.is_discarded() || !message.is_object())
        return std::nullopt;
    return message;
}

json make_message(const char* channel, const char* type) {
    return json{{"ch", channel}, {"t", type}};
}

} // namespace kizuna::wire
