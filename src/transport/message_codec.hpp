/*
 * message_codec.hpp
 *
 * Copyright (C) 2024 The sweeplink Authors
 */

/*************************************************

Date: 2024-12

Description: Correlation envelope around opaque device payloads

**************************************************/

#ifndef SWEEPLINK_TRANSPORT_MESSAGE_CODEC_HPP
#define SWEEPLINK_TRANSPORT_MESSAGE_CODEC_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace sweeplink::transport {

/**
 * @brief One enveloped message
 */
struct Frame {
    uint32_t requestId{0};
    uint16_t protocol{0};
    std::string payload;

    auto operator==(const Frame& other) const -> bool = default;
};

/**
 * @brief Encodes frames as [u32 id][u16 protocol][u32 length][payload]
 *
 * All integers are big-endian.
 */
class EnvelopeCodec {
public:
    static constexpr uint16_t kRpcRequest = 101;
    static constexpr uint16_t kRpcResponse = 102;
    static constexpr size_t kHeaderSize = 10;

    [[nodiscard]] static auto encode(const Frame& frame) -> std::string;

    /**
     * @brief Decode one complete frame
     * @return nullopt for truncated input or a length that does not match
     */
    [[nodiscard]] static auto decode(std::string_view data)
        -> std::optional<Frame>;
};

}  // namespace sweeplink::transport

#endif  // SWEEPLINK_TRANSPORT_MESSAGE_CODEC_HPP
