/*
 * message_codec.cpp
 *
 * Copyright (C) 2024 The sweeplink Authors
 */

#include "message_codec.hpp"

namespace sweeplink::transport {

namespace {

void putU32(std::string& out, uint32_t value) {
    out.push_back(static_cast<char>((value >> 24) & 0xFF));
    out.push_back(static_cast<char>((value >> 16) & 0xFF));
    out.push_back(static_cast<char>((value >> 8) & 0xFF));
    out.push_back(static_cast<char>(value & 0xFF));
}

void putU16(std::string& out, uint16_t value) {
    out.push_back(static_cast<char>((value >> 8) & 0xFF));
    out.push_back(static_cast<char>(value & 0xFF));
}

auto getU32(std::string_view data, size_t offset) -> uint32_t {
    auto byte = [&](size_t i) {
        return static_cast<uint32_t>(static_cast<uint8_t>(data[offset + i]));
    };
    return (byte(0) << 24) | (byte(1) << 16) | (byte(2) << 8) | byte(3);
}

auto getU16(std::string_view data, size_t offset) -> uint16_t {
    auto hi = static_cast<uint8_t>(data[offset]);
    auto lo = static_cast<uint8_t>(data[offset + 1]);
    return static_cast<uint16_t>((hi << 8) | lo);
}

}  // namespace

auto EnvelopeCodec::encode(const Frame& frame) -> std::string {
    std::string out;
    out.reserve(kHeaderSize + frame.payload.size());
    putU32(out, frame.requestId);
    putU16(out, frame.protocol);
    putU32(out, static_cast<uint32_t>(frame.payload.size()));
    out.append(frame.payload);
    return out;
}

auto EnvelopeCodec::decode(std::string_view data) -> std::optional<Frame> {
    if (data.size() < kHeaderSize) {
        return std::nullopt;
    }

    auto length = getU32(data, 6);
    if (data.size() - kHeaderSize != length) {
        return std::nullopt;
    }

    Frame frame;
    frame.requestId = getU32(data, 0);
    frame.protocol = getU16(data, 4);
    frame.payload.assign(data.substr(kHeaderSize));
    return frame;
}

}  // namespace sweeplink::transport
