/*
 * hex_feature_string.cpp
 *
 * Copyright (C) 2024 The sweeplink Authors
 */

#include "hex_feature_string.hpp"

#include <optional>

namespace sweeplink::capability {

namespace {

auto hexValue(char c) noexcept -> std::optional<uint8_t> {
    if (c >= '0' && c <= '9') {
        return static_cast<uint8_t>(c - '0');
    }
    if (c >= 'a' && c <= 'f') {
        return static_cast<uint8_t>(c - 'a' + 10);
    }
    if (c >= 'A' && c <= 'F') {
        return static_cast<uint8_t>(c - 'A' + 10);
    }
    return std::nullopt;
}

}  // namespace

HexFeatureString::HexFeatureString(std::string_view text) {
    nibbles_.reserve(text.size());
    for (auto it = text.rbegin(); it != text.rend(); ++it) {
        auto value = hexValue(*it);
        if (!value) {
            nibbles_.clear();
            return;
        }
        nibbles_.push_back(*value);
    }
}

auto HexFeatureString::testBit(uint32_t bit) const noexcept -> bool {
    size_t index = bit / 4;
    if (index >= nibbles_.size()) {
        return false;
    }
    return ((nibbles_[index] >> (bit % 4)) & 0x1) != 0;
}

auto HexFeatureString::testMask(uint64_t mask) const noexcept -> bool {
    uint64_t low = 0;
    for (size_t i = 0; i < nibbles_.size() && i < 16; ++i) {
        low |= static_cast<uint64_t>(nibbles_[i]) << (i * 4);
    }
    return (low & mask) != 0;
}

}  // namespace sweeplink::capability
