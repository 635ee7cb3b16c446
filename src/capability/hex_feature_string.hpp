/*
 * hex_feature_string.hpp
 *
 * Copyright (C) 2024 The sweeplink Authors
 */

/*************************************************

Date: 2024-12

Description: Arbitrary-length hexadecimal feature flags

**************************************************/

#ifndef SWEEPLINK_CAPABILITY_HEX_FEATURE_STRING_HPP
#define SWEEPLINK_CAPABILITY_HEX_FEATURE_STRING_HPP

#include <cstdint>
#include <string_view>
#include <vector>

namespace sweeplink::capability {

/**
 * @brief Big-integer view of a hexadecimal feature string
 *
 * The rightmost character is the least-significant nibble. A string with
 * any non-hex character is treated as empty, so every test is false.
 */
class HexFeatureString {
public:
    HexFeatureString() = default;
    explicit HexFeatureString(std::string_view text);

    /**
     * @brief Test a single absolute bit index
     */
    [[nodiscard]] auto testBit(uint32_t bit) const noexcept -> bool;

    /**
     * @brief True when any bit of the mask is set in the low 64 bits
     */
    [[nodiscard]] auto testMask(uint64_t mask) const noexcept -> bool;

    [[nodiscard]] auto empty() const noexcept -> bool {
        return nibbles_.empty();
    }

    /**
     * @brief Number of addressable bits
     */
    [[nodiscard]] auto bitWidth() const noexcept -> size_t {
        return nibbles_.size() * 4;
    }

private:
    std::vector<uint8_t> nibbles_;  // least-significant first
};

}  // namespace sweeplink::capability

#endif  // SWEEPLINK_CAPABILITY_HEX_FEATURE_STRING_HPP
