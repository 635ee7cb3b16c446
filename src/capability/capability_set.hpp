/*
 * capability_set.hpp
 *
 * Copyright (C) 2024 The sweeplink Authors
 */

/*************************************************

Date: 2024-12

Description: Normalized, immutable feature set of a device

**************************************************/

#ifndef SWEEPLINK_CAPABILITY_CAPABILITY_SET_HPP
#define SWEEPLINK_CAPABILITY_CAPABILITY_SET_HPP

#include <bitset>
#include <initializer_list>
#include <vector>

#include <nlohmann/json.hpp>

#include "feature.hpp"

namespace sweeplink::capability {

class CapabilitySet {
public:
    using Bits = std::bitset<kFeatureCount>;

    CapabilitySet() = default;
    explicit CapabilitySet(Bits bits) : bits_(bits) {}
    CapabilitySet(std::initializer_list<Feature> features);

    [[nodiscard]] auto supports(Feature feature) const -> bool {
        return bits_.test(featureIndex(feature));
    }

    [[nodiscard]] auto enabledFeatures() const -> std::vector<Feature>;

    [[nodiscard]] auto count() const -> size_t { return bits_.count(); }

    [[nodiscard]] auto bits() const -> const Bits& { return bits_; }

    /**
     * @brief Object of every feature name mapped to its value
     */
    [[nodiscard]] auto toJson() const -> nlohmann::json;

    /**
     * @brief Parse an object of feature name to bool; unknown names ignored
     */
    [[nodiscard]] static auto fromJson(const nlohmann::json& j)
        -> CapabilitySet;

    auto operator==(const CapabilitySet& other) const -> bool = default;

private:
    Bits bits_;
};

}  // namespace sweeplink::capability

#endif  // SWEEPLINK_CAPABILITY_CAPABILITY_SET_HPP
