/*
 * capability_set.cpp
 *
 * Copyright (C) 2024 The sweeplink Authors
 */

#include "capability_set.hpp"

#include <string>

namespace sweeplink::capability {

CapabilitySet::CapabilitySet(std::initializer_list<Feature> features) {
    for (auto feature : features) {
        bits_.set(featureIndex(feature));
    }
}

auto CapabilitySet::enabledFeatures() const -> std::vector<Feature> {
    std::vector<Feature> result;
    result.reserve(bits_.count());
    for (size_t i = 0; i < kFeatureCount; ++i) {
        if (bits_.test(i)) {
            result.push_back(static_cast<Feature>(i));
        }
    }
    return result;
}

auto CapabilitySet::toJson() const -> nlohmann::json {
    nlohmann::json j = nlohmann::json::object();
    for (size_t i = 0; i < kFeatureCount; ++i) {
        j[std::string(featureName(static_cast<Feature>(i)))] = bits_.test(i);
    }
    return j;
}

auto CapabilitySet::fromJson(const nlohmann::json& j) -> CapabilitySet {
    Bits bits;
    if (!j.is_object()) {
        return CapabilitySet(bits);
    }
    for (const auto& [name, value] : j.items()) {
        auto feature = featureFromName(name);
        if (feature && value.is_boolean() && value.get<bool>()) {
            bits.set(featureIndex(*feature));
        }
    }
    return CapabilitySet(bits);
}

}  // namespace sweeplink::capability
