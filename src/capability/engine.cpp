/*
 * engine.cpp
 *
 * Copyright (C) 2024 The sweeplink Authors
 */

#include "engine.hpp"

#include "logging/logging.hpp"

namespace sweeplink::capability {

CapabilityEngine::CapabilityEngine(RuleTable rules,
                                   std::set<std::string> knownModels)
    : rules_(std::move(rules)), knownModels_(std::move(knownModels)) {}

auto CapabilityEngine::compute(
    const inventory::DeviceDescriptor& descriptor,
    const std::optional<inventory::CapabilityOverride>& overrideRecord) const
    -> CapabilitySet {
    HexFeatureString featureString(descriptor.featureString);
    RuleContext context{.featureBits = descriptor.featureBits,
                        .featureString = featureString,
                        .featureIds = descriptor.featureIds,
                        .model = descriptor.model,
                        .modelKnown = isKnownModel(descriptor.model),
                        .productTags = descriptor.productTags};

    CapabilitySet::Bits bits;
    for (const auto& entry : rules_) {
        auto index = featureIndex(entry.feature);
        if (!bits.test(index) && evaluate(entry.rule, context)) {
            bits.set(index);
        }
    }

    if (overrideRecord) {
        if (overrideApplies(descriptor, *overrideRecord)) {
            for (const auto& [feature, enabled] : overrideRecord->features) {
                if (enabled) {
                    bits.set(featureIndex(feature));
                }
            }
        } else {
            logging::getLogger("capability")
                ->debug("Ignoring override for {} (firmware {} != {})",
                        descriptor.duid, overrideRecord->firmwareVersion,
                        descriptor.firmwareVersion);
        }
    }

    return CapabilitySet(bits);
}

auto CapabilityEngine::isKnownModel(const std::string& model) const -> bool {
    return knownModels_.contains(model);
}

auto CapabilityEngine::overrideApplies(
    const inventory::DeviceDescriptor& descriptor,
    const inventory::CapabilityOverride& overrideRecord) -> bool {
    return overrideRecord.deviceId == descriptor.duid &&
           overrideRecord.firmwareVersion == descriptor.firmwareVersion;
}

}  // namespace sweeplink::capability
