/*
 * engine.hpp
 *
 * Copyright (C) 2024 The sweeplink Authors
 */

/*************************************************

Date: 2024-12

Description: Capability engine: descriptor + override -> CapabilitySet

**************************************************/

#ifndef SWEEPLINK_CAPABILITY_ENGINE_HPP
#define SWEEPLINK_CAPABILITY_ENGINE_HPP

#include <optional>
#include <set>
#include <string>

#include "capability_set.hpp"
#include "inventory/types.hpp"
#include "rule_table.hpp"

namespace sweeplink::capability {

/**
 * @brief Deterministic decoder of a device's static feature encodings
 *
 * compute() is pure and total: it holds no mutable state, never throws for
 * unknown input and is safe to call concurrently.
 */
class CapabilityEngine {
public:
    explicit CapabilityEngine(RuleTable rules = defaultFeatureRules(),
                              std::set<std::string> knownModels =
                                  defaultKnownModels());

    /**
     * @brief Compute the capability set of a device
     *
     * True entries of a matching override are OR-ed in; an override for
     * another device or firmware version is ignored.
     */
    [[nodiscard]] auto compute(
        const inventory::DeviceDescriptor& descriptor,
        const std::optional<inventory::CapabilityOverride>& overrideRecord =
            std::nullopt) const -> CapabilitySet;

    [[nodiscard]] auto isKnownModel(const std::string& model) const -> bool;

    /**
     * @brief Whether an override still applies to the descriptor
     */
    [[nodiscard]] static auto overrideApplies(
        const inventory::DeviceDescriptor& descriptor,
        const inventory::CapabilityOverride& overrideRecord) -> bool;

private:
    RuleTable rules_;
    std::set<std::string> knownModels_;
};

}  // namespace sweeplink::capability

#endif  // SWEEPLINK_CAPABILITY_ENGINE_HPP
