/*
 * rule_table.hpp
 *
 * Copyright (C) 2024 The sweeplink Authors
 */

/*************************************************

Date: 2024-12

Description: Default feature rule table and model catalogue

**************************************************/

#ifndef SWEEPLINK_CAPABILITY_RULE_TABLE_HPP
#define SWEEPLINK_CAPABILITY_RULE_TABLE_HPP

#include <set>
#include <string>
#include <vector>

#include "feature.hpp"
#include "rule.hpp"

namespace sweeplink::capability {

/**
 * @brief A feature bound to the rule that enables it
 *
 * Several entries for the same feature are OR-ed.
 */
struct FeatureRule {
    Feature feature;
    Rule rule;
};

using RuleTable = std::vector<FeatureRule>;

inline constexpr std::string_view kModelPrefix = "roborock.vacuum.";

namespace tags {
inline constexpr const char* kCamera = "CAMERA";
inline constexpr const char* kMopWashDock = "MOP_WASH_DOCK";
inline constexpr const char* kAutoEmptyDock = "AUTO_EMPTY_DOCK";
inline constexpr const char* kRemoteControl = "REMOTE_CONTROL";
inline constexpr const char* kMatter = "MATTER";
}  // namespace tags

[[nodiscard]] auto defaultFeatureRules() -> RuleTable;

/**
 * @brief Full model names the model-list rules have knowledge of
 */
[[nodiscard]] auto defaultKnownModels() -> std::set<std::string>;

}  // namespace sweeplink::capability

#endif  // SWEEPLINK_CAPABILITY_RULE_TABLE_HPP
