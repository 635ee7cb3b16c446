/*
 * rule.hpp
 *
 * Copyright (C) 2024 The sweeplink Authors
 */

/*************************************************

Date: 2024-12

Description: Declarative feature rules and their interpreter

**************************************************/

#ifndef SWEEPLINK_CAPABILITY_RULE_HPP
#define SWEEPLINK_CAPABILITY_RULE_HPP

#include <cstdint>
#include <initializer_list>
#include <set>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "hex_feature_string.hpp"

namespace sweeplink::capability {

struct Rule;

/// Bit n (0-31) of the lower half of the 64-bit feature integer
struct LowBit {
    uint32_t bit;
};

/// Bit n (0-31) of the upper half of the 64-bit feature integer
struct HighBit {
    uint32_t bit;
};

/// Any bit of the mask set in the hex feature string
struct HexMask {
    uint64_t mask;
};

/// Absolute bit index of the hex feature string
struct HexBit {
    uint32_t bit;
};

/// Feature id present in the device's id list
struct FeatureIdIn {
    int id;
};

/// Known model contained in the list
struct ModelIn {
    std::set<std::string> models;
};

/// Known model absent from the list
struct ModelNotIn {
    std::set<std::string> models;
};

/// Device carries at least one of the tags
struct ProductTagAny {
    std::set<std::string> tags;
};

struct Composite {
    enum class Op : uint8_t { All, Any };

    Op op;
    std::vector<Rule> children;
};

struct Rule {
    std::variant<LowBit, HighBit, HexMask, HexBit, FeatureIdIn, ModelIn,
                 ModelNotIn, ProductTagAny, Composite>
        node;
};

/**
 * @brief Inputs a rule is evaluated against
 *
 * All references must outlive the evaluation.
 */
struct RuleContext {
    uint64_t featureBits{0};
    const HexFeatureString& featureString;
    const std::vector<int>& featureIds;
    std::string_view model;
    bool modelKnown{false};
    const std::set<std::string>& productTags;
};

[[nodiscard]] auto evaluate(const Rule& rule, const RuleContext& context)
    -> bool;

// Builders

[[nodiscard]] auto lowBit(uint32_t bit) -> Rule;
[[nodiscard]] auto highBit(uint32_t bit) -> Rule;
[[nodiscard]] auto hexMask(uint64_t mask) -> Rule;
[[nodiscard]] auto hexBit(uint32_t bit) -> Rule;
[[nodiscard]] auto featureId(int id) -> Rule;
[[nodiscard]] auto modelIn(std::initializer_list<std::string> models) -> Rule;
[[nodiscard]] auto modelNotIn(std::initializer_list<std::string> models)
    -> Rule;
[[nodiscard]] auto productTagAny(std::initializer_list<std::string> tags)
    -> Rule;
[[nodiscard]] auto allOf(std::initializer_list<Rule> children) -> Rule;
[[nodiscard]] auto anyOf(std::initializer_list<Rule> children) -> Rule;

}  // namespace sweeplink::capability

#endif  // SWEEPLINK_CAPABILITY_RULE_HPP
