/*
 * rule.cpp
 *
 * Copyright (C) 2024 The sweeplink Authors
 */

#include "rule.hpp"

#include <algorithm>
#include <type_traits>

namespace sweeplink::capability {

namespace {

constexpr uint32_t kHalfWidth = 32;

auto testHalf(uint64_t value, uint32_t bit) noexcept -> bool {
    if (bit >= kHalfWidth) {
        return false;
    }
    return ((value >> bit) & 0x1ULL) != 0;
}

}  // namespace

auto evaluate(const Rule& rule, const RuleContext& context) -> bool {
    return std::visit(
        [&context](const auto& node) -> bool {
            using T = std::decay_t<decltype(node)>;

            if constexpr (std::is_same_v<T, LowBit>) {
                return testHalf(context.featureBits & 0xFFFFFFFFULL, node.bit);
            } else if constexpr (std::is_same_v<T, HighBit>) {
                return testHalf(context.featureBits >> kHalfWidth, node.bit);
            } else if constexpr (std::is_same_v<T, HexMask>) {
                return context.featureString.testMask(node.mask);
            } else if constexpr (std::is_same_v<T, HexBit>) {
                return context.featureString.testBit(node.bit);
            } else if constexpr (std::is_same_v<T, FeatureIdIn>) {
                return std::find(context.featureIds.begin(),
                                 context.featureIds.end(),
                                 node.id) != context.featureIds.end();
            } else if constexpr (std::is_same_v<T, ModelIn>) {
                return context.modelKnown &&
                       node.models.contains(std::string(context.model));
            } else if constexpr (std::is_same_v<T, ModelNotIn>) {
                return context.modelKnown &&
                       !node.models.contains(std::string(context.model));
            } else if constexpr (std::is_same_v<T, ProductTagAny>) {
                return std::any_of(node.tags.begin(), node.tags.end(),
                                   [&context](const std::string& tag) {
                                       return context.productTags.contains(tag);
                                   });
            } else {
                auto check = [&context](const Rule& child) {
                    return evaluate(child, context);
                };
                if (node.op == Composite::Op::All) {
                    return !node.children.empty() &&
                           std::all_of(node.children.begin(),
                                       node.children.end(), check);
                }
                return std::any_of(node.children.begin(), node.children.end(),
                                   check);
            }
        },
        rule.node);
}

auto lowBit(uint32_t bit) -> Rule { return Rule{LowBit{bit}}; }

auto highBit(uint32_t bit) -> Rule { return Rule{HighBit{bit}}; }

auto hexMask(uint64_t mask) -> Rule { return Rule{HexMask{mask}}; }

auto hexBit(uint32_t bit) -> Rule { return Rule{HexBit{bit}}; }

auto featureId(int id) -> Rule { return Rule{FeatureIdIn{id}}; }

auto modelIn(std::initializer_list<std::string> models) -> Rule {
    return Rule{ModelIn{std::set<std::string>(models)}};
}

auto modelNotIn(std::initializer_list<std::string> models) -> Rule {
    return Rule{ModelNotIn{std::set<std::string>(models)}};
}

auto productTagAny(std::initializer_list<std::string> tags) -> Rule {
    return Rule{ProductTagAny{std::set<std::string>(tags)}};
}

auto allOf(std::initializer_list<Rule> children) -> Rule {
    return Rule{Composite{Composite::Op::All, std::vector<Rule>(children)}};
}

auto anyOf(std::initializer_list<Rule> children) -> Rule {
    return Rule{Composite{Composite::Op::Any, std::vector<Rule>(children)}};
}

}  // namespace sweeplink::capability
