/*
 * rule_table.cpp
 *
 * Copyright (C) 2024 The sweeplink Authors
 */

#include "rule_table.hpp"

namespace sweeplink::capability {

namespace {

auto model(const char* shortName) -> std::string {
    return std::string(kModelPrefix) + shortName;
}

}  // namespace

auto defaultFeatureRules() -> RuleTable {
    using F = Feature;

    return {
        // Lower 32 bits of the feature integer
        {F::ShowCleanFinishReason, lowBit(0)},
        {F::BreakpointResume, lowBit(1)},
        {F::ReSegment, lowBit(2)},
        {F::VideoMonitor, anyOf({lowBit(3), productTagAny({tags::kCamera})})},
        {F::AnyStateTransitGoto, lowBit(4)},
        {F::FwFilterObstacle, lowBit(5)},
        {F::VideoSetting, allOf({lowBit(6), productTagAny({tags::kCamera})})},
        {F::IgnoreUnknownMapObject, lowBit(7)},
        {F::SetChildLock, lowBit(8)},
        {F::Carpet, lowBit(9)},
        {F::MopPath, lowBit(11)},
        {F::MultiMapSegmentTimer, lowBit(12)},
        {F::CurrentMapRestore, lowBit(13)},
        {F::RoomName, lowBit(14)},
        {F::ShakeMopSet, lowBit(18)},
        {F::NewCleanHistory, lowBit(22)},
        {F::FlowLedSetting, lowBit(24)},
        {F::DustCollectionSetting, lowBit(25)},
        {F::RpcRetry, lowBit(26)},
        {F::AvoidCollision, lowBit(27)},
        {F::SwitchMapMode, lowBit(28)},
        {F::CustomWaterBoxDistance, lowBit(31)},

        // Upper 32 bits
        {F::SmartScene, highBit(1)},
        {F::FloorEdit, highBit(3)},
        {F::Furniture, highBit(4)},
        {F::WashThenCharge, highBit(5)},
        {F::RoomTag, highBit(6)},
        {F::QuickMapBuilder, highBit(7)},
        {F::CarefulSlowMop, highBit(9)},
        {F::EggMode, highBit(10)},
        {F::CarpetShowOnMap, highBit(12)},
        {F::ValleyElectricity, highBit(13)},
        {F::Drying, highBit(15)},
        {F::BackupMap, highBit(17)},
        {F::CustomModeInCleaning, highBit(18)},

        // Hex feature string
        {F::SetVolumeInCall, hexMask(0x8)},
        {F::CleanEstimate, hexMask(0x10)},
        {F::CustomDnd, hexMask(0x20)},
        {F::CarpetDeepClean, hexBit(13)},
        {F::MopBackPwmSet, hexBit(28)},
        {F::HotWashTowel,
         allOf({hexBit(33), productTagAny({tags::kMopWashDock})})},

        // Feature id list
        {F::LedStatusSwitch, featureId(119)},
        {F::MultiFloor, featureId(120)},
        {F::FetchTimerSummary, featureId(121)},
        {F::OrderClean, featureId(122)},
        {F::Analysis, featureId(123)},
        {F::RemoteControl,
         anyOf({featureId(124), productTagAny({tags::kRemoteControl})})},
        {F::VoiceControlDebug, featureId(125)},

        // Model lists
        {F::CustomMode, modelNotIn({model("s5"), model("s6"), model("m1s")})},
        {F::MopForbidden, modelIn({model("a27"), model("a70"), model("a51")})},
        {F::SoftCleanMode, modelIn({model("a70"), model("a51")})},
        {F::CustomCarpet, modelIn({model("a70")})},

        // Product tags
        {F::AutoEmptyDock, productTagAny({tags::kAutoEmptyDock})},
        {F::MopWash, productTagAny({tags::kMopWashDock})},
        {F::Matter, productTagAny({tags::kMatter})},
    };
}

auto defaultKnownModels() -> std::set<std::string> {
    return {model("s5"),  model("s6"),  model("m1s"), model("a15"),
            model("a27"), model("a51"), model("a70")};
}

}  // namespace sweeplink::capability
