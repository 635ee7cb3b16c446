/*
 * feature.hpp
 *
 * Copyright (C) 2024 The sweeplink Authors
 */

/*************************************************

Date: 2024-12

Description: Closed enumeration of normalized device features

**************************************************/

#ifndef SWEEPLINK_CAPABILITY_FEATURE_HPP
#define SWEEPLINK_CAPABILITY_FEATURE_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace sweeplink::capability {

/**
 * @brief Every feature a device can advertise
 */
enum class Feature : uint8_t {
    ShowCleanFinishReason,
    BreakpointResume,
    ReSegment,
    VideoMonitor,
    AnyStateTransitGoto,
    FwFilterObstacle,
    VideoSetting,
    IgnoreUnknownMapObject,
    SetChildLock,
    Carpet,
    MopPath,
    MultiMapSegmentTimer,
    CurrentMapRestore,
    RoomName,
    ShakeMopSet,
    NewCleanHistory,
    FlowLedSetting,
    DustCollectionSetting,
    RpcRetry,
    AvoidCollision,
    SwitchMapMode,
    CustomWaterBoxDistance,
    SmartScene,
    FloorEdit,
    Furniture,
    WashThenCharge,
    RoomTag,
    QuickMapBuilder,
    CarefulSlowMop,
    EggMode,
    CarpetShowOnMap,
    ValleyElectricity,
    Drying,
    BackupMap,
    CustomModeInCleaning,
    SetVolumeInCall,
    CleanEstimate,
    CustomDnd,
    CarpetDeepClean,
    MopBackPwmSet,
    HotWashTowel,
    LedStatusSwitch,
    MultiFloor,
    FetchTimerSummary,
    OrderClean,
    Analysis,
    RemoteControl,
    VoiceControlDebug,
    CustomMode,
    MopForbidden,
    SoftCleanMode,
    CustomCarpet,
    AutoEmptyDock,
    MopWash,
    Matter,
};

inline constexpr size_t kFeatureCount =
    static_cast<size_t>(Feature::Matter) + 1;

/**
 * @brief Stable snake_case name of a feature
 */
[[nodiscard]] auto featureName(Feature feature) noexcept -> std::string_view;

/**
 * @brief Reverse lookup of featureName()
 */
[[nodiscard]] auto featureFromName(std::string_view name)
    -> std::optional<Feature>;

[[nodiscard]] constexpr auto featureIndex(Feature feature) noexcept -> size_t {
    return static_cast<size_t>(feature);
}

}  // namespace sweeplink::capability

#endif  // SWEEPLINK_CAPABILITY_FEATURE_HPP
