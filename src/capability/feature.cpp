/*
 * feature.cpp
 *
 * Copyright (C) 2024 The sweeplink Authors
 */

#include "feature.hpp"

#include <array>

namespace sweeplink::capability {

namespace {

constexpr std::array<std::string_view, kFeatureCount> kFeatureNames = {
    "show_clean_finish_reason",
    "breakpoint_resume",
    "re_segment",
    "video_monitor",
    "any_state_transit_goto",
    "fw_filter_obstacle",
    "video_setting",
    "ignore_unknown_map_object",
    "set_child_lock",
    "carpet",
    "mop_path",
    "multi_map_segment_timer",
    "current_map_restore",
    "room_name",
    "shake_mop_set",
    "new_clean_history",
    "flow_led_setting",
    "dust_collection_setting",
    "rpc_retry",
    "avoid_collision",
    "switch_map_mode",
    "custom_water_box_distance",
    "smart_scene",
    "floor_edit",
    "furniture",
    "wash_then_charge",
    "room_tag",
    "quick_map_builder",
    "careful_slow_mop",
    "egg_mode",
    "carpet_show_on_map",
    "valley_electricity",
    "drying",
    "backup_map",
    "custom_mode_in_cleaning",
    "set_volume_in_call",
    "clean_estimate",
    "custom_dnd",
    "carpet_deep_clean",
    "mop_back_pwm_set",
    "hot_wash_towel",
    "led_status_switch",
    "multi_floor",
    "fetch_timer_summary",
    "order_clean",
    "analysis",
    "remote_control",
    "voice_control_debug",
    "custom_mode",
    "mop_forbidden",
    "soft_clean_mode",
    "custom_carpet",
    "auto_empty_dock",
    "mop_wash",
    "matter",
};

}  // namespace

auto featureName(Feature feature) noexcept -> std::string_view {
    auto index = featureIndex(feature);
    return index < kFeatureNames.size() ? kFeatureNames[index] : "unknown";
}

auto featureFromName(std::string_view name) -> std::optional<Feature> {
    for (size_t i = 0; i < kFeatureNames.size(); ++i) {
        if (kFeatureNames[i] == name) {
            return static_cast<Feature>(i);
        }
    }
    return std::nullopt;
}

}  // namespace sweeplink::capability
