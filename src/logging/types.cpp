/*
 * types.cpp
 *
 * Copyright (C) 2024 The sweeplink Authors
 */

#include "types.hpp"

#include <array>
#include <utility>

namespace sweeplink::logging {

namespace {

constexpr std::array<std::pair<std::string_view, Level>, 10> kLevelNames{{
    {"trace", Level::trace},
    {"debug", Level::debug},
    {"info", Level::info},
    {"warn", Level::warn},
    {"warning", Level::warn},
    {"error", Level::err},
    {"err", Level::err},
    {"critical", Level::critical},
    {"fatal", Level::critical},
    {"off", Level::off},
}};

constexpr std::array<std::pair<std::string_view, SinkKind>, 5> kSinkNames{{
    {"console", SinkKind::Console},
    {"stdout", SinkKind::Console},
    {"file", SinkKind::File},
    {"basic_file", SinkKind::File},
    {"rotating_file", SinkKind::RotatingFile},
}};

}  // namespace

// ============================================================================
// Names
// ============================================================================

auto levelFromString(std::string_view level) -> Level {
    for (const auto& [name, value] : kLevelNames) {
        if (name == level) {
            return value;
        }
    }
    return Level::info;
}

auto levelToString(Level level) -> std::string {
    auto sv = spdlog::level::to_string_view(level);
    return std::string(sv.data(), sv.size());
}

auto sinkKindFromString(std::string_view type) -> std::optional<SinkKind> {
    for (const auto& [name, kind] : kSinkNames) {
        if (name == type) {
            return kind;
        }
    }
    return std::nullopt;
}

auto sinkKindName(SinkKind kind) -> std::string_view {
    switch (kind) {
        case SinkKind::Console: return "console";
        case SinkKind::File: return "file";
        case SinkKind::RotatingFile: return "rotating_file";
    }
    return "console";
}

// ============================================================================
// LoggerInfo
// ============================================================================

auto LoggerInfo::toJson() const -> nlohmann::json {
    return {{"name", name},
            {"level", levelToString(level)},
            {"pattern", pattern},
            {"sinks", sinkCount},
            {"pinned", pinned}};
}

// ============================================================================
// SinkConfig
// ============================================================================

auto SinkConfig::toJson() const -> nlohmann::json {
    nlohmann::json j = {{"name", name},
                        {"type", type},
                        {"level", levelToString(level)},
                        {"pattern", pattern}};

    auto sinkKind = kind();
    if (sinkKind == SinkKind::File || sinkKind == SinkKind::RotatingFile) {
        j["filePath"] = filePath;
    }
    if (sinkKind == SinkKind::RotatingFile) {
        j["maxFileSize"] = maxFileSize;
        j["maxFiles"] = maxFiles;
    }
    return j;
}

auto SinkConfig::fromJson(const nlohmann::json& j) -> SinkConfig {
    SinkConfig config;
    config.name = j.value("name", config.name);
    config.type = j.value("type", config.type);
    config.level = levelFromString(j.value("level", std::string("trace")));
    config.pattern = j.value("pattern", config.pattern);
    config.filePath = j.value("filePath", config.filePath);
    config.maxFileSize = j.value("maxFileSize", config.maxFileSize);
    config.maxFiles = j.value("maxFiles", config.maxFiles);
    return config;
}

// ============================================================================
// LoggingConfig
// ============================================================================

auto LoggingConfig::levelFor(const std::string& component) const -> Level {
    auto it = components.find(component);
    return it != components.end() ? it->second : level;
}

auto LoggingConfig::toJson() const -> nlohmann::json {
    nlohmann::json componentsJson = nlohmann::json::object();
    for (const auto& [name, componentLevel] : components) {
        componentsJson[name] = levelToString(componentLevel);
    }

    nlohmann::json sinksJson = nlohmann::json::array();
    for (const auto& sink : sinks) {
        sinksJson.push_back(sink.toJson());
    }

    return {{"level", levelToString(level)},
            {"pattern", pattern},
            {"flushLevel", levelToString(flushLevel)},
            {"components", componentsJson},
            {"sinks", sinksJson}};
}

auto LoggingConfig::fromJson(const nlohmann::json& j) -> LoggingConfig {
    LoggingConfig config;
    config.level = levelFromString(j.value("level", std::string("info")));
    config.pattern = j.value("pattern", config.pattern);
    config.flushLevel =
        levelFromString(j.value("flushLevel", std::string("warn")));

    if (auto it = j.find("components"); it != j.end() && it->is_object()) {
        for (const auto& [name, value] : it->items()) {
            if (value.is_string()) {
                config.components[name] =
                    levelFromString(value.get<std::string>());
            }
        }
    }

    if (auto it = j.find("sinks"); it != j.end() && it->is_array()) {
        for (const auto& sinkJson : *it) {
            config.sinks.push_back(SinkConfig::fromJson(sinkJson));
        }
    }
    return config;
}

}  // namespace sweeplink::logging
