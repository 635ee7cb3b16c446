/*
 * types.hpp
 *
 * Copyright (C) 2024 The sweeplink Authors
 */

/*************************************************

Date: 2024-12

Description: Logging configuration types

**************************************************/

#ifndef SWEEPLINK_LOGGING_TYPES_HPP
#define SWEEPLINK_LOGGING_TYPES_HPP

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace sweeplink::logging {

using Level = spdlog::level::level_enum;

/**
 * @brief Snapshot of one component logger
 */
struct LoggerInfo {
    std::string name;
    Level level{Level::info};
    std::string pattern;
    size_t sinkCount{0};
    bool pinned{false};  // level set per component, unaffected by the default

    [[nodiscard]] auto toJson() const -> nlohmann::json;
};

enum class SinkKind { Console, File, RotatingFile };

/**
 * @brief Parse a sink type name; "stdout" and "basic_file" are aliases
 */
[[nodiscard]] auto sinkKindFromString(std::string_view type)
    -> std::optional<SinkKind>;

[[nodiscard]] auto sinkKindName(SinkKind kind) -> std::string_view;

/**
 * @brief One output of the log stream
 *
 * JSON keys: name, type, level, pattern, filePath, maxFileSize, maxFiles.
 * The type is kept verbatim so that unknown types can be reported.
 */
struct SinkConfig {
    std::string name;
    std::string type{"console"};
    Level level{Level::trace};
    std::string pattern;

    std::string filePath;
    size_t maxFileSize{10 * 1024 * 1024};
    size_t maxFiles{5};

    [[nodiscard]] auto kind() const -> std::optional<SinkKind> {
        return sinkKindFromString(type);
    }

    [[nodiscard]] auto toJson() const -> nlohmann::json;
    [[nodiscard]] static auto fromJson(const nlohmann::json& j) -> SinkConfig;
};

/**
 * @brief The "logging" section of the fleet configuration
 *
 * @code
 * {
 *   "level": "info",
 *   "pattern": "...",
 *   "flushLevel": "warn",
 *   "components": { "transport": "debug" },
 *   "sinks": [ { "type": "console" } ]
 * }
 * @endcode
 *
 * An empty sink list means a single colour console sink. Components listed
 * under "components" keep their level when the default level changes.
 */
struct LoggingConfig {
    Level level{Level::info};
    std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [%t] %v"};
    Level flushLevel{Level::warn};
    std::map<std::string, Level> components;
    std::vector<SinkConfig> sinks;

    /**
     * @brief Level a component logger should run at
     */
    [[nodiscard]] auto levelFor(const std::string& component) const -> Level;

    [[nodiscard]] auto toJson() const -> nlohmann::json;
    [[nodiscard]] static auto fromJson(const nlohmann::json& j)
        -> LoggingConfig;
};

/**
 * @brief Parse a level name; unrecognised names map to info
 */
[[nodiscard]] auto levelFromString(std::string_view level) -> Level;

[[nodiscard]] auto levelToString(Level level) -> std::string;

}  // namespace sweeplink::logging

#endif  // SWEEPLINK_LOGGING_TYPES_HPP
