/*
 * sink_factory.cpp
 *
 * Copyright (C) 2024 The sweeplink Authors
 */

#include "sink_factory.hpp"

#include <filesystem>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace sweeplink::logging {

auto SinkFactory::createSink(const SinkConfig& config) -> spdlog::sink_ptr {
    auto kind = config.kind();
    if (!kind) {
        spdlog::warn("Skipping log sink '{}' of unknown type '{}'",
                     config.name, config.type);
        return nullptr;
    }

    spdlog::sink_ptr sink;
    try {
        sink = build(*kind, config);
    } catch (const std::exception& e) {
        spdlog::error("Cannot create {} log sink '{}': {}", sinkKindName(*kind),
                      config.name, e.what());
        return nullptr;
    }
    if (!sink) {
        return nullptr;
    }

    sink->set_level(config.level);
    if (!config.pattern.empty()) {
        sink->set_pattern(config.pattern);
    }
    return sink;
}

auto SinkFactory::createSinks(const std::vector<SinkConfig>& configs)
    -> std::vector<spdlog::sink_ptr> {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.reserve(configs.size());
    for (const auto& config : configs) {
        if (auto sink = createSink(config)) {
            sinks.push_back(std::move(sink));
        }
    }
    if (sinks.empty()) {
        sinks.push_back(createConsoleSink());
    }
    return sinks;
}

auto SinkFactory::createConsoleSink() -> spdlog::sink_ptr {
    return std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
}

auto SinkFactory::build(SinkKind kind, const SinkConfig& config)
    -> spdlog::sink_ptr {
    if (kind == SinkKind::Console) {
        return createConsoleSink();
    }

    if (config.filePath.empty()) {
        spdlog::warn("Log sink '{}' of type {} has no filePath", config.name,
                     sinkKindName(kind));
        return nullptr;
    }
    std::filesystem::path path(config.filePath);
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }

    if (kind == SinkKind::RotatingFile) {
        return std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.filePath, config.maxFileSize, config.maxFiles);
    }
    return std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.filePath,
                                                               false);
}

}  // namespace sweeplink::logging
