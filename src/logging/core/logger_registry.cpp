/*
 * logger_registry.cpp
 *
 * Copyright (C) 2024 The sweeplink Authors
 */

#include "logger_registry.hpp"

#include <mutex>

#include "../sinks/sink_factory.hpp"

namespace sweeplink::logging {

auto LoggerRegistry::makeEntry(const std::string& name) const -> Entry {
    auto sinks = sinks_;
    if (sinks.empty()) {
        sinks.push_back(SinkFactory::createConsoleSink());
    }

    Entry entry;
    entry.logger =
        std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    entry.pattern = pattern_;
    entry.logger->set_pattern(pattern_);
    entry.logger->flush_on(flushLevel_);

    auto pinned = components_.find(name);
    entry.pinned = pinned != components_.end();
    entry.logger->set_level(entry.pinned ? pinned->second : level_);
    return entry;
}

void LoggerRegistry::configure(std::vector<spdlog::sink_ptr> sinks,
                               const LoggingConfig& config) {
    std::unique_lock lock(mutex_);
    sinks_ = std::move(sinks);
    level_ = config.level;
    flushLevel_ = config.flushLevel;
    pattern_ = config.pattern;
    components_ = config.components;

    for (auto& [name, entry] : loggers_) {
        entry.logger->flush();
        entry.logger->sinks() = sinks_;
        entry.logger->set_pattern(pattern_);
        entry.logger->flush_on(flushLevel_);
        entry.pattern = pattern_;
        entry.pinned = components_.contains(name);
        entry.logger->set_level(config.levelFor(name));
    }
}

auto LoggerRegistry::getOrCreate(const std::string& name)
    -> std::shared_ptr<spdlog::logger> {
    {
        std::shared_lock lock(mutex_);
        if (auto it = loggers_.find(name); it != loggers_.end()) {
            return it->second.logger;
        }
    }

    std::unique_lock lock(mutex_);
    auto [it, inserted] = loggers_.try_emplace(name);
    if (inserted) {
        it->second = makeEntry(name);
    }
    return it->second.logger;
}

auto LoggerRegistry::get(const std::string& name) const
    -> std::shared_ptr<spdlog::logger> {
    std::shared_lock lock(mutex_);
    auto it = loggers_.find(name);
    return it != loggers_.end() ? it->second.logger : nullptr;
}

auto LoggerRegistry::exists(const std::string& name) const -> bool {
    std::shared_lock lock(mutex_);
    return loggers_.contains(name);
}

auto LoggerRegistry::remove(const std::string& name) -> bool {
    std::unique_lock lock(mutex_);
    auto it = loggers_.find(name);
    if (it == loggers_.end()) {
        return false;
    }
    it->second.logger->flush();
    loggers_.erase(it);
    return true;
}

auto LoggerRegistry::list() const -> std::vector<LoggerInfo> {
    std::shared_lock lock(mutex_);
    std::vector<LoggerInfo> result;
    result.reserve(loggers_.size());
    for (const auto& [name, entry] : loggers_) {
        result.push_back({.name = name,
                          .level = entry.logger->level(),
                          .pattern = entry.pattern,
                          .sinkCount = entry.logger->sinks().size(),
                          .pinned = entry.pinned});
    }
    return result;
}

auto LoggerRegistry::setLevel(const std::string& name, Level level) -> bool {
    std::unique_lock lock(mutex_);
    auto it = loggers_.find(name);
    if (it == loggers_.end()) {
        return false;
    }
    it->second.logger->set_level(level);
    it->second.pinned = true;
    components_[name] = level;
    return true;
}

void LoggerRegistry::setDefaultLevel(Level level) {
    std::unique_lock lock(mutex_);
    level_ = level;
    for (auto& [name, entry] : loggers_) {
        if (!entry.pinned) {
            entry.logger->set_level(level);
        }
    }
}

auto LoggerRegistry::defaultLevel() const -> Level {
    std::shared_lock lock(mutex_);
    return level_;
}

auto LoggerRegistry::setPattern(const std::string& name,
                                const std::string& pattern) -> bool {
    std::unique_lock lock(mutex_);
    auto it = loggers_.find(name);
    if (it == loggers_.end()) {
        return false;
    }
    it->second.logger->set_pattern(pattern);
    it->second.pattern = pattern;
    return true;
}

auto LoggerRegistry::getPattern(const std::string& name) const
    -> std::string {
    std::shared_lock lock(mutex_);
    auto it = loggers_.find(name);
    return it != loggers_.end() ? it->second.pattern : std::string();
}

auto LoggerRegistry::sinks() const -> std::vector<spdlog::sink_ptr> {
    std::shared_lock lock(mutex_);
    return sinks_;
}

void LoggerRegistry::flushAll() {
    std::shared_lock lock(mutex_);
    for (const auto& [name, entry] : loggers_) {
        entry.logger->flush();
    }
}

void LoggerRegistry::clear() {
    std::unique_lock lock(mutex_);
    for (const auto& [name, entry] : loggers_) {
        entry.logger->flush();
    }
    loggers_.clear();
}

auto LoggerRegistry::count() const -> size_t {
    std::shared_lock lock(mutex_);
    return loggers_.size();
}

}  // namespace sweeplink::logging
