/*
 * file_cache.cpp
 *
 * Copyright (C) 2024 The sweeplink Authors
 */

#include "file_cache.hpp"

#include <fstream>
#include <system_error>

#include "exception/exception.hpp"
#include "logging/logging.hpp"

namespace sweeplink::inventory {

using json = nlohmann::json;

FileCache::FileCache(std::filesystem::path path) : path_(std::move(path)) {}

auto FileCache::readDocument() -> json {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        return json::object();
    }

    std::ifstream file(path_);
    if (!file) {
        logging::getLogger("cache")->warn("Cannot open cache file {}",
                                          path_.string());
        return json::object();
    }

    try {
        auto document = json::parse(file);
        if (!document.is_object()) {
            logging::getLogger("cache")->warn(
                "Cache file {} is not a JSON object, ignoring it",
                path_.string());
            return json::object();
        }
        return document;
    } catch (const json::parse_error& e) {
        logging::getLogger("cache")->warn("Corrupt cache file {}: {}",
                                          path_.string(), e.what());
        return json::object();
    }
}

void FileCache::writeDocument(const json& document) {
    auto tmpPath = path_;
    tmpPath += ".tmp";

    std::error_code ec;
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec) {
            throw CacheUnavailable("cannot create cache directory " +
                                   path_.parent_path().string() + ": " +
                                   ec.message());
        }
    }

    {
        std::ofstream file(tmpPath, std::ios::trunc);
        if (!file) {
            throw CacheUnavailable("cannot write cache file " +
                                   tmpPath.string());
        }
        file << document.dump(2);
        file.flush();
        if (!file) {
            throw CacheUnavailable("failed writing cache file " +
                                   tmpPath.string());
        }
    }

    std::filesystem::rename(tmpPath, path_, ec);
    if (ec) {
        std::filesystem::remove(tmpPath, ec);
        throw CacheUnavailable("cannot replace cache file " + path_.string());
    }
}

auto FileCache::loadInventory() -> std::optional<InventorySnapshot> {
    std::lock_guard lock(mutex_);
    auto document = readDocument();
    if (!document.contains("inventory")) {
        return std::nullopt;
    }

    try {
        return InventorySnapshot::fromJson(document["inventory"]);
    } catch (const ProtocolViolation& e) {
        logging::getLogger("cache")->warn(
            "Discarding cached inventory from {}: {}", path_.string(),
            e.what());
        return std::nullopt;
    }
}

void FileCache::storeInventory(const InventorySnapshot& snapshot) {
    std::lock_guard lock(mutex_);
    auto document = readDocument();
    document["inventory"] = snapshot.toJson();
    writeDocument(document);
    logging::getLogger("cache")->debug("Stored {} devices to {}",
                                       snapshot.size(), path_.string());
}

auto FileCache::loadOverride(const std::string& deviceId)
    -> std::optional<CapabilityOverride> {
    std::lock_guard lock(mutex_);
    auto document = readDocument();
    if (!document.contains("overrides") || !document["overrides"].is_object() ||
        !document["overrides"].contains(deviceId)) {
        return std::nullopt;
    }

    try {
        return CapabilityOverride::fromJson(document["overrides"][deviceId]);
    } catch (const ProtocolViolation& e) {
        logging::getLogger("cache")->warn(
            "Discarding cached override for {}: {}", deviceId, e.what());
        return std::nullopt;
    }
}

void FileCache::storeOverride(const std::string& deviceId,
                              const CapabilityOverride& record) {
    std::lock_guard lock(mutex_);
    auto document = readDocument();
    if (!document.contains("overrides") || !document["overrides"].is_object()) {
        document["overrides"] = json::object();
    }
    document["overrides"][deviceId] = record.toJson();
    writeDocument(document);
}

auto makeCache(const config::CacheConfig& config)
    -> std::shared_ptr<InventoryCache> {
    if (config.path.empty()) {
        logging::getLogger("cache")->debug("Using in-memory inventory cache");
        return std::make_shared<InMemoryCache>();
    }
    logging::getLogger("cache")->info("Using inventory cache file {}",
                                      config.path);
    return std::make_shared<FileCache>(config.path);
}

}  // namespace sweeplink::inventory
