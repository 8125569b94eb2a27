/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file config.cpp
 * @brief cJSON-backed parsing of logger configuration documents.
 *
 * @details
 * The document is parsed once into a cJSON tree, each recognized key is
 * validated and copied into a `Config`, and the tree is released. Validation
 * errors carry the name of the offending key so that a broken config file can
 * be fixed without reading the source.
 */

#include "chromalog/config/config.hpp"

#include "chromalog/infra/string.hpp"

#include <cJSON.h>
#include <fstream>
#include <iostream>
#include <sstream>
#include <utility>

namespace chromalog::config {

namespace {

/// @brief Owns a parsed cJSON tree and releases it on every exit path.
using JsonPtr = std::unique_ptr<cJSON, decltype(&cJSON_Delete)>;

/**
 * @brief Reads a level given either by name or as an integer in 0..5.
 */
int read_level(const cJSON* item, const char* key)
{
    if (cJSON_IsString(item) && item->valuestring) {
        auto level = core::parse_level(item->valuestring);
        if (!level) {
            throw ConfigError(std::string("'") + key + "': unknown level '" + item->valuestring +
                              "'");
        }
        return *level;
    }
    if (cJSON_IsNumber(item)) {
        int value = item->valueint;
        if (value < core::TRACE || value > core::FATAL ||
            static_cast<double>(value) != item->valuedouble) {
            throw ConfigError(std::string("'") + key + "': level out of range");
        }
        return value;
    }
    throw ConfigError(std::string("'") + key + "': expected a level name or number");
}

int read_flags(const cJSON* item)
{
    if (cJSON_IsNumber(item)) {
        if (item->valueint < 0 || static_cast<double>(item->valueint) != item->valuedouble) {
            throw ConfigError("'flags': expected a non-negative integer bitset");
        }
        return item->valueint;
    }
    if (!cJSON_IsArray(item)) {
        throw ConfigError("'flags': expected an array of flag names or a number");
    }

    int flags = 0;
    const cJSON* entry = nullptr;
    cJSON_ArrayForEach(entry, item)
    {
        if (!cJSON_IsString(entry) || !entry->valuestring) {
            throw ConfigError("'flags': every entry must be a string");
        }
        flags |= parse_flag(entry->valuestring);
    }
    return flags;
}

std::string read_string(const cJSON* item, const char* key)
{
    if (!cJSON_IsString(item) || !item->valuestring) {
        throw ConfigError(std::string("'") + key + "': expected a string");
    }
    return item->valuestring;
}

} // namespace

int parse_flag(const std::string& name)
{
    std::string key = infra::String::to_lower(infra::String::trim(name));

    if (key == "date")
        return core::kDate;
    if (key == "time")
        return core::kTime;
    if (key == "microseconds")
        return core::kMicroseconds;
    if (key == "longfile")
        return core::kLongFile;
    if (key == "shortfile")
        return core::kShortFile;
    if (key == "color")
        return core::kColor;
    if (key == "level")
        return core::kLevel;
    if (key == "utc")
        return core::kUTC;
    if (key == "std")
        return core::kStdFlags;
    if (key == "default")
        return core::kDefaultFlags;

    throw ConfigError("'flags': unknown flag '" + name + "'");
}

/**
 * @brief Parses a configuration document.
 *
 * Pipeline:
 * 1. **Ingest**: `cJSON_Parse`, rejecting malformed input and non-object roots.
 * 2. **Decode**: Each recognized key is type-checked and converted.
 * 3. **Release**: The tree is freed by `JsonPtr`, including on exceptions.
 */
Config Config::parse(const std::string& json)
{
    JsonPtr root(cJSON_Parse(json.c_str()), cJSON_Delete);
    if (!root) {
        throw ConfigError("invalid JSON syntax");
    }
    if (!cJSON_IsObject(root.get())) {
        throw ConfigError("configuration root must be a JSON object");
    }

    Config config;

    if (const cJSON* item = cJSON_GetObjectItem(root.get(), "prefix")) {
        config.prefix = read_string(item, "prefix");
    }
    if (const cJSON* item = cJSON_GetObjectItem(root.get(), "flags")) {
        config.flags = read_flags(item);
    }
    if (const cJSON* item = cJSON_GetObjectItem(root.get(), "level_filter")) {
        config.level_filter = read_level(item, "level_filter");
    }
    if (const cJSON* item = cJSON_GetObjectItem(root.get(), "default_level")) {
        config.default_level = read_level(item, "default_level");
    }
    if (const cJSON* item = cJSON_GetObjectItem(root.get(), "output")) {
        config.output = read_string(item, "output");
        if (config.output.empty()) {
            throw ConfigError("'output': must not be empty");
        }
    }

    return config;
}

Config Config::load(const std::string& path)
{
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw ConfigError("cannot read config file '" + path + "'");
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    if (file.bad()) {
        throw ConfigError("I/O error while reading config file '" + path + "'");
    }

    return parse(contents.str());
}

std::shared_ptr<core::Sink> Config::make_sink() const
{
    if (output == "stderr") {
        return std::make_shared<core::StreamSink>(std::cerr);
    }
    if (output == "stdout") {
        return std::make_shared<core::StreamSink>(std::cout);
    }

    try {
        return std::make_shared<core::FileSink>(output);
    } catch (const std::runtime_error& e) {
        throw ConfigError("'output': " + std::string(e.what()));
    }
}

void Config::apply(core::Logger& logger) const
{
    // Open the sink first so that a bad path leaves the logger unchanged.
    auto sink = make_sink();

    logger.set_output(std::move(sink));
    logger.set_flags(flags);
    logger.set_prefix(prefix);
    logger.set_level_filter(level_filter);
    logger.set_default_level(default_level);
}

} // namespace chromalog::config
