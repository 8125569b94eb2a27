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
 * @file level.cpp
 * @brief Level names, tags and ANSI colors.
 */

#include "chromalog/core/level.hpp"

#include "chromalog/infra/string.hpp"

#include <string>

namespace chromalog::core {

std::string_view level_name(int level)
{
    switch (level) {
    case TRACE:
        return "TRACE";
    case DEBUG:
        return "DEBUG";
    case INFO:
        return "INFO";
    case WARN:
        return "WARN";
    case ERROR:
        return "ERROR";
    case FATAL:
        return "FATAL";
    }
    return "UNKNOWN";
}

std::optional<Level> parse_level(std::string_view name)
{
    std::string key = infra::String::to_lower(infra::String::trim(std::string(name)));

    if (key == "trace")
        return TRACE;
    if (key == "debug")
        return DEBUG;
    if (key == "info")
        return INFO;
    if (key == "warn" || key == "warning")
        return WARN;
    if (key == "error")
        return ERROR;
    if (key == "fatal")
        return FATAL;
    return std::nullopt;
}

std::string_view level_tag(int level)
{
    switch (level) {
    case TRACE:
        return "[T]";
    case DEBUG:
        return "[D]";
    case INFO:
        return "[I]";
    case WARN:
        return "[W]";
    case ERROR:
        return "[E]";
    case FATAL:
        return "[F]";
    }
    return {};
}

std::string_view level_color(int level)
{
    switch (level) {
    case TRACE:
    case DEBUG:
        // Blue - development chatter.
        return "\x1b[34m";
    case INFO:
        // Green - nominal status.
        return "\x1b[32m";
    case WARN:
        // Yellow - anomalies.
        return "\x1b[33m";
    case ERROR:
    case FATAL:
        // Red - failures.
        return "\x1b[31m";
    }
    return {};
}

} // namespace chromalog::core
