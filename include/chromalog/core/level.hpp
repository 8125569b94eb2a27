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
 * @file level.hpp
 * @brief Severity levels and rendering flag bits.
 *
 * @details
 * Levels are plain ordered integers so that the same value serves both as the
 * tag of a single call and as the threshold of a logger's filter. Flag bits are
 * laid out so that the first five match the conventional minimal-logger layout;
 * the chromalog extensions sit above them.
 */

#pragma once

#include <optional>
#include <string_view>

namespace chromalog::core {

/**
 * @enum Level
 * @brief Ordered severity hierarchy (TRACE < DEBUG < INFO < WARN < ERROR < FATAL).
 *
 * Unscoped on purpose: the pipeline accepts any integer level, and values
 * outside the enumerated range are rendered without color or tag.
 */
enum Level : int {
    TRACE = 0, ///< Granular execution flow details.
    DEBUG = 1, ///< Diagnostic information for development.
    INFO = 2,  ///< Nominal operational events.
    WARN = 3,  ///< Non-blocking anomalies.
    ERROR = 4, ///< Recoverable runtime errors.
    FATAL = 5  ///< Failures that end the process.
};

/// @brief Rendering flag bits. Combine with `|`.
enum Flag : int {
    kDate = 1 << 0,         ///< `YYYY/MM/DD `
    kTime = 1 << 1,         ///< `HH:MM:SS `
    kMicroseconds = 1 << 2, ///< `HH:MM:SS.uuuuuu ` (implies kTime)
    kLongFile = 1 << 3,     ///< Full call-site path.
    kShortFile = 1 << 4,    ///< Base name of the call site; overrides kLongFile.
    kColor = 1 << 5,        ///< ANSI color per level.
    kLevel = 1 << 6,        ///< Bracketed one-letter level tag.
    kUTC = 1 << 7,          ///< Render date and time in UTC.

    kStdFlags = kDate | kTime,
    kDefaultFlags = kStdFlags | kColor | kLevel
};

/**
 * @brief Returns the upper-case name of a level ("TRACE" ... "FATAL").
 * @return "UNKNOWN" for integers outside the enumerated range.
 */
std::string_view level_name(int level);

/**
 * @brief Parses a level name.
 *
 * Matching is case-insensitive and ignores surrounding whitespace. "WARNING"
 * is accepted as an alias of WARN.
 *
 * @param name The textual level, e.g. "warn" or " Error ".
 * @return The level, or std::nullopt if the name is not recognized.
 */
std::optional<Level> parse_level(std::string_view name);

/// @brief Returns the bracketed tag ("[T]" ... "[F]"), empty if unmapped.
std::string_view level_tag(int level);

/// @brief Returns the ANSI color escape for a level, empty if unmapped.
std::string_view level_color(int level);

} // namespace chromalog::core
