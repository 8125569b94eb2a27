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
 * @file config.hpp
 * @brief JSON configuration for loggers.
 *
 * @details
 * Lets an application keep its logging setup (flags, prefix, levels and the
 * output destination) in a JSON document instead of code. Example document:
 *
 * @code
 * {
 *   "prefix": "kv: ",
 *   "flags": ["date", "microseconds", "shortfile", "level"],
 *   "level_filter": "debug",
 *   "default_level": "info",
 *   "output": "/var/log/kv.log"
 * }
 * @endcode
 */

#pragma once

#include "chromalog/core/level.hpp"
#include "chromalog/core/logger.hpp"
#include "chromalog/core/sink.hpp"

#include <memory>
#include <stdexcept>
#include <string>

namespace chromalog::config {

/**
 * @class ConfigError
 * @brief Raised when a configuration document cannot be read or is invalid.
 */
class ConfigError : public std::runtime_error {
  public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @struct Config
 * @brief Logger settings. Defaults match the process-wide default logger.
 */
struct Config {
    std::string prefix;
    int flags = core::kDefaultFlags;
    int level_filter = core::INFO;
    int default_level = core::INFO;

    /// @brief `"stderr"`, `"stdout"` or a file path to append to.
    std::string output = "stderr";

    /**
     * @brief Parses a JSON document.
     *
     * **Recognized keys** (all optional, unknown keys are ignored):
     * - `prefix`: string.
     * - `flags`: array of flag names (`date`, `time`, `microseconds`,
     *   `longfile`, `shortfile`, `color`, `level`, `utc`, `std`, `default`)
     *   or a number holding the raw bitset.
     * - `level_filter`, `default_level`: level name or integer 0..5.
     * - `output`: non-empty string.
     *
     * @throws ConfigError on malformed JSON, a non-object root, a value of the
     * wrong type, or an unknown flag or level.
     */
    static Config parse(const std::string& json);

    /**
     * @brief Reads and parses the file at `path`.
     * @throws ConfigError if the file cannot be read or is invalid.
     */
    static Config load(const std::string& path);

    /**
     * @brief Creates the sink named by `output`.
     * @throws ConfigError if the output file cannot be opened.
     */
    std::shared_ptr<core::Sink> make_sink() const;

    /**
     * @brief Applies every setting, including the output, to `logger`.
     * @throws ConfigError if the output file cannot be opened; the logger is
     * left untouched in that case.
     */
    void apply(core::Logger& logger) const;
};

/**
 * @brief Maps a flag name to its bit(s).
 * @throws ConfigError for an unknown name.
 */
int parse_flag(const std::string& name);

} // namespace chromalog::config
