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
 * @file log_message.hpp
 * @brief Call-site location and the per-call record handed to formatters.
 */

#pragma once

#include <chrono>
#include <string_view>

namespace chromalog::core {

/**
 * @struct Site
 * @brief Source location of a logging call.
 *
 * Captured by the `CHROMALOG_*` / `LOG_*` macros from `__FILE__` and
 * `__LINE__`. A default-constructed Site is the unresolved location
 * `"???":0`.
 */
struct Site {
    const char* file = "???";
    int line = 0;
};

/**
 * @struct LogMessage
 * @brief Immutable snapshot describing one log call.
 *
 * @details
 * Built by the logger inside its critical section and passed by const
 * reference to the active formatter. The string views point into logger-owned
 * storage and the call-site literal; they are valid only for the duration of
 * the `Formatter::format` call, so a formatter must not retain them.
 */
struct LogMessage {
    std::chrono::system_clock::time_point time;
    std::string_view file;
    int line;
    int level;

    // Logger settings at emission time.
    std::string_view prefix;
    int flags;
};

} // namespace chromalog::core
