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
 * @file formatter.hpp
 * @brief Pluggable line rendering.
 *
 * @details
 * A formatter turns a `LogMessage` into the metadata that precedes the user's
 * text on a log line (color, prefix, level tag, timestamp, call site). The
 * logger appends the message text and the newline itself.
 */

#pragma once

#include "chromalog/core/log_message.hpp"

#include <functional>
#include <string>

namespace chromalog::core {

/**
 * @class Formatter
 * @brief Rendering capability with a single method.
 *
 * @details
 * **Contract:**
 * - `format()` reads only the message it is given.
 * - It only appends to `buf`; it never clears or rewrites existing content.
 * - It never calls back into a `Logger`. It runs inside the logger's critical
 *   section, so doing so would deadlock.
 *
 * Implementations may carry state, but `format()` is const and may be invoked
 * by several loggers at once when a formatter instance is shared.
 */
class Formatter {
  public:
    virtual ~Formatter() = default;

    /**
     * @brief Appends the rendered metadata for `msg` to `buf`.
     * @param msg The record of the current call.
     * @param buf The logger's scratch buffer.
     */
    virtual void format(const LogMessage& msg, std::string& buf) const = 0;
};

/**
 * @class DefaultFormatter
 * @brief The built-in rendering.
 *
 * Each segment is gated by its flag bit and emitted in this fixed order:
 * 1. level color (`kColor`)
 * 2. prefix (always)
 * 3. level tag and a space (`kLevel`)
 * 4. `YYYY/MM/DD ` (`kDate`)
 * 5. `HH:MM:SS` with optional `.uuuuuu`, then a space (`kTime`, `kMicroseconds`)
 * 6. `file:line: ` (`kShortFile`, `kLongFile`)
 * 7. color reset (`kColor`)
 *
 * Date and time are rendered in local time unless `kUTC` is set.
 *
 * @code
 * // kDate | kTime | kLevel, prefix "db: ", level WARN:
 * // "db: [W] 2024/01/02 03:04:05 "
 * @endcode
 */
class DefaultFormatter : public Formatter {
  public:
    void format(const LogMessage& msg, std::string& buf) const override;
};

/// @brief Signature accepted by `FunctionFormatter`.
using FormatFunction = std::function<void(const LogMessage&, std::string&)>;

/**
 * @class FunctionFormatter
 * @brief Adapts a plain callable to the `Formatter` interface.
 */
class FunctionFormatter : public Formatter {
  public:
    explicit FunctionFormatter(FormatFunction fn);

    void format(const LogMessage& msg, std::string& buf) const override;

  private:
    FormatFunction fn_;
};

} // namespace chromalog::core
