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
 * @file formatter.cpp
 * @brief Built-in line rendering.
 *
 * @details
 * The default formatter appends, in a fixed order, the segments enabled by the
 * message's flag bits. Numeric fields are written with a small zero-padding
 * helper instead of a stream so that rendering never allocates beyond the
 * growth of the logger's scratch buffer.
 */

#include "chromalog/core/formatter.hpp"

#include "chromalog/core/level.hpp"
#include "chromalog/infra/string.hpp"

#include <chrono>
#include <ctime>
#include <string>
#include <utility>

namespace chromalog::core {

namespace {

constexpr std::string_view kReset = "\x1b[0m";

/**
 * @brief Appends `value` in decimal, left-padded with zeros to `width` digits.
 */
void append_padded(std::string& buf, long value, int width)
{
    char digits[24];
    int n = 0;
    do {
        digits[n++] = static_cast<char>('0' + value % 10);
        value /= 10;
    } while (value > 0 && n < static_cast<int>(sizeof(digits)));

    for (int i = n; i < width; ++i) {
        buf.push_back('0');
    }
    while (n > 0) {
        buf.push_back(digits[--n]);
    }
}

/// @brief Breaks `time` into calendar fields, in UTC or the local zone.
std::tm calendar(std::time_t time, bool utc)
{
    std::tm tm{};
    if (utc) {
        gmtime_r(&time, &tm);
    } else {
        localtime_r(&time, &tm);
    }
    return tm;
}

} // namespace

void DefaultFormatter::format(const LogMessage& msg, std::string& buf) const
{
    const int flags = msg.flags;

    if (flags & kColor) {
        buf.append(level_color(msg.level));
    }

    buf.append(msg.prefix);

    if (flags & kLevel) {
        std::string_view tag = level_tag(msg.level);
        if (!tag.empty()) {
            buf.append(tag);
            buf.push_back(' ');
        }
    }

    if (flags & (kDate | kTime | kMicroseconds)) {
        const auto since_epoch = msg.time.time_since_epoch();
        const auto whole = std::chrono::floor<std::chrono::seconds>(since_epoch);
        const std::tm tm = calendar(static_cast<std::time_t>(whole.count()), (flags & kUTC) != 0);

        if (flags & kDate) {
            append_padded(buf, tm.tm_year + 1900, 4);
            buf.push_back('/');
            append_padded(buf, tm.tm_mon + 1, 2);
            buf.push_back('/');
            append_padded(buf, tm.tm_mday, 2);
            buf.push_back(' ');
        }
        if (flags & (kTime | kMicroseconds)) {
            append_padded(buf, tm.tm_hour, 2);
            buf.push_back(':');
            append_padded(buf, tm.tm_min, 2);
            buf.push_back(':');
            append_padded(buf, tm.tm_sec, 2);
            if (flags & kMicroseconds) {
                auto micros =
                    std::chrono::duration_cast<std::chrono::microseconds>(since_epoch - whole).count();
                buf.push_back('.');
                append_padded(buf, static_cast<long>(micros), 6);
            }
            buf.push_back(' ');
        }
    }

    if (flags & (kShortFile | kLongFile)) {
        std::string_view file = msg.file;
        if (flags & kShortFile) {
            file = infra::String::base_name(file);
        }
        buf.append(file);
        buf.push_back(':');
        buf.append(std::to_string(msg.line));
        buf.append(": ");
    }

    if (flags & kColor) {
        buf.append(kReset);
    }
}

FunctionFormatter::FunctionFormatter(FormatFunction fn) : fn_(std::move(fn)) {}

void FunctionFormatter::format(const LogMessage& msg, std::string& buf) const
{
    if (fn_) {
        fn_(msg, buf);
    }
}

} // namespace chromalog::core
