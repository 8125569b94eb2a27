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
 * @file chromalog.cpp
 * @brief The process-wide default logger.
 */

#include "chromalog/chromalog.hpp"

#include <iostream>
#include <utility>

namespace chromalog {

/**
 * @brief Lazily constructs the default logger.
 *
 * A function-local static gives thread-safe one-time initialization and avoids
 * the static initialization order problem for loggers used by other static
 * constructors. The instance is intentionally never destroyed, so logging from
 * static destructors and `atexit` handlers stays valid.
 */
core::Logger& default_logger()
{
    static core::Logger* instance =
        new core::Logger(std::make_shared<core::StreamSink>(std::cerr), "", core::kDefaultFlags);
    return *instance;
}

int flags()
{
    return default_logger().flags();
}

void set_flags(int flags)
{
    default_logger().set_flags(flags);
}

std::string prefix()
{
    return default_logger().prefix();
}

void set_prefix(std::string prefix)
{
    default_logger().set_prefix(std::move(prefix));
}

int default_level()
{
    return default_logger().default_level();
}

void set_default_level(int level)
{
    default_logger().set_default_level(level);
}

int level_filter()
{
    return default_logger().level_filter();
}

void set_level_filter(int level)
{
    default_logger().set_level_filter(level);
}

bool would_log(int level)
{
    return default_logger().would_log(level);
}

bool output(int level, std::string_view message)
{
    return default_logger().output(level, message);
}

void set_formatter(std::shared_ptr<const core::Formatter> formatter)
{
    default_logger().set_formatter(std::move(formatter));
}

void set_formatter(core::FormatFunction fn)
{
    default_logger().set_formatter(std::move(fn));
}

void set_output(std::shared_ptr<core::Sink> sink)
{
    default_logger().set_output(std::move(sink));
}

void set_clock(core::Clock clock)
{
    default_logger().set_clock(std::move(clock));
}

} // namespace chromalog
