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
 * @file chromalog.hpp
 * @brief Process-wide default logger and its convenience API.
 *
 * @details
 * Including this header is all an application needs for everyday logging:
 *
 * @code
 * #include "chromalog/chromalog.hpp"
 *
 * LOG_INFO("listening on port ", 5555);
 * LOG_WARNF("retry %d/%d", attempt, max_attempts);
 * chromalog::set_level_filter(chromalog::core::DEBUG);
 * @endcode
 *
 * The default logger writes to standard error with `kDefaultFlags`
 * (date, time, color and level tag). It is created on first use, exactly once
 * even under concurrent first use, and lives until the process exits.
 */

#pragma once

#include "chromalog/core/formatter.hpp"
#include "chromalog/core/level.hpp"
#include "chromalog/core/logger.hpp"
#include "chromalog/core/sink.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace chromalog {

/**
 * @brief Returns the process-wide logger.
 *
 * Code that wants to stay testable should take a `core::Logger&` parameter
 * and receive this instance from `main`, rather than call it deep inside.
 */
core::Logger& default_logger();

int flags();
void set_flags(int flags);

std::string prefix();
void set_prefix(std::string prefix);

int default_level();
void set_default_level(int level);

int level_filter();
void set_level_filter(int level);

bool would_log(int level);

/// @brief Writes one line through the default logger, with an unresolved call site.
bool output(int level, std::string_view message);

void set_formatter(std::shared_ptr<const core::Formatter> formatter);
void set_formatter(core::FormatFunction fn);
void set_output(std::shared_ptr<core::Sink> sink);
void set_clock(core::Clock clock);

} // namespace chromalog

// ============================================================================
// Default Logger Macros
// ============================================================================

#define LOG_PRINT(...) CHROMALOG_PRINT(::chromalog::default_logger(), __VA_ARGS__)
#define LOG_PRINTF(...) CHROMALOG_PRINTF(::chromalog::default_logger(), __VA_ARGS__)
#define LOG_PRINTLN(...) CHROMALOG_PRINTLN(::chromalog::default_logger(), __VA_ARGS__)

#define LOG_TRACE(...) CHROMALOG_TRACE(::chromalog::default_logger(), __VA_ARGS__)
#define LOG_TRACEF(...) CHROMALOG_TRACEF(::chromalog::default_logger(), __VA_ARGS__)
#define LOG_TRACELN(...) CHROMALOG_TRACELN(::chromalog::default_logger(), __VA_ARGS__)

#define LOG_DEBUG(...) CHROMALOG_DEBUG(::chromalog::default_logger(), __VA_ARGS__)
#define LOG_DEBUGF(...) CHROMALOG_DEBUGF(::chromalog::default_logger(), __VA_ARGS__)
#define LOG_DEBUGLN(...) CHROMALOG_DEBUGLN(::chromalog::default_logger(), __VA_ARGS__)

#define LOG_INFO(...) CHROMALOG_INFO(::chromalog::default_logger(), __VA_ARGS__)
#define LOG_INFOF(...) CHROMALOG_INFOF(::chromalog::default_logger(), __VA_ARGS__)
#define LOG_INFOLN(...) CHROMALOG_INFOLN(::chromalog::default_logger(), __VA_ARGS__)

#define LOG_WARN(...) CHROMALOG_WARN(::chromalog::default_logger(), __VA_ARGS__)
#define LOG_WARNF(...) CHROMALOG_WARNF(::chromalog::default_logger(), __VA_ARGS__)
#define LOG_WARNLN(...) CHROMALOG_WARNLN(::chromalog::default_logger(), __VA_ARGS__)

#define LOG_ERROR(...) CHROMALOG_ERROR(::chromalog::default_logger(), __VA_ARGS__)
#define LOG_ERRORF(...) CHROMALOG_ERRORF(::chromalog::default_logger(), __VA_ARGS__)
#define LOG_ERRORLN(...) CHROMALOG_ERRORLN(::chromalog::default_logger(), __VA_ARGS__)

#define LOG_FATAL(...) CHROMALOG_FATAL(::chromalog::default_logger(), __VA_ARGS__)
#define LOG_FATALF(...) CHROMALOG_FATALF(::chromalog::default_logger(), __VA_ARGS__)
#define LOG_FATALLN(...) CHROMALOG_FATALLN(::chromalog::default_logger(), __VA_ARGS__)

#define LOG_PANIC(...) CHROMALOG_PANIC(::chromalog::default_logger(), __VA_ARGS__)
#define LOG_PANICF(...) CHROMALOG_PANICF(::chromalog::default_logger(), __VA_ARGS__)
#define LOG_PANICLN(...) CHROMALOG_PANICLN(::chromalog::default_logger(), __VA_ARGS__)
