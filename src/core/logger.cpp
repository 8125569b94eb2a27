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
 * @file logger.cpp
 * @brief Implementation of the leveled logger and its output pipeline.
 *
 * @details
 * Every entry point ends up in `Logger::output`, which holds the logger's mutex
 * for the whole render-and-write sequence. The call site arrives already
 * resolved (captured by the caller's macro), so nothing has to run outside the
 * critical section and the snapshot of prefix and flags is consistent with the
 * filter decision.
 */

#include "chromalog/core/logger.hpp"

#include "chromalog/infra/report.hpp"

#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <utility>
#include <vector>

namespace chromalog::core {

namespace {

/**
 * @brief printf-style formatting into a `std::string`.
 *
 * Formats into a stack buffer first and only allocates when the result does
 * not fit.
 */
std::string vformat(const char* fmt, va_list args)
{
    char stack_buf[512];

    va_list sizing;
    va_copy(sizing, args);
    int n = std::vsnprintf(stack_buf, sizeof(stack_buf), fmt, sizing);
    va_end(sizing);

    if (n < 0) {
        return std::string(fmt);
    }
    if (static_cast<size_t>(n) < sizeof(stack_buf)) {
        return std::string(stack_buf, static_cast<size_t>(n));
    }

    std::vector<char> heap_buf(static_cast<size_t>(n) + 1);
    if (std::vsnprintf(heap_buf.data(), heap_buf.size(), fmt, args) < 0) {
        return std::string(fmt);
    }
    return std::string(heap_buf.data(), static_cast<size_t>(n));
}

std::shared_ptr<const Formatter> default_formatter()
{
    static const auto formatter = std::make_shared<const DefaultFormatter>();
    return formatter;
}

std::chrono::system_clock::time_point system_now()
{
    return std::chrono::system_clock::now();
}

} // namespace

Logger::Logger(std::shared_ptr<Sink> sink, std::string prefix, int flags)
    : flags_(flags), sink_(std::move(sink)), formatter_(default_formatter()), clock_(system_now),
      prefix_(std::move(prefix)), default_level_(INFO), level_filter_(INFO)
{
    if (!sink_) {
        throw std::invalid_argument("chromalog: logger requires a sink");
    }
}

/**
 * @brief Renders and writes one log line.
 *
 * Operational Logic:
 * 1. **Synchronization**: A `lock_guard` covers the whole sequence, so the
 *    scratch buffer and the sink are never used by two calls at once.
 * 2. **Filtering**: Calls below the threshold return before any other work.
 * 3. **Snapshot**: Time, call site, level, prefix and flags form the message.
 * 4. **Rendering**: The formatter appends metadata, then the text follows.
 * 5. **Emission**: One sink write per line.
 */
bool Logger::output(const Site& site, int level, std::string_view message)
{
    std::lock_guard<std::mutex> lock(mutex_);

    if (level < level_filter_) {
        return true;
    }

    const auto now = clock_();

    std::string_view file = "???";
    int line = 0;
    if (site.file != nullptr && site.file[0] != '\0') {
        file = site.file;
        line = site.line;
    }

    buf_.clear();

    const LogMessage msg{now, file, line, level, prefix_, flags_};
    formatter_->format(msg, buf_);

    buf_.append(message);
    if (!message.empty() && message.back() != '\n') {
        buf_.push_back('\n');
    }

    if (!sink_->write(buf_)) {
        infra::Report::error("sink write failed while emitting a " +
                             std::string(level_name(level)) + " line");
        return false;
    }
    return true;
}

bool Logger::output(int level, std::string_view message)
{
    return output(Site{}, level, message);
}

void Logger::set_formatter(std::shared_ptr<const Formatter> formatter)
{
    std::lock_guard<std::mutex> lock(mutex_);
    formatter_ = formatter ? std::move(formatter) : default_formatter();
}

void Logger::set_formatter(FormatFunction fn)
{
    if (!fn) {
        set_formatter(std::shared_ptr<const Formatter>());
        return;
    }
    set_formatter(std::make_shared<const FunctionFormatter>(std::move(fn)));
}

void Logger::set_output(std::shared_ptr<Sink> sink)
{
    if (!sink) {
        throw std::invalid_argument("chromalog: logger requires a sink");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = std::move(sink);
}

void Logger::set_clock(Clock clock)
{
    std::lock_guard<std::mutex> lock(mutex_);
    clock_ = clock ? std::move(clock) : Clock(system_now);
}

int Logger::flags() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return flags_;
}

void Logger::set_flags(int flags)
{
    std::lock_guard<std::mutex> lock(mutex_);
    flags_ = flags;
}

std::string Logger::prefix() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return prefix_;
}

void Logger::set_prefix(std::string prefix)
{
    std::lock_guard<std::mutex> lock(mutex_);
    prefix_ = std::move(prefix);
}

int Logger::default_level() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return default_level_;
}

void Logger::set_default_level(int level)
{
    std::lock_guard<std::mutex> lock(mutex_);
    default_level_ = level;
}

int Logger::level_filter() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return level_filter_;
}

void Logger::set_level_filter(int level)
{
    std::lock_guard<std::mutex> lock(mutex_);
    level_filter_ = level;
}

bool Logger::would_log(int level) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return level >= level_filter_;
}

// ----------------------------------------------------------------------------
// printf-style entry points
// ----------------------------------------------------------------------------

bool Logger::printf(const Site& site, const char* fmt, ...)
{
    va_list args;
    va_start(args, fmt);
    std::string text = vformat(fmt, args);
    va_end(args);
    return output(site, default_level(), text);
}

bool Logger::tracef(const Site& site, const char* fmt, ...)
{
    va_list args;
    va_start(args, fmt);
    std::string text = vformat(fmt, args);
    va_end(args);
    return output(site, TRACE, text);
}

bool Logger::debugf(const Site& site, const char* fmt, ...)
{
    va_list args;
    va_start(args, fmt);
    std::string text = vformat(fmt, args);
    va_end(args);
    return output(site, DEBUG, text);
}

bool Logger::infof(const Site& site, const char* fmt, ...)
{
    va_list args;
    va_start(args, fmt);
    std::string text = vformat(fmt, args);
    va_end(args);
    return output(site, INFO, text);
}

bool Logger::warnf(const Site& site, const char* fmt, ...)
{
    va_list args;
    va_start(args, fmt);
    std::string text = vformat(fmt, args);
    va_end(args);
    return output(site, WARN, text);
}

bool Logger::errorf(const Site& site, const char* fmt, ...)
{
    va_list args;
    va_start(args, fmt);
    std::string text = vformat(fmt, args);
    va_end(args);
    return output(site, ERROR, text);
}

void Logger::fatalf(const Site& site, const char* fmt, ...)
{
    va_list args;
    va_start(args, fmt);
    std::string text = vformat(fmt, args);
    va_end(args);
    terminate(site, text);
}

void Logger::panicf(const Site& site, const char* fmt, ...)
{
    va_list args;
    va_start(args, fmt);
    std::string text = vformat(fmt, args);
    va_end(args);
    raise(site, text);
}

// ----------------------------------------------------------------------------
// Terminating paths
// ----------------------------------------------------------------------------

/**
 * @brief Emits at FATAL and exits with status 1.
 *
 * The exit happens whether or not the line passed the filter or reached the
 * sink. `std::exit` runs static destructors, so buffered streams are flushed.
 */
void Logger::terminate(const Site& site, const std::string& message)
{
    if (!output(site, FATAL, message)) {
        infra::Report::error("fatal message could not be written: " + message);
    }
    std::exit(1);
}

void Logger::raise(const Site& site, const std::string& message)
{
    if (!output(site, FATAL, message)) {
        infra::Report::error("panic message could not be written");
    }
    throw Panic(message);
}

} // namespace chromalog::core
