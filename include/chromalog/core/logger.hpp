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
 * @file logger.hpp
 * @brief Thread-safe leveled logger with pluggable formatting.
 *
 * @details
 * This header declares the `Logger` class. A logger owns a sink, a set of
 * rendering flags, a prefix, a default level for level-less calls and a level
 * filter, all guarded by a single mutex. Every entry point funnels into
 * `Logger::output`, which renders and writes exactly one line per accepted call,
 * so lines from concurrent threads never interleave.
 */

#pragma once

#include "chromalog/core/formatter.hpp"
#include "chromalog/core/level.hpp"
#include "chromalog/core/log_message.hpp"
#include "chromalog/core/sink.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>

namespace chromalog::core {

/**
 * @class Panic
 * @brief Raised by the `panic*` entry points after the message was emitted.
 *
 * `what()` returns the formatted message text.
 */
class Panic : public std::runtime_error {
  public:
    explicit Panic(const std::string& message) : std::runtime_error(message) {}
};

/// @brief Time source used for timestamps. Defaults to the system clock.
using Clock = std::function<std::chrono::system_clock::time_point()>;

namespace detail {

template <typename T>
inline constexpr bool is_text_v = std::is_convertible_v<const T&, std::string_view> ||
                                  std::is_same_v<T, char>;

/// @brief Streams one operand. A null C string renders as `(null)`.
template <typename T> void put_operand(std::ostream& os, const T& value)
{
    if constexpr (std::is_pointer_v<T> &&
                  std::is_same_v<std::remove_cv_t<std::remove_pointer_t<T>>, char>) {
        if (value == nullptr) {
            os << "(null)";
            return;
        }
    }
    os << value;
}

/**
 * @brief Streams operands back to back, inserting a space between two adjacent
 * operands when neither is text.
 */
template <typename... Args> std::string concat(const Args&... args)
{
    std::ostringstream os;
    os << std::boolalpha;
    bool first = true;
    bool prev_text = false;
    auto put = [&](const auto& value) {
        constexpr bool text = is_text_v<std::decay_t<decltype(value)>>;
        if (!first && !text && !prev_text) {
            os << ' ';
        }
        put_operand(os, value);
        first = false;
        prev_text = text;
    };
    (put(args), ...);
    return os.str();
}

/// @brief Streams operands separated by single spaces and ends with a newline.
template <typename... Args> std::string concat_line(const Args&... args)
{
    std::ostringstream os;
    os << std::boolalpha;
    bool first = true;
    auto put = [&](const auto& value) {
        if (!first) {
            os << ' ';
        }
        put_operand(os, value);
        first = false;
    };
    (put(args), ...);
    os << '\n';
    return os.str();
}

} // namespace detail

/**
 * @class Logger
 * @brief A mutex-protected writer of leveled, formatted log lines.
 *
 * @details
 * **Entry points.** For `print` (which uses the default level) and for every
 * level there are three forms:
 * - `info(site, a, b, ...)` concatenates its operands.
 * - `infof(site, fmt, ...)` formats printf-style.
 * - `infoln(site, a, b, ...)` separates operands by spaces and appends a newline.
 *
 * The leading `Site` is normally supplied by the `CHROMALOG_*` macros, which
 * capture `__FILE__` and `__LINE__` at the call site.
 *
 * `fatal*` terminates the process with status 1 after emitting, even when the
 * level filter suppressed the line. `panic*` emits at FATAL and then throws
 * `Panic`.
 *
 * **Thread-safety.** Every public method may be called concurrently. Accessors
 * lock for their single read or write only; there is no atomicity across
 * several setters.
 *
 * @code
 * auto sink = std::make_shared<chromalog::core::StreamSink>(std::cerr);
 * chromalog::core::Logger log(sink, "db: ", chromalog::core::kStdFlags);
 * CHROMALOG_WARNF(log, "compaction took %d ms", 420);
 * @endcode
 */
class Logger {
  public:
    /**
     * @brief Creates a logger. Performs no I/O.
     *
     * The new logger uses `DefaultFormatter`, the system clock, a default level
     * of INFO and a level filter of INFO.
     *
     * @throws std::invalid_argument if `sink` is null.
     */
    Logger(std::shared_ptr<Sink> sink, std::string prefix, int flags);

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /**
     * @brief Renders and writes one line.
     *
     * Pipeline (entirely under the mutex):
     * 1. Drop the call if `level` is below the level filter.
     * 2. Read the clock and resolve the call site (`"???":0` when unknown).
     * 3. Clear the scratch buffer and let the formatter append the metadata.
     * 4. Append `message` and, if it is non-empty and lacks one, a newline.
     * 5. Hand the whole buffer to the sink in one write.
     *
     * @return false if the sink reported a write failure; true otherwise,
     * including when the call was filtered out.
     */
    bool output(const Site& site, int level, std::string_view message);

    /// @brief As above, with an unresolved call site.
    bool output(int level, std::string_view message);

    /**
     * @brief Replaces the active formatter. A null pointer restores the default.
     *
     * A line being rendered concurrently may still use the previous formatter.
     */
    void set_formatter(std::shared_ptr<const Formatter> formatter);

    /// @brief Wraps `fn` in a `FunctionFormatter` and installs it.
    void set_formatter(FormatFunction fn);

    /**
     * @brief Redirects output.
     * @throws std::invalid_argument if `sink` is null.
     */
    void set_output(std::shared_ptr<Sink> sink);

    /// @brief Replaces the time source (used by tests to pin timestamps).
    void set_clock(Clock clock);

    int flags() const;
    void set_flags(int flags);

    std::string prefix() const;
    void set_prefix(std::string prefix);

    /// @brief Level used by the `print*` entry points.
    int default_level() const;
    void set_default_level(int level);

    /// @brief Minimum level that is actually written.
    int level_filter() const;
    void set_level_filter(int level);

    /**
     * @brief Reports whether a call at `level` would pass the filter.
     *
     * Useful to skip building expensive arguments:
     * @code
     * if (log.would_log(chromalog::core::DEBUG)) {
     *     CHROMALOG_DEBUG(log, "state: ", dump_state());
     * }
     * @endcode
     */
    bool would_log(int level) const;

    // --------------------------------------------------------------------
    // Level-less entry points (use the default level)
    // --------------------------------------------------------------------

    template <typename... Args> bool print(const Site& site, const Args&... args)
    {
        return output(site, default_level(), detail::concat(args...));
    }
    bool printf(const Site& site, const char* fmt, ...) __attribute__((format(__printf__, 3, 4)));
    template <typename... Args> bool println(const Site& site, const Args&... args)
    {
        return output(site, default_level(), detail::concat_line(args...));
    }

    // --------------------------------------------------------------------
    // Severity-tagged entry points
    // --------------------------------------------------------------------

    template <typename... Args> bool trace(const Site& site, const Args&... args)
    {
        return output(site, TRACE, detail::concat(args...));
    }
    bool tracef(const Site& site, const char* fmt, ...) __attribute__((format(__printf__, 3, 4)));
    template <typename... Args> bool traceln(const Site& site, const Args&... args)
    {
        return output(site, TRACE, detail::concat_line(args...));
    }

    template <typename... Args> bool debug(const Site& site, const Args&... args)
    {
        return output(site, DEBUG, detail::concat(args...));
    }
    bool debugf(const Site& site, const char* fmt, ...) __attribute__((format(__printf__, 3, 4)));
    template <typename... Args> bool debugln(const Site& site, const Args&... args)
    {
        return output(site, DEBUG, detail::concat_line(args...));
    }

    template <typename... Args> bool info(const Site& site, const Args&... args)
    {
        return output(site, INFO, detail::concat(args...));
    }
    bool infof(const Site& site, const char* fmt, ...) __attribute__((format(__printf__, 3, 4)));
    template <typename... Args> bool infoln(const Site& site, const Args&... args)
    {
        return output(site, INFO, detail::concat_line(args...));
    }

    template <typename... Args> bool warn(const Site& site, const Args&... args)
    {
        return output(site, WARN, detail::concat(args...));
    }
    bool warnf(const Site& site, const char* fmt, ...) __attribute__((format(__printf__, 3, 4)));
    template <typename... Args> bool warnln(const Site& site, const Args&... args)
    {
        return output(site, WARN, detail::concat_line(args...));
    }

    template <typename... Args> bool error(const Site& site, const Args&... args)
    {
        return output(site, ERROR, detail::concat(args...));
    }
    bool errorf(const Site& site, const char* fmt, ...) __attribute__((format(__printf__, 3, 4)));
    template <typename... Args> bool errorln(const Site& site, const Args&... args)
    {
        return output(site, ERROR, detail::concat_line(args...));
    }

    // --------------------------------------------------------------------
    // Terminating entry points
    // --------------------------------------------------------------------

    template <typename... Args> [[noreturn]] void fatal(const Site& site, const Args&... args)
    {
        terminate(site, detail::concat(args...));
    }
    [[noreturn]] void fatalf(const Site& site, const char* fmt, ...)
        __attribute__((format(__printf__, 3, 4)));
    template <typename... Args> [[noreturn]] void fatalln(const Site& site, const Args&... args)
    {
        terminate(site, detail::concat_line(args...));
    }

    template <typename... Args> [[noreturn]] void panic(const Site& site, const Args&... args)
    {
        raise(site, detail::concat(args...));
    }
    [[noreturn]] void panicf(const Site& site, const char* fmt, ...)
        __attribute__((format(__printf__, 3, 4)));
    template <typename... Args> [[noreturn]] void panicln(const Site& site, const Args&... args)
    {
        raise(site, detail::concat_line(args...));
    }

  private:
    /// @brief Emits at FATAL, then exits with status 1 regardless of the outcome.
    [[noreturn]] void terminate(const Site& site, const std::string& message);

    /// @brief Emits at FATAL, then throws `Panic` carrying `message`.
    [[noreturn]] void raise(const Site& site, const std::string& message);

    /// @brief Guards every field below.
    mutable std::mutex mutex_;

    int flags_;
    std::shared_ptr<Sink> sink_;
    std::shared_ptr<const Formatter> formatter_;
    Clock clock_;

    /// @brief Scratch space reused across calls; cleared, never shrunk.
    std::string buf_;

    std::string prefix_;
    int default_level_;
    int level_filter_;
};

} // namespace chromalog::core

// ============================================================================
// Call-site Macros
// ============================================================================

/**
 * @def CHROMALOG_SITE
 * @brief The current source location as a `chromalog::core::Site`.
 */
#define CHROMALOG_SITE (::chromalog::core::Site{__FILE__, __LINE__})

#define CHROMALOG_PRINT(logger, ...) (logger).print(CHROMALOG_SITE, __VA_ARGS__)
#define CHROMALOG_PRINTF(logger, ...) (logger).printf(CHROMALOG_SITE, __VA_ARGS__)
#define CHROMALOG_PRINTLN(logger, ...) (logger).println(CHROMALOG_SITE, __VA_ARGS__)

#define CHROMALOG_TRACE(logger, ...) (logger).trace(CHROMALOG_SITE, __VA_ARGS__)
#define CHROMALOG_TRACEF(logger, ...) (logger).tracef(CHROMALOG_SITE, __VA_ARGS__)
#define CHROMALOG_TRACELN(logger, ...) (logger).traceln(CHROMALOG_SITE, __VA_ARGS__)

#define CHROMALOG_DEBUG(logger, ...) (logger).debug(CHROMALOG_SITE, __VA_ARGS__)
#define CHROMALOG_DEBUGF(logger, ...) (logger).debugf(CHROMALOG_SITE, __VA_ARGS__)
#define CHROMALOG_DEBUGLN(logger, ...) (logger).debugln(CHROMALOG_SITE, __VA_ARGS__)

#define CHROMALOG_INFO(logger, ...) (logger).info(CHROMALOG_SITE, __VA_ARGS__)
#define CHROMALOG_INFOF(logger, ...) (logger).infof(CHROMALOG_SITE, __VA_ARGS__)
#define CHROMALOG_INFOLN(logger, ...) (logger).infoln(CHROMALOG_SITE, __VA_ARGS__)

#define CHROMALOG_WARN(logger, ...) (logger).warn(CHROMALOG_SITE, __VA_ARGS__)
#define CHROMALOG_WARNF(logger, ...) (logger).warnf(CHROMALOG_SITE, __VA_ARGS__)
#define CHROMALOG_WARNLN(logger, ...) (logger).warnln(CHROMALOG_SITE, __VA_ARGS__)

#define CHROMALOG_ERROR(logger, ...) (logger).error(CHROMALOG_SITE, __VA_ARGS__)
#define CHROMALOG_ERRORF(logger, ...) (logger).errorf(CHROMALOG_SITE, __VA_ARGS__)
#define CHROMALOG_ERRORLN(logger, ...) (logger).errorln(CHROMALOG_SITE, __VA_ARGS__)

#define CHROMALOG_FATAL(logger, ...) (logger).fatal(CHROMALOG_SITE, __VA_ARGS__)
#define CHROMALOG_FATALF(logger, ...) (logger).fatalf(CHROMALOG_SITE, __VA_ARGS__)
#define CHROMALOG_FATALLN(logger, ...) (logger).fatalln(CHROMALOG_SITE, __VA_ARGS__)

#define CHROMALOG_PANIC(logger, ...) (logger).panic(CHROMALOG_SITE, __VA_ARGS__)
#define CHROMALOG_PANICF(logger, ...) (logger).panicf(CHROMALOG_SITE, __VA_ARGS__)
#define CHROMALOG_PANICLN(logger, ...) (logger).panicln(CHROMALOG_SITE, __VA_ARGS__)
