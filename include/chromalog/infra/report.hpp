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
 * @file report.hpp
 * @brief Internal diagnostics channel of the library.
 *
 * @details
 * Problems inside chromalog itself (a sink that failed to write) cannot be
 * logged through the logger that caused them. They are written instead to
 * standard error in a fixed format, serialized by a dedicated static mutex.
 */

#pragma once

#include <mutex>
#include <string_view>

namespace chromalog::infra {

/**
 * @class Report
 * @brief A static utility writing `"[chromalog] <message>"` lines to stderr.
 */
class Report {
  public:
    /**
     * @brief Writes one diagnostic line to `std::cerr` and flushes it.
     *
     * @note Thread-safe and blocking. Never calls into a `Logger`, so it is
     * safe to use from within a logger's critical section.
     */
    static void error(std::string_view message);

  private:
    /// @brief Keeps diagnostic lines from concurrent threads distinct.
    static std::mutex mutex_;
};

} // namespace chromalog::infra
