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
 * @file string.hpp
 * @brief Text helpers shared by level parsing, configuration and rendering.
 */

#pragma once

#include <string>
#include <string_view>

namespace chromalog::infra {

/**
 * @class String
 * @brief A static container for small, stateless text operations.
 */
class String {
  public:
    /**
     * @brief Strips leading and trailing whitespace (space, `\t`, `\n`, `\r`,
     * `\v`, `\f`).
     *
     * @return The trimmed copy; empty if `s` holds only whitespace.
     *
     * @code
     * chromalog::infra::String::trim("  warn \n"); // "warn"
     * @endcode
     */
    static std::string trim(const std::string& s);

    /// @brief ASCII lower-case copy of `s`.
    static std::string to_lower(std::string s);

    /**
     * @brief Returns the part of `path` after the last `/`.
     *
     * A path without a separator is returned unchanged. A path ending in `/`
     * yields an empty view.
     *
     * @code
     * String::base_name("a/b/c.cpp"); // "c.cpp"
     * @endcode
     */
    static std::string_view base_name(std::string_view path);
};

} // namespace chromalog::infra
