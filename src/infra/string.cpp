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
 * @file string.cpp
 * @brief Implementation of the `String` text helpers.
 */

#include "chromalog/infra/string.hpp"

#include <algorithm>
#include <cctype>

namespace chromalog::infra {

/**
 * @brief Trims leading and trailing whitespace.
 *
 * @note Characters are widened through `unsigned char` before reaching
 * `std::isspace`, which is undefined for negative values.
 */
std::string String::trim(const std::string& s)
{
    auto is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };

    auto first = std::find_if_not(s.begin(), s.end(), is_space);
    if (first == s.end()) {
        return "";
    }
    auto last = std::find_if_not(s.rbegin(), s.rend(), is_space).base();
    return std::string(first, last);
}

std::string String::to_lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](char c) { return static_cast<char>(std::tolower(static_cast<unsigned char>(c))); });
    return s;
}

std::string_view String::base_name(std::string_view path)
{
    auto slash = path.rfind('/');
    if (slash == std::string_view::npos) {
        return path;
    }
    return path.substr(slash + 1);
}

} // namespace chromalog::infra
