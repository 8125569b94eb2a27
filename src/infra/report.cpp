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
 * @file report.cpp
 * @brief Implementation of the internal diagnostics channel.
 */

#include "chromalog/infra/report.hpp"

#include <iostream>

namespace chromalog::infra {

std::mutex Report::mutex_;

void Report::error(std::string_view message)
{
    std::lock_guard<std::mutex> lock(mutex_);

    // Red tag so it stands out from regular log traffic on a terminal.
    std::cerr << "\033[31m[chromalog]\033[0m " << message << std::endl;
}

} // namespace chromalog::infra
