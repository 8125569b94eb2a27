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
 * @file main.cpp
 * @brief Demonstration program for the chromalog library.
 *
 * @details
 * Sequence:
 * 1. Argument Parsing.
 * 2. Optional configuration of the default logger from a JSON file.
 * 3. One line per level through each entry-point form.
 */

#include "chromalog/chromalog.hpp"
#include "chromalog/config/config.hpp"

#include <iostream>
#include <string>

/**
 * @brief Prints usage instructions to stdout.
 */
void print_help(const char* binary_name)
{
    std::cout << "Usage: " << binary_name << " [CONFIG_JSON]\n"
              << "Options:\n"
              << "  CONFIG_JSON  Logger configuration file (Default: built-in defaults)\n"
              << "  --help       Show this help message\n";
}

int main(int argc, char* argv[])
{
    if (argc > 1 && std::string(argv[1]) == "--help") {
        print_help(argv[0]);
        return 0;
    }

    if (argc > 1) {
        try {
            chromalog::config::Config::load(argv[1]).apply(chromalog::default_logger());
        } catch (const chromalog::config::ConfigError& e) {
            LOG_ERROR("Config: ", e.what());
            return 1;
        }
    }

    // Show everything regardless of the configured threshold.
    chromalog::set_level_filter(chromalog::core::TRACE);

    LOG_TRACE("Demo: trace-level detail");
    LOG_DEBUG("Demo: debug counters ", 1, 2, 3);
    LOG_INFO("Demo: service ready on port ", 5555);
    LOG_WARNF("Demo: disk usage at %d%%", 91);
    LOG_ERRORLN("Demo: request failed:", "timeout", 30, "s");
    LOG_PRINT("Demo: level-less message at the default level");
    return 0;
}
