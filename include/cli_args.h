// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
#pragma once

/**
 * @file cli_args.h
 * @brief Command-line argument parsing for the printdeck daemon
 */

#include <cstdint>
#include <string>

namespace printdeck {

/**
 * @brief Parsed command-line arguments
 */
struct CliArgs {
    std::string config_path; // --config: empty = Config::default_path()

    // Test mode
    bool test_mode = false;
    int mock_printers = 2; // --mock-printers: simulated printers in test mode

    // Logging
    int verbosity = 0;
    std::string log_dest; // --log-dest: empty = use config
    std::string log_file; // --log-file: empty = use config

    uint32_t poll_interval_ms = 0; // --poll-interval: 0 = use config

    bool show_help = false;
    bool show_version = false;
};

/**
 * @brief Parse command-line arguments
 *
 * @param argc Argument count
 * @param argv Argument values
 * @param args Output: parsed arguments
 * @return true on success, false if help/version was shown or an error occurred
 *         (args.show_help / args.show_version tell the two apart)
 */
bool parse_cli_args(int argc, char** argv, CliArgs& args);

/**
 * @brief Print the usage text to stdout
 */
void print_usage(const char* program_name);

/**
 * @brief Print test mode configuration banner
 */
void print_test_mode_banner(const CliArgs& args);

} // namespace printdeck
