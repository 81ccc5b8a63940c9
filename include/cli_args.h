// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
#pragma once

/**
 * @file cli_args.h
 * @brief Command-line argument parsing for olympus-monitor
 */

#include <string>
#include <vector>

namespace olympus {

/**
 * @brief Parsed command-line arguments
 */
struct CliArgs {
    std::string config_path = "olympus.json";

    // Endpoint overrides (win over config file and environment)
    std::string api_url;
    std::string ws_url;

    // Credentials (fall back to OLYMPUS_ACCESS_TOKEN / OLYMPUS_REFRESH_TOKEN)
    std::string access_token;
    std::string refresh_token;

    // Realtime subscriptions
    std::vector<std::string> order_ids;
    std::vector<std::string> location_ids;
    std::vector<std::string> user_ids;

    // One-shot request instead of streaming
    std::string get_path;

    // Logging
    int verbosity = 0;
    std::string log_dest; // auto, journal, syslog, file, console
    std::string log_file;

    bool help_shown = false;
};

/**
 * @brief Parse command-line arguments
 *
 * @param argc Argument count
 * @param argv Argument values
 * @param args Output: parsed arguments
 * @return true on success, false if help was shown or an error occurred
 */
bool parse_cli_args(int argc, char** argv, CliArgs& args);

void print_usage(const char* program);

} // namespace olympus
