// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "cli_args.h"

#include <cstdio>
#include <cstring>

namespace olympus {

namespace {

/// Fetch the value following an option, or report it missing
const char* take_value(int argc, char** argv, int& i) {
    if (i + 1 >= argc) {
        printf("Error: %s requires an argument\n", argv[i]);
        return nullptr;
    }
    return argv[++i];
}

} // namespace

void print_usage(const char* program) {
    printf("Usage: %s [options]\n", program);
    printf("Streams live order, inventory and notification updates.\n\n");
    printf("Options:\n");
    printf("  -c, --config <path>      Config file (default: olympus.json)\n");
    printf("      --api-url <url>      API base URL override\n");
    printf("      --ws-url <url>       Realtime URL override\n");
    printf("      --token <token>      Access token (or OLYMPUS_ACCESS_TOKEN)\n");
    printf("      --refresh-token <t>  Refresh token (or OLYMPUS_REFRESH_TOKEN)\n");
    printf("      --order <id>         Subscribe to an order (repeatable)\n");
    printf("      --location <id>      Subscribe to a location's inventory (repeatable)\n");
    printf("      --user <id>          Subscribe to a user's notifications (repeatable)\n");
    printf("      --get <path>         Perform one GET request, print the result and exit\n");
    printf("  -v, -vv, -vvv            Verbosity (info, debug, trace)\n");
    printf("      --log-dest <dest>    auto, journal, syslog, file, console\n");
    printf("      --log-file <path>    Log file path for --log-dest file\n");
    printf("  -h, --help               Show this help\n");
}

bool parse_cli_args(int argc, char** argv, CliArgs& args) {
    for (int i = 1; i < argc; i++) {
        const char* arg = argv[i];
        const char* value = nullptr;

        if (strcmp(arg, "-h") == 0 || strcmp(arg, "--help") == 0) {
            print_usage(argv[0]);
            args.help_shown = true;
            return false;
        } else if (strcmp(arg, "-c") == 0 || strcmp(arg, "--config") == 0) {
            if (!(value = take_value(argc, argv, i)))
                return false;
            args.config_path = value;
        } else if (strcmp(arg, "--api-url") == 0) {
            if (!(value = take_value(argc, argv, i)))
                return false;
            args.api_url = value;
        } else if (strcmp(arg, "--ws-url") == 0) {
            if (!(value = take_value(argc, argv, i)))
                return false;
            args.ws_url = value;
        } else if (strcmp(arg, "--token") == 0) {
            if (!(value = take_value(argc, argv, i)))
                return false;
            args.access_token = value;
        } else if (strcmp(arg, "--refresh-token") == 0) {
            if (!(value = take_value(argc, argv, i)))
                return false;
            args.refresh_token = value;
        } else if (strcmp(arg, "--order") == 0) {
            if (!(value = take_value(argc, argv, i)))
                return false;
            args.order_ids.emplace_back(value);
        } else if (strcmp(arg, "--location") == 0) {
            if (!(value = take_value(argc, argv, i)))
                return false;
            args.location_ids.emplace_back(value);
        } else if (strcmp(arg, "--user") == 0) {
            if (!(value = take_value(argc, argv, i)))
                return false;
            args.user_ids.emplace_back(value);
        } else if (strcmp(arg, "--get") == 0) {
            if (!(value = take_value(argc, argv, i)))
                return false;
            args.get_path = value;
        } else if (strcmp(arg, "--log-dest") == 0) {
            if (!(value = take_value(argc, argv, i)))
                return false;
            args.log_dest = value;
        } else if (strcmp(arg, "--log-file") == 0) {
            if (!(value = take_value(argc, argv, i)))
                return false;
            args.log_file = value;
        } else if (arg[0] == '-' && arg[1] == 'v' && strspn(arg + 1, "v") == strlen(arg + 1)) {
            // -v, -vv, -vvv (repeatable)
            args.verbosity += static_cast<int>(strlen(arg + 1));
        } else if (strcmp(arg, "--verbose") == 0) {
            args.verbosity++;
        } else {
            printf("Unknown argument: %s\n", arg);
            print_usage(argv[0]);
            return false;
        }
    }
    return true;
}

} // namespace olympus
