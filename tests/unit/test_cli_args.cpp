// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file test_cli_args.cpp
 * @brief Unit tests for olympus-monitor argument parsing
 */

#include "cli_args.h"

#include <string>
#include <vector>

#include <catch2/catch_test_macros.hpp>

using namespace olympus;

namespace {

/// Build a mutable argv from string literals
class Argv {
  public:
    Argv(std::initializer_list<const char*> args) {
        for (const char* a : args) {
            storage_.emplace_back(a);
        }
        for (auto& s : storage_) {
            ptrs_.push_back(&s[0]);
        }
        ptrs_.push_back(nullptr);
    }

    int argc() const {
        return static_cast<int>(storage_.size());
    }
    char** argv() {
        return ptrs_.data();
    }

  private:
    std::vector<std::string> storage_;
    std::vector<char*> ptrs_;
};

} // namespace

TEST_CASE("parse_cli_args: defaults", "[cli_args]") {
    Argv a{"olympus-monitor"};
    CliArgs args;
    REQUIRE(parse_cli_args(a.argc(), a.argv(), args));
    REQUIRE(args.config_path == "olympus.json");
    REQUIRE(args.verbosity == 0);
    REQUIRE(args.order_ids.empty());
    REQUIRE(args.get_path.empty());
    REQUIRE_FALSE(args.help_shown);
}

TEST_CASE("parse_cli_args: options with values", "[cli_args]") {
    Argv a{"olympus-monitor", "-c",      "/etc/olympus.json", "--token",   "abc",
           "--refresh-token", "def",     "--api-url",         "http://x/api", "--ws-url",
           "ws://x/ws",       "--log-dest", "console",        "--log-file", "/tmp/o.log"};
    CliArgs args;
    REQUIRE(parse_cli_args(a.argc(), a.argv(), args));
    REQUIRE(args.config_path == "/etc/olympus.json");
    REQUIRE(args.access_token == "abc");
    REQUIRE(args.refresh_token == "def");
    REQUIRE(args.api_url == "http://x/api");
    REQUIRE(args.ws_url == "ws://x/ws");
    REQUIRE(args.log_dest == "console");
    REQUIRE(args.log_file == "/tmp/o.log");
}

TEST_CASE("parse_cli_args: repeatable subscriptions", "[cli_args]") {
    Argv a{"olympus-monitor", "--order", "o-1", "--order", "o-2", "--location", "loc-7",
           "--user", "u-1"};
    CliArgs args;
    REQUIRE(parse_cli_args(a.argc(), a.argv(), args));
    REQUIRE(args.order_ids == std::vector<std::string>{"o-1", "o-2"});
    REQUIRE(args.location_ids == std::vector<std::string>{"loc-7"});
    REQUIRE(args.user_ids == std::vector<std::string>{"u-1"});
}

TEST_CASE("parse_cli_args: verbosity flags accumulate", "[cli_args]") {
    SECTION("-vv") {
        Argv a{"olympus-monitor", "-vv"};
        CliArgs args;
        REQUIRE(parse_cli_args(a.argc(), a.argv(), args));
        REQUIRE(args.verbosity == 2);
    }

    SECTION("-v -v -v") {
        Argv a{"olympus-monitor", "-v", "-v", "--verbose"};
        CliArgs args;
        REQUIRE(parse_cli_args(a.argc(), a.argv(), args));
        REQUIRE(args.verbosity == 3);
    }
}

TEST_CASE("parse_cli_args: errors and help", "[cli_args]") {
    SECTION("missing value") {
        Argv a{"olympus-monitor", "--order"};
        CliArgs args;
        REQUIRE_FALSE(parse_cli_args(a.argc(), a.argv(), args));
        REQUIRE_FALSE(args.help_shown);
    }

    SECTION("unknown option") {
        Argv a{"olympus-monitor", "--frobnicate"};
        CliArgs args;
        REQUIRE_FALSE(parse_cli_args(a.argc(), a.argv(), args));
    }

    SECTION("-vx is not a verbosity flag") {
        Argv a{"olympus-monitor", "-vx"};
        CliArgs args;
        REQUIRE_FALSE(parse_cli_args(a.argc(), a.argv(), args));
    }

    SECTION("help") {
        Argv a{"olympus-monitor", "--help"};
        CliArgs args;
        REQUIRE_FALSE(parse_cli_args(a.argc(), a.argv(), args));
        REQUIRE(args.help_shown);
    }
}
