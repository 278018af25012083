// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file test_cli_args.cpp
 * @brief Unit tests for daemon command-line parsing
 */

#include "cli_args.h"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace printdeck;

namespace {

// Builds a mutable argv from string literals
class Argv {
  public:
    Argv(std::initializer_list<const char*> args) {
        storage_.emplace_back("printdeck");
        for (const char* arg : args) {
            storage_.emplace_back(arg);
        }
        for (auto& s : storage_) {
            pointers_.push_back(s.data());
        }
    }

    int argc() {
        return static_cast<int>(pointers_.size());
    }
    char** argv() {
        return pointers_.data();
    }

  private:
    std::vector<std::string> storage_;
    std::vector<char*> pointers_;
};

bool parse(Argv& args, CliArgs& out) {
    return parse_cli_args(args.argc(), args.argv(), out);
}

} // namespace

TEST_CASE("CLI: no arguments keeps defaults", "[cli_args]") {
    Argv argv({});
    CliArgs args;

    REQUIRE(parse(argv, args));
    REQUIRE(args.config_path.empty());
    REQUIRE_FALSE(args.test_mode);
    REQUIRE(args.mock_printers == 2);
    REQUIRE(args.verbosity == 0);
    REQUIRE(args.poll_interval_ms == 0);
    REQUIRE(args.log_dest.empty());
}

TEST_CASE("CLI: config path", "[cli_args]") {
    CliArgs args;

    SECTION("separate value") {
        Argv argv({"--config", "/etc/printdeck.json"});
        REQUIRE(parse(argv, args));
        REQUIRE(args.config_path == "/etc/printdeck.json");
    }

    SECTION("short form") {
        Argv argv({"-c", "my.json"});
        REQUIRE(parse(argv, args));
        REQUIRE(args.config_path == "my.json");
    }

    SECTION("equals form") {
        Argv argv({"--config=/tmp/x.json"});
        REQUIRE(parse(argv, args));
        REQUIRE(args.config_path == "/tmp/x.json");
    }

    SECTION("missing value is an error") {
        Argv argv({"--config"});
        REQUIRE_FALSE(parse(argv, args));
        REQUIRE_FALSE(args.show_help);
    }
}

TEST_CASE("CLI: verbosity flags accumulate", "[cli_args]") {
    CliArgs args;

    SECTION("-v") {
        Argv argv({"-v"});
        REQUIRE(parse(argv, args));
        REQUIRE(args.verbosity == 1);
    }

    SECTION("-vvv") {
        Argv argv({"-vvv"});
        REQUIRE(parse(argv, args));
        REQUIRE(args.verbosity == 3);
    }

    SECTION("mixed") {
        Argv argv({"-vv", "--verbose"});
        REQUIRE(parse(argv, args));
        REQUIRE(args.verbosity == 3);
    }
}

TEST_CASE("CLI: test mode and mock printers", "[cli_args]") {
    CliArgs args;

    SECTION("--test alone") {
        Argv argv({"--test"});
        REQUIRE(parse(argv, args));
        REQUIRE(args.test_mode);
        REQUIRE(args.mock_printers == 2);
    }

    SECTION("--mock-printers with --test") {
        Argv argv({"--mock-printers", "4", "--test"});
        REQUIRE(parse(argv, args));
        REQUIRE(args.mock_printers == 4);
    }

    SECTION("--mock-printers requires --test") {
        Argv argv({"--mock-printers=3"});
        REQUIRE_FALSE(parse(argv, args));
    }

    SECTION("--mock-printers out of range") {
        Argv argv({"--test", "--mock-printers", "0"});
        REQUIRE_FALSE(parse(argv, args));
    }

    SECTION("--mock-printers not a number") {
        Argv argv({"--test", "--mock-printers", "two"});
        REQUIRE_FALSE(parse(argv, args));
    }
}

TEST_CASE("CLI: poll interval", "[cli_args]") {
    CliArgs args;

    SECTION("valid") {
        Argv argv({"--poll-interval", "1500"});
        REQUIRE(parse(argv, args));
        REQUIRE(args.poll_interval_ms == 1500);
    }

    SECTION("too small") {
        Argv argv({"--poll-interval", "10"});
        REQUIRE_FALSE(parse(argv, args));
    }

    SECTION("trailing garbage") {
        Argv argv({"--poll-interval=3000ms"});
        REQUIRE_FALSE(parse(argv, args));
    }
}

TEST_CASE("CLI: log destination", "[cli_args]") {
    CliArgs args;

    SECTION("valid destinations") {
        for (const char* dest : {"auto", "journal", "syslog", "file", "console"}) {
            CliArgs fresh;
            Argv argv({"--log-dest", dest});
            REQUIRE(parse(argv, fresh));
            REQUIRE(fresh.log_dest == dest);
        }
    }

    SECTION("invalid destination") {
        Argv argv({"--log-dest=stderr"});
        REQUIRE_FALSE(parse(argv, args));
    }

    SECTION("log file") {
        Argv argv({"--log-dest", "file", "--log-file", "/tmp/pd.log"});
        REQUIRE(parse(argv, args));
        REQUIRE(args.log_file == "/tmp/pd.log");
    }
}

TEST_CASE("CLI: help and version stop parsing", "[cli_args]") {
    CliArgs args;

    SECTION("help") {
        Argv argv({"--help", "--test"});
        REQUIRE_FALSE(parse(argv, args));
        REQUIRE(args.show_help);
        REQUIRE_FALSE(args.test_mode);
    }

    SECTION("version") {
        Argv argv({"-V"});
        REQUIRE_FALSE(parse(argv, args));
        REQUIRE(args.show_version);
    }
}

TEST_CASE("CLI: unknown argument is an error", "[cli_args]") {
    Argv argv({"--frobnicate"});
    CliArgs args;

    REQUIRE_FALSE(parse(argv, args));
    REQUIRE_FALSE(args.show_help);
    REQUIRE_FALSE(args.show_version);
}
