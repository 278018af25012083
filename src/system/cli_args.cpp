// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "cli_args.h"

#include "printdeck_version.h"

#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace printdeck {

namespace {

constexpr int MAX_MOCK_PRINTERS = 8;
constexpr long MIN_POLL_INTERVAL_MS = 250;
constexpr long MAX_POLL_INTERVAL_MS = 600000;

// Helper to parse integer with validation
bool parse_int(const char* str, long min_val, long max_val, long& out, const char* name) {
    char* endptr;
    long val = strtol(str, &endptr, 10);
    if (*str == '\0' || *endptr != '\0' || val < min_val || val > max_val) {
        printf("Error: invalid %s (must be %ld-%ld): %s\n", name, min_val, max_val, str);
        return false;
    }
    out = val;
    return true;
}

/// Value of "--opt value" or "--opt=value"; nullptr (with an error) if missing
const char* option_value(int argc, char** argv, int& i, const char* option) {
    size_t len = strlen(option);
    if (strncmp(argv[i], option, len) == 0 && argv[i][len] == '=') {
        return argv[i] + len + 1;
    }
    if (i + 1 < argc) {
        return argv[++i];
    }
    printf("Error: %s requires an argument\n", option);
    return nullptr;
}

bool matches_option(const char* arg, const char* option) {
    size_t len = strlen(option);
    return strncmp(arg, option, len) == 0 && (arg[len] == '\0' || arg[len] == '=');
}

bool is_valid_log_dest(const std::string& dest) {
    return dest == "auto" || dest == "journal" || dest == "syslog" || dest == "file" ||
           dest == "console";
}

} // namespace

void print_usage(const char* program_name) {
    printf("Usage: %s [options]\n", program_name);
    printf("Options:\n");
    printf("  -c, --config <path>      Config file (default: ~/.config/printdeck/printdeck.json)\n");
    printf("  --test                   Run against simulated printers\n");
    printf("  --mock-printers <n>      Number of simulated printers (1-%d, default: 2)\n",
           MAX_MOCK_PRINTERS);
    printf("  --poll-interval <ms>     Status poll interval (%ld-%ld)\n", MIN_POLL_INTERVAL_MS,
           MAX_POLL_INTERVAL_MS);
    printf("  -v, --verbose            Increase verbosity (-v=info, -vv=debug, -vvv=trace)\n");
    printf("  --log-dest <dest>        Log destination: auto, journal, syslog, file, console\n");
    printf("  --log-file <path>        Log file path (when --log-dest=file)\n");
    printf("  -V, --version            Show version and exit\n");
    printf("  -h, --help               Show this help message\n");
}

void print_test_mode_banner(const CliArgs& args) {
    printf("╔════════════════════════════════════════╗\n");
    printf("║           TEST MODE ENABLED            ║\n");
    printf("╚════════════════════════════════════════╝\n");
    printf("  Simulating %d printer(s)\n", args.mock_printers);
    printf("  Notifications go to the log only\n");
    printf("\n");
}

bool parse_cli_args(int argc, char** argv, CliArgs& args) {
    bool mock_count_set = false;

    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "-c") == 0 || matches_option(argv[i], "--config")) {
            const char* value = strcmp(argv[i], "-c") == 0
                                    ? (i + 1 < argc ? argv[++i] : nullptr)
                                    : option_value(argc, argv, i, "--config");
            if (!value || *value == '\0') {
                printf("Error: --config requires a path argument\n");
                return false;
            }
            args.config_path = value;
        } else if (strcmp(argv[i], "--test") == 0) {
            args.test_mode = true;
        } else if (matches_option(argv[i], "--mock-printers")) {
            const char* value = option_value(argc, argv, i, "--mock-printers");
            long count;
            if (!value || !parse_int(value, 1, MAX_MOCK_PRINTERS, count, "--mock-printers")) {
                return false;
            }
            args.mock_printers = static_cast<int>(count);
            mock_count_set = true;
        } else if (matches_option(argv[i], "--poll-interval")) {
            const char* value = option_value(argc, argv, i, "--poll-interval");
            long interval;
            if (!value || !parse_int(value, MIN_POLL_INTERVAL_MS, MAX_POLL_INTERVAL_MS, interval,
                                     "--poll-interval")) {
                return false;
            }
            args.poll_interval_ms = static_cast<uint32_t>(interval);
        }
        // Verbosity
        else if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "-vv") == 0 ||
                 strcmp(argv[i], "-vvv") == 0) {
            const char* p = argv[i];
            while (*p == '-')
                p++;
            while (*p == 'v') {
                args.verbosity++;
                p++;
            }
        } else if (strcmp(argv[i], "--verbose") == 0) {
            args.verbosity++;
        }
        // Log destination
        else if (matches_option(argv[i], "--log-dest")) {
            const char* value = option_value(argc, argv, i, "--log-dest");
            if (!value) {
                return false;
            }
            if (!is_valid_log_dest(value)) {
                printf("Error: invalid --log-dest value: %s\n", value);
                printf("Valid values: auto, journal, syslog, file, console\n");
                return false;
            }
            args.log_dest = value;
        } else if (matches_option(argv[i], "--log-file")) {
            const char* value = option_value(argc, argv, i, "--log-file");
            if (!value) {
                return false;
            }
            args.log_file = value;
        }
        // Help
        else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            args.show_help = true;
            print_usage(argv[0]);
            return false;
        }
        // Version
        else if (strcmp(argv[i], "-V") == 0 || strcmp(argv[i], "--version") == 0) {
            args.show_version = true;
            printf("printdeck %s\n", printdeck_version());
            return false;
        }
        // Unknown argument
        else {
            printf("Unknown argument: %s\n", argv[i]);
            printf("Use --help for usage information\n");
            return false;
        }
    }

    if (mock_count_set && !args.test_mode) {
        printf("Error: --mock-printers requires --test mode\n");
        return false;
    }

    return true;
}

} // namespace printdeck
