// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <spdlog/spdlog.h>

#include <string>

namespace printdeck {
namespace logging {

/**
 * @brief Where log output goes
 */
enum class LogTarget {
    Auto,    ///< Journal when started as a systemd service, console otherwise
    Journal, ///< systemd journal (needs PRINTDECK_HAS_SYSTEMD)
    Syslog,  ///< syslog(3)
    File,    ///< Rotating log file
    Console  ///< Console only
};

/**
 * @brief Raw logging inputs, before precedence is applied
 *
 * CLI values win over config values. `journal_stream` is the JOURNAL_STREAM
 * environment variable, which systemd sets for services whose stdout is the
 * journal.
 */
struct LogSettings {
    int verbosity = 0;
    bool test_mode = false;
    std::string cli_dest;
    std::string cli_file;
    std::string config_level; ///< /log_level
    std::string config_dest;  ///< /log_dest
    std::string config_file;  ///< /log_file
    std::string config_path;  ///< Config file in use, anchors the default log file
    std::string journal_stream;
};

/**
 * @brief Fully resolved logging setup
 */
struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::warn;
    LogTarget target = LogTarget::Console; ///< Never Auto once resolved
    bool enable_console = true;
    std::string file_path; ///< Only meaningful for LogTarget::File
};

/**
 * @brief Console-only logger for messages emitted before config is loaded
 */
void init_early();

/**
 * @brief Apply precedence and auto-detection to the raw settings
 */
LogConfig resolve_log_config(const LogSettings& settings);

/**
 * @brief Install the resolved sinks as the default logger and route libhv's
 * own log lines into it
 *
 * If the log file cannot be opened the daemon keeps logging to the console.
 */
void init(const LogConfig& config);

/// True when the journal sink was compiled in
bool journal_supported();

/**
 * @brief "printdeck.log" next to the config file
 */
std::string default_log_file(const std::string& config_path);

/**
 * @brief Parse a level name ("trace" ... "off", "warning" alias); case sensitive
 */
spdlog::level::level_enum parse_level(const std::string& str,
                                      spdlog::level::level_enum default_level = spdlog::level::warn);

/**
 * @brief Map -v count to a level: 0 warn, 1 info, 2 debug, 3+ trace
 */
spdlog::level::level_enum verbosity_to_level(int verbosity);

/**
 * @brief Effective level: CLI verbosity, then config string, then default
 *
 * The default is debug in test mode and warn otherwise.
 */
spdlog::level::level_enum resolve_log_level(int verbosity, const std::string& config_level,
                                            bool test_mode);

/// libhv log level for a spdlog level (libhv has no trace)
int to_hv_level(spdlog::level::level_enum level);

/// spdlog level for a libhv log level
spdlog::level::level_enum from_hv_level(int hv_level);

LogTarget parse_log_target(const std::string& str);

const char* log_target_name(LogTarget target);

} // namespace logging
} // namespace printdeck
