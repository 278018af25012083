// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "logging_init.h"

#include "hv/hlog.h"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/syslog_sink.h>

#ifdef PRINTDECK_HAS_SYSTEMD
#include <spdlog/sinks/systemd_sink.h>
#endif

#include <filesystem>
#include <vector>

namespace printdeck {
namespace logging {

namespace {

constexpr const char* LOGGER_NAME = "printdeck";
constexpr const char* LOG_FILE_NAME = "printdeck.log";
constexpr size_t LOG_FILE_MAX_BYTES = 5 * 1024 * 1024;
constexpr size_t LOG_FILE_COUNT = 3;

// libhv formats the whole line itself; keep only the message part
void forward_hv_log(int hv_level, const char* buf, int len) {
    std::string line(buf, static_cast<size_t>(len));
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
        line.pop_back();
    }
    spdlog::log(from_hv_level(hv_level), "[libhv] {}", line);
}

spdlog::sink_ptr make_file_sink(const std::string& path) {
    std::filesystem::path parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            spdlog::warn("[Logging] Cannot create {}: {}", parent.string(), ec.message());
        }
    }
    try {
        return std::make_shared<spdlog::sinks::rotating_file_sink_mt>(path, LOG_FILE_MAX_BYTES,
                                                                      LOG_FILE_COUNT);
    } catch (const spdlog::spdlog_ex& e) {
        spdlog::error("[Logging] Cannot open log file {}: {}", path, e.what());
        return nullptr;
    }
}

} // namespace

void init_early() {
    auto logger = std::make_shared<spdlog::logger>(
        LOGGER_NAME, std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    logger->set_level(spdlog::level::warn);
    spdlog::set_default_logger(logger);
}

bool journal_supported() {
#ifdef PRINTDECK_HAS_SYSTEMD
    return true;
#else
    return false;
#endif
}

std::string default_log_file(const std::string& config_path) {
    std::filesystem::path dir = std::filesystem::path(config_path).parent_path();
    if (dir.empty()) {
        return LOG_FILE_NAME;
    }
    return (dir / LOG_FILE_NAME).string();
}

LogConfig resolve_log_config(const LogSettings& settings) {
    LogConfig config;
    config.level = resolve_log_level(settings.verbosity, settings.config_level, settings.test_mode);

    const std::string& dest = settings.cli_dest.empty() ? settings.config_dest : settings.cli_dest;
    LogTarget target = parse_log_target(dest);

    if (target == LogTarget::Auto) {
        // Under systemd stdout already lands in the journal
        if (settings.journal_stream.empty()) {
            target = LogTarget::Console;
        } else {
            target = journal_supported() ? LogTarget::Journal : LogTarget::Console;
        }
    }
    config.target = target;

    // A journal service would otherwise get every line twice
    config.enable_console = !(target == LogTarget::Journal && !settings.journal_stream.empty());

    if (target == LogTarget::File) {
        if (!settings.cli_file.empty()) {
            config.file_path = settings.cli_file;
        } else if (!settings.config_file.empty()) {
            config.file_path = settings.config_file;
        } else {
            config.file_path = default_log_file(settings.config_path);
        }
    }
    return config;
}

void init(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    bool want_console = config.enable_console;

    switch (config.target) {
    case LogTarget::Journal:
#ifdef PRINTDECK_HAS_SYSTEMD
        sinks.push_back(std::make_shared<spdlog::sinks::systemd_sink_mt>(LOGGER_NAME));
#else
        spdlog::warn("[Logging] Journal support not compiled in, logging to console");
        want_console = true;
#endif
        break;
    case LogTarget::Syslog:
        sinks.push_back(std::make_shared<spdlog::sinks::syslog_sink_mt>(LOGGER_NAME, LOG_PID,
                                                                        LOG_DAEMON, false));
        break;
    case LogTarget::File:
        if (auto sink = make_file_sink(config.file_path)) {
            sinks.push_back(sink);
        } else {
            want_console = true;
        }
        break;
    case LogTarget::Console:
    case LogTarget::Auto:
        want_console = true;
        break;
    }

    if (want_console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }

    auto logger = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
    logger->set_level(config.level);
    spdlog::set_default_logger(logger);

    hlog_set_format("%s");
    hlog_set_handler(forward_hv_log);
    hlog_set_level(to_hv_level(config.level));

    spdlog::debug("[Logging] target={} console={} level={}{}", log_target_name(config.target),
                  want_console ? "yes" : "no", spdlog::level::to_string_view(config.level),
                  config.target == LogTarget::File ? " file=" + config.file_path : "");
}

spdlog::level::level_enum parse_level(const std::string& str,
                                      spdlog::level::level_enum default_level) {
    // from_str maps every unknown name to off
    spdlog::level::level_enum level = spdlog::level::from_str(str);
    if (level == spdlog::level::off && str != "off") {
        return default_level;
    }
    return level;
}

spdlog::level::level_enum verbosity_to_level(int verbosity) {
    if (verbosity <= 0) {
        return spdlog::level::warn;
    }
    switch (verbosity) {
    case 1:
        return spdlog::level::info;
    case 2:
        return spdlog::level::debug;
    default:
        return spdlog::level::trace;
    }
}

spdlog::level::level_enum resolve_log_level(int verbosity, const std::string& config_level,
                                            bool test_mode) {
    if (verbosity > 0) {
        return verbosity_to_level(verbosity);
    }
    spdlog::level::level_enum fallback = test_mode ? spdlog::level::debug : spdlog::level::warn;
    if (!config_level.empty()) {
        return parse_level(config_level, fallback);
    }
    return fallback;
}

int to_hv_level(spdlog::level::level_enum level) {
    switch (level) {
    case spdlog::level::trace:
    case spdlog::level::debug:
        return LOG_LEVEL_DEBUG; // libhv VERBOSE is too noisy
    case spdlog::level::info:
        return LOG_LEVEL_INFO;
    case spdlog::level::warn:
        return LOG_LEVEL_WARN;
    case spdlog::level::err:
        return LOG_LEVEL_ERROR;
    case spdlog::level::critical:
        return LOG_LEVEL_FATAL;
    default:
        return LOG_LEVEL_SILENT;
    }
}

spdlog::level::level_enum from_hv_level(int hv_level) {
    switch (hv_level) {
    case LOG_LEVEL_VERBOSE:
        return spdlog::level::trace;
    case LOG_LEVEL_DEBUG:
        return spdlog::level::debug;
    case LOG_LEVEL_INFO:
        return spdlog::level::info;
    case LOG_LEVEL_WARN:
        return spdlog::level::warn;
    case LOG_LEVEL_ERROR:
        return spdlog::level::err;
    case LOG_LEVEL_FATAL:
        return spdlog::level::critical;
    default:
        return spdlog::level::off;
    }
}

LogTarget parse_log_target(const std::string& str) {
    for (auto target : {LogTarget::Journal, LogTarget::Syslog, LogTarget::File,
                        LogTarget::Console}) {
        if (str == log_target_name(target)) {
            return target;
        }
    }
    return LogTarget::Auto;
}

const char* log_target_name(LogTarget target) {
    switch (target) {
    case LogTarget::Auto:
        return "auto";
    case LogTarget::Journal:
        return "journal";
    case LogTarget::Syslog:
        return "syslog";
    case LogTarget::File:
        return "file";
    case LogTarget::Console:
        return "console";
    }
    return "unknown";
}

} // namespace logging
} // namespace printdeck
