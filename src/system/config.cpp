// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "config.h"

#include "polling_service.h"
#include "port_allocator.h"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace printdeck {

Config* Config::instance{NULL};

namespace {

/// Add keys present in @p defaults but missing in @p target (recursively)
bool merge_missing(json& target, const json& defaults) {
    bool modified = false;
    for (const auto& item : defaults.items()) {
        const std::string& key = item.key();
        if (!target.contains(key)) {
            target[key] = item.value();
            modified = true;
        } else if (item.value().is_object() && target[key].is_object()) {
            modified |= merge_missing(target[key], item.value());
        }
    }
    return modified;
}

bool write_json_file(const std::string& path, const json& data) {
    std::string tmp_path = path + ".tmp";
    {
        std::ofstream o(tmp_path);
        if (!o.is_open()) {
            spdlog::error("[Config] Failed to open {} for writing", tmp_path);
            return false;
        }
        o << std::setw(2) << data << std::endl;
        if (!o.good()) {
            spdlog::error("[Config] Error writing {}", tmp_path);
            return false;
        }
    }
    if (std::rename(tmp_path.c_str(), path.c_str()) != 0) {
        spdlog::error("[Config] Failed to move {} into place", tmp_path);
        std::remove(tmp_path.c_str());
        return false;
    }
    return true;
}

} // namespace

Config::Config() {}

Config* Config::get_instance() {
    if (instance == nullptr) {
        instance = new Config();
    }
    return instance;
}

json Config::default_config() {
    return {{"log_level", "warn"},
            {"log_dest", "auto"},
            {"log_file", ""},
            {"polling", {{"interval_ms", PollingService::DEFAULT_INTERVAL_MS}}},
            {"camera",
             {{"port_range_start", PortAllocator::DEFAULT_START_PORT},
              {"port_range_end", PortAllocator::DEFAULT_END_PORT},
              {"reconnect",
               {{"enabled", true},
                {"max_retries", 5},
                {"retry_delay_ms", 2000},
                {"exponential_backoff", true}}}}},
            {"notifications",
             {{"alert_when_complete", true},
              {"alert_when_cooled", true},
              {"cooled_threshold", 40},
              {"desktop", true}}},
            {"printers", json::array()}};
}

std::string Config::default_path() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) {
        return std::string(xdg) + "/printdeck/printdeck.json";
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return std::string(home) + "/.config/printdeck/printdeck.json";
    }
    return "printdeck.json";
}

void Config::init(const std::string& config_path) {
    path = config_path;
    struct stat buffer;
    bool config_modified = false;

    if (stat(config_path.c_str(), &buffer) == 0) {
        spdlog::info("[Config] Loading config from {}", config_path);
        try {
            data = json::parse(std::fstream(config_path));
        } catch (const json::exception& e) {
            spdlog::error("[Config] Failed to parse {}: {}", config_path, e.what());
            spdlog::warn("[Config] Config file is corrupt, resetting to defaults");

            std::string backup_path = config_path + ".corrupt";
            std::rename(config_path.c_str(), backup_path.c_str());
            spdlog::info("[Config] Corrupt config backed up to {}", backup_path);

            data = default_config();
            config_modified = true;
        }

        if (!data.is_object()) {
            spdlog::warn("[Config] Config root is not an object, resetting to defaults");
            data = default_config();
            config_modified = true;
        } else if (merge_missing(data, default_config())) {
            config_modified = true;
        }
    } else {
        spdlog::info("[Config] Creating default config at {}", config_path);
        fs::path config_dir = fs::path(config_path).parent_path();
        if (!config_dir.empty() && !fs::exists(config_dir)) {
            std::error_code ec;
            fs::create_directories(config_dir, ec);
            if (ec) {
                spdlog::warn("[Config] Cannot create {}: {}", config_dir.string(), ec.message());
            }
        }
        data = default_config();
        config_modified = true;
    }

    if (config_modified && !write_json_file(config_path, data)) {
        spdlog::warn("[Config] Continuing with in-memory config");
    }

    spdlog::debug("[Config] initialized: {} printer(s), poll every {}ms",
                  data["printers"].is_array() ? data["printers"].size() : 0,
                  polling_interval_ms());
}

std::string Config::get_path() {
    return path;
}

json& Config::get_json(const std::string& json_path) {
    return data[json::json_pointer(json_path)];
}

bool Config::save() {
    spdlog::trace("[Config] Saving config to {}", path);
    try {
        if (!write_json_file(path, data)) {
            return false;
        }
    } catch (const std::exception& e) {
        spdlog::error("[Config] Exception while saving config to {}: {}", path, e.what());
        return false;
    }
    spdlog::trace("[Config] saved successfully to {}", path);
    return true;
}

// ============================================================================
// Typed sections
// ============================================================================

uint32_t Config::polling_interval_ms() {
    int interval = get<int>("/polling/interval_ms", PollingService::DEFAULT_INTERVAL_MS);
    if (interval <= 0) {
        spdlog::warn("[Config] Invalid /polling/interval_ms {}, using {}", interval,
                     PollingService::DEFAULT_INTERVAL_MS);
        return PollingService::DEFAULT_INTERVAL_MS;
    }
    return static_cast<uint32_t>(interval);
}

int Config::camera_port_range_start() {
    return get<int>("/camera/port_range_start", PortAllocator::DEFAULT_START_PORT);
}

int Config::camera_port_range_end() {
    return get<int>("/camera/port_range_end", PortAllocator::DEFAULT_END_PORT);
}

CameraReconnectConfig Config::camera_reconnect() {
    CameraReconnectConfig cfg;
    cfg.enabled = get<bool>("/camera/reconnect/enabled", cfg.enabled);
    cfg.max_retries = get<int>("/camera/reconnect/max_retries", cfg.max_retries);
    cfg.retry_delay_ms = get<uint32_t>("/camera/reconnect/retry_delay_ms", cfg.retry_delay_ms);
    cfg.exponential_backoff =
        get<bool>("/camera/reconnect/exponential_backoff", cfg.exponential_backoff);
    if (cfg.max_retries < 0) {
        cfg.max_retries = 0;
    }
    return cfg;
}

NotificationSettings Config::notification_settings() {
    NotificationSettings settings;
    settings.alert_when_complete =
        get<bool>("/notifications/alert_when_complete", settings.alert_when_complete);
    settings.alert_when_cooled =
        get<bool>("/notifications/alert_when_cooled", settings.alert_when_cooled);
    settings.cooled_threshold =
        get<double>("/notifications/cooled_threshold", settings.cooled_threshold);
    return settings;
}

bool Config::desktop_notifications_enabled() {
    return get<bool>("/notifications/desktop", true);
}

std::vector<PrinterDetails> Config::printers() {
    std::vector<PrinterDetails> result;
    json::json_pointer ptr("/printers");
    if (!data.contains(ptr) || !data[ptr].is_array()) {
        return result;
    }

    for (const auto& entry : data[ptr]) {
        if (!entry.is_object()) {
            continue;
        }
        PrinterDetails details;
        details.name = entry.value("name", "");
        details.ip_address = entry.value("ip", "");
        details.serial_number = entry.value("serial_number", "");
        details.check_code = entry.value("check_code", "");
        details.model = entry.value("model", "");
        details.custom_camera_url = entry.value("custom_camera_url", "");
        details.custom_camera_enabled = entry.value("custom_camera_enabled", false);

        if (details.ip_address.empty()) {
            spdlog::warn("[Config] Skipping printer '{}' without an IP address", details.name);
            continue;
        }
        if (details.name.empty()) {
            details.name = details.ip_address;
        }
        result.push_back(std::move(details));
    }
    return result;
}

} // namespace printdeck
