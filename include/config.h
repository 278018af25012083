// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "camera_proxy.h"
#include "notification_coordinator.h"
#include "printer_details.h"

#include "spdlog/spdlog.h"

#include <string>
#include <vector>

#include "hv/json.hpp"

namespace printdeck {

using json = nlohmann::json;

/**
 * @brief Application configuration manager (singleton)
 *
 * Loads and manages application configuration from a JSON file.
 * Uses JSON pointer syntax (RFC 6901) for nested value access.
 *
 * Thread safety: Not thread-safe. Should be initialized once at startup
 * and accessed from the event loop thread only.
 *
 * Example usage:
 * ```cpp
 * Config* cfg = Config::get_instance();
 * cfg->init(Config::default_path());
 *
 * uint32_t interval = cfg->get<uint32_t>("/polling/interval_ms", 3000);
 *
 * cfg->set<bool>("/notifications/desktop", false);
 * cfg->save();
 * ```
 */
class Config {
  private:
    static Config* instance;
    std::string path;

  protected:
    json data;

    /// Allow test fixture to access protected members
    friend class ConfigTestFixture;

  public:
    Config();

    Config(Config& o) = delete;
    void operator=(const Config&) = delete;

    /**
     * @brief Initialize configuration from file
     *
     * Creates the file (and its directory) with defaults if it doesn't exist.
     * A corrupt file is moved aside to <path>.corrupt and replaced by defaults.
     * Missing sections of an existing file are filled in.
     *
     * @param config_path Path to JSON configuration file
     */
    void init(const std::string& config_path);

    /**
     * @brief Get configuration value at JSON pointer path
     *
     * @throws nlohmann::json::exception if path not found
     */
    template <typename T> T get(const std::string& json_ptr) {
        return data[json::json_pointer(json_ptr)].template get<T>();
    };

    /**
     * @brief Get configuration value with default fallback
     *
     * Returns default_value if the path doesn't exist or holds the wrong type.
     */
    template <typename T> T get(const std::string& json_ptr, const T& default_value) {
        json::json_pointer ptr(json_ptr);
        if (!data.contains(ptr)) {
            return default_value;
        }
        try {
            return data[ptr].template get<T>();
        } catch (const json::exception& e) {
            spdlog::warn("[Config] Wrong type at {}: {}", json_ptr, e.what());
            return default_value;
        }
    };

    /**
     * @brief Set configuration value at JSON pointer path
     *
     * Creates intermediate paths. In-memory only until save().
     */
    template <typename T> T set(const std::string& json_ptr, T v) {
        return data[json::json_pointer(json_ptr)] = v;
    };

    json& get_json(const std::string& json_path);

    /**
     * @brief Save current configuration to file
     *
     * Written to a temp file and renamed into place.
     * @return false if the file could not be written
     */
    bool save();

    std::string get_path();

    // ========================================================================
    // Typed sections
    // ========================================================================

    uint32_t polling_interval_ms();
    int camera_port_range_start();
    int camera_port_range_end();
    CameraReconnectConfig camera_reconnect();
    NotificationSettings notification_settings();
    bool desktop_notifications_enabled();

    /**
     * @brief Printers listed under /printers
     *
     * Entries without an IP address are skipped with a warning.
     */
    std::vector<PrinterDetails> printers();

    /// Default config document
    static json default_config();

    /// $XDG_CONFIG_HOME/printdeck/printdeck.json, else ~/.config/printdeck/printdeck.json
    static std::string default_path();

    static Config* get_instance();
};

} // namespace printdeck
