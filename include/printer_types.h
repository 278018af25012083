// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file printer_types.h
 * @brief Printer state and status snapshot types
 *
 * A PrinterStatus is an immutable point-in-time snapshot produced by a
 * backend status call and carried through the polling service to the
 * notification coordinators and the UI bridge.
 */

#include "hv/json.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace printdeck {

using json = nlohmann::json;

/**
 * @brief Machine state reported by the printer
 */
enum class PrinterState {
    READY,       ///< Idle, ready to print
    PRINTING,    ///< Job running
    PAUSED,      ///< Job paused
    COMPLETED,   ///< Job finished successfully
    ERROR,       ///< Printer fault
    BUSY,        ///< Busy with a non-print task
    CALIBRATING, ///< Levelling or other calibration
    HEATING,     ///< Heating before a job
    PAUSING,     ///< Pause requested, not yet paused
    CANCELLED,   ///< Job cancelled
    UNKNOWN      ///< Status string not recognised
};

/**
 * @brief Get display string for a printer state
 */
inline const char* printer_state_to_string(PrinterState state) {
    switch (state) {
    case PrinterState::READY:
        return "Ready";
    case PrinterState::PRINTING:
        return "Printing";
    case PrinterState::PAUSED:
        return "Paused";
    case PrinterState::COMPLETED:
        return "Completed";
    case PrinterState::ERROR:
        return "Error";
    case PrinterState::BUSY:
        return "Busy";
    case PrinterState::CALIBRATING:
        return "Calibrating";
    case PrinterState::HEATING:
        return "Heating";
    case PrinterState::PAUSING:
        return "Pausing";
    case PrinterState::CANCELLED:
        return "Cancelled";
    case PrinterState::UNKNOWN:
        return "Unknown";
    }
    return "Unknown";
}

/**
 * @brief Parse a display string produced by printer_state_to_string()
 *
 * @return Matching state, UNKNOWN for anything else (case sensitive)
 */
PrinterState parse_printer_state(const std::string& str);

/**
 * @brief Active-work states: entering one re-arms notification dedup flags
 */
inline bool is_reset_state(PrinterState state) {
    return state == PrinterState::PRINTING || state == PrinterState::HEATING ||
           state == PrinterState::CALIBRATING || state == PrinterState::BUSY;
}

/**
 * @brief End-of-job states: candidates for raising a notification
 */
inline bool is_trigger_state(PrinterState state) {
    return state == PrinterState::COMPLETED || state == PrinterState::CANCELLED ||
           state == PrinterState::ERROR;
}

/**
 * @brief One heater's readings in degrees Celsius
 */
struct TemperatureReading {
    double current = 0.0;
    double target = 0.0;

    bool is_heating() const {
        return target > 0.0 && current < target;
    }
};

/**
 * @brief Air filtration mode (Adventurer 5M Pro)
 */
enum class FiltrationMode { NONE, INTERNAL, EXTERNAL };

inline const char* filtration_mode_to_string(FiltrationMode mode) {
    switch (mode) {
    case FiltrationMode::NONE:
        return "none";
    case FiltrationMode::INTERNAL:
        return "internal";
    case FiltrationMode::EXTERNAL:
        return "external";
    }
    return "none";
}

struct FiltrationStatus {
    bool available = false;
    FiltrationMode mode = FiltrationMode::NONE;
    double tvoc_level = 0.0;
};

struct FanStatus {
    int cooling_fan_speed = 0; ///< Percent 0-100
    int chamber_fan_speed = 0; ///< Percent 0-100
};

/**
 * @brief Progress of the job currently on the printer
 */
struct JobProgress {
    std::string file_name;
    double percentage = 0.0; ///< 0-100
    int current_layer = 0;
    int total_layers = 0;
    int elapsed_seconds = 0;
    int remaining_seconds = 0;
};

/**
 * @brief Capabilities reported alongside every snapshot
 */
struct CapabilityFlags {
    bool filtration = false;
    bool material_station = false;
    bool led_control = false;
    bool camera = false;
};

/**
 * @brief Point-in-time printer status
 */
struct PrinterStatus {
    PrinterState state = PrinterState::UNKNOWN;
    std::string raw_state; ///< Status string as the printer reported it

    TemperatureReading bed;
    TemperatureReading extruder;
    std::optional<TemperatureReading> chamber;

    FanStatus fans;
    FiltrationStatus filtration;
    std::optional<JobProgress> job;
    CapabilityFlags capabilities;

    std::chrono::system_clock::time_point polled_at{};
};

/**
 * @brief Serialise a snapshot for the UI bridge and web UI
 */
json printer_status_to_json(const PrinterStatus& status);

/**
 * @brief Format a time point as an ISO-8601 UTC string ("2026-01-31T12:00:00.000Z")
 */
std::string format_iso8601(std::chrono::system_clock::time_point tp);

} // namespace printdeck
