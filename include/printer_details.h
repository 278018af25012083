// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file printer_details.h
 * @brief Printer identity, model detection and per-model feature sets
 */

#include <string>

namespace printdeck {

/**
 * @brief Printer model families with distinct backends
 */
enum class PrinterModel {
    ADVENTURER_5M,     ///< Adventurer 5M (HTTP API)
    ADVENTURER_5M_PRO, ///< Adventurer 5M Pro (HTTP API, camera, LED, filtration)
    AD5X,              ///< AD5X (HTTP API, material station)
    GENERIC_LEGACY,    ///< Older models with the TCP-only protocol
    MOCK               ///< Simulated printer for test mode
};

/**
 * @brief Identity of one physical printer
 *
 * Immutable for the lifetime of a context. The serial number is the printer
 * identity used for duplicate detection.
 */
struct PrinterDetails {
    std::string name;          ///< Display name
    std::string ip_address;    ///< LAN address
    std::string serial_number; ///< Unique printer identity
    std::string check_code;    ///< Pairing code for the HTTP API
    std::string model;         ///< Model string reported by the printer ("Adventurer 5M Pro")

    std::string custom_camera_url;      ///< User-configured camera source
    bool custom_camera_enabled = false; ///< Prefer custom_camera_url over the built-in camera
};

/**
 * @brief Hardware features that change what the orchestration layer sets up
 */
struct PrinterFeatureSet {
    bool builtin_camera = false;
    bool led_control = false;
    bool filtration = false;
    bool material_station = false;
    bool requires_check_code = false;
};

/**
 * @brief Detect the model family from a printer-reported model string
 *
 * Matching is case-insensitive and ordered by specificity ("5M Pro" before
 * "5M"). Anything unrecognised is GENERIC_LEGACY. "mock" selects MOCK.
 */
PrinterModel detect_printer_model(const std::string& model_string);

/**
 * @brief Feature set of a model family
 */
PrinterFeatureSet features_for_model(PrinterModel model);

/**
 * @brief Display name of a model family
 */
inline const char* printer_model_display_name(PrinterModel model) {
    switch (model) {
    case PrinterModel::ADVENTURER_5M:
        return "Adventurer 5M";
    case PrinterModel::ADVENTURER_5M_PRO:
        return "Adventurer 5M Pro";
    case PrinterModel::AD5X:
        return "AD5X";
    case PrinterModel::GENERIC_LEGACY:
        return "Legacy Printer";
    case PrinterModel::MOCK:
        return "Mock Printer";
    }
    return "Unknown";
}

} // namespace printdeck
