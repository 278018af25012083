// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "printer_details.h"

#include <algorithm>
#include <cctype>

namespace printdeck {

PrinterModel detect_printer_model(const std::string& model_string) {
    std::string lower = model_string;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower.find("mock") != std::string::npos) {
        return PrinterModel::MOCK;
    }
    if (lower.find("5m pro") != std::string::npos) {
        return PrinterModel::ADVENTURER_5M_PRO;
    }
    if (lower.find("5m") != std::string::npos) {
        return PrinterModel::ADVENTURER_5M;
    }
    if (lower.find("ad5x") != std::string::npos) {
        return PrinterModel::AD5X;
    }
    return PrinterModel::GENERIC_LEGACY;
}

PrinterFeatureSet features_for_model(PrinterModel model) {
    PrinterFeatureSet features;
    switch (model) {
    case PrinterModel::ADVENTURER_5M_PRO:
        features.builtin_camera = true;
        features.led_control = true;
        features.filtration = true;
        features.requires_check_code = true;
        break;
    case PrinterModel::ADVENTURER_5M:
        features.requires_check_code = true;
        break;
    case PrinterModel::AD5X:
        features.material_station = true;
        features.requires_check_code = true;
        break;
    case PrinterModel::MOCK:
        features.builtin_camera = true;
        features.led_control = true;
        break;
    case PrinterModel::GENERIC_LEGACY:
        break;
    }
    return features;
}

} // namespace printdeck
