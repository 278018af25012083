// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "printer_details.h"

#include <optional>
#include <string>

namespace printdeck {

enum class CameraSourceType { NONE, BUILTIN, CUSTOM };

const char* camera_source_type_to_string(CameraSourceType type);

struct CameraUrlValidation {
    bool is_valid = false;
    std::string error;
};

/**
 * @brief Result of picking a camera source for a printer
 */
struct ResolvedCameraConfig {
    CameraSourceType source_type = CameraSourceType::NONE;
    std::optional<std::string> stream_url; ///< Unset when unavailable
    std::string unavailable_reason;

    bool is_available() const {
        return stream_url.has_value();
    }
};

/**
 * @brief Accept http, https and rtsp URLs with a host
 */
CameraUrlValidation validate_camera_url(const std::string& url);

/**
 * @brief MJPEG stream URL of the camera built into FlashForge printers
 */
std::string builtin_camera_url(const std::string& ip_address);

/**
 * @brief Pick the camera source for a printer
 *
 * Priority: custom URL (when enabled; an empty custom URL falls back to the
 * built-in pattern, an invalid one makes the camera unavailable), then the
 * built-in camera, then none.
 */
ResolvedCameraConfig resolve_camera_config(const PrinterDetails& details,
                                           const PrinterFeatureSet& features);

/**
 * @brief Human-readable camera status line
 */
std::string camera_status_message(const ResolvedCameraConfig& config);

} // namespace printdeck
