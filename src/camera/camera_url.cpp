// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "camera_url.h"

#include "hv/hurl.h"

#include <spdlog/spdlog.h>

namespace printdeck {

namespace {

bool is_blank(const std::string& s) {
    return s.find_first_not_of(" \t\r\n") == std::string::npos;
}

} // namespace

const char* camera_source_type_to_string(CameraSourceType type) {
    switch (type) {
    case CameraSourceType::NONE:
        return "none";
    case CameraSourceType::BUILTIN:
        return "builtin";
    case CameraSourceType::CUSTOM:
        return "custom";
    }
    return "none";
}

CameraUrlValidation validate_camera_url(const std::string& url) {
    if (is_blank(url)) {
        return {false, "URL is empty or not provided"};
    }

    size_t sep = url.find("://");
    if (sep == std::string::npos || sep == 0) {
        return {false, "Invalid URL format"};
    }
    std::string scheme = url.substr(0, sep);
    if (scheme != "http" && scheme != "https" && scheme != "rtsp") {
        return {false, "Unsupported protocol: " + scheme + ":. Use http://, https://, or rtsp://"};
    }

    HUrl parsed;
    if (!parsed.parse(url)) {
        return {false, "Invalid URL format"};
    }
    if (parsed.host.empty()) {
        return {false, "Invalid hostname in URL"};
    }
    return {true, {}};
}

std::string builtin_camera_url(const std::string& ip_address) {
    return "http://" + ip_address + ":8080/?action=stream";
}

ResolvedCameraConfig resolve_camera_config(const PrinterDetails& details,
                                           const PrinterFeatureSet& features) {
    ResolvedCameraConfig config;

    if (details.custom_camera_enabled) {
        config.source_type = CameraSourceType::CUSTOM;
        if (is_blank(details.custom_camera_url)) {
            // Aftermarket camera on the stock port
            config.stream_url = builtin_camera_url(details.ip_address);
            return config;
        }

        CameraUrlValidation validation = validate_camera_url(details.custom_camera_url);
        if (validation.is_valid) {
            config.stream_url = details.custom_camera_url;
        } else {
            config.unavailable_reason = "Custom camera URL is invalid: " + validation.error;
            spdlog::warn("[CameraUrl] {} ({})", config.unavailable_reason, details.name);
        }
        return config;
    }

    if (features.builtin_camera) {
        config.source_type = CameraSourceType::BUILTIN;
        config.stream_url = builtin_camera_url(details.ip_address);
        return config;
    }

    config.unavailable_reason =
        "Printer does not have built-in camera and custom camera is not configured";
    return config;
}

std::string camera_status_message(const ResolvedCameraConfig& config) {
    if (config.is_available()) {
        switch (config.source_type) {
        case CameraSourceType::BUILTIN:
            return "Using printer built-in camera";
        case CameraSourceType::CUSTOM:
            return "Using custom camera URL";
        case CameraSourceType::NONE:
            break;
        }
        return "Camera available";
    }
    return config.unavailable_reason.empty() ? "Camera not available" : config.unavailable_reason;
}

} // namespace printdeck
