// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file printer_context.h
 * @brief The unit of management: one printer and the services it owns
 */

#include "camera_proxy.h"
#include "notification_coordinator.h"
#include "printer_backend.h"
#include "printer_details.h"

#include "hv/json.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace printdeck {

using json = nlohmann::json;

/// Opaque, never reused ("context-3-1767225600000")
using ContextId = std::string;

enum class ContextConnectionState { CONNECTING, CONNECTED, DISCONNECTED, ERROR };

inline const char* connection_state_to_string(ContextConnectionState state) {
    switch (state) {
    case ContextConnectionState::CONNECTING:
        return "connecting";
    case ContextConnectionState::CONNECTED:
        return "connected";
    case ContextConnectionState::DISCONNECTED:
        return "disconnected";
    case ContextConnectionState::ERROR:
        return "error";
    }
    return "unknown";
}

/**
 * @brief Live state of one managed printer
 *
 * Owned by the ContextRegistry. The backend, camera proxy and notification
 * coordinator belong to this context alone.
 */
struct PrinterContext {
    ContextId id;
    PrinterDetails details;
    ContextConnectionState connection_state = ContextConnectionState::CONNECTING;

    std::unique_ptr<PrinterBackend> backend;
    std::unique_ptr<CameraProxy> camera_proxy;      ///< Absent without a camera source
    std::vector<int> camera_ports;                  ///< Ports held in the pool for the proxy
    std::unique_ptr<NotificationCoordinator> notifications;

    bool polling_active = false;
    bool is_active = false;
    bool removing = false; ///< Teardown in progress; treated as unknown

    std::chrono::system_clock::time_point created_at{};
    std::chrono::system_clock::time_point last_activity{};
};

/**
 * @brief Serialisable projection of a context
 *
 * Carries no handles; safe to hand to the UI and web UI.
 */
struct ContextInfo {
    ContextId id;
    std::string name;
    std::string ip_address;
    std::string model;
    std::string serial_number;
    ContextConnectionState status = ContextConnectionState::CONNECTING;
    bool is_active = false;
    bool has_camera = false;
    std::optional<std::string> camera_url;
    std::chrono::system_clock::time_point created_at{};
    std::chrono::system_clock::time_point last_activity{};
};

ContextInfo make_context_info(const PrinterContext& context);

json context_info_to_json(const ContextInfo& info);

enum class ContextResultStatus { OK, DUPLICATE_PRINTER, UNKNOWN_CONTEXT, INVALID_BACKEND };

inline const char* context_result_status_to_string(ContextResultStatus status) {
    switch (status) {
    case ContextResultStatus::OK:
        return "ok";
    case ContextResultStatus::DUPLICATE_PRINTER:
        return "duplicate-printer";
    case ContextResultStatus::UNKNOWN_CONTEXT:
        return "unknown-context";
    case ContextResultStatus::INVALID_BACKEND:
        return "invalid-backend";
    }
    return "unknown";
}

/**
 * @brief Outcome of a registry operation
 *
 * For DUPLICATE_PRINTER, context_id is the existing context's id.
 */
struct ContextResult {
    ContextResultStatus status = ContextResultStatus::OK;
    ContextId context_id;
    std::string message;

    bool success() const {
        return status == ContextResultStatus::OK;
    }

    explicit operator bool() const {
        return success();
    }

    static ContextResult ok(const ContextId& id) {
        return {ContextResultStatus::OK, id, {}};
    }

    static ContextResult duplicate(const ContextId& existing, const std::string& serial) {
        return {ContextResultStatus::DUPLICATE_PRINTER, existing,
                "Printer " + serial + " is already connected"};
    }

    static ContextResult unknown(const ContextId& id) {
        return {ContextResultStatus::UNKNOWN_CONTEXT, id, "Unknown context: " + id};
    }

    static ContextResult invalid_backend(const std::string& why) {
        return {ContextResultStatus::INVALID_BACKEND, {}, why};
    }
};

} // namespace printdeck
