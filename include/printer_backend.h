// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "printer_details.h"
#include "printer_error.h"
#include "printer_types.h"

#include "hv/EventLoop.h"

#include <functional>
#include <memory>
#include <string>

namespace printdeck {

/**
 * @file printer_backend.h
 * @brief Abstract interface for per-model printer backends
 *
 * A backend is the capability object one printer context owns exclusively.
 * Concrete implementations handle the model-specific protocol:
 * - HttpPrinterBackend: Adventurer 5M / 5M Pro / AD5X over the printer HTTP API
 * - PrinterBackendMock: simulated print cycle for test mode and unit tests
 *
 * All callbacks are delivered on the event loop thread.
 */

/**
 * @brief Lifecycle events a backend reports
 */
enum class BackendEventType {
    INITIALIZED,           ///< connect() completed, backend ready for status calls
    INITIALIZATION_FAILED, ///< connect() failed
    PRE_DISCONNECT,        ///< About to drop the connection
    DISPOSED               ///< Connection gone for good; the owning context must go too
};

inline const char* backend_event_to_string(BackendEventType type) {
    switch (type) {
    case BackendEventType::INITIALIZED:
        return "initialized";
    case BackendEventType::INITIALIZATION_FAILED:
        return "initialization-failed";
    case BackendEventType::PRE_DISCONNECT:
        return "pre-disconnect";
    case BackendEventType::DISPOSED:
        return "disposed";
    }
    return "unknown";
}

struct BackendEvent {
    BackendEventType type = BackendEventType::INITIALIZED;
    std::string message; ///< Error text for INITIALIZATION_FAILED / unexpected DISPOSED
    bool expected = true; ///< false when the printer dropped us (not a user disconnect)
};

/**
 * @brief Printer commands common to every backend
 */
enum class PrinterCommand { PAUSE, RESUME, CANCEL, LIGHT_ON, LIGHT_OFF };

inline const char* printer_command_to_string(PrinterCommand cmd) {
    switch (cmd) {
    case PrinterCommand::PAUSE:
        return "pause";
    case PrinterCommand::RESUME:
        return "resume";
    case PrinterCommand::CANCEL:
        return "cancel";
    case PrinterCommand::LIGHT_ON:
        return "light_on";
    case PrinterCommand::LIGHT_OFF:
        return "light_off";
    }
    return "unknown";
}

class PrinterBackend {
  public:
    using SuccessCallback = std::function<void()>;
    using StatusCallback = std::function<void(const PrinterStatus&)>;
    using ErrorCallback = std::function<void(const PrinterError&)>;
    using EventCallback = std::function<void(const BackendEvent&)>;

    virtual ~PrinterBackend() = default;

    /**
     * @brief Open the connection and verify the printer answers
     *
     * Reports INITIALIZED or INITIALIZATION_FAILED through the event callback
     * before invoking @p on_ready or @p on_error.
     */
    virtual void connect(SuccessCallback on_ready, ErrorCallback on_error) = 0;

    /**
     * @brief Close the connection
     *
     * Reports PRE_DISCONNECT then DISPOSED. Pending callbacks are dropped.
     * Safe to call when not connected.
     */
    virtual void disconnect() = 0;

    /**
     * @brief Fetch a status snapshot
     */
    virtual void get_status(StatusCallback on_status, ErrorCallback on_error) = 0;

    /**
     * @brief Send a printer command
     */
    virtual void send_command(PrinterCommand command, SuccessCallback on_done,
                              ErrorCallback on_error) = 0;

    [[nodiscard]] virtual bool is_connected() const = 0;

    [[nodiscard]] virtual PrinterModel model() const = 0;

    [[nodiscard]] virtual PrinterFeatureSet features() const = 0;

    [[nodiscard]] virtual const PrinterDetails& details() const = 0;

    /**
     * @brief Replace the lifecycle event callback
     *
     * Only one callback is held; the context registry installs its own once
     * the backend has been wrapped in a context.
     */
    virtual void set_event_callback(EventCallback callback) = 0;

    /**
     * @brief Factory method to create the backend for a printer's model
     *
     * @param details Printer identity (model string selects the backend)
     * @param loop Event loop that callbacks are delivered on
     * @return Backend instance, or nullptr if the model is not supported
     */
    static std::unique_ptr<PrinterBackend> create(const PrinterDetails& details,
                                                  hv::EventLoopPtr loop);
};

} // namespace printdeck
