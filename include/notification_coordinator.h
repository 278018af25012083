// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file notification_coordinator.h
 * @brief Per-context exactly-once notification state machine
 *
 * Consumes the polling snapshots of one context and decides when a
 * notification is raised:
 *
 * - Entering Printing, Heating, Calibrating or Busy clears every sent flag.
 * - Completed raises PRINT_COMPLETE once per episode.
 * - After PRINT_COMPLETE, a bed at or below the cooled threshold raises
 *   PRINTER_COOLED once.
 * - Cancelled and Error are recorded as the last trigger state only.
 *
 * Settings gate delivery, not state tracking: a disabled notification still
 * consumes its episode. A failed delivery keeps the flag set and is not
 * retried.
 */

#include "event_signal.h"
#include "notification_sink.h"
#include "printer_backend.h"
#include "printer_types.h"

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace printdeck {

struct NotificationSettings {
    bool alert_when_complete = true;
    bool alert_when_cooled = true;
    double cooled_threshold = 40.0; ///< Bed temperature in degrees Celsius
};

/**
 * @brief Dedup state of one context
 */
struct NotificationState {
    bool print_complete_sent = false;
    bool printer_cooled_sent = false;
    std::optional<PrinterState> last_trigger_state;
    std::optional<PrinterState> last_state;
    std::optional<std::chrono::system_clock::time_point> last_print_complete_time;
};

class NotificationCoordinator {
  public:
    NotificationCoordinator(std::string context_id, std::string printer_name,
                            std::shared_ptr<NotificationSink> sink,
                            NotificationSettings settings = {});

    NotificationCoordinator(const NotificationCoordinator&) = delete;
    NotificationCoordinator& operator=(const NotificationCoordinator&) = delete;

    /**
     * @brief Evaluate one polling snapshot of this context
     */
    void handle_status(const PrinterStatus& status);

    /**
     * @brief React to backend lifecycle events
     *
     * An unexpected PRE_DISCONNECT resets the state and raises CONNECTION_LOST.
     */
    void handle_backend_event(const BackendEvent& event);

    void update_settings(const NotificationSettings& settings);

    [[nodiscard]] const NotificationSettings& settings() const {
        return settings_;
    }

    [[nodiscard]] const NotificationState& state() const {
        return state_;
    }

    /// Clear every flag and the recorded trigger state
    void reset_state();

    /**
     * @brief Detach from the sink and drop all slots; later input is ignored
     */
    void dispose();

    [[nodiscard]] bool is_disposed() const {
        return disposed_;
    }

    /// A notification was raised (emitted whether or not delivery succeeded)
    Signal<Notification> on_notification;

  private:
    void raise(NotificationType type, bool enabled, const PrinterStatus* status);
    Notification build(NotificationType type, const PrinterStatus* status) const;

    std::string context_id_;
    std::string printer_name_;
    std::shared_ptr<NotificationSink> sink_;
    NotificationSettings settings_;
    NotificationState state_;
    std::string last_job_name_;
    bool disposed_ = false;
};

} // namespace printdeck
