// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "notification_coordinator.h"

#include <spdlog/spdlog.h>

namespace printdeck {

NotificationCoordinator::NotificationCoordinator(std::string context_id, std::string printer_name,
                                                 std::shared_ptr<NotificationSink> sink,
                                                 NotificationSettings settings)
    : context_id_(std::move(context_id)), printer_name_(std::move(printer_name)),
      sink_(std::move(sink)), settings_(settings) {}

void NotificationCoordinator::handle_status(const PrinterStatus& status) {
    if (disposed_) {
        return;
    }

    PrinterState state = status.state;
    bool entered = !state_.last_state || *state_.last_state != state;
    state_.last_state = state;

    if (status.job && !status.job->file_name.empty()) {
        last_job_name_ = status.job->file_name;
    }

    if (is_reset_state(state)) {
        if (entered && (state_.print_complete_sent || state_.printer_cooled_sent)) {
            spdlog::debug("[Notifications {}] {} re-arms notifications", context_id_,
                          printer_state_to_string(state));
        }
        if (entered) {
            state_.print_complete_sent = false;
            state_.printer_cooled_sent = false;
            state_.last_print_complete_time.reset();
        }
        return;
    }

    if (is_trigger_state(state)) {
        state_.last_trigger_state = state;

        if (state == PrinterState::COMPLETED && !state_.print_complete_sent) {
            state_.print_complete_sent = true;
            state_.last_print_complete_time = std::chrono::system_clock::now();
            raise(NotificationType::PRINT_COMPLETE, settings_.alert_when_complete, &status);
        }
    }

    if (state_.print_complete_sent && !state_.printer_cooled_sent &&
        status.bed.current <= settings_.cooled_threshold) {
        state_.printer_cooled_sent = true;
        raise(NotificationType::PRINTER_COOLED, settings_.alert_when_cooled, &status);
    }
}

void NotificationCoordinator::handle_backend_event(const BackendEvent& event) {
    if (disposed_) {
        return;
    }
    if (event.type == BackendEventType::PRE_DISCONNECT && !event.expected) {
        spdlog::warn("[Notifications {}] Connection to {} lost: {}", context_id_, printer_name_,
                     event.message);
        reset_state();
        raise(NotificationType::CONNECTION_LOST, true, nullptr);
    }
}

void NotificationCoordinator::update_settings(const NotificationSettings& settings) {
    settings_ = settings;
    spdlog::debug("[Notifications {}] Settings: complete={} cooled={} threshold={}", context_id_,
                  settings_.alert_when_complete, settings_.alert_when_cooled,
                  settings_.cooled_threshold);
}

void NotificationCoordinator::reset_state() {
    state_ = NotificationState{};
}

void NotificationCoordinator::dispose() {
    if (disposed_) {
        return;
    }
    disposed_ = true;
    on_notification.disconnect_all();
    sink_.reset();
    reset_state();
    spdlog::debug("[Notifications {}] Disposed", context_id_);
}

void NotificationCoordinator::raise(NotificationType type, bool enabled,
                                    const PrinterStatus* status) {
    if (!enabled) {
        spdlog::debug("[Notifications {}] {} disabled in settings", context_id_,
                      notification_type_to_string(type));
        return;
    }

    Notification notification = build(type, status);
    spdlog::info("[Notifications {}] {}: {}", context_id_, notification.title, notification.body);

    if (sink_ && !sink_->deliver(notification)) {
        spdlog::error("[Notifications {}] Failed to deliver '{}'", context_id_,
                      notification.title);
    }
    on_notification.emit(notification);
}

Notification NotificationCoordinator::build(NotificationType type,
                                            const PrinterStatus* status) const {
    Notification n;
    n.type = type;
    n.context_id = context_id_;
    n.printer_name = printer_name_;
    n.timestamp = std::chrono::system_clock::now();

    std::string file = last_job_name_;
    if (status && status->job && !status->job->file_name.empty()) {
        file = status->job->file_name;
    }
    if (file.empty()) {
        file = "Unknown";
    }

    switch (type) {
    case NotificationType::PRINT_COMPLETE:
        n.priority = NotificationPriority::NORMAL;
        n.title = "Print Complete";
        n.body = "Your print job \"" + file + "\" has finished.";
        break;
    case NotificationType::PRINTER_COOLED:
        n.priority = NotificationPriority::LOW;
        n.title = "Printer Cooled";
        n.body = file + " is ready for removal.";
        break;
    case NotificationType::CONNECTION_LOST:
        n.priority = NotificationPriority::HIGH;
        n.title = "Connection Lost";
        n.body = "Lost connection to printer \"" + printer_name_ + "\".";
        break;
    }
    return n;
}

} // namespace printdeck
