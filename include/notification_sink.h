// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file notification_sink.h
 * @brief User-visible notification payloads and their delivery targets
 */

#include <chrono>
#include <string>

namespace printdeck {

enum class NotificationType { PRINT_COMPLETE, PRINTER_COOLED, CONNECTION_LOST };

inline const char* notification_type_to_string(NotificationType type) {
    switch (type) {
    case NotificationType::PRINT_COMPLETE:
        return "print-complete";
    case NotificationType::PRINTER_COOLED:
        return "printer-cooled";
    case NotificationType::CONNECTION_LOST:
        return "connection-lost";
    }
    return "unknown";
}

enum class NotificationPriority { LOW, NORMAL, HIGH };

struct Notification {
    NotificationType type = NotificationType::PRINT_COMPLETE;
    NotificationPriority priority = NotificationPriority::NORMAL;
    std::string title;
    std::string body;
    std::string context_id;
    std::string printer_name;
    std::chrono::system_clock::time_point timestamp{};
};

/**
 * @brief Delivery target for notifications
 *
 * deliver() reports failure instead of throwing. Callers log the failure
 * and do not retry.
 */
class NotificationSink {
  public:
    virtual ~NotificationSink() = default;

    /**
     * @return false if the notification could not be shown
     */
    virtual bool deliver(const Notification& notification) = 0;
};

/**
 * @brief Shows notifications on the desktop through notify-send
 *
 * notify-send returns as soon as the notification server accepted the
 * message, so the child is waited for and its exit status decides delivery.
 * A missing binary (exit 127) or a rejected notification counts as failed.
 */
class DesktopNotificationSink : public NotificationSink {
  public:
    explicit DesktopNotificationSink(std::string app_name = "PrintDeck",
                                     std::string program = "notify-send");

    bool deliver(const Notification& notification) override;

    /// notify-send urgency for a priority
    static const char* urgency_for(NotificationPriority priority);

  private:
    std::string app_name_;
    std::string program_;
};

/**
 * @brief Writes notifications to the log only (headless and test mode)
 */
class LogNotificationSink : public NotificationSink {
  public:
    bool deliver(const Notification& notification) override;
};

} // namespace printdeck
