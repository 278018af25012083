// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "notification_sink.h"

#include <vector>

namespace printdeck {

/// Remembers every delivered notification
class RecordingNotificationSink : public NotificationSink {
  public:
    bool deliver(const Notification& notification) override {
        delivered.push_back(notification);
        return succeed;
    }

    size_t count(NotificationType type) const {
        size_t n = 0;
        for (const auto& notification : delivered) {
            if (notification.type == type) {
                n++;
            }
        }
        return n;
    }

    std::vector<Notification> delivered;
    bool succeed = true;
};

} // namespace printdeck
