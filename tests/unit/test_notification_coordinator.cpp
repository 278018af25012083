// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file test_notification_coordinator.cpp
 * @brief Exactly-once print-complete / printer-cooled logic
 */

#include "notification_coordinator.h"

#include "../mocks/recording_notification_sink.h"

#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <string>

using namespace printdeck;

namespace {

PrinterStatus snapshot(PrinterState state, double bed = 60.0, const std::string& file = "") {
    PrinterStatus status;
    status.state = state;
    status.bed.current = bed;
    if (!file.empty()) {
        JobProgress job;
        job.file_name = file;
        status.job = job;
    }
    return status;
}

class CoordinatorFixture {
  public:
    CoordinatorFixture()
        : sink(std::make_shared<RecordingNotificationSink>()),
          coordinator("context-1-0", "Workshop", sink) {}

    void feed(PrinterState state, double bed = 60.0, const std::string& file = "") {
        coordinator.handle_status(snapshot(state, bed, file));
    }

    std::shared_ptr<RecordingNotificationSink> sink;
    NotificationCoordinator coordinator;
};

} // namespace

TEST_CASE_METHOD(CoordinatorFixture, "Notifications: complete then cooled, once each",
                 "[notifications]") {
    feed(PrinterState::PRINTING, 60.0, "benchy.gcode");
    feed(PrinterState::COMPLETED, 55.0);

    REQUIRE(sink->count(NotificationType::PRINT_COMPLETE) == 1);
    REQUIRE(sink->count(NotificationType::PRINTER_COOLED) == 0);
    REQUIRE(sink->delivered[0].body == "Your print job \"benchy.gcode\" has finished.");
    REQUIRE(sink->delivered[0].context_id == "context-1-0");
    REQUIRE(coordinator.state().last_print_complete_time.has_value());

    feed(PrinterState::COMPLETED, 48.0);
    feed(PrinterState::COMPLETED, 38.0);
    feed(PrinterState::READY, 30.0);
    feed(PrinterState::READY, 25.0);

    REQUIRE(sink->count(NotificationType::PRINT_COMPLETE) == 1);
    REQUIRE(sink->count(NotificationType::PRINTER_COOLED) == 1);
    REQUIRE(sink->delivered[1].title == "Printer Cooled");
    REQUIRE(sink->delivered[1].priority == NotificationPriority::LOW);
}

TEST_CASE_METHOD(CoordinatorFixture, "Notifications: repeated Completed polls raise nothing new",
                 "[notifications]") {
    for (int i = 0; i < 10; ++i) {
        feed(PrinterState::COMPLETED, 70.0);
    }
    REQUIRE(sink->delivered.size() == 1);
}

TEST_CASE_METHOD(CoordinatorFixture, "Notifications: cooled threshold is inclusive",
                 "[notifications]") {
    feed(PrinterState::COMPLETED, 41.0);
    REQUIRE(sink->count(NotificationType::PRINTER_COOLED) == 0);

    feed(PrinterState::COMPLETED, 40.0);
    REQUIRE(sink->count(NotificationType::PRINTER_COOLED) == 1);
}

TEST_CASE_METHOD(CoordinatorFixture, "Notifications: cold bed on completion raises both",
                 "[notifications]") {
    feed(PrinterState::COMPLETED, 30.0);

    REQUIRE(sink->delivered.size() == 2);
    REQUIRE(sink->delivered[0].type == NotificationType::PRINT_COMPLETE);
    REQUIRE(sink->delivered[1].type == NotificationType::PRINTER_COOLED);
}

TEST_CASE_METHOD(CoordinatorFixture, "Notifications: cooled needs a completion first",
                 "[notifications]") {
    feed(PrinterState::READY, 22.0);
    feed(PrinterState::CANCELLED, 22.0);
    feed(PrinterState::ERROR, 22.0);

    REQUIRE(sink->delivered.empty());
    REQUIRE(coordinator.state().last_trigger_state == std::optional<PrinterState>(PrinterState::ERROR));
}

TEST_CASE_METHOD(CoordinatorFixture, "Notifications: a new job re-arms the flags",
                 "[notifications]") {
    feed(PrinterState::COMPLETED, 30.0);
    REQUIRE(sink->delivered.size() == 2);

    SECTION("Printing") {
        feed(PrinterState::PRINTING, 60.0);
    }
    SECTION("Heating") {
        feed(PrinterState::HEATING, 45.0);
    }
    SECTION("Calibrating") {
        feed(PrinterState::CALIBRATING, 45.0);
    }
    SECTION("Busy") {
        feed(PrinterState::BUSY, 45.0);
    }

    REQUIRE_FALSE(coordinator.state().print_complete_sent);
    REQUIRE_FALSE(coordinator.state().printer_cooled_sent);

    feed(PrinterState::COMPLETED, 30.0);
    REQUIRE(sink->delivered.size() == 4);
}

TEST_CASE_METHOD(CoordinatorFixture, "Notifications: pause does not re-arm", "[notifications]") {
    feed(PrinterState::COMPLETED, 70.0);
    feed(PrinterState::PAUSED, 70.0);
    feed(PrinterState::COMPLETED, 70.0);

    REQUIRE(sink->count(NotificationType::PRINT_COMPLETE) == 1);
}

TEST_CASE_METHOD(CoordinatorFixture, "Notifications: disabled settings still consume the episode",
                 "[notifications][settings]") {
    NotificationSettings settings;
    settings.alert_when_complete = false;
    settings.alert_when_cooled = false;
    coordinator.update_settings(settings);

    feed(PrinterState::COMPLETED, 55.0);
    feed(PrinterState::COMPLETED, 35.0);
    REQUIRE(sink->delivered.empty());
    REQUIRE(coordinator.state().print_complete_sent);
    REQUIRE(coordinator.state().printer_cooled_sent);

    // Re-enabling mid-episode does not produce a late notification
    coordinator.update_settings(NotificationSettings{});
    feed(PrinterState::COMPLETED, 30.0);
    REQUIRE(sink->delivered.empty());
}

TEST_CASE_METHOD(CoordinatorFixture, "Notifications: custom cooled threshold",
                 "[notifications][settings]") {
    NotificationSettings settings;
    settings.cooled_threshold = 50.0;
    coordinator.update_settings(settings);

    feed(PrinterState::COMPLETED, 55.0);
    feed(PrinterState::COMPLETED, 50.0);

    REQUIRE(sink->count(NotificationType::PRINTER_COOLED) == 1);
}

TEST_CASE_METHOD(CoordinatorFixture, "Notifications: failed delivery is not retried",
                 "[notifications]") {
    sink->succeed = false;
    int raised = 0;
    coordinator.on_notification.connect([&](const Notification&) { raised++; });

    feed(PrinterState::COMPLETED, 70.0);
    feed(PrinterState::COMPLETED, 70.0);

    REQUIRE(sink->delivered.size() == 1);
    REQUIRE(raised == 1);
    REQUIRE(coordinator.state().print_complete_sent);
}

TEST_CASE_METHOD(CoordinatorFixture, "Notifications: unexpected disconnect", "[notifications]") {
    feed(PrinterState::COMPLETED, 70.0);
    sink->delivered.clear();

    BackendEvent event;
    event.type = BackendEventType::PRE_DISCONNECT;
    event.expected = false;
    event.message = "socket closed";
    coordinator.handle_backend_event(event);

    REQUIRE(sink->delivered.size() == 1);
    REQUIRE(sink->delivered[0].type == NotificationType::CONNECTION_LOST);
    REQUIRE(sink->delivered[0].priority == NotificationPriority::HIGH);
    REQUIRE(sink->delivered[0].body == "Lost connection to printer \"Workshop\".");
    REQUIRE_FALSE(coordinator.state().print_complete_sent);
}

TEST_CASE_METHOD(CoordinatorFixture, "Notifications: user disconnect is silent",
                 "[notifications]") {
    BackendEvent event;
    event.type = BackendEventType::PRE_DISCONNECT;
    event.expected = true;
    coordinator.handle_backend_event(event);

    event.type = BackendEventType::DISPOSED;
    coordinator.handle_backend_event(event);

    REQUIRE(sink->delivered.empty());
}

TEST_CASE_METHOD(CoordinatorFixture, "Notifications: disposed coordinator ignores input",
                 "[notifications]") {
    coordinator.dispose();
    coordinator.dispose();

    feed(PrinterState::COMPLETED, 30.0);

    REQUIRE(coordinator.is_disposed());
    REQUIRE(sink->delivered.empty());
}

TEST_CASE("Notifications: coordinators of different contexts are independent",
          "[notifications]") {
    auto sink = std::make_shared<RecordingNotificationSink>();
    NotificationCoordinator a("context-1-0", "Left", sink);
    NotificationCoordinator b("context-2-0", "Right", sink);

    a.handle_status(snapshot(PrinterState::COMPLETED, 70.0));
    b.handle_status(snapshot(PrinterState::COMPLETED, 70.0));
    a.handle_status(snapshot(PrinterState::COMPLETED, 70.0));

    REQUIRE(sink->count(NotificationType::PRINT_COMPLETE) == 2);
    REQUIRE(sink->delivered[0].printer_name == "Left");
    REQUIRE(sink->delivered[1].printer_name == "Right");
}

TEST_CASE("DesktopNotificationSink: urgency mapping", "[notifications]") {
    REQUIRE(std::string(DesktopNotificationSink::urgency_for(NotificationPriority::LOW)) == "low");
    REQUIRE(std::string(DesktopNotificationSink::urgency_for(NotificationPriority::NORMAL)) ==
            "normal");
    REQUIRE(std::string(DesktopNotificationSink::urgency_for(NotificationPriority::HIGH)) ==
            "critical");
}

TEST_CASE("DesktopNotificationSink: exit status decides delivery", "[notifications][slow]") {
    Notification n;
    n.type = NotificationType::PRINT_COMPLETE;
    n.priority = NotificationPriority::NORMAL;
    n.title = "Print Complete";
    n.body = "Your print job \"benchy.gcode\" has finished.";

    SECTION("successful run is delivered") {
        DesktopNotificationSink sink("PrintDeck", "true");
        REQUIRE(sink.deliver(n));
    }

    SECTION("rejected notification is a failure") {
        DesktopNotificationSink sink("PrintDeck", "false");
        REQUIRE_FALSE(sink.deliver(n));
    }

    SECTION("missing binary is a failure") {
        DesktopNotificationSink sink("PrintDeck", "/nonexistent/printdeck-notify-send");
        REQUIRE_FALSE(sink.deliver(n));
    }
}

TEST_CASE("NotificationCoordinator: failed desktop delivery keeps dedup state",
          "[notifications][slow]") {
    auto sink = std::make_shared<DesktopNotificationSink>("PrintDeck", "false");
    NotificationCoordinator coordinator("ctx-1", "Left", sink);

    int raised = 0;
    coordinator.on_notification.connect([&](const Notification&) { raised++; });

    coordinator.handle_status(snapshot(PrinterState::PRINTING, 60.0, "benchy.gcode"));
    coordinator.handle_status(snapshot(PrinterState::COMPLETED, 60.0, "benchy.gcode"));
    coordinator.handle_status(snapshot(PrinterState::COMPLETED, 60.0, "benchy.gcode"));

    REQUIRE(raised == 1);
    REQUIRE(coordinator.state().print_complete_sent);
}
