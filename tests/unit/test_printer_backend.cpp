// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file test_printer_backend.cpp
 * @brief Backend factory, HTTP API response mapping and the mock backend
 */

#include "printer_backend.h"
#include "printer_backend_http.h"
#include "printer_backend_mock.h"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <optional>
#include <vector>

using namespace printdeck;

// ============================================================================
// Factory
// ============================================================================

TEST_CASE("PrinterBackend::create: model selects the backend", "[printer_backend]") {
    PrinterDetails details;
    details.name = "Workshop";
    details.ip_address = "127.0.0.1";

    SECTION("HTTP API models") {
        details.model = "Adventurer 5M Pro";
        auto backend = PrinterBackend::create(details, nullptr);
        REQUIRE(backend != nullptr);
        REQUIRE(dynamic_cast<HttpPrinterBackend*>(backend.get()) != nullptr);
        REQUIRE(backend->model() == PrinterModel::ADVENTURER_5M_PRO);
        REQUIRE_FALSE(backend->is_connected());
    }

    SECTION("mock") {
        details.model = "mock";
        auto backend = PrinterBackend::create(details, nullptr);
        REQUIRE(dynamic_cast<PrinterBackendMock*>(backend.get()) != nullptr);
    }

    SECTION("legacy models have no backend") {
        details.model = "Adventurer 3";
        REQUIRE(PrinterBackend::create(details, nullptr) == nullptr);
    }
}

// ============================================================================
// HTTP API mapping
// ============================================================================

TEST_CASE("HttpPrinterBackend: machine status vocabulary", "[printer_backend][http]") {
    REQUIRE(HttpPrinterBackend::map_machine_status("ready") == PrinterState::READY);
    REQUIRE(HttpPrinterBackend::map_machine_status("printing") == PrinterState::PRINTING);
    REQUIRE(HttpPrinterBackend::map_machine_status("pausing") == PrinterState::PAUSING);
    REQUIRE(HttpPrinterBackend::map_machine_status("completed") == PrinterState::COMPLETED);
    REQUIRE(HttpPrinterBackend::map_machine_status("cancel") == PrinterState::CANCELLED);
    REQUIRE(HttpPrinterBackend::map_machine_status("calibrate_doing") ==
            PrinterState::CALIBRATING);
    REQUIRE(HttpPrinterBackend::map_machine_status("heating") == PrinterState::HEATING);
    REQUIRE(HttpPrinterBackend::map_machine_status("Ready") == PrinterState::UNKNOWN);
    REQUIRE(HttpPrinterBackend::map_machine_status("") == PrinterState::UNKNOWN);
}

TEST_CASE("HttpPrinterBackend: parse_detail of a printing 5M Pro", "[printer_backend][http]") {
    json detail = {{"status", "printing"},
                   {"platTemp", 59.8},
                   {"platTargetTemp", 60},
                   {"rightTemp", 219.5},
                   {"rightTargetTemp", 220},
                   {"chamberTemp", 32},
                   {"coolingFanSpeed", 100},
                   {"chamberFanSpeed", 40},
                   {"externalFanStatus", "open"},
                   {"internalFanStatus", "close"},
                   {"tvoc", 2},
                   {"printFileName", "benchy.gcode"},
                   {"printProgress", 0.25},
                   {"printLayer", 50},
                   {"targetPrintLayer", 200},
                   {"printDuration", 600},
                   {"estimatedTime", 2400}};

    PrinterStatus status = HttpPrinterBackend::parse_detail(
        detail, features_for_model(PrinterModel::ADVENTURER_5M_PRO));

    REQUIRE(status.state == PrinterState::PRINTING);
    REQUIRE(status.raw_state == "printing");
    REQUIRE(status.bed.current == Catch::Approx(59.8));
    REQUIRE(status.extruder.target == Catch::Approx(220.0));
    REQUIRE(status.chamber.has_value());
    REQUIRE(status.fans.chamber_fan_speed == 40);
    REQUIRE(status.filtration.mode == FiltrationMode::EXTERNAL);
    REQUIRE(status.capabilities.camera);

    REQUIRE(status.job.has_value());
    REQUIRE(status.job->percentage == Catch::Approx(25.0));
    REQUIRE(status.job->total_layers == 200);
    REQUIRE(status.job->remaining_seconds == 1800);
}

TEST_CASE("HttpPrinterBackend: parse_detail tolerates missing and mistyped fields",
          "[printer_backend][http]") {
    json detail = {{"status", "ready"}, {"platTemp", "hot"}, {"printFileName", ""}};

    PrinterStatus status =
        HttpPrinterBackend::parse_detail(detail, features_for_model(PrinterModel::AD5X));

    REQUIRE(status.state == PrinterState::READY);
    REQUIRE(status.bed.current == Catch::Approx(0.0));
    REQUIRE_FALSE(status.chamber.has_value());
    REQUIRE_FALSE(status.job.has_value());
    REQUIRE_FALSE(status.filtration.available);
    REQUIRE(status.capabilities.material_station);
}

// ============================================================================
// Mock backend
// ============================================================================

TEST_CASE("PrinterBackendMock: lifecycle events", "[printer_backend][mock]") {
    PrinterDetails details;
    details.name = "Mock";
    PrinterBackendMock backend(details);
    std::vector<BackendEvent> events;
    backend.set_event_callback([&](const BackendEvent& e) { events.push_back(e); });

    SECTION("connect then disconnect") {
        bool ready = false;
        backend.connect([&]() { ready = true; }, nullptr);
        backend.disconnect();

        REQUIRE(ready);
        REQUIRE(events.size() == 3);
        REQUIRE(events[0].type == BackendEventType::INITIALIZED);
        REQUIRE(events[1].type == BackendEventType::PRE_DISCONNECT);
        REQUIRE(events[1].expected);
        REQUIRE(events[2].type == BackendEventType::DISPOSED);
    }

    SECTION("connection lost is unexpected") {
        backend.connect(nullptr, nullptr);
        events.clear();
        backend.simulate_connection_lost("cable");

        REQUIRE(events.size() == 2);
        REQUIRE_FALSE(events[0].expected);
        REQUIRE(events[0].message == "cable");
        REQUIRE_FALSE(backend.is_connected());
    }

    SECTION("status before connect fails") {
        std::optional<PrinterError> error;
        backend.get_status(nullptr, [&](const PrinterError& e) { error = e; });
        REQUIRE(error->type == PrinterErrorType::NOT_CONNECTED);
    }
}

TEST_CASE("PrinterBackendMock: simulated cycle completes and cools", "[printer_backend][mock]") {
    PrinterDetails details;
    details.name = "Mock";
    PrinterBackendMock backend(details);
    backend.connect(nullptr, nullptr);

    std::vector<PrinterState> states;
    double completed_bed_min = 1000.0;
    for (int i = 0; i < 45; ++i) {
        backend.get_status(
            [&](const PrinterStatus& s) {
                if (states.empty() || states.back() != s.state) {
                    states.push_back(s.state);
                }
                if (s.state == PrinterState::COMPLETED) {
                    completed_bed_min = std::min(completed_bed_min, s.bed.current);
                }
            },
            nullptr);
    }

    REQUIRE(states == std::vector<PrinterState>{PrinterState::READY, PrinterState::HEATING,
                                                PrinterState::PRINTING, PrinterState::COMPLETED,
                                                PrinterState::READY});
    // Bed drops below the default cooled threshold while still Completed
    REQUIRE(completed_bed_min <= 40.0);
}

TEST_CASE("PrinterBackendMock: commands", "[printer_backend][mock]") {
    PrinterDetails details;
    PrinterBackendMock plain(details, PrinterModel::ADVENTURER_5M);
    plain.connect(nullptr, nullptr);

    bool done = false;
    plain.send_command(PrinterCommand::PAUSE, [&]() { done = true; }, nullptr);
    REQUIRE(done);

    std::optional<PrinterError> error;
    plain.send_command(PrinterCommand::LIGHT_ON, nullptr,
                       [&](const PrinterError& e) { error = e; });
    REQUIRE(error->type == PrinterErrorType::NOT_SUPPORTED);
    REQUIRE(plain.sent_commands() == std::vector<PrinterCommand>{PrinterCommand::PAUSE});
}
