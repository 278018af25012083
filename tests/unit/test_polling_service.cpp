// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "polling_service.h"
#include "printer_backend_mock.h"

#include "../mocks/manual_scheduler.h"

#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <string>
#include <vector>

using namespace printdeck;

namespace {

PrinterStatus status_with_state(PrinterState state) {
    PrinterStatus status;
    status.state = state;
    status.raw_state = printer_state_to_string(state);
    return status;
}

class PollingFixture {
  public:
    PollingFixture() : ports(9000, 9009), registry(scheduler, ports), polling(registry, scheduler, 1000) {
        polling.on_polling_data.connect([this](const ContextId& id, const PrinterStatus& s) {
            data.emplace_back(id, s.state);
        });
        polling.on_polling_error.connect(
            [this](const ContextId& id, const PrinterError& e) { errors.emplace_back(id, e.type); });
    }

    ContextId add(const std::string& serial, PrinterBackendMock** out) {
        PrinterDetails details;
        details.name = serial;
        details.serial_number = serial;
        details.ip_address = "127.0.0.1";
        auto backend = std::make_unique<PrinterBackendMock>(details);
        backend->connect(nullptr, nullptr);
        *out = backend.get();
        return registry.create_context(std::move(backend), details).context_id;
    }

    ManualScheduler scheduler;
    PortAllocator ports;
    ContextRegistry registry;
    PollingService polling;

    std::vector<std::pair<ContextId, PrinterState>> data;
    std::vector<std::pair<ContextId, PrinterErrorType>> errors;
};

} // namespace

TEST_CASE_METHOD(PollingFixture, "PollingService: first poll runs immediately",
                 "[polling]") {
    PrinterBackendMock* backend = nullptr;
    ContextId id = add("SN-A", &backend);
    backend->queue_status(status_with_state(PrinterState::READY));

    REQUIRE(polling.start_polling_for_context(id));

    REQUIRE(backend->status_call_count() == 1);
    REQUIRE(data.size() == 1);
    REQUIRE(data[0] == std::make_pair(id, PrinterState::READY));
    REQUIRE(registry.get_context(id)->polling_active);
    REQUIRE(polling.last_data(id)->state == PrinterState::READY);
}

TEST_CASE_METHOD(PollingFixture, "PollingService: polls on every interval", "[polling]") {
    PrinterBackendMock* backend = nullptr;
    ContextId id = add("SN-A", &backend);

    polling.start_polling_for_context(id);
    scheduler.advance(3000);

    REQUIRE(backend->status_call_count() == 4);
    REQUIRE(data.size() == 4);
}

TEST_CASE_METHOD(PollingFixture, "PollingService: starting twice is a no-op", "[polling]") {
    PrinterBackendMock* backend = nullptr;
    ContextId id = add("SN-A", &backend);
    int started = 0;
    polling.on_polling_started.connect([&](const ContextId&) { started++; });

    REQUIRE(polling.start_polling_for_context(id));
    REQUIRE(polling.start_polling_for_context(id));

    REQUIRE(started == 1);
    REQUIRE(backend->status_call_count() == 1);
    REQUIRE(scheduler.pending_timers() == 1);
}

TEST_CASE_METHOD(PollingFixture, "PollingService: unknown context is refused", "[polling]") {
    REQUIRE_FALSE(polling.start_polling_for_context("context-7-0"));
    REQUIRE(polling.polling_count() == 0);
}

TEST_CASE_METHOD(PollingFixture, "PollingService: at most one call in flight", "[polling]") {
    PrinterBackendMock* backend = nullptr;
    ContextId id = add("SN-A", &backend);
    backend->set_auto_respond(false);

    polling.start_polling_for_context(id);
    scheduler.advance(5000);

    // Ticks while the first call is pending are skipped, not queued
    REQUIRE(backend->status_call_count() == 1);
    REQUIRE(backend->pending_status_count() == 1);

    REQUIRE(backend->complete_pending_status());
    REQUIRE(data.size() == 1);

    scheduler.advance(1000);
    REQUIRE(backend->status_call_count() == 2);
}

TEST_CASE_METHOD(PollingFixture, "PollingService: errors do not stop polling", "[polling]") {
    PrinterBackendMock* backend = nullptr;
    ContextId id = add("SN-A", &backend);
    backend->fail_next_status_calls(2, PrinterError::timeout("get_status", 5000));

    polling.start_polling_for_context(id);
    scheduler.advance(2000);

    REQUIRE(errors.size() == 2);
    REQUIRE(errors[0] == std::make_pair(id, PrinterErrorType::TIMEOUT));
    REQUIRE(data.size() == 1);
    REQUIRE(polling.is_polling(id));
}

TEST_CASE_METHOD(PollingFixture, "PollingService: stop discards the in-flight result",
                 "[polling]") {
    PrinterBackendMock* backend = nullptr;
    ContextId id = add("SN-A", &backend);
    backend->set_auto_respond(false);
    int stopped = 0;
    polling.on_polling_stopped.connect([&](const ContextId&) { stopped++; });

    polling.start_polling_for_context(id);
    polling.stop_polling_for_context(id);

    REQUIRE(stopped == 1);
    REQUIRE_FALSE(registry.get_context(id)->polling_active);
    REQUIRE(scheduler.pending_timers() == 0);

    SECTION("late result is dropped") {
        REQUIRE(backend->complete_pending_status());
        REQUIRE(data.empty());
    }

    SECTION("late result from before a restart is dropped") {
        polling.start_polling_for_context(id);
        REQUIRE(backend->pending_status_count() == 2);

        backend->complete_pending_status();
        REQUIRE(data.empty());

        backend->complete_pending_status();
        REQUIRE(data.size() == 1);
    }
}

TEST_CASE_METHOD(PollingFixture, "PollingService: every context is polled", "[polling]") {
    PrinterBackendMock* a = nullptr;
    PrinterBackendMock* b = nullptr;
    ContextId id_a = add("SN-A", &a);
    ContextId id_b = add("SN-B", &b);
    registry.switch_active(id_a);

    polling.start_polling_for_context(id_a);
    polling.start_polling_for_context(id_b);
    scheduler.advance(1000);

    REQUIRE(a->status_call_count() == 2);
    REQUIRE(b->status_call_count() == 2);
}

TEST_CASE_METHOD(PollingFixture, "PollingService: switch re-emits the cached snapshot",
                 "[polling]") {
    PrinterBackendMock* a = nullptr;
    PrinterBackendMock* b = nullptr;
    ContextId id_a = add("SN-A", &a);
    ContextId id_b = add("SN-B", &b);
    b->queue_status(status_with_state(PrinterState::PRINTING));

    polling.start_polling_for_context(id_b);
    data.clear();

    registry.switch_active(id_b);
    REQUIRE(data.empty());
    scheduler.run_posted();
    REQUIRE(data.size() == 1);
    REQUIRE(data[0] == std::make_pair(id_b, PrinterState::PRINTING));

    // Nothing cached yet for A
    data.clear();
    registry.switch_active(id_a);
    scheduler.run_posted();
    REQUIRE(data.empty());
}

TEST_CASE_METHOD(PollingFixture, "PollingService: removing a context stops its polling",
                 "[polling]") {
    PrinterBackendMock* backend = nullptr;
    ContextId id = add("SN-A", &backend);
    polling.start_polling_for_context(id);

    registry.remove_context(id);

    REQUIRE_FALSE(polling.is_polling(id));
    REQUIRE(scheduler.pending_timers() == 0);
}

TEST_CASE_METHOD(PollingFixture, "PollingService: stop_all", "[polling]") {
    PrinterBackendMock* a = nullptr;
    PrinterBackendMock* b = nullptr;
    polling.start_polling_for_context(add("SN-A", &a));
    polling.start_polling_for_context(add("SN-B", &b));

    polling.stop_all();

    REQUIRE(polling.polling_count() == 0);
    REQUIRE(scheduler.pending_timers() == 0);
}
