// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "printer_backend.h"

#include <deque>
#include <string>
#include <vector>

namespace printdeck {

/**
 * @file printer_backend_mock.h
 * @brief Mock printer backend for test mode and unit tests
 *
 * Without scripting, every get_status() call advances a simulated print
 * cycle: Ready -> Heating -> Printing -> Completed (bed cooling) -> Ready.
 *
 * Tests can instead:
 * - queue exact snapshots with queue_status()
 * - hold status calls open (set_auto_respond(false)) and complete them later
 * - make connect() or individual status calls fail
 * - simulate the printer dropping the connection
 *
 * Callbacks are invoked synchronously when auto-respond is on.
 */
class PrinterBackendMock : public PrinterBackend {
  public:
    explicit PrinterBackendMock(const PrinterDetails& details,
                                PrinterModel model = PrinterModel::MOCK);
    ~PrinterBackendMock() override = default;

    // PrinterBackend
    void connect(SuccessCallback on_ready, ErrorCallback on_error) override;
    void disconnect() override;
    void get_status(StatusCallback on_status, ErrorCallback on_error) override;
    void send_command(PrinterCommand command, SuccessCallback on_done,
                      ErrorCallback on_error) override;
    [[nodiscard]] bool is_connected() const override {
        return connected_;
    }
    [[nodiscard]] PrinterModel model() const override {
        return model_;
    }
    [[nodiscard]] PrinterFeatureSet features() const override {
        return features_;
    }
    [[nodiscard]] const PrinterDetails& details() const override {
        return details_;
    }
    void set_event_callback(EventCallback callback) override {
        event_callback_ = std::move(callback);
    }

    // ========================================================================
    // Test control
    // ========================================================================

    /// Make the next connect() fail with @p message
    void set_connect_failure(const std::string& message) {
        connect_failure_ = message;
    }

    /// When false, status calls stay pending until completed explicitly
    void set_auto_respond(bool enabled) {
        auto_respond_ = enabled;
    }

    /// Snapshots returned (in order) before falling back to the simulation
    void queue_status(const PrinterStatus& status) {
        scripted_.push_back(status);
    }

    /// Make the next @p count status calls fail
    void fail_next_status_calls(int count, const PrinterError& error);

    /// Complete the oldest pending status call with the next snapshot
    bool complete_pending_status();

    /// Fail the oldest pending status call
    bool fail_pending_status(const PrinterError& error);

    [[nodiscard]] size_t pending_status_count() const {
        return pending_.size();
    }

    [[nodiscard]] int status_call_count() const {
        return status_calls_;
    }

    [[nodiscard]] const std::vector<PrinterCommand>& sent_commands() const {
        return sent_commands_;
    }

    /// Report an unexpected connection drop (PRE_DISCONNECT then DISPOSED)
    void simulate_connection_lost(const std::string& reason);

    void set_features(const PrinterFeatureSet& features) {
        features_ = features;
    }

  private:
    struct PendingStatus {
        StatusCallback on_status;
        ErrorCallback on_error;
    };

    PrinterStatus next_snapshot();
    PrinterStatus simulate_step();
    void emit_event(BackendEventType type, const std::string& message = "", bool expected = true);

    PrinterDetails details_;
    PrinterModel model_;
    PrinterFeatureSet features_;
    EventCallback event_callback_;

    bool connected_ = false;
    bool auto_respond_ = true;
    std::string connect_failure_;

    std::deque<PrinterStatus> scripted_;
    std::deque<PendingStatus> pending_;
    int failures_remaining_ = 0;
    PrinterError failure_error_;
    int status_calls_ = 0;
    std::vector<PrinterCommand> sent_commands_;

    // Simulation state
    int sim_tick_ = 0;
    double sim_bed_temp_ = 25.0;
    double sim_nozzle_temp_ = 25.0;
    bool sim_paused_ = false;
};

} // namespace printdeck
