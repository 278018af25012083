// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "printer_backend_mock.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace printdeck {

namespace {

// Simulated cycle, in status calls
constexpr int SIM_READY_END = 2;
constexpr int SIM_HEATING_END = 6;
constexpr int SIM_PRINTING_END = 26;
constexpr int SIM_COMPLETED_END = 40;
constexpr int SIM_CYCLE_END = 45;

constexpr double SIM_AMBIENT = 25.0;
constexpr double SIM_BED_TARGET = 60.0;
constexpr double SIM_NOZZLE_TARGET = 210.0;

} // namespace

PrinterBackendMock::PrinterBackendMock(const PrinterDetails& details, PrinterModel model)
    : details_(details), model_(model), features_(features_for_model(model)) {}

void PrinterBackendMock::connect(SuccessCallback on_ready, ErrorCallback on_error) {
    if (!connect_failure_.empty()) {
        std::string message = std::move(connect_failure_);
        connect_failure_.clear();
        spdlog::debug("[MockBackend] Simulated connection failure for {}: {}", details_.name,
                      message);
        emit_event(BackendEventType::INITIALIZATION_FAILED, message, false);
        if (on_error) {
            on_error(PrinterError::connection_failed("connect", message));
        }
        return;
    }

    connected_ = true;
    spdlog::debug("[MockBackend] Connected {}", details_.name);
    emit_event(BackendEventType::INITIALIZED);
    if (on_ready) {
        on_ready();
    }
}

void PrinterBackendMock::disconnect() {
    if (!connected_) {
        return;
    }
    emit_event(BackendEventType::PRE_DISCONNECT);
    connected_ = false;
    pending_.clear();
    emit_event(BackendEventType::DISPOSED);
}

void PrinterBackendMock::get_status(StatusCallback on_status, ErrorCallback on_error) {
    ++status_calls_;

    if (!connected_) {
        if (on_error) {
            on_error(PrinterError::not_connected("get_status"));
        }
        return;
    }

    if (!auto_respond_) {
        pending_.push_back(PendingStatus{std::move(on_status), std::move(on_error)});
        return;
    }

    if (failures_remaining_ > 0) {
        --failures_remaining_;
        if (on_error) {
            on_error(failure_error_);
        }
        return;
    }

    PrinterStatus status = next_snapshot();
    if (on_status) {
        on_status(status);
    }
}

void PrinterBackendMock::send_command(PrinterCommand command, SuccessCallback on_done,
                                      ErrorCallback on_error) {
    if (!connected_) {
        if (on_error) {
            on_error(PrinterError::not_connected(printer_command_to_string(command)));
        }
        return;
    }

    if ((command == PrinterCommand::LIGHT_ON || command == PrinterCommand::LIGHT_OFF) &&
        !features_.led_control) {
        if (on_error) {
            on_error(PrinterError::not_supported(printer_command_to_string(command)));
        }
        return;
    }

    sent_commands_.push_back(command);
    switch (command) {
    case PrinterCommand::PAUSE:
        sim_paused_ = true;
        break;
    case PrinterCommand::RESUME:
        sim_paused_ = false;
        break;
    case PrinterCommand::CANCEL:
        sim_paused_ = false;
        sim_tick_ = SIM_COMPLETED_END;
        break;
    case PrinterCommand::LIGHT_ON:
    case PrinterCommand::LIGHT_OFF:
        break;
    }
    if (on_done) {
        on_done();
    }
}

void PrinterBackendMock::fail_next_status_calls(int count, const PrinterError& error) {
    failures_remaining_ = count;
    failure_error_ = error;
}

bool PrinterBackendMock::complete_pending_status() {
    if (pending_.empty()) {
        return false;
    }
    PendingStatus pending = std::move(pending_.front());
    pending_.pop_front();
    PrinterStatus status = next_snapshot();
    if (pending.on_status) {
        pending.on_status(status);
    }
    return true;
}

bool PrinterBackendMock::fail_pending_status(const PrinterError& error) {
    if (pending_.empty()) {
        return false;
    }
    PendingStatus pending = std::move(pending_.front());
    pending_.pop_front();
    if (pending.on_error) {
        pending.on_error(error);
    }
    return true;
}

void PrinterBackendMock::simulate_connection_lost(const std::string& reason) {
    if (!connected_) {
        return;
    }
    spdlog::debug("[MockBackend] Simulating connection loss for {}: {}", details_.name, reason);
    emit_event(BackendEventType::PRE_DISCONNECT, reason, false);
    connected_ = false;
    pending_.clear();
    emit_event(BackendEventType::DISPOSED, reason, false);
}

PrinterStatus PrinterBackendMock::next_snapshot() {
    PrinterStatus status;
    if (!scripted_.empty()) {
        status = scripted_.front();
        scripted_.pop_front();
    } else {
        status = simulate_step();
    }
    if (status.polled_at == std::chrono::system_clock::time_point{}) {
        status.polled_at = std::chrono::system_clock::now();
    }
    return status;
}

PrinterStatus PrinterBackendMock::simulate_step() {
    PrinterStatus status;
    status.capabilities.camera = features_.builtin_camera;
    status.capabilities.led_control = features_.led_control;
    status.capabilities.filtration = features_.filtration;
    status.capabilities.material_station = features_.material_station;
    status.filtration.available = features_.filtration;

    auto approach = [](double current, double target, double step) {
        if (current < target) {
            return std::min(target, current + step);
        }
        return std::max(target, current - step);
    };

    int tick = sim_tick_;
    double bed_target = 0.0;
    double nozzle_target = 0.0;

    if (tick < SIM_READY_END) {
        status.state = PrinterState::READY;
    } else if (tick < SIM_HEATING_END) {
        status.state = PrinterState::HEATING;
        bed_target = SIM_BED_TARGET;
        nozzle_target = SIM_NOZZLE_TARGET;
    } else if (tick < SIM_PRINTING_END) {
        status.state = sim_paused_ ? PrinterState::PAUSED : PrinterState::PRINTING;
        bed_target = SIM_BED_TARGET;
        nozzle_target = SIM_NOZZLE_TARGET;
        JobProgress job;
        job.file_name = "mock_benchy.gcode";
        job.total_layers = 200;
        job.percentage = (tick - SIM_HEATING_END) * 100.0 / (SIM_PRINTING_END - SIM_HEATING_END);
        job.current_layer = static_cast<int>(job.percentage * job.total_layers / 100.0);
        job.elapsed_seconds = (tick - SIM_HEATING_END) * 60;
        job.remaining_seconds = (SIM_PRINTING_END - tick) * 60;
        status.job = job;
    } else if (tick < SIM_COMPLETED_END) {
        status.state = PrinterState::COMPLETED;
        JobProgress job;
        job.file_name = "mock_benchy.gcode";
        job.percentage = 100.0;
        job.total_layers = 200;
        job.current_layer = 200;
        status.job = job;
    } else {
        status.state = PrinterState::READY;
    }

    sim_bed_temp_ = approach(sim_bed_temp_, bed_target > 0 ? bed_target : SIM_AMBIENT,
                             bed_target > 0 ? 10.0 : 4.0);
    sim_nozzle_temp_ = approach(sim_nozzle_temp_, nozzle_target > 0 ? nozzle_target : SIM_AMBIENT,
                                nozzle_target > 0 ? 50.0 : 20.0);

    status.bed.current = sim_bed_temp_;
    status.bed.target = bed_target;
    status.extruder.current = sim_nozzle_temp_;
    status.extruder.target = nozzle_target;
    status.raw_state = printer_state_to_string(status.state);

    if (!(sim_paused_ && status.state == PrinterState::PAUSED)) {
        sim_tick_ = (sim_tick_ + 1) % SIM_CYCLE_END;
    }
    return status;
}

void PrinterBackendMock::emit_event(BackendEventType type, const std::string& message,
                                    bool expected) {
    // Copy: the callback may replace itself
    EventCallback callback = event_callback_;
    if (callback) {
        BackendEvent event;
        event.type = type;
        event.message = message;
        event.expected = expected;
        callback(event);
    }
}

} // namespace printdeck
