// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "printer_backend_http.h"

#include "hv/requests.h"

#include <spdlog/spdlog.h>

namespace printdeck {

namespace {

double json_number(const json& j, const char* key, double fallback = 0.0) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number()) {
        return fallback;
    }
    return it->get<double>();
}

std::string json_string(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

} // namespace

HttpPrinterBackend::HttpPrinterBackend(const PrinterDetails& details, PrinterModel model,
                                       hv::EventLoopPtr loop)
    : details_(details), model_(model), features_(features_for_model(model)),
      loop_(std::move(loop)) {
    spdlog::debug("[HttpBackend] Created {} backend for {} ({})", printer_model_display_name(model_),
                  details_.name, details_.ip_address);
}

HttpPrinterBackend::~HttpPrinterBackend() {
    shutting_down_.store(true);

    std::list<HttpThread> threads_to_join;
    {
        std::lock_guard<std::mutex> lock(http_threads_mutex_);
        threads_to_join = std::move(http_threads_);
    }

    if (!threads_to_join.empty()) {
        spdlog::debug("[HttpBackend] Waiting for {} HTTP threads ({})", threads_to_join.size(),
                      details_.name);
    }
    for (auto& t : threads_to_join) {
        if (t.thread.joinable()) {
            t.thread.join();
        }
    }
}

// ============================================================================
// PrinterBackend interface
// ============================================================================

void HttpPrinterBackend::connect(SuccessCallback on_ready, ErrorCallback on_error) {
    if (connected_ || connecting_) {
        spdlog::debug("[HttpBackend] connect() ignored, already {} ({})",
                      connected_ ? "connected" : "connecting", details_.name);
        return;
    }
    if (features_.requires_check_code && details_.check_code.empty()) {
        PrinterError err = PrinterError::auth_failed("connect", 0, "Check code required");
        emit_event(BackendEventType::INITIALIZATION_FAILED, err.message, false);
        if (on_error) {
            on_error(err);
        }
        return;
    }

    connecting_ = true;
    uint64_t gen = generation_;
    spdlog::info("[HttpBackend] Connecting to {} at {}", details_.name, base_url());

    launch_http_thread([this, gen, on_ready, on_error]() {
        ApiResult result = post_api("/detail", auth_payload(), "connect");
        post_to_loop(gen, [this, result, on_ready, on_error]() {
            connecting_ = false;
            if (result.error.has_error()) {
                spdlog::error("[HttpBackend] Connection to {} failed: {}", details_.name,
                              result.error.message);
                emit_event(BackendEventType::INITIALIZATION_FAILED, result.error.user_message(),
                           false);
                if (on_error) {
                    on_error(result.error);
                }
                return;
            }

            connected_ = true;
            spdlog::info("[HttpBackend] Connected to {} ({})", details_.name,
                         printer_model_display_name(model_));
            emit_event(BackendEventType::INITIALIZED);
            if (on_ready) {
                on_ready();
            }
        });
    });
}

void HttpPrinterBackend::disconnect() {
    if (!connected_ && !connecting_) {
        return;
    }

    spdlog::info("[HttpBackend] Disconnecting from {}", details_.name);
    emit_event(BackendEventType::PRE_DISCONNECT);

    connected_ = false;
    connecting_ = false;
    ++generation_;

    emit_event(BackendEventType::DISPOSED);
}

void HttpPrinterBackend::get_status(StatusCallback on_status, ErrorCallback on_error) {
    if (!connected_) {
        if (on_error) {
            on_error(PrinterError::not_connected("get_status"));
        }
        return;
    }

    uint64_t gen = generation_;
    PrinterFeatureSet features = features_;
    launch_http_thread([this, gen, features, on_status, on_error]() {
        ApiResult result = post_api("/detail", auth_payload(), "get_status");

        PrinterStatus status;
        if (!result.error.has_error()) {
            auto it = result.body.find("detail");
            if (it == result.body.end() || !it->is_object()) {
                result.error = PrinterError::parse_error("get_status", "missing detail object");
            } else {
                status = parse_detail(*it, features);
            }
        }

        post_to_loop(gen, [result, status, on_status, on_error]() {
            if (result.error.has_error()) {
                if (on_error) {
                    on_error(result.error);
                }
                return;
            }
            if (on_status) {
                on_status(status);
            }
        });
    });
}

void HttpPrinterBackend::send_command(PrinterCommand command, SuccessCallback on_done,
                                      ErrorCallback on_error) {
    const char* op = printer_command_to_string(command);
    if (!connected_) {
        if (on_error) {
            on_error(PrinterError::not_connected(op));
        }
        return;
    }

    json payload = auth_payload();
    switch (command) {
    case PrinterCommand::PAUSE:
    case PrinterCommand::RESUME:
    case PrinterCommand::CANCEL: {
        const char* action = command == PrinterCommand::PAUSE    ? "pause"
                             : command == PrinterCommand::RESUME ? "continue"
                                                                 : "cancel";
        payload["payload"] = {{"cmd", "jobCtl_cmd"}, {"args", {{"jobID", ""}, {"action", action}}}};
        break;
    }
    case PrinterCommand::LIGHT_ON:
    case PrinterCommand::LIGHT_OFF:
        if (!features_.led_control) {
            if (on_error) {
                on_error(PrinterError::not_supported(op));
            }
            return;
        }
        payload["payload"] = {
            {"cmd", "lightControl_cmd"},
            {"args", {{"status", command == PrinterCommand::LIGHT_ON ? "open" : "close"}}}};
        break;
    }

    spdlog::info("[HttpBackend] Sending {} to {}", op, details_.name);
    uint64_t gen = generation_;
    std::string op_name = op;
    launch_http_thread([this, gen, payload, op_name, on_done, on_error]() {
        ApiResult result = post_api("/control", payload, op_name.c_str());
        post_to_loop(gen, [result, on_done, on_error]() {
            if (result.error.has_error()) {
                if (on_error) {
                    on_error(result.error);
                }
                return;
            }
            if (on_done) {
                on_done();
            }
        });
    });
}

// ============================================================================
// Response mapping
// ============================================================================

PrinterState HttpPrinterBackend::map_machine_status(const std::string& status) {
    if (status == "ready")
        return PrinterState::READY;
    if (status == "printing")
        return PrinterState::PRINTING;
    if (status == "paused")
        return PrinterState::PAUSED;
    if (status == "pausing")
        return PrinterState::PAUSING;
    if (status == "completed")
        return PrinterState::COMPLETED;
    if (status == "cancel" || status == "cancelled")
        return PrinterState::CANCELLED;
    if (status == "error")
        return PrinterState::ERROR;
    if (status == "busy")
        return PrinterState::BUSY;
    if (status == "heating")
        return PrinterState::HEATING;
    if (status == "calibrate_doing" || status == "calibrating")
        return PrinterState::CALIBRATING;
    return PrinterState::UNKNOWN;
}

PrinterStatus HttpPrinterBackend::parse_detail(const json& detail,
                                               const PrinterFeatureSet& features) {
    PrinterStatus status;
    status.raw_state = json_string(detail, "status");
    status.state = map_machine_status(status.raw_state);

    status.bed.current = json_number(detail, "platTemp");
    status.bed.target = json_number(detail, "platTargetTemp");
    status.extruder.current = json_number(detail, "rightTemp");
    status.extruder.target = json_number(detail, "rightTargetTemp");
    if (detail.contains("chamberTemp")) {
        TemperatureReading chamber;
        chamber.current = json_number(detail, "chamberTemp");
        chamber.target = json_number(detail, "chamberTargetTemp");
        status.chamber = chamber;
    }

    status.fans.cooling_fan_speed = static_cast<int>(json_number(detail, "coolingFanSpeed"));
    status.fans.chamber_fan_speed = static_cast<int>(json_number(detail, "chamberFanSpeed"));

    status.filtration.available = features.filtration;
    if (features.filtration) {
        if (json_string(detail, "externalFanStatus") == "open") {
            status.filtration.mode = FiltrationMode::EXTERNAL;
        } else if (json_string(detail, "internalFanStatus") == "open") {
            status.filtration.mode = FiltrationMode::INTERNAL;
        }
        status.filtration.tvoc_level = json_number(detail, "tvoc");
    }

    std::string file_name = json_string(detail, "printFileName");
    if (!file_name.empty()) {
        JobProgress job;
        job.file_name = file_name;
        // printProgress is a 0-1 fraction on this API
        job.percentage = json_number(detail, "printProgress") * 100.0;
        job.current_layer = static_cast<int>(json_number(detail, "printLayer"));
        job.total_layers = static_cast<int>(json_number(detail, "targetPrintLayer"));
        job.elapsed_seconds = static_cast<int>(json_number(detail, "printDuration"));
        int estimated = static_cast<int>(json_number(detail, "estimatedTime"));
        job.remaining_seconds = estimated > job.elapsed_seconds ? estimated - job.elapsed_seconds : 0;
        status.job = job;
    }

    status.capabilities.filtration = features.filtration;
    status.capabilities.material_station = features.material_station;
    status.capabilities.led_control = features.led_control;
    status.capabilities.camera = features.builtin_camera;
    status.polled_at = std::chrono::system_clock::now();
    return status;
}

// ============================================================================
// HTTP plumbing
// ============================================================================

std::string HttpPrinterBackend::base_url() const {
    return "http://" + details_.ip_address + ":" + std::to_string(API_PORT);
}

json HttpPrinterBackend::auth_payload() const {
    return {{"serialNumber", details_.serial_number}, {"checkCode", details_.check_code}};
}

HttpPrinterBackend::ApiResult HttpPrinterBackend::post_api(const std::string& path,
                                                           const json& payload,
                                                           const char* op) const {
    ApiResult result;

    auto req = std::make_shared<HttpRequest>();
    req->method = HTTP_POST;
    req->url = base_url() + path;
    req->timeout = REQUEST_TIMEOUT_SEC;
    req->headers["Content-Type"] = "application/json";
    req->body = payload.dump();

    auto resp = requests::request(req);
    if (!resp) {
        result.error = PrinterError::connection_failed(op, "no response from " + req->url);
        return result;
    }
    if (resp->status_code != 200) {
        result.error = PrinterError::http_error(op, static_cast<int>(resp->status_code));
        return result;
    }

    try {
        result.body = json::parse(resp->body);
    } catch (const json::parse_error& e) {
        result.error = PrinterError::parse_error(op, e.what());
        return result;
    }

    int code = result.body.value("code", -1);
    if (code != 0) {
        result.error = PrinterError::auth_failed(op, code, result.body.value("message", "rejected"));
    }
    return result;
}

void HttpPrinterBackend::launch_http_thread(std::function<void()> func) {
    if (shutting_down_.load()) {
        return;
    }

    std::lock_guard<std::mutex> lock(http_threads_mutex_);

    // Reap threads that finished since the last launch
    for (auto it = http_threads_.begin(); it != http_threads_.end();) {
        if (it->done->load()) {
            it->thread.join();
            it = http_threads_.erase(it);
        } else {
            ++it;
        }
    }

    auto done = std::make_shared<std::atomic<bool>>(false);
    http_threads_.push_back(HttpThread{std::thread([func = std::move(func), done]() {
                                           func();
                                           done->store(true);
                                       }),
                                       done});
}

void HttpPrinterBackend::post_to_loop(uint64_t generation, std::function<void()> func) {
    if (shutting_down_.load()) {
        return;
    }
    std::weak_ptr<bool> weak = lifetime_;
    loop_->queueInLoop([this, weak, generation, func = std::move(func)]() {
        if (weak.expired()) {
            return;
        }
        if (generation != generation_) {
            spdlog::trace("[HttpBackend] Dropping stale response ({})", details_.name);
            return;
        }
        func();
    });
}

void HttpPrinterBackend::emit_event(BackendEventType type, const std::string& message,
                                    bool expected) {
    spdlog::debug("[HttpBackend] {} event: {}", details_.name, backend_event_to_string(type));
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
