// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "printer_backend.h"

#include "hv/json.hpp"

#include <atomic>
#include <list>
#include <mutex>
#include <thread>

namespace printdeck {

/**
 * @brief Backend for printers with the local HTTP API (Adventurer 5M family, AD5X)
 *
 * Requests are authenticated with the serial number and check code and sent
 * with libhv's blocking requests API on tracked worker threads. Results are
 * posted back to the event loop, so every callback runs on the loop thread.
 *
 * A generation counter is bumped on disconnect(); results from requests
 * started under an older generation are dropped.
 */
class HttpPrinterBackend : public PrinterBackend {
  public:
    static constexpr int API_PORT = 8898;
    static constexpr int REQUEST_TIMEOUT_SEC = 5;

    HttpPrinterBackend(const PrinterDetails& details, PrinterModel model, hv::EventLoopPtr loop);
    ~HttpPrinterBackend() override;

    HttpPrinterBackend(const HttpPrinterBackend&) = delete;
    HttpPrinterBackend& operator=(const HttpPrinterBackend&) = delete;

    void connect(SuccessCallback on_ready, ErrorCallback on_error) override;
    void disconnect() override;
    void get_status(StatusCallback on_status, ErrorCallback on_error) override;
    void send_command(PrinterCommand command, SuccessCallback on_done,
                      ErrorCallback on_error) override;

    bool is_connected() const override {
        return connected_;
    }
    PrinterModel model() const override {
        return model_;
    }
    PrinterFeatureSet features() const override {
        return features_;
    }
    const PrinterDetails& details() const override {
        return details_;
    }
    void set_event_callback(EventCallback callback) override {
        event_callback_ = std::move(callback);
    }

    /**
     * @brief Map the printer's machine status string onto PrinterState
     *
     * Accepts the HTTP API vocabulary ("ready", "printing", "calibrate_doing",
     * "cancel", ...).
     */
    static PrinterState map_machine_status(const std::string& status);

    /**
     * @brief Build a snapshot from a /detail response body
     *
     * @param detail The "detail" object of the response
     * @param features Model feature set (fills capability flags)
     */
    static PrinterStatus parse_detail(const json& detail, const PrinterFeatureSet& features);

  private:
    /// Outcome of one API round trip, evaluated on the worker thread
    struct ApiResult {
        PrinterError error;
        json body;
    };

    std::string base_url() const;
    json auth_payload() const;
    ApiResult post_api(const std::string& path, const json& payload, const char* op) const;

    void launch_http_thread(std::function<void()> func);
    void post_to_loop(uint64_t generation, std::function<void()> func);
    void emit_event(BackendEventType type, const std::string& message = "", bool expected = true);

    PrinterDetails details_;
    PrinterModel model_;
    PrinterFeatureSet features_;
    hv::EventLoopPtr loop_;
    EventCallback event_callback_;

    bool connected_ = false;
    bool connecting_ = false;
    uint64_t generation_ = 0;

    struct HttpThread {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    std::list<HttpThread> http_threads_;
    std::mutex http_threads_mutex_;
    std::atomic<bool> shutting_down_{false};

    std::shared_ptr<bool> lifetime_ = std::make_shared<bool>(true);
};

} // namespace printdeck
