// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file fake_camera_io.h
 * @brief In-memory viewer sockets, listener and upstream connector
 */

#include "camera_stream_io.h"

#include <memory>
#include <set>
#include <string>
#include <vector>

namespace printdeck {

class FakeViewerConnection : public ViewerConnection {
  public:
    explicit FakeViewerConnection(std::string address = "127.0.0.1:50000")
        : address_(std::move(address)) {}

    std::string remote_address() const override {
        return address_;
    }

    bool send_head(int status_code, const HttpHeaderList& headers) override {
        if (closed || fail_head) {
            return false;
        }
        head_status = status_code;
        head_headers = headers;
        head_count++;
        return true;
    }

    bool send(const char* data, size_t len) override {
        if (closed || fail_send) {
            return false;
        }
        body.append(data, len);
        return true;
    }

    void close() override {
        closed = true;
        close_count++;
    }

    std::string header(const std::string& name) const {
        for (const auto& h : head_headers) {
            if (h.first == name) {
                return h.second;
            }
        }
        return {};
    }

    int header_count(const std::string& name) const {
        int n = 0;
        for (const auto& h : head_headers) {
            if (h.first == name) {
                n++;
            }
        }
        return n;
    }

    int head_status = 0;
    int head_count = 0;
    HttpHeaderList head_headers;
    std::string body;
    bool closed = false;
    int close_count = 0;
    bool fail_head = false;
    bool fail_send = false;

  private:
    std::string address_;
};

class FakeViewerListener : public ViewerListener {
  public:
    /// Shared with the test after ownership moves into the proxy
    struct State {
        std::set<int> failing_ports;
        std::vector<int> listen_attempts;
        int bound_port = 0;
        bool closed = false;
        ViewerHandlers handlers;
    };

    explicit FakeViewerListener(std::shared_ptr<State> state) : state_(std::move(state)) {}

    bool listen(int port, ViewerHandlers handlers) override {
        state_->listen_attempts.push_back(port);
        if (state_->failing_ports.count(port) > 0) {
            return false;
        }
        state_->bound_port = port;
        state_->closed = false;
        state_->handlers = std::move(handlers);
        return true;
    }

    void close() override {
        state_->closed = true;
        state_->bound_port = 0;
    }

  private:
    std::shared_ptr<State> state_;
};

class FakeUpstreamStream : public UpstreamStream {
  public:
    FakeUpstreamStream(std::string url, UpstreamHandlers handlers)
        : url(std::move(url)), handlers_(std::move(handlers)) {}

    void close() override {
        closed = true;
    }

    // Drivers mirror the real stream: nothing fires once closed
    void respond(int status_code, const HttpHeaderList& headers = {}) {
        if (!closed && handlers_.on_response) {
            handlers_.on_response(status_code, headers);
        }
    }

    void data(const std::string& bytes) {
        if (!closed && handlers_.on_data) {
            handlers_.on_data(bytes.data(), bytes.size());
        }
    }

    void end() {
        if (!closed && handlers_.on_end) {
            handlers_.on_end();
        }
    }

    void error(const std::string& message) {
        if (!closed && handlers_.on_error) {
            handlers_.on_error(message);
        }
    }

    std::string url;
    bool closed = false;

  private:
    UpstreamHandlers handlers_;
};

class FakeUpstreamConnector : public UpstreamConnector {
  public:
    std::shared_ptr<UpstreamStream> open(const std::string& url,
                                         UpstreamHandlers handlers) override {
        opened_urls.push_back(url);
        if (fail_open) {
            return nullptr;
        }
        auto stream = std::make_shared<FakeUpstreamStream>(url, std::move(handlers));
        streams.push_back(stream);
        return stream;
    }

    std::shared_ptr<FakeUpstreamStream> last() const {
        return streams.empty() ? nullptr : streams.back();
    }

    size_t open_count() const {
        size_t n = 0;
        for (const auto& s : streams) {
            if (!s->closed) {
                n++;
            }
        }
        return n;
    }

    std::vector<std::string> opened_urls;
    std::vector<std::shared_ptr<FakeUpstreamStream>> streams;
    bool fail_open = false;
};

} // namespace printdeck
