// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "camera_proxy.h"

#include "printer_types.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace printdeck {

namespace {

bool header_name_equals(const std::string& a, const char* b) {
    size_t len = std::char_traits<char>::length(b);
    if (a.size() != len) {
        return false;
    }
    for (size_t i = 0; i < len; ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

} // namespace

json camera_proxy_status_to_json(const CameraProxyStatus& status) {
    json clients = json::array();
    for (const auto& client : status.clients) {
        clients.push_back({{"id", client.id},
                           {"remoteAddress", client.remote_address},
                           {"connectedAt", format_iso8601(client.connected_at)},
                           {"isConnected", true}});
    }

    return {{"isRunning", status.is_running},
            {"port", status.port},
            {"proxyUrl", status.proxy_url},
            {"isStreaming", status.is_streaming},
            {"sourceUrl", status.source_url ? json(*status.source_url) : json(nullptr)},
            {"clientCount", status.client_count},
            {"clients", clients},
            {"lastError", status.last_error ? json(*status.last_error) : json(nullptr)},
            {"stats",
             {{"bytesReceived", status.stats.bytes_received},
              {"bytesSent", status.stats.bytes_sent},
              {"successfulConnections", status.stats.successful_connections},
              {"failedConnections", status.stats.failed_connections},
              {"currentRetryCount", status.stats.current_retry_count}}}};
}

CameraProxy::CameraProxy(std::string owner_tag, Scheduler& scheduler,
                         std::unique_ptr<ViewerListener> listener,
                         std::shared_ptr<UpstreamConnector> connector)
    : tag_(std::move(owner_tag)), scheduler_(scheduler), listener_(std::move(listener)),
      connector_(std::move(connector)) {
    current_port_ = config_.port;
}

CameraProxy::~CameraProxy() {
    shutdown();
}

// ============================================================================
// Lifecycle
// ============================================================================

ProxyError CameraProxy::initialize(const CameraProxyConfig& config) {
    config_ = config;
    if (!running_) {
        current_port_ = config_.port;
    }
    spdlog::debug("[CameraProxy {}] Initialized: port={} fallback={} max_retries={} "
                  "retry_delay={}ms",
                  tag_, config_.port, config_.fallback_port, config_.reconnection.max_retries,
                  config_.reconnection.retry_delay_ms);

    if (config_.auto_start) {
        return start();
    }
    return ProxyError::ok();
}

ProxyError CameraProxy::start() {
    if (running_) {
        spdlog::debug("[CameraProxy {}] Already running on port {}", tag_, current_port_);
        return ProxyError::ok();
    }

    ViewerHandlers handlers;
    handlers.on_camera_request = [this](std::shared_ptr<ViewerConnection> conn) {
        return handle_viewer_connect(std::move(conn));
    };
    handlers.on_viewer_closed = [this](const std::string& id) { handle_viewer_disconnect(id); };
    handlers.health_json = [this]() { return camera_proxy_status_to_json(get_status()).dump(); };

    if (listener_->listen(config_.port, handlers)) {
        current_port_ = config_.port;
        running_ = true;
        spdlog::info("[CameraProxy {}] Listening on http://localhost:{}/camera", tag_,
                     current_port_);
        on_proxy_started.emit(current_port_);
        return ProxyError::ok();
    }

    if (config_.fallback_port > 0 && config_.fallback_port != config_.port) {
        spdlog::warn("[CameraProxy {}] Port {} in use, trying fallback port {}", tag_,
                     config_.port, config_.fallback_port);
        if (listener_->listen(config_.fallback_port, handlers)) {
            int old_port = config_.port;
            current_port_ = config_.fallback_port;
            running_ = true;
            spdlog::info("[CameraProxy {}] Listening on http://localhost:{}/camera", tag_,
                         current_port_);
            on_proxy_started.emit(current_port_);
            on_port_changed.emit(old_port, current_port_);
            return ProxyError::ok();
        }
    }

    ProxyError err = ProxyError::bind_failed(config_.port, config_.fallback_port);
    last_error_ = err.message;
    spdlog::error("[CameraProxy {}] {}", tag_, err.message);
    return err;
}

void CameraProxy::stop() {
    stop_streaming();
    close_all_viewers();

    if (running_) {
        listener_->close();
        running_ = false;
        spdlog::info("[CameraProxy {}] Stopped (port {})", tag_, current_port_);
        on_proxy_stopped.emit();
    }
}

void CameraProxy::shutdown() {
    if (shut_down_) {
        return;
    }
    stop();
    shut_down_ = true;

    on_proxy_started.disconnect_all();
    on_proxy_stopped.disconnect_all();
    on_port_changed.disconnect_all();
    on_client_connected.disconnect_all();
    on_client_disconnected.disconnect_all();
    on_stream_connected.disconnect_all();
    on_stream_disconnected.disconnect_all();
    on_stream_error.disconnect_all();
    on_retry_attempt.disconnect_all();
}

// ============================================================================
// Source and viewers
// ============================================================================

void CameraProxy::set_upstream_url(const std::optional<std::string>& url) {
    bool idle = !upstream_ && retry_timer_ == NULL_TIMER_ID;

    if (url == source_url_) {
        // Re-setting the same source re-arms a proxy that gave up retrying
        if (idle && url && !viewers_.empty()) {
            spdlog::info("[CameraProxy {}] Source re-set, restarting stream", tag_);
            start_streaming();
        }
        return;
    }

    spdlog::info("[CameraProxy {}] Camera source: {}", tag_, url ? *url : "none");
    source_url_ = url;

    stop_streaming();
    retry_count_ = 0;
    stats_.current_retry_count = 0;

    if (source_url_ && !viewers_.empty()) {
        start_streaming();
    }
}

std::string CameraProxy::handle_viewer_connect(std::shared_ptr<ViewerConnection> connection) {
    if (!connection) {
        return {};
    }

    if (!source_url_) {
        spdlog::debug("[CameraProxy {}] Rejecting viewer {}: no camera source", tag_,
                      connection->remote_address());
        static const std::string body = "Camera stream not available";
        if (connection->send_head(503, {{"Content-Type", "text/plain"},
                                        {"Content-Length", std::to_string(body.size())},
                                        {"Connection", "close"}})) {
            connection->send(body.data(), body.size());
        }
        connection->close();
        return {};
    }

    std::string id = "client-" + std::to_string(next_client_id_++);
    Viewer viewer;
    viewer.connection = std::move(connection);
    viewer.info.id = id;
    viewer.info.remote_address = viewer.connection->remote_address();
    viewer.info.connected_at = std::chrono::system_clock::now();

    auto it = viewers_.emplace(id, std::move(viewer)).first;
    spdlog::info("[CameraProxy {}] Viewer {} connected from {} ({} attached)", tag_, id,
                 it->second.info.remote_address, viewers_.size());
    on_client_connected.emit(id, it->second.info.remote_address);

    auto vit = viewers_.find(id);
    if (vit == viewers_.end()) {
        // A slot detached it
        return id;
    }

    if (upstream_ && upstream_head_received_) {
        send_head_to(vit->second);
    } else if (!upstream_ && retry_timer_ == NULL_TIMER_ID) {
        start_streaming();
    }
    return id;
}

void CameraProxy::handle_viewer_disconnect(const std::string& client_id) {
    auto it = viewers_.find(client_id);
    if (it == viewers_.end()) {
        return;
    }
    viewers_.erase(it);
    spdlog::info("[CameraProxy {}] Viewer {} disconnected ({} attached)", tag_, client_id,
                 viewers_.size());
    on_client_disconnected.emit(client_id);

    if (viewers_.empty()) {
        spdlog::debug("[CameraProxy {}] No viewers left, stopping camera stream", tag_);
        stop_streaming();
    }
}

CameraProxyStatus CameraProxy::get_status() const {
    CameraProxyStatus status;
    status.is_running = running_;
    status.port = current_port_;
    status.proxy_url = "http://localhost:" + std::to_string(current_port_) + "/camera";
    status.is_streaming = upstream_ != nullptr;
    status.source_url = source_url_;
    status.client_count = viewers_.size();
    for (const auto& [id, viewer] : viewers_) {
        status.clients.push_back(viewer.info);
    }
    status.last_error = last_error_;
    status.stats = stats_;
    return status;
}

HttpHeaderList CameraProxy::build_viewer_headers(const HttpHeaderList& upstream_headers) {
    HttpHeaderList headers;
    for (const auto& [name, value] : upstream_headers) {
        if (header_name_equals(name, "Connection") || header_name_equals(name, "Cache-Control") ||
            header_name_equals(name, "Pragma") || header_name_equals(name, "Expires")) {
            continue;
        }
        headers.emplace_back(name, value);
    }
    headers.emplace_back("Connection", "close");
    headers.emplace_back("Cache-Control", "no-cache, no-store, must-revalidate");
    headers.emplace_back("Pragma", "no-cache");
    headers.emplace_back("Expires", "0");
    return headers;
}

// ============================================================================
// Upstream
// ============================================================================

void CameraProxy::start_streaming() {
    if (!source_url_) {
        spdlog::debug("[CameraProxy {}] Cannot start stream: no source URL", tag_);
        return;
    }
    if (upstream_) {
        return;
    }
    retry_count_ = 0;
    stats_.current_retry_count = 0;
    spdlog::info("[CameraProxy {}] Starting camera stream from {}", tag_, *source_url_);
    connect_upstream();
}

void CameraProxy::connect_upstream() {
    if (!source_url_ || viewers_.empty()) {
        return;
    }

    uint64_t attempt = ++upstream_attempt_;
    upstream_head_received_ = false;

    UpstreamHandlers handlers;
    handlers.on_response = [this, attempt](int status_code, const HttpHeaderList& headers) {
        on_upstream_response(attempt, status_code, headers);
    };
    handlers.on_data = [this, attempt](const char* data, size_t len) {
        on_upstream_data(attempt, data, len);
    };
    handlers.on_end = [this, attempt]() { on_upstream_end(attempt); };
    handlers.on_error = [this, attempt](const std::string& error) {
        on_upstream_error(attempt, error);
    };

    upstream_ = connector_->open(*source_url_, handlers);
    if (!upstream_) {
        std::string error = "Could not open camera stream " + *source_url_;
        spdlog::error("[CameraProxy {}] {}", tag_, error);
        last_error_ = error;
        stats_.failed_connections++;
        on_stream_error.emit(error);
        handle_stream_error();
    }
}

void CameraProxy::stop_streaming() {
    if (retry_timer_ != NULL_TIMER_ID) {
        scheduler_.cancel(retry_timer_);
        retry_timer_ = NULL_TIMER_ID;
    }
    if (upstream_) {
        spdlog::debug("[CameraProxy {}] Stopping camera stream", tag_);
        teardown_upstream();
    }
}

void CameraProxy::teardown_upstream() {
    if (!upstream_) {
        return;
    }
    ++upstream_attempt_;
    upstream_head_received_ = false;

    std::shared_ptr<UpstreamStream> stream = std::move(upstream_);
    upstream_.reset();
    stream->close();
    // We may be inside one of the stream's own callbacks; free it on the next turn
    scheduler_.post([stream]() {});
}

void CameraProxy::handle_stream_error() {
    teardown_upstream();

    if (viewers_.empty()) {
        return;
    }
    if (!config_.reconnection.enabled) {
        spdlog::warn("[CameraProxy {}] Reconnection disabled, camera stream idle", tag_);
        return;
    }
    if (retry_count_ >= config_.reconnection.max_retries) {
        spdlog::error("[CameraProxy {}] Giving up after {} reconnection attempts: {}", tag_,
                      retry_count_, last_error_.value_or("unknown error"));
        return;
    }

    uint32_t delay = config_.reconnection.retry_delay_ms;
    if (config_.reconnection.exponential_backoff) {
        delay = config_.reconnection.retry_delay_ms << retry_count_;
    }

    retry_count_++;
    stats_.current_retry_count = retry_count_;

    spdlog::info("[CameraProxy {}] Retrying camera connection in {}ms (attempt {}/{})", tag_,
                 delay, retry_count_, config_.reconnection.max_retries);
    on_retry_attempt.emit(retry_count_, config_.reconnection.max_retries);

    retry_timer_ = scheduler_.set_timeout(delay, [this]() {
        retry_timer_ = NULL_TIMER_ID;
        if (!viewers_.empty()) {
            connect_upstream();
        }
    });
}

void CameraProxy::on_upstream_response(uint64_t attempt, int status_code,
                                       const HttpHeaderList& headers) {
    if (attempt != upstream_attempt_) {
        return;
    }

    if (status_code < 200 || status_code > 299) {
        std::string error = "Camera returned status code: " + std::to_string(status_code);
        spdlog::error("[CameraProxy {}] {}", tag_, error);
        last_error_ = error;
        stats_.failed_connections++;
        on_stream_error.emit(error);
        handle_stream_error();
        return;
    }

    spdlog::info("[CameraProxy {}] Connected to camera stream", tag_);
    upstream_head_received_ = true;
    viewer_headers_ = build_viewer_headers(headers);
    last_error_.reset();
    stats_.successful_connections++;
    retry_count_ = 0;
    stats_.current_retry_count = 0;
    on_stream_connected.emit();

    std::vector<std::string> failed;
    for (auto& [id, viewer] : viewers_) {
        if (!viewer.head_sent) {
            send_head_to(viewer);
            if (!viewer.head_sent) {
                failed.push_back(id);
            }
        }
    }
    drop_viewers(failed, "header write failed");
}

void CameraProxy::on_upstream_data(uint64_t attempt, const char* data, size_t len) {
    if (attempt != upstream_attempt_) {
        return;
    }
    stats_.bytes_received += len;

    // Snapshot: a send may close a socket and re-enter handle_viewer_disconnect()
    std::vector<std::pair<std::string, std::shared_ptr<ViewerConnection>>> targets;
    targets.reserve(viewers_.size());
    for (const auto& [id, viewer] : viewers_) {
        if (viewer.head_sent) {
            targets.emplace_back(id, viewer.connection);
        }
    }

    std::vector<std::string> failed;
    for (const auto& [id, conn] : targets) {
        if (conn->send(data, len)) {
            stats_.bytes_sent += len;
        } else {
            failed.push_back(id);
        }
    }
    drop_viewers(failed, "write failed");
}

void CameraProxy::on_upstream_end(uint64_t attempt) {
    if (attempt != upstream_attempt_) {
        return;
    }
    spdlog::warn("[CameraProxy {}] Camera stream ended", tag_);
    if (!upstream_head_received_) {
        stats_.failed_connections++;
    }
    last_error_ = "Camera stream ended";
    on_stream_disconnected.emit();
    handle_stream_error();
}

void CameraProxy::on_upstream_error(uint64_t attempt, const std::string& error) {
    if (attempt != upstream_attempt_) {
        return;
    }
    spdlog::error("[CameraProxy {}] Camera stream error: {}", tag_, error);
    if (!upstream_head_received_) {
        stats_.failed_connections++;
    }
    last_error_ = error;
    on_stream_error.emit(error);
    handle_stream_error();
}

void CameraProxy::send_head_to(Viewer& viewer) {
    if (viewer.head_sent) {
        return;
    }
    viewer.head_sent = viewer.connection->send_head(200, viewer_headers_);
}

void CameraProxy::drop_viewers(const std::vector<std::string>& ids, const char* reason) {
    for (const auto& id : ids) {
        auto it = viewers_.find(id);
        if (it == viewers_.end()) {
            continue;
        }
        std::shared_ptr<ViewerConnection> conn = it->second.connection;
        spdlog::warn("[CameraProxy {}] Dropping viewer {}: {}", tag_, id, reason);
        // Erase before close() so the listener's close callback finds nothing to do
        viewers_.erase(it);
        conn->close();
        on_client_disconnected.emit(id);
    }

    if (!ids.empty() && viewers_.empty()) {
        stop_streaming();
    }
}

void CameraProxy::close_all_viewers() {
    if (viewers_.empty()) {
        return;
    }
    std::map<std::string, Viewer> viewers = std::move(viewers_);
    viewers_.clear();
    for (auto& [id, viewer] : viewers) {
        viewer.connection->close();
        on_client_disconnected.emit(id);
    }
}

} // namespace printdeck
