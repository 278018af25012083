// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file camera_proxy.h
 * @brief Per-context camera stream fan-out proxy
 *
 * Keeps a single upstream connection to the camera and copies every received
 * byte to each attached viewer. The upstream is opened on the first viewer
 * and closed as soon as the last viewer leaves; a proxy with no viewers
 * never holds an upstream socket.
 *
 * Upstream failures are retried with exponential backoff
 * (retry_delay_ms * 2^retry_count) up to max_retries; after that the proxy
 * stays idle until a viewer attaches again or the source URL is set.
 */

#include "camera_stream_io.h"
#include "event_signal.h"
#include "scheduler.h"

#include "hv/json.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace printdeck {

using json = nlohmann::json;

struct CameraReconnectConfig {
    bool enabled = true;
    int max_retries = 5;
    uint32_t retry_delay_ms = 2000;
    bool exponential_backoff = true;
};

struct CameraProxyConfig {
    int port = 8181;
    int fallback_port = 8182; ///< 0 disables the fallback attempt
    bool auto_start = true;   ///< initialize() calls start()
    CameraReconnectConfig reconnection;
};

/**
 * @brief Error types for proxy operations
 */
enum class ProxyErrorType {
    NONE,           ///< No error
    BIND_FAILED,    ///< Neither the port nor the fallback could be bound (fatal, not retried)
    NOT_RUNNING,    ///< Operation needs a running proxy
    UPSTREAM_FAILED ///< Camera source unreachable or returned an error
};

struct ProxyError {
    ProxyErrorType type = ProxyErrorType::NONE;
    std::string message;

    bool success() const {
        return type == ProxyErrorType::NONE;
    }

    explicit operator bool() const {
        return success();
    }

    static ProxyError ok() {
        return {};
    }

    static ProxyError bind_failed(int port, int fallback_port) {
        ProxyError err;
        err.type = ProxyErrorType::BIND_FAILED;
        err.message = "Failed to bind camera proxy on port " + std::to_string(port);
        if (fallback_port > 0) {
            err.message += " or fallback port " + std::to_string(fallback_port);
        }
        return err;
    }
};

struct CameraProxyClientInfo {
    std::string id;
    std::string remote_address;
    std::chrono::system_clock::time_point connected_at;
};

struct CameraProxyStats {
    uint64_t bytes_received = 0;
    uint64_t bytes_sent = 0;
    uint32_t successful_connections = 0;
    uint32_t failed_connections = 0;
    int current_retry_count = 0;
};

/**
 * @brief Point-in-time copy of proxy state (shares nothing with the proxy)
 */
struct CameraProxyStatus {
    bool is_running = false;
    int port = 0;
    std::string proxy_url;
    bool is_streaming = false;
    std::optional<std::string> source_url;
    size_t client_count = 0;
    std::vector<CameraProxyClientInfo> clients;
    std::optional<std::string> last_error;
    CameraProxyStats stats;
};

json camera_proxy_status_to_json(const CameraProxyStatus& status);

class CameraProxy {
  public:
    /**
     * @param owner_tag Log tag of the owning context
     * @param scheduler Timer source for retry backoff and deferred cleanup
     * @param listener Viewer-side server socket
     * @param connector Upstream connection factory
     */
    CameraProxy(std::string owner_tag, Scheduler& scheduler,
                std::unique_ptr<ViewerListener> listener,
                std::shared_ptr<UpstreamConnector> connector);
    ~CameraProxy();

    CameraProxy(const CameraProxy&) = delete;
    CameraProxy& operator=(const CameraProxy&) = delete;

    /**
     * @brief Apply configuration; starts the proxy when auto_start is set
     */
    ProxyError initialize(const CameraProxyConfig& config);

    /**
     * @brief Bind the configured port, falling back once to fallback_port
     *
     * Emits proxy-started, plus port-changed when the fallback was used.
     * A second bind failure is fatal and is not retried.
     */
    ProxyError start();

    /**
     * @brief Close the upstream, every viewer and the server socket
     */
    void stop();

    /**
     * @brief Swap the camera source (std::nullopt = no stream available)
     *
     * An open upstream is torn down; if viewers remain and a URL is set the
     * new source is opened immediately with a fresh retry budget.
     */
    void set_upstream_url(const std::optional<std::string>& url);

    /**
     * @brief Attach a viewer
     *
     * Without a source URL the viewer gets 503 and is closed.
     * @return Assigned client id, or "" if the viewer was rejected
     */
    std::string handle_viewer_connect(std::shared_ptr<ViewerConnection> connection);

    /**
     * @brief Detach a viewer (no-op for unknown ids)
     *
     * Detaching the last viewer closes the upstream before returning.
     */
    void handle_viewer_disconnect(const std::string& client_id);

    [[nodiscard]] CameraProxyStatus get_status() const;

    /**
     * @brief stop() and disconnect every event slot; idempotent
     */
    void shutdown();

    [[nodiscard]] bool is_running() const {
        return running_;
    }
    [[nodiscard]] bool is_streaming() const {
        return upstream_ != nullptr;
    }
    [[nodiscard]] bool retry_pending() const {
        return retry_timer_ != NULL_TIMER_ID;
    }
    [[nodiscard]] int port() const {
        return current_port_;
    }
    [[nodiscard]] const CameraProxyConfig& config() const {
        return config_;
    }

    /**
     * @brief Viewer response headers derived from the upstream response
     *
     * Copies every upstream header except Connection and the cache headers,
     * then forces Connection: close and no-cache.
     */
    static HttpHeaderList build_viewer_headers(const HttpHeaderList& upstream_headers);

    // ========================================================================
    // Events
    // ========================================================================

    Signal<int> on_proxy_started;                     ///< port
    Signal<> on_proxy_stopped;
    Signal<int, int> on_port_changed;                 ///< old_port, new_port
    Signal<std::string, std::string> on_client_connected; ///< client_id, remote_address
    Signal<std::string> on_client_disconnected;        ///< client_id
    Signal<> on_stream_connected;
    Signal<> on_stream_disconnected;
    Signal<std::string> on_stream_error;               ///< error message
    Signal<int, int> on_retry_attempt;                 ///< attempt, max_retries

  private:
    struct Viewer {
        std::shared_ptr<ViewerConnection> connection;
        CameraProxyClientInfo info;
        bool head_sent = false;
    };

    void start_streaming();
    void connect_upstream();
    void stop_streaming();
    void teardown_upstream();
    void handle_stream_error();

    void on_upstream_response(uint64_t attempt, int status_code, const HttpHeaderList& headers);
    void on_upstream_data(uint64_t attempt, const char* data, size_t len);
    void on_upstream_end(uint64_t attempt);
    void on_upstream_error(uint64_t attempt, const std::string& error);

    void send_head_to(Viewer& viewer);
    void drop_viewers(const std::vector<std::string>& ids, const char* reason);
    void close_all_viewers();

    std::string tag_;
    Scheduler& scheduler_;
    std::unique_ptr<ViewerListener> listener_;
    std::shared_ptr<UpstreamConnector> connector_;
    CameraProxyConfig config_;

    bool running_ = false;
    bool shut_down_ = false;
    int current_port_ = 0;

    std::optional<std::string> source_url_;
    std::map<std::string, Viewer> viewers_;
    uint64_t next_client_id_ = 1;

    std::shared_ptr<UpstreamStream> upstream_;
    uint64_t upstream_attempt_ = 0; ///< Bumped per attempt; stale callbacks are ignored
    bool upstream_head_received_ = false;
    HttpHeaderList viewer_headers_;

    int retry_count_ = 0;
    TimerId retry_timer_ = NULL_TIMER_ID;

    std::optional<std::string> last_error_;
    CameraProxyStats stats_;
};

} // namespace printdeck
