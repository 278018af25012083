// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file camera_stream_io.h
 * @brief Socket-facing seams of the camera proxy
 *
 * The proxy logic only sees these interfaces. Production implementations
 * live in camera_http_server.h (viewers) and camera_upstream.h (camera
 * source); unit tests substitute in-memory fakes.
 */

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace printdeck {

using HttpHeaderList = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief One downstream viewer socket
 */
class ViewerConnection {
  public:
    virtual ~ViewerConnection() = default;

    [[nodiscard]] virtual std::string remote_address() const = 0;

    /**
     * @brief Write the HTTP status line and headers
     * @return false if the socket is no longer writable
     */
    virtual bool send_head(int status_code, const HttpHeaderList& headers) = 0;

    /**
     * @brief Queue body bytes, unchanged
     * @return false if the socket failed or the viewer is too far behind
     */
    virtual bool send(const char* data, size_t len) = 0;

    /**
     * @brief Close the socket now, dropping anything still queued
     */
    virtual void close() = 0;
};

/**
 * @brief Callbacks a listener invokes for viewer traffic
 */
struct ViewerHandlers {
    /// GET /camera. Returns the assigned client id, or "" if the request was answered and closed
    std::function<std::string(std::shared_ptr<ViewerConnection>)> on_camera_request;
    /// A viewer socket closed (client id from on_camera_request)
    std::function<void(const std::string&)> on_viewer_closed;
    /// GET /health body
    std::function<std::string()> health_json;
};

/**
 * @brief Local server socket that accepts viewers
 */
class ViewerListener {
  public:
    virtual ~ViewerListener() = default;

    /**
     * @brief Bind and start accepting on @p port
     * @return false if the port could not be bound
     */
    virtual bool listen(int port, ViewerHandlers handlers) = 0;

    /**
     * @brief Stop accepting and close every accepted socket
     */
    virtual void close() = 0;
};

/**
 * @brief Callbacks of one upstream connection attempt
 *
 * After close() has been called on the stream none of these fire.
 */
struct UpstreamHandlers {
    std::function<void(int status_code, const HttpHeaderList& headers)> on_response;
    std::function<void(const char* data, size_t len)> on_data;
    std::function<void()> on_end;
    std::function<void(const std::string& error)> on_error;
};

/**
 * @brief An open (or opening) upstream camera connection
 */
class UpstreamStream {
  public:
    virtual ~UpstreamStream() = default;

    /// Close the socket immediately; safe to call from inside a handler
    virtual void close() = 0;
};

/**
 * @brief Opens upstream connections to camera sources
 */
class UpstreamConnector {
  public:
    virtual ~UpstreamConnector() = default;

    /**
     * @brief Start a GET request to @p url
     * @return Stream handle, or nullptr if the request could not be started
     *         (unparseable URL, socket creation failure)
     */
    virtual std::shared_ptr<UpstreamStream> open(const std::string& url,
                                                 UpstreamHandlers handlers) = 0;
};

} // namespace printdeck
