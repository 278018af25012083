// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file camera_http_server.h
 * @brief Minimal HTTP/1.1 viewer server for a camera proxy
 *
 * Serves exactly two routes on a libhv TCP server bound to 0.0.0.0:
 *   GET /camera  hand the socket to the proxy as a streaming viewer
 *   GET /health  JSON status, then close
 * Everything else gets 404. A raw TCP server is used instead of hv::HttpServer
 * because an MJPEG response never ends and must be written chunk by chunk.
 */

#include "camera_stream_io.h"

#include "hv/EventLoop.h"
#include "hv/TcpServer.h"

#include <map>
#include <memory>
#include <string>

namespace printdeck {

/**
 * @brief Parsed request line of a viewer request
 */
struct ViewerRequestLine {
    std::string method;
    std::string path; ///< Without query string
};

/**
 * @brief Parse "GET /camera?x=1 HTTP/1.1" style request lines
 * @return false if the line is malformed
 */
bool parse_request_line(const std::string& line, ViewerRequestLine& out);

class CameraHttpServer : public ViewerListener {
  public:
    /// Viewers that fall further behind than this are dropped
    static constexpr size_t MAX_VIEWER_BACKLOG = 8 * 1024 * 1024;
    /// Request heads larger than this are rejected
    static constexpr size_t MAX_REQUEST_HEAD = 8 * 1024;

    explicit CameraHttpServer(hv::EventLoopPtr loop);
    ~CameraHttpServer() override;

    bool listen(int port, ViewerHandlers handlers) override;

    /**
     * @brief Stop listening and close every accepted socket
     *
     * Covers viewers, sockets that have not sent a full request yet and
     * responses still being flushed. Must run on the loop thread.
     */
    void close() override;

    /// Accepted sockets that are still open
    [[nodiscard]] size_t connection_count() const {
        return requests_.size();
    }

  private:
    using Server = hv::TcpServerEventLoopTmpl<hv::SocketChannel>;

    struct PendingRequest {
        hv::SocketChannelPtr channel;
        std::string head;
        std::string client_id; ///< Set once the socket became a viewer
        bool handled = false;
    };

    void on_connection(const hv::SocketChannelPtr& channel);
    void on_message(const hv::SocketChannelPtr& channel, hv::Buffer* buf);
    void route(const hv::SocketChannelPtr& channel, PendingRequest& request);

    hv::EventLoopPtr loop_;
    std::unique_ptr<Server> server_;
    ViewerHandlers handlers_;
    std::map<uint32_t, PendingRequest> requests_; ///< Keyed by channel id
    int port_ = 0;
};

} // namespace printdeck
