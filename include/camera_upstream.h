// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file camera_upstream.h
 * @brief libhv TCP client that reads an MJPEG camera stream
 *
 * Sends one GET request and reports the response head, then passes the body
 * through byte for byte. No HTTP body decoding is done: cameras serve
 * multipart/x-mixed-replace without chunked encoding.
 */

#include "camera_stream_io.h"

#include "hv/EventLoop.h"

#include <memory>
#include <string>

namespace printdeck {

enum class ResponseHeadResult {
    INCOMPLETE, ///< Need more bytes
    COMPLETE,
    MALFORMED
};

/**
 * @brief Parse an HTTP response status line and headers from @p buf
 *
 * @param[out] status_code Status from the status line
 * @param[out] headers Header fields in received order
 * @param[out] head_length Bytes consumed, including the blank line
 */
ResponseHeadResult parse_http_response_head(const std::string& buf, int& status_code,
                                            HttpHeaderList& headers, size_t& head_length);

class HvUpstreamConnector : public UpstreamConnector {
  public:
    static constexpr int CONNECT_TIMEOUT_MS = 5000;

    explicit HvUpstreamConnector(hv::EventLoopPtr loop);

    std::shared_ptr<UpstreamStream> open(const std::string& url,
                                         UpstreamHandlers handlers) override;

  private:
    hv::EventLoopPtr loop_;
};

} // namespace printdeck
