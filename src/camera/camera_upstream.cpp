// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "camera_upstream.h"

#include "printdeck_version.h"

#include "hv/TcpClient.h"
#include "hv/hurl.h"

#include <spdlog/spdlog.h>

#include <cstdlib>

namespace printdeck {

namespace {

std::string trim(const std::string& s) {
    size_t begin = s.find_first_not_of(" \t");
    if (begin == std::string::npos) {
        return {};
    }
    size_t end = s.find_last_not_of(" \t\r");
    return s.substr(begin, end - begin + 1);
}

class HvUpstreamStream : public UpstreamStream,
                         public std::enable_shared_from_this<HvUpstreamStream> {
  public:
    using Client = hv::TcpClientEventLoopTmpl<hv::SocketChannel>;

    HvUpstreamStream(hv::EventLoopPtr loop, UpstreamHandlers handlers)
        : client_(std::make_unique<Client>(std::move(loop))), handlers_(std::move(handlers)) {}

    ~HvUpstreamStream() override {
        close();
    }

    bool start(const HUrl& url) {
        std::string path = url.path.empty() ? "/" : url.path;
        if (!url.query.empty()) {
            path += "?" + url.query;
        }
        std::string host = url.host;
        bool default_port = (url.scheme == "http" && url.port == 80) ||
                            (url.scheme == "https" && url.port == 443);
        if (!default_port) {
            host += ":" + std::to_string(url.port);
        }

        request_ = "GET " + path + " HTTP/1.1\r\n" + "Host: " + host + "\r\n" +
                   "Accept: */*\r\n" + "User-Agent: PrintDeck/" + PRINTDECK_VERSION + "\r\n" +
                   "Connection: close\r\n\r\n";

        if (client_->createsocket(url.port, url.host.c_str()) < 0) {
            spdlog::error("[CameraUpstream] Cannot create socket for {}:{}", url.host, url.port);
            return false;
        }
        if (url.scheme == "https" && client_->withTLS() != 0) {
            spdlog::error("[CameraUpstream] TLS unavailable for {}", url.host);
            return false;
        }
        client_->setConnectTimeout(HvUpstreamConnector::CONNECT_TIMEOUT_MS);

        std::weak_ptr<HvUpstreamStream> weak = shared_from_this();
        client_->onConnection = [weak](const hv::SocketChannelPtr& channel) {
            if (auto self = weak.lock()) {
                self->on_connection(channel);
            }
        };
        client_->onMessage = [weak](const hv::SocketChannelPtr&, hv::Buffer* buf) {
            if (auto self = weak.lock()) {
                self->on_message(static_cast<const char*>(buf->data()), buf->size());
            }
        };
        client_->start();
        return true;
    }

    void close() override {
        if (closed_) {
            return;
        }
        closed_ = true;
        client_->closesocket();
    }

  private:
    void on_connection(const hv::SocketChannelPtr& channel) {
        if (closed_) {
            return;
        }
        if (channel->isConnected()) {
            connected_ = true;
            spdlog::debug("[CameraUpstream] Connected to {}", channel->peeraddr());
            channel->write(request_);
            return;
        }

        closed_ = true;
        if (!connected_) {
            fire_error("Failed to connect to camera");
        } else if (!head_done_) {
            fire_error("Camera closed connection before responding");
        } else if (handlers_.on_end) {
            handlers_.on_end();
        }
    }

    void on_message(const char* data, size_t len) {
        if (closed_) {
            return;
        }
        if (head_done_) {
            if (handlers_.on_data) {
                handlers_.on_data(data, len);
            }
            return;
        }

        head_buf_.append(data, len);
        int status_code = 0;
        HttpHeaderList headers;
        size_t head_length = 0;
        switch (parse_http_response_head(head_buf_, status_code, headers, head_length)) {
        case ResponseHeadResult::INCOMPLETE:
            if (head_buf_.size() > MAX_HEAD) {
                closed_ = true;
                client_->closesocket();
                fire_error("Camera response header too large");
            }
            return;
        case ResponseHeadResult::MALFORMED:
            closed_ = true;
            client_->closesocket();
            fire_error("Malformed camera response");
            return;
        case ResponseHeadResult::COMPLETE:
            break;
        }

        head_done_ = true;
        std::string rest = head_buf_.substr(head_length);
        head_buf_.clear();

        // Handlers may close this stream
        auto keep_alive = shared_from_this();
        if (handlers_.on_response) {
            handlers_.on_response(status_code, headers);
        }
        if (!closed_ && !rest.empty() && handlers_.on_data) {
            handlers_.on_data(rest.data(), rest.size());
        }
    }

    void fire_error(const std::string& error) {
        if (handlers_.on_error) {
            handlers_.on_error(error);
        }
    }

    static constexpr size_t MAX_HEAD = 16 * 1024;

    std::unique_ptr<Client> client_;
    UpstreamHandlers handlers_;
    std::string request_;
    std::string head_buf_;
    bool connected_ = false;
    bool head_done_ = false;
    bool closed_ = false;
};

} // namespace

ResponseHeadResult parse_http_response_head(const std::string& buf, int& status_code,
                                            HttpHeaderList& headers, size_t& head_length) {
    size_t end = buf.find("\r\n\r\n");
    if (end == std::string::npos) {
        return ResponseHeadResult::INCOMPLETE;
    }
    head_length = end + 4;

    size_t line_end = buf.find("\r\n");
    std::string status_line = buf.substr(0, line_end);
    if (status_line.compare(0, 5, "HTTP/") != 0) {
        return ResponseHeadResult::MALFORMED;
    }
    size_t sp = status_line.find(' ');
    if (sp == std::string::npos) {
        return ResponseHeadResult::MALFORMED;
    }
    std::string code = status_line.substr(sp + 1, 3);
    if (code.size() != 3 || code.find_first_not_of("0123456789") != std::string::npos) {
        return ResponseHeadResult::MALFORMED;
    }
    status_code = std::atoi(code.c_str());

    headers.clear();
    size_t pos = line_end + 2;
    while (pos < end) {
        size_t next = buf.find("\r\n", pos);
        std::string line = buf.substr(pos, next - pos);
        pos = next + 2;

        size_t colon = line.find(':');
        if (colon == std::string::npos || colon == 0) {
            return ResponseHeadResult::MALFORMED;
        }
        headers.emplace_back(line.substr(0, colon), trim(line.substr(colon + 1)));
    }
    return ResponseHeadResult::COMPLETE;
}

HvUpstreamConnector::HvUpstreamConnector(hv::EventLoopPtr loop) : loop_(std::move(loop)) {}

std::shared_ptr<UpstreamStream> HvUpstreamConnector::open(const std::string& url,
                                                          UpstreamHandlers handlers) {
    HUrl parsed;
    if (!parsed.parse(url) || parsed.host.empty()) {
        spdlog::error("[CameraUpstream] Invalid camera URL: {}", url);
        return nullptr;
    }
    if (parsed.scheme != "http" && parsed.scheme != "https") {
        spdlog::error("[CameraUpstream] Unsupported camera URL scheme '{}'", parsed.scheme);
        return nullptr;
    }

    spdlog::debug("[CameraUpstream] Opening {}", url);
    auto stream = std::make_shared<HvUpstreamStream>(loop_, std::move(handlers));
    if (!stream->start(parsed)) {
        return nullptr;
    }
    return stream;
}

} // namespace printdeck
