// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "camera_http_server.h"

#include <spdlog/spdlog.h>

#include <sstream>

namespace printdeck {

namespace {

const char* status_reason(int status_code) {
    switch (status_code) {
    case 200:
        return "OK";
    case 400:
        return "Bad Request";
    case 404:
        return "Not Found";
    case 405:
        return "Method Not Allowed";
    case 431:
        return "Request Header Fields Too Large";
    case 502:
        return "Bad Gateway";
    case 503:
        return "Service Unavailable";
    default:
        return "Unknown";
    }
}

std::string build_head(int status_code, const HttpHeaderList& headers) {
    std::ostringstream ss;
    ss << "HTTP/1.1 " << status_code << ' ' << status_reason(status_code) << "\r\n";
    for (const auto& [name, value] : headers) {
        ss << name << ": " << value << "\r\n";
    }
    ss << "\r\n";
    return ss.str();
}

void respond_and_close(const hv::SocketChannelPtr& channel, int status_code,
                       const std::string& content_type, const std::string& body) {
    HttpHeaderList headers = {{"Content-Type", content_type},
                              {"Content-Length", std::to_string(body.size())},
                              {"Connection", "close"}};
    channel->write(build_head(status_code, headers) + body);
    channel->close(true);
}

/**
 * @brief ViewerConnection over a libhv socket channel
 */
class HvViewerConnection : public ViewerConnection {
  public:
    explicit HvViewerConnection(hv::SocketChannelPtr channel) : channel_(std::move(channel)) {}

    std::string remote_address() const override {
        return channel_->peeraddr();
    }

    bool send_head(int status_code, const HttpHeaderList& headers) override {
        if (!channel_->isConnected()) {
            return false;
        }
        return channel_->write(build_head(status_code, headers)) >= 0;
    }

    bool send(const char* data, size_t len) override {
        if (!channel_->isConnected()) {
            return false;
        }
        if (channel_->writeBufsize() > CameraHttpServer::MAX_VIEWER_BACKLOG) {
            spdlog::warn("[CameraHttpServer] Viewer {} backlog over {} bytes",
                         channel_->peeraddr(), CameraHttpServer::MAX_VIEWER_BACKLOG);
            return false;
        }
        return channel_->write(data, static_cast<int>(len)) >= 0;
    }

    void close() override {
        if (channel_->isOpened()) {
            channel_->close();
        }
    }

  private:
    hv::SocketChannelPtr channel_;
};

} // namespace

bool parse_request_line(const std::string& line, ViewerRequestLine& out) {
    size_t sp1 = line.find(' ');
    if (sp1 == std::string::npos || sp1 == 0) {
        return false;
    }
    size_t sp2 = line.find(' ', sp1 + 1);
    if (sp2 == std::string::npos || sp2 == sp1 + 1) {
        return false;
    }
    if (line.compare(sp2 + 1, 5, "HTTP/") != 0) {
        return false;
    }

    out.method = line.substr(0, sp1);
    std::string target = line.substr(sp1 + 1, sp2 - sp1 - 1);
    size_t query = target.find('?');
    out.path = (query == std::string::npos) ? target : target.substr(0, query);
    return true;
}

CameraHttpServer::CameraHttpServer(hv::EventLoopPtr loop) : loop_(std::move(loop)) {}

CameraHttpServer::~CameraHttpServer() {
    close();
}

bool CameraHttpServer::listen(int port, ViewerHandlers handlers) {
    close();

    auto server = std::make_unique<Server>(loop_);
    if (server->createsocket(port, "0.0.0.0") < 0) {
        spdlog::warn("[CameraHttpServer] Cannot bind port {}", port);
        return false;
    }

    handlers_ = std::move(handlers);
    server->onConnection = [this](const hv::SocketChannelPtr& channel) {
        on_connection(channel);
    };
    server->onMessage = [this](const hv::SocketChannelPtr& channel, hv::Buffer* buf) {
        on_message(channel, buf);
    };
    server->start();

    server_ = std::move(server);
    port_ = port;
    spdlog::debug("[CameraHttpServer] Listening on 0.0.0.0:{}", port);
    return true;
}

void CameraHttpServer::close() {
    if (!server_) {
        return;
    }
    spdlog::debug("[CameraHttpServer] Closing port {} ({} open connections)", port_,
                  requests_.size());

    std::unique_ptr<Server> server = std::move(server_);
    server->onConnection = nullptr;
    server->onMessage = nullptr;

    // Accepted channels outlive the server otherwise, and their libhv callbacks
    // point back at it
    std::map<uint32_t, PendingRequest> requests;
    requests.swap(requests_);
    for (auto& [id, request] : requests) {
        const hv::SocketChannelPtr& channel = request.channel;
        if (!channel) {
            continue;
        }
        channel->onread = nullptr;
        channel->onwrite = nullptr;
        channel->onclose = nullptr;
        if (channel->isOpened()) {
            channel->close();
        }
    }
    // A close libhv deferred for unsent data completes when the last channel
    // reference goes with the server below

    server->stop();
    handlers_ = ViewerHandlers{};
    port_ = 0;
}

void CameraHttpServer::on_connection(const hv::SocketChannelPtr& channel) {
    if (channel->isConnected()) {
        PendingRequest request;
        request.channel = channel;
        requests_[channel->id()] = std::move(request);
        return;
    }

    auto it = requests_.find(channel->id());
    if (it == requests_.end()) {
        return;
    }
    std::string client_id = std::move(it->second.client_id);
    requests_.erase(it);

    if (!client_id.empty() && handlers_.on_viewer_closed) {
        handlers_.on_viewer_closed(client_id);
    }
}

void CameraHttpServer::on_message(const hv::SocketChannelPtr& channel, hv::Buffer* buf) {
    auto it = requests_.find(channel->id());
    if (it == requests_.end() || it->second.handled) {
        // Viewers do not send anything meaningful after the request
        return;
    }

    PendingRequest& request = it->second;
    request.head.append(static_cast<const char*>(buf->data()), buf->size());

    if (request.head.find("\r\n\r\n") == std::string::npos) {
        if (request.head.size() > MAX_REQUEST_HEAD) {
            request.handled = true;
            respond_and_close(channel, 431, "text/plain", "Request header too large");
        }
        return;
    }

    request.handled = true;
    route(channel, request);
}

void CameraHttpServer::route(const hv::SocketChannelPtr& channel, PendingRequest& request) {
    std::string first_line = request.head.substr(0, request.head.find("\r\n"));
    request.head.clear();

    ViewerRequestLine line;
    if (!parse_request_line(first_line, line)) {
        respond_and_close(channel, 400, "text/plain", "Bad request");
        return;
    }

    spdlog::trace("[CameraHttpServer] {} {} from {}", line.method, line.path, channel->peeraddr());

    if (line.method == "GET" && line.path == "/camera") {
        if (!handlers_.on_camera_request) {
            respond_and_close(channel, 503, "text/plain", "Camera stream not available");
            return;
        }
        uint32_t channel_id = channel->id();
        std::string client_id =
            handlers_.on_camera_request(std::make_shared<HvViewerConnection>(channel));
        // The request entry may already be gone if the viewer was closed inside the handler
        auto it = requests_.find(channel_id);
        if (it != requests_.end()) {
            it->second.client_id = client_id;
        }
        return;
    }

    if (line.method == "GET" && line.path == "/health") {
        std::string body = handlers_.health_json ? handlers_.health_json() : "{}";
        respond_and_close(channel, 200, "application/json", body);
        return;
    }

    respond_and_close(channel, 404, "text/plain", "Not found");
}

} // namespace printdeck
