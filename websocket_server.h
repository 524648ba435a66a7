#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <unordered_map>

#include <ixwebsocket/IXConnectionState.h>
#include <ixwebsocket/IXWebSocket.h>
#include <ixwebsocket/IXWebSocketMessage.h>
#include <ixwebsocket/IXWebSocketMessageType.h>
#include <ixwebsocket/IXWebSocketServer.h>

#include "session_info.h"
#include "web_ptt_handler.h"

// PeerConnection over one ix::WebSocket. The socket belongs to the server; once the connection
// closes every send fails instead of touching it.
class IxPeerConnection : public PeerConnection {
public:
    IxPeerConnection(ix::WebSocket& web_socket, std::string remote)
        : web_socket_(&web_socket), remote_(std::move(remote)) {}

    bool send_text(const std::string& text) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (web_socket_ == nullptr) {
            return false;
        }
        return web_socket_->sendText(text).success;
    }

    bool send_binary(std::span<const uint8_t> data) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (web_socket_ == nullptr) {
            return false;
        }
        std::string payload(reinterpret_cast<const char*>(data.data()), data.size());
        return web_socket_->sendBinary(payload).success;
    }

    std::string remote_address() const override {
        return remote_;
    }

    void detach() {
        std::lock_guard<std::mutex> lock(mutex_);
        web_socket_ = nullptr;
    }

private:
    std::mutex     mutex_;
    ix::WebSocket* web_socket_;
    std::string    remote_;
};

// Browser endpoint at /ws. IXWebSocket runs each connection on its own thread; every event is
// handed to the WebPttHandler from there.
class WebSocketServer {
public:
    static constexpr const char* PATH = "/ws";

    WebSocketServer(uint16_t port, WebPttHandler& handler);
    ~WebSocketServer();

    WebSocketServer(const WebSocketServer&)            = delete;
    WebSocketServer& operator=(const WebSocketServer&) = delete;

    // Throws std::runtime_error when the port cannot be bound
    void start();
    void stop();

private:
    void on_message(const std::shared_ptr<ix::ConnectionState>& connection_state,
                    ix::WebSocket& web_socket, const ix::WebSocketMessagePtr& message);

    ix::WebSocketServer server_;
    WebPttHandler&      handler_;
    uint16_t            port_;
    bool                started_ = false;

    std::mutex                                                       peers_mutex_;
    std::unordered_map<std::string, std::shared_ptr<IxPeerConnection>> peers_;
};
