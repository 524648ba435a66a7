#include "websocket_server.h"

#include <utility>

#include "check.hpp"
#include "logger.h"

WebSocketServer::WebSocketServer(uint16_t port, WebPttHandler& handler)
    : server_(port, "0.0.0.0"), handler_(handler), port_(port) {
    server_.setOnClientMessageCallback(
        [this](const std::shared_ptr<ix::ConnectionState>& connection_state,
               ix::WebSocket& web_socket, const ix::WebSocketMessagePtr& message) {
            on_message(connection_state, web_socket, message);
        });
}

WebSocketServer::~WebSocketServer() {
    stop();
}

void WebSocketServer::start() {
    auto result = server_.listen();
    require(result.first, "websocket listen on port " + std::to_string(port_) + ": " +
                              result.second);
    server_.start();
    started_ = true;
    Log::info("WebSocket server listening on port {} ({})", port_, PATH);
}

void WebSocketServer::stop() {
    if (!started_) {
        return;
    }
    started_ = false;
    server_.stop();
}

void WebSocketServer::on_message(const std::shared_ptr<ix::ConnectionState>& connection_state,
                                 ix::WebSocket& web_socket, const ix::WebSocketMessagePtr& message) {
    const std::string connection_id = connection_state->getId();

    switch (message->type) {
        case ix::WebSocketMessageType::Open: {
            if (!message->openInfo.uri.starts_with(PATH)) {
                Log::warn("WebSocket connection to {} refused", message->openInfo.uri);
                web_socket.close();
                return;
            }
            std::string remote = connection_state->getRemoteIp() + ":" +
                                 std::to_string(connection_state->getRemotePort());
            auto peer = std::make_shared<IxPeerConnection>(web_socket, remote);
            {
                std::lock_guard<std::mutex> lock(peers_mutex_);
                peers_[connection_id] = peer;
            }
            handler_.on_open(connection_id, peer);
            break;
        }
        case ix::WebSocketMessageType::Message: {
            if (message->binary) {
                const auto* data = reinterpret_cast<const uint8_t*>(message->str.data());
                handler_.on_binary(connection_id, std::span<const uint8_t>(data, message->str.size()));
            } else {
                handler_.on_text(connection_id, message->str);
            }
            break;
        }
        case ix::WebSocketMessageType::Close: {
            std::shared_ptr<IxPeerConnection> peer;
            {
                std::lock_guard<std::mutex> lock(peers_mutex_);
                auto                        it = peers_.find(connection_id);
                if (it == peers_.end()) {
                    return;  // refused at open
                }
                peer = std::move(it->second);
                peers_.erase(it);
            }
            peer->detach();
            handler_.on_close(connection_id);
            break;
        }
        case ix::WebSocketMessageType::Error:
            Log::error("WebSocket error on {}: {}", connection_id, message->errorInfo.reason);
            break;
        default:
            break;
    }
}
