#pragma once

#include <asio.hpp>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "http_router.h"

// Minimal HTTP/1.1 server for the hub API: one request per connection, Content-Length bodies,
// handlers run on the io_context thread.
class HttpApiServer {
public:
    static constexpr size_t MAX_HEADER_SIZE = 16 * 1024;
    static constexpr size_t MAX_BODY_SIZE   = 8 * 1024 * 1024;

    // Binds the port; throws std::runtime_error when that fails
    HttpApiServer(asio::io_context& io_context, uint16_t port, HttpRouter& router);

    void stop();

    uint16_t port() const {
        return port_;
    }

    // Parses "METHOD /target HTTP/1.1" plus headers. False on a malformed request line.
    static bool parse_head(const std::string& head, HttpRequest& request, size_t& content_length);

    static std::string create_http_response(const HttpResponse& response);

private:
    using Socket = std::shared_ptr<asio::ip::tcp::socket>;

    void start_accept();
    void handle_connection(const Socket& socket);
    void read_body(const Socket& socket, const std::shared_ptr<asio::streambuf>& streambuf,
                   HttpRequest request, size_t content_length);
    void respond(const Socket& socket, const HttpRequest& request);
    void write_response(const Socket& socket, const HttpResponse& response);

    asio::ip::tcp::acceptor acceptor_;
    HttpRouter&             router_;
    uint16_t                port_;
};
