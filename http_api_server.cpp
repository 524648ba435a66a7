#include "http_api_server.h"

#include <algorithm>
#include <cctype>
#include <exception>
#include <istream>
#include <sstream>
#include <utility>

#include "check.hpp"
#include "logger.h"

namespace {

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string trim(const std::string& value) {
    size_t first = value.find_first_not_of(" \t\r");
    if (first == std::string::npos) {
        return {};
    }
    size_t last = value.find_last_not_of(" \t\r");
    return value.substr(first, last - first + 1);
}

}  // namespace

HttpApiServer::HttpApiServer(asio::io_context& io_context, uint16_t port, HttpRouter& router)
    : acceptor_(io_context), router_(router), port_(port) {
    std::error_code          ec;
    asio::ip::tcp::endpoint endpoint(asio::ip::tcp::v4(), port);

    acceptor_.open(endpoint.protocol(), ec);
    throw_if_err(ec, "http acceptor open");
    acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true), ec);
    throw_if_err(ec, "http reuse_address");
    acceptor_.bind(endpoint, ec);
    throw_if_err(ec, "http bind port " + std::to_string(port));
    acceptor_.listen(asio::socket_base::max_listen_connections, ec);
    throw_if_err(ec, "http listen");

    Log::info("HTTP API listening on port {}", port);
    start_accept();
}

void HttpApiServer::stop() {
    std::error_code ec;
    acceptor_.close(ec);
}

void HttpApiServer::start_accept() {
    auto new_connection = std::make_shared<asio::ip::tcp::socket>(acceptor_.get_executor());

    acceptor_.async_accept(*new_connection, [this, new_connection](std::error_code error_code) {
        if (error_code == asio::error::operation_aborted) {
            return;  // acceptor closed
        }
        if (!error_code) {
            handle_connection(new_connection);
        } else {
            Log::error("HTTP accept error: {}", error_code.message());
        }

        // Continue accepting new connections
        start_accept();
    });
}

void HttpApiServer::handle_connection(const Socket& socket) {
    auto streambuf = std::make_shared<asio::streambuf>(MAX_HEADER_SIZE + MAX_BODY_SIZE);

    // Read until double newline (HTTP headers end)
    asio::async_read_until(
        *socket, *streambuf, "\r\n\r\n",
        [this, socket, streambuf](std::error_code error_code, std::size_t header_length) {
            if (error_code) {
                Log::debug("HTTP client disconnected before headers: {}", error_code.message());
                return;
            }
            if (header_length > MAX_HEADER_SIZE) {
                write_response(socket, HttpResponse::error(HttpResponse::HTTP_BAD_REQUEST,
                                                           "Headers too large"));
                return;
            }

            std::string head(asio::buffers_begin(streambuf->data()),
                             asio::buffers_begin(streambuf->data()) +
                                 static_cast<std::ptrdiff_t>(header_length));
            streambuf->consume(header_length);

            HttpRequest request;
            size_t      content_length = 0;
            if (!parse_head(head, request, content_length)) {
                write_response(socket, HttpResponse::error(HttpResponse::HTTP_BAD_REQUEST,
                                                           "Malformed request"));
                return;
            }
            if (content_length > MAX_BODY_SIZE) {
                write_response(socket, HttpResponse::error(HttpResponse::HTTP_PAYLOAD_TOO_LARGE,
                                                           "Request body too large"));
                return;
            }

            read_body(socket, streambuf, std::move(request), content_length);
        });
}

void HttpApiServer::read_body(const Socket& socket, const std::shared_ptr<asio::streambuf>& streambuf,
                              HttpRequest request, size_t content_length) {
    // Part of the body may already sit in the streambuf behind the headers
    size_t available = streambuf->size();
    if (available >= content_length) {
        request.body.assign(asio::buffers_begin(streambuf->data()),
                            asio::buffers_begin(streambuf->data()) +
                                static_cast<std::ptrdiff_t>(content_length));
        respond(socket, request);
        return;
    }

    auto pending = std::make_shared<HttpRequest>(std::move(request));
    asio::async_read(*socket, *streambuf, asio::transfer_exactly(content_length - available),
                     [this, socket, streambuf, pending, content_length](std::error_code body_error,
                                                                        std::size_t) {
                         if (body_error) {
                             Log::debug("Error reading HTTP body: {}", body_error.message());
                             return;
                         }
                         pending->body.assign(asio::buffers_begin(streambuf->data()),
                                              asio::buffers_begin(streambuf->data()) +
                                                  static_cast<std::ptrdiff_t>(content_length));
                         respond(socket, *pending);
                     });
}

void HttpApiServer::respond(const Socket& socket, const HttpRequest& request) {
    HttpResponse response;
    try {
        response = router_.dispatch(request);
    } catch (const std::exception& e) {
        Log::error("HTTP {} {} failed: {}", request.method, request.path, e.what());
        response = HttpResponse::error(HttpResponse::HTTP_INTERNAL_ERROR, "Internal error");
    }
    Log::debug("HTTP {} {} -> {}", request.method, request.path, response.status_code);
    write_response(socket, response);
}

void HttpApiServer::write_response(const Socket& socket, const HttpResponse& response) {
    auto payload = std::make_shared<std::string>(create_http_response(response));

    // Send HTTP response and close connection
    asio::async_write(*socket, asio::buffer(*payload),
                      [socket, payload](std::error_code write_error, std::size_t) {
                          if (write_error) {
                              Log::debug("HTTP write error: {}", write_error.message());
                          }
                          std::error_code ec;
                          socket->shutdown(asio::ip::tcp::socket::shutdown_both, ec);
                          socket->close(ec);
                      });
}

bool HttpApiServer::parse_head(const std::string& head, HttpRequest& request,
                               size_t& content_length) {
    std::istringstream stream(head);
    std::string        line;

    // Parse the request line (first line)
    if (!std::getline(stream, line)) {
        return false;
    }
    std::istringstream request_line(trim(line));
    std::string        method;
    std::string        target;
    std::string        version;
    request_line >> method >> target >> version;
    if (method.empty() || target.empty() || target.front() != '/' ||
        !version.starts_with("HTTP/")) {
        return false;
    }

    std::transform(method.begin(), method.end(), method.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    request.method = method;
    HttpRouter::split_target(target, request.path, request.query);

    content_length = 0;
    while (std::getline(stream, line)) {
        line = trim(line);
        if (line.empty()) {
            break;
        }
        size_t colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        if (lowercase(line.substr(0, colon)) != "content-length") {
            continue;
        }
        std::string value = trim(line.substr(colon + 1));
        if (value.empty() || !std::all_of(value.begin(), value.end(), [](unsigned char c) {
                return std::isdigit(c) != 0;
            })) {
            return false;
        }
        try {
            content_length = std::stoul(value);
        } catch (const std::out_of_range&) {
            return false;
        }
    }
    return true;
}

std::string HttpApiServer::create_http_response(const HttpResponse& response) {
    std::string status_line = "HTTP/1.1 " + std::to_string(response.status_code) + " " +
                              HttpResponse::status_text(response.status_code);
    return status_line + "\r\nContent-Type: " + response.content_type +
           "\r\nContent-Length: " + std::to_string(response.body.length()) +
           "\r\nConnection: close\r\n\r\n" + response.body;
}
