#pragma once

#include <algorithm>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

struct HttpRequest {
    std::string                        method;
    std::string                        path;  // without the query string
    std::map<std::string, std::string> query;
    std::string                        body;

    const std::string* query_param(const std::string& name) const {
        auto it = query.find(name);
        return it != query.end() ? &it->second : nullptr;
    }
};

struct HttpResponse {
    static constexpr int HTTP_OK                = 200;
    static constexpr int HTTP_BAD_REQUEST       = 400;
    static constexpr int HTTP_NOT_FOUND         = 404;
    static constexpr int HTTP_CONFLICT          = 409;
    static constexpr int HTTP_PAYLOAD_TOO_LARGE = 413;
    static constexpr int HTTP_INTERNAL_ERROR    = 500;

    int         status_code = HTTP_OK;
    std::string body;
    std::string content_type = "application/json";

    static HttpResponse json(int code, const nlohmann::json& value) {
        return HttpResponse{code, value.dump(), "application/json"};
    }

    static HttpResponse error(int code, const std::string& message) {
        return json(code, {{"error", message}});
    }

    static const char* status_text(int code) {
        switch (code) {
            case HTTP_OK:
                return "OK";
            case HTTP_BAD_REQUEST:
                return "Bad Request";
            case HTTP_NOT_FOUND:
                return "Not Found";
            case HTTP_CONFLICT:
                return "Conflict";
            case HTTP_PAYLOAD_TOO_LARGE:
                return "Payload Too Large";
            default:
                return "Internal Server Error";
        }
    }
};

// Method + path dispatch. Exact routes win over prefix routes; among prefix routes the
// longest prefix wins, so "/api/devices/" can sit beside "/api/devices".
class HttpRouter {
public:
    using EndpointHandler = std::function<HttpResponse(const HttpRequest& request)>;

    void add_endpoint(const std::string& method, const std::string& path, EndpointHandler handler) {
        exact_[method + " " + path] = std::move(handler);
    }

    void add_prefix_endpoint(const std::string& method, const std::string& prefix,
                             EndpointHandler handler) {
        prefixes_.push_back(PrefixRoute{method, prefix, std::move(handler)});
        std::sort(prefixes_.begin(), prefixes_.end(), [](const auto& a, const auto& b) {
            return a.prefix.size() > b.prefix.size();
        });
    }

    HttpResponse dispatch(const HttpRequest& request) const {
        auto it = exact_.find(request.method + " " + request.path);
        if (it != exact_.end()) {
            return it->second(request);
        }
        for (const auto& route: prefixes_) {
            if (route.method == request.method && request.path.starts_with(route.prefix) &&
                request.path.size() > route.prefix.size()) {
                return route.handler(request);
            }
        }
        return HttpResponse::error(HttpResponse::HTTP_NOT_FOUND,
                                   "Endpoint not found: " + request.method + " " + request.path);
    }

    // "%41b+c" -> "Ab c"; malformed escapes are kept as they are
    static std::string url_decode(std::string_view value) {
        std::string out;
        out.reserve(value.size());
        for (size_t i = 0; i < value.size(); ++i) {
            char c = value[i];
            if (c == '+') {
                out.push_back(' ');
            } else if (c == '%' && i + 2 < value.size() && hex_value(value[i + 1]) >= 0 &&
                       hex_value(value[i + 2]) >= 0) {
                out.push_back(static_cast<char>(hex_value(value[i + 1]) * 16 + hex_value(value[i + 2])));
                i += 2;
            } else {
                out.push_back(c);
            }
        }
        return out;
    }

    // Splits "/path?a=1&b=2" into path and decoded query parameters
    static void split_target(std::string_view target, std::string& path,
                             std::map<std::string, std::string>& query) {
        size_t question = target.find('?');
        path            = url_decode(target.substr(0, question));
        if (question == std::string_view::npos) {
            return;
        }
        std::string_view rest = target.substr(question + 1);
        while (!rest.empty()) {
            size_t           amp  = rest.find('&');
            std::string_view pair = rest.substr(0, amp);
            size_t           eq   = pair.find('=');
            if (!pair.empty()) {
                std::string key   = url_decode(pair.substr(0, eq));
                std::string value = eq == std::string_view::npos ? "" : url_decode(pair.substr(eq + 1));
                query[key]        = value;
            }
            if (amp == std::string_view::npos) {
                break;
            }
            rest = rest.substr(amp + 1);
        }
    }

private:
    static int hex_value(char c) {
        if (c >= '0' && c <= '9') {
            return c - '0';
        }
        if (c >= 'a' && c <= 'f') {
            return c - 'a' + 10;
        }
        if (c >= 'A' && c <= 'F') {
            return c - 'A' + 10;
        }
        return -1;
    }

    struct PrefixRoute {
        std::string     method;
        std::string     prefix;
        EndpointHandler handler;
    };

    std::map<std::string, EndpointHandler> exact_;
    std::vector<PrefixRoute>               prefixes_;
};
