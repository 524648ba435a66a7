#include <catch2/catch.hpp>

#include <map>
#include <string>
#include <utility>

#include "http_api_server.h"
#include "http_router.h"

namespace {

HttpRequest request(const std::string& method, const std::string& target, std::string body = {}) {
    HttpRequest req;
    req.method = method;
    HttpRouter::split_target(target, req.path, req.query);
    req.body = std::move(body);
    return req;
}

}  // namespace

TEST_CASE("Targets split into path and decoded query", "[routing]") {
    HttpRequest req = request("GET", "/api/audio_stats?window=30&sender=ab%20cd&flag");
    CHECK(req.path == "/api/audio_stats");
    CHECK(req.query.at("window") == "30");
    CHECK(req.query.at("sender") == "ab cd");
    CHECK(req.query.at("flag").empty());
    REQUIRE(req.query_param("window") != nullptr);
    CHECK(req.query_param("missing") == nullptr);
}

TEST_CASE("URL decoding keeps malformed escapes", "[routing]") {
    CHECK(HttpRouter::url_decode("%41b+c") == "Ab c");
    CHECK(HttpRouter::url_decode("100%") == "100%");
    CHECK(HttpRouter::url_decode("%zz") == "%zz");
}

TEST_CASE("Exact routes win, then the longest prefix", "[routing]") {
    HttpRouter router;
    router.add_endpoint("GET", "/api/chimes", [](const HttpRequest&) {
        return HttpResponse::json(HttpResponse::HTTP_OK, {{"route", "list"}});
    });
    router.add_prefix_endpoint("DELETE", "/api/", [](const HttpRequest&) {
        return HttpResponse::json(HttpResponse::HTTP_OK, {{"route", "api"}});
    });
    router.add_prefix_endpoint("DELETE", "/api/chimes/", [](const HttpRequest& req) {
        return HttpResponse::json(HttpResponse::HTTP_OK, {{"route", req.path.substr(12)}});
    });

    CHECK(nlohmann::json::parse(router.dispatch(request("GET", "/api/chimes")).body)["route"] == "list");
    CHECK(nlohmann::json::parse(router.dispatch(request("DELETE", "/api/chimes/ding")).body)["route"] ==
          "ding");
    CHECK(nlohmann::json::parse(router.dispatch(request("DELETE", "/api/devices/x")).body)["route"] ==
          "api");

    // A path equal to a prefix falls through to a shorter one
    CHECK(nlohmann::json::parse(router.dispatch(request("DELETE", "/api/chimes/")).body)["route"] ==
          "api");
    CHECK(router.dispatch(request("POST", "/api/chimes")).status_code == HttpResponse::HTTP_NOT_FOUND);
    CHECK(router.dispatch(request("GET", "/nope")).status_code == HttpResponse::HTTP_NOT_FOUND);
}

TEST_CASE("Raw responses carry status line, type and length", "[routing]") {
    HttpResponse response = HttpResponse::error(HttpResponse::HTTP_CONFLICT, "busy");
    std::string  raw      = HttpApiServer::create_http_response(response);

    CHECK(raw.rfind("HTTP/1.1 409 Conflict\r\n", 0) == 0);
    CHECK(raw.find("Content-Type: application/json\r\n") != std::string::npos);
    CHECK(raw.find("Content-Length: " + std::to_string(response.body.size()) + "\r\n") !=
          std::string::npos);
    CHECK(raw.substr(raw.size() - response.body.size()) == R"({"error":"busy"})");
}

TEST_CASE("Request heads are parsed with a case-insensitive length", "[routing]") {
    HttpRequest req;
    size_t      length = 0;
    REQUIRE(HttpApiServer::parse_head(
        "POST /api/control?x=1 HTTP/1.1\r\nHost: hub\r\ncontent-length: 27\r\n\r\n", req, length));
    CHECK(req.method == "POST");
    CHECK(req.path == "/api/control");
    CHECK(req.query.at("x") == "1");
    CHECK(length == 27);

    HttpRequest bad;
    CHECK_FALSE(HttpApiServer::parse_head("garbage\r\n\r\n", bad, length));
}
