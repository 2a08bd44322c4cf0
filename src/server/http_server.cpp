#include "server/http_server.hpp"
#include "core/log.hpp"
#include "net/http_client.hpp"
#include <drogon/drogon.h>
#include <cstdint>
#include <exception>
#include <functional>
#include <utility>

namespace chromadex {

namespace {

using Callback = std::function<void(const drogon::HttpResponsePtr&)>;

}

HttpServer::HttpServer(const Config& config, ApiRouter& router) : config_(config), router_(router) {}

ApiRequest HttpServer::to_api_request(const drogon::HttpRequestPtr& request) {
    ApiRequest out;
    out.method = request->methodString();
    out.path = request->path();
    for (const auto& param : request->getParameters()) {
        out.query[param.first] = param.second;
    }
    for (const auto& header : request->getHeaders()) {
        out.headers[to_lower_ascii(header.first)] = header.second;
    }
    auto body = request->getBody();
    out.body.assign(body.begin(), body.end());
    return out;
}

drogon::HttpResponsePtr HttpServer::to_http_response(const ApiResponse& response) {
    auto http = drogon::HttpResponse::newHttpResponse();
    http->setStatusCode(static_cast<drogon::HttpStatusCode>(response.status));
    http->setContentTypeCode(drogon::CT_APPLICATION_JSON);
    http->setBody(response.to_json());
    for (const auto& header : response.headers) {
        http->addHeader(header.first, header.second);
    }
    return http;
}

void HttpServer::register_routes() {
    auto handle = [this](const drogon::HttpRequestPtr& request, Callback&& callback) {
        ApiResponse response;
        try {
            response = router_.handle(to_api_request(request));
        } catch (const std::exception& e) {
            log_error(std::string("request ") + request->methodString() + " " + request->path() +
                      " failed: " + e.what());
            response.status = 500;
            response.body = Json::Value(Json::objectValue);
            response.body["error"] = "Internal server error.";
        }
        callback(to_http_response(response));
    };

    drogon::app().registerHandler("/", handle, {drogon::Get, drogon::Options});
    drogon::app().registerHandler("/image", handle, {drogon::Put, drogon::Options});
    drogon::app().registerHandler("/images", handle, {drogon::Get, drogon::Options});
    drogon::app().registerHandler(
        "/images/{1}",
        [handle](const drogon::HttpRequestPtr& request, Callback&& callback, const std::string&) {
            handle(request, std::move(callback));
        },
        {drogon::Get, drogon::Options});
}

void HttpServer::run() {
    register_routes();
    log_info("listening on " + config_.host + ":" + std::to_string(config_.port));
    // Signals are handled by the caller, which calls quit().
    drogon::app()
        .disableSigtermHandling()
        .setThreadNum(static_cast<size_t>(config_.threads))
        .setClientMaxBodySize(config_.max_body_bytes)
        .addListener(config_.host, static_cast<uint16_t>(config_.port))
        .run();
}

void HttpServer::quit() {
    drogon::app().quit();
}

}
