#pragma once

#include "service/api_router.hpp"
#include <drogon/HttpRequest.h>
#include <drogon/HttpResponse.h>
#include <cstddef>
#include <string>

namespace chromadex {

// Serves ApiRouter over HTTP on drogon's event loop.
class HttpServer {
public:
    struct Config {
        std::string host = "0.0.0.0";
        int port = 8080;
        int threads = 4;
        size_t max_body_bytes = 5242880;
    };

    HttpServer(const Config& config, ApiRouter& router);

    // Blocks until quit() is called from another thread.
    void run();
    void quit();

    static ApiRequest to_api_request(const drogon::HttpRequestPtr& request);
    static drogon::HttpResponsePtr to_http_response(const ApiResponse& response);

private:
    Config config_;
    ApiRouter& router_;

    void register_routes();
};

}
