#pragma once

#include "service/palette_service.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace chromadex {

struct ApiRequest {
    std::string method;
    std::string path;
    std::map<std::string, std::string> query;
    // Keys are lowercase.
    std::map<std::string, std::string> headers;
    std::vector<uint8_t> body;

    std::optional<std::string> header(const std::string& name) const;
};

// Maps HTTP requests onto PaletteService:
//   GET  /                -> {"status": "OK"}
//   PUT  /image           -> palette of the uploaded bytes, or of {"url": ...}
//   GET  /images?color=   -> images ranked by color (limit, offset optional)
//   GET  /images/{id}     -> image detail
// The rate-limit key is the X-Real-IP header set by the fronting proxy.
class ApiRouter {
public:
    struct Config {
        std::string cors_allow_origin = "*";
    };

    ApiRouter(const Config& config, PaletteService& service);

    ApiResponse handle(const ApiRequest& request);

    static std::string client_id(const ApiRequest& request);

private:
    Config config_;
    PaletteService& service_;

    ApiResponse put_image(const ApiRequest& request);
    ApiResponse get_images(const ApiRequest& request);
    ApiResponse get_image(const std::string& id);
    void add_cors_headers(ApiResponse& response) const;
};

}
