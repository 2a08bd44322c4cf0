#include "service/api_router.hpp"
#include "net/http_client.hpp"
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <memory>

namespace chromadex {

namespace {

const char* const IMAGES_PREFIX = "/images/";

bool parse_int64(const std::string& text, long long& out) {
    if (text.empty()) return false;
    char* end = nullptr;
    errno = 0;
    long long value = std::strtoll(text.c_str(), &end, 10);
    if (errno != 0 || end == text.c_str() || *end != '\0') return false;
    out = value;
    return true;
}

bool parse_int(const std::string& text, int& out) {
    long long value = 0;
    if (!parse_int64(text, value) || value < INT_MIN || value > INT_MAX) return false;
    out = static_cast<int>(value);
    return true;
}

ApiResponse method_not_allowed(const std::string& allow) {
    ApiResponse response;
    response.status = 405;
    response.body = Json::Value(Json::objectValue);
    response.body["error"] = "Method not allowed.";
    response.headers["Allow"] = allow;
    return response;
}

ApiResponse route_not_found() {
    return PaletteService::error_response(Result::fail(ErrorCode::NOT_FOUND, "Not found."));
}

}

std::optional<std::string> ApiRequest::header(const std::string& name) const {
    auto it = headers.find(to_lower_ascii(name));
    if (it == headers.end()) return std::nullopt;
    return it->second;
}

ApiRouter::ApiRouter(const Config& config, PaletteService& service) : config_(config), service_(service) {}

std::string ApiRouter::client_id(const ApiRequest& request) {
    return trim_ascii(request.header("x-real-ip").value_or(""));
}

void ApiRouter::add_cors_headers(ApiResponse& response) const {
    if (config_.cors_allow_origin.empty()) return;
    response.headers["Access-Control-Allow-Origin"] = config_.cors_allow_origin;
    response.headers["Access-Control-Allow-Methods"] = "GET, PUT, OPTIONS";
    response.headers["Access-Control-Allow-Headers"] = "*";
    response.headers["Access-Control-Max-Age"] = "86400";
}

ApiResponse ApiRouter::handle(const ApiRequest& request) {
    ApiResponse response;
    const std::string& path = request.path;

    if (request.method == "OPTIONS") {
        response.body = Json::Value(Json::objectValue);
    } else if (path == "/") {
        if (request.method == "GET") {
            response.body = Json::Value(Json::objectValue);
            response.body["status"] = "OK";
        } else {
            response = method_not_allowed("GET");
        }
    } else if (path == "/image") {
        response = request.method == "PUT" ? put_image(request) : method_not_allowed("PUT");
    } else if (path == "/images") {
        response = request.method == "GET" ? get_images(request) : method_not_allowed("GET");
    } else if (path.rfind(IMAGES_PREFIX, 0) == 0) {
        if (request.method == "GET") {
            response = get_image(path.substr(std::string(IMAGES_PREFIX).size()));
        } else {
            response = method_not_allowed("GET");
        }
    } else {
        response = route_not_found();
    }

    add_cors_headers(response);
    return response;
}

ApiResponse ApiRouter::put_image(const ApiRequest& request) {
    const std::string client = client_id(request);
    const std::string content_type = request.header("content-type").value_or("");
    const std::string media_type = to_lower_ascii(trim_ascii(content_type.substr(0, content_type.find(';'))));

    if (media_type != "application/json") {
        return service_.extract_from_bytes(client, request.body, content_type);
    }

    Json::Value body;
    bool parsed = false;
    if (!request.body.empty()) {
        Json::CharReaderBuilder builder;
        std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
        const char* begin = reinterpret_cast<const char*>(request.body.data());
        std::string errors;
        parsed = reader->parse(begin, begin + request.body.size(), &body, &errors);
    }
    if (!parsed || !body.isObject() || !body["url"].isString()) {
        return PaletteService::error_response(
            Result::fail(ErrorCode::INVALID_ARGUMENT, "Missing data for required field.", "url"));
    }
    return service_.extract_from_url(client, body["url"].asString());
}

ApiResponse ApiRouter::get_images(const ApiRequest& request) {
    auto color = request.query.find("color");
    if (color == request.query.end()) {
        return PaletteService::error_response(
            Result::fail(ErrorCode::INVALID_ARGUMENT, "Missing data for required field.", "color"));
    }

    std::optional<int> limit;
    auto limit_param = request.query.find("limit");
    if (limit_param != request.query.end()) {
        int value = 0;
        if (!parse_int(limit_param->second, value)) {
            return PaletteService::error_response(
                Result::fail(ErrorCode::INVALID_ARGUMENT, "Not a valid integer.", "limit"));
        }
        limit = value;
    }

    int offset = 0;
    auto offset_param = request.query.find("offset");
    if (offset_param != request.query.end() && !parse_int(offset_param->second, offset)) {
        return PaletteService::error_response(
            Result::fail(ErrorCode::INVALID_ARGUMENT, "Not a valid integer.", "offset"));
    }

    return service_.search(client_id(request), color->second, limit, offset);
}

ApiResponse ApiRouter::get_image(const std::string& id) {
    long long value = 0;
    if (!parse_int64(id, value) || value < 1) {
        return PaletteService::error_response(Result::fail(ErrorCode::NOT_FOUND, "Image not found."));
    }
    return service_.detail(static_cast<int64_t>(value));
}

}
