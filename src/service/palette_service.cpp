#include "service/palette_service.hpp"
#include "core/color_space.hpp"
#include "core/log.hpp"
#include <future>

namespace chromadex {

namespace {

const char* const EXTRACTION_ACTION = "color_extraction";
const char* const SEARCH_ACTION = "image_search";

Json::Value message_body(const std::string& key, const std::string& message) {
    Json::Value body(Json::objectValue);
    body[key] = message;
    return body;
}

}

std::string ApiResponse::to_json(bool pretty) const {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = pretty ? "  " : "";
    return Json::writeString(builder, body);
}

PaletteService::PaletteService(const Config& config, ImageStore& store, const ImageFetcher& fetcher,
                               const ImageDecoder& decoder, const ClusterExtractor& extractor,
                               WorkerPool& pool, RateLimiter& limiter, ConcurrencyGate& gate)
    : config_(config),
      store_(store),
      fetcher_(fetcher),
      decoder_(decoder),
      extractor_(extractor),
      pool_(pool),
      limiter_(limiter),
      gate_(gate) {}

Json::Value PaletteService::color_json(const Color& color) {
    Json::Value json(Json::objectValue);

    Json::Value lab(Json::arrayValue);
    lab.append(color.L());
    lab.append(color.a());
    lab.append(color.b());
    json["lab"] = lab;

    Json::Value rgb(Json::arrayValue);
    rgb.append(color.rgb().r);
    rgb.append(color.rgb().g);
    rgb.append(color.rgb().b);
    json["rgb"] = rgb;

    json["hex"] = color.hex();
    json["percentage"] = color.percentage();
    json["name"] = color.name() ? Json::Value(*color.name()) : Json::Value(Json::nullValue);
    json["name_distance"] =
        color.name_distance() ? Json::Value(*color.name_distance()) : Json::Value(Json::nullValue);
    return json;
}

Json::Value PaletteService::image_json(const ImageRef& ref) {
    Json::Value json(Json::objectValue);
    json["id"] = ref.id ? Json::Value(static_cast<Json::Int64>(*ref.id)) : Json::Value(Json::nullValue);
    json["origin"] = ref.origin;
    json["url_big"] = ref.url_big;
    json["url_thumb"] = ref.url_thumb;
    return json;
}

ApiResponse PaletteService::error_response(const Result& result) {
    ApiResponse response;
    switch (result.error) {
        case ErrorCode::SUCCESS:
            response.status = 200;
            response.body = Json::Value(Json::objectValue);
            break;
        case ErrorCode::INVALID_ARGUMENT:
        case ErrorCode::INVALID_CONTENT_TYPE:
        case ErrorCode::MISSING_CONTENT_LENGTH:
        case ErrorCode::CONTENT_TOO_LARGE:
        case ErrorCode::INVALID_FORMAT:
        case ErrorCode::DIMENSION_OUT_OF_RANGE:
        case ErrorCode::TRANSIENT_FETCH:
            response.status = 400;
            response.body = message_body(result.field.empty() ? "error" : result.field, result.message);
            break;
        case ErrorCode::RATE_LIMIT_EXCEEDED:
            response.status = 429;
            response.body = message_body("error", result.message);
            response.headers["Retry-After"] = std::to_string(result.retry_after);
            break;
        case ErrorCode::SERVICE_SATURATED:
        case ErrorCode::CANCELLED:
            response.status = 503;
            response.body = message_body("error", result.message);
            break;
        case ErrorCode::NOT_FOUND:
            response.status = 404;
            response.body = message_body("error", result.message);
            break;
        case ErrorCode::STORAGE_ERROR:
            log_error(result.message);
            response.status = 500;
            response.body = message_body("error", "Internal server error.");
            break;
    }
    return response;
}

ApiResponse PaletteService::palette_response(const std::vector<Color>& colors) {
    ApiResponse response;
    response.body = Json::Value(Json::arrayValue);
    for (const auto& color : colors) {
        response.body.append(color_json(color));
    }
    return response;
}

ApiResponse PaletteService::run_extraction(const std::vector<uint8_t>& bytes) {
    std::vector<Color> colors;
    std::future<Result> extraction = pool_.submit([this, &bytes, &colors]() {
        return extractor_.extract_from_bytes(bytes, decoder_, colors);
    });
    Result result = extraction.get();
    if (result.failure()) return error_response(result);
    return palette_response(colors);
}

ApiResponse PaletteService::extract_from_bytes(const std::string& client, const std::vector<uint8_t>& bytes,
                                               const std::optional<std::string>& content_type) {
    Result result = limiter_.check(client, EXTRACTION_ACTION, config_.extraction_rule);
    if (result.failure()) return error_response(result);

    ConcurrencyGate::Permit permit = gate_.try_acquire();
    if (!permit) {
        return error_response(Result::fail(ErrorCode::SERVICE_SATURATED,
                                           "Service is busy. Try again later."));
    }

    if (content_type) {
        result = fetcher_.validate_content_type(*content_type);
        if (result.failure()) return error_response(result);
    }
    result = fetcher_.validate_size(bytes.size());
    if (result.failure()) return error_response(result);

    return run_extraction(bytes);
}

ApiResponse PaletteService::extract_from_url(const std::string& client, const std::string& url) {
    Result result = limiter_.check(client, EXTRACTION_ACTION, config_.extraction_rule);
    if (result.failure()) return error_response(result);

    ConcurrencyGate::Permit permit = gate_.try_acquire();
    if (!permit) {
        return error_response(Result::fail(ErrorCode::SERVICE_SATURATED,
                                           "Service is busy. Try again later."));
    }

    std::vector<uint8_t> bytes;
    result = fetcher_.fetch(url, bytes);
    if (result.failure()) return error_response(result);

    return run_extraction(bytes);
}

bool PaletteService::is_search_hex(const std::string& hex) {
    if (hex.size() != 6) return false;
    for (char c : hex) {
        bool digit = c >= '0' && c <= '9';
        bool lower = c >= 'a' && c <= 'f';
        if (!digit && !lower) return false;
    }
    return true;
}

ApiResponse PaletteService::search(const std::string& client, const std::string& hex, std::optional<int> limit,
                                   int offset) {
    Result result = limiter_.check(client, SEARCH_ACTION, config_.search_rule);
    if (result.failure()) return error_response(result);

    Rgb rgb;
    if (!is_search_hex(hex) || !ColorSpace::parse_hex(hex, rgb)) {
        return error_response(Result::fail(ErrorCode::INVALID_ARGUMENT,
                                           "Color must be 6 lowercase hex digits, e.g. ff00aa.", "color"));
    }

    const int count = limit.value_or(config_.default_limit);
    if (count < 1 || count > config_.max_limit) {
        return error_response(Result::fail(ErrorCode::INVALID_ARGUMENT,
                                           "Limit must be between 1 and " + std::to_string(config_.max_limit) + ".",
                                           "limit"));
    }
    if (offset < 0) {
        return error_response(Result::fail(ErrorCode::INVALID_ARGUMENT, "Offset must not be negative.", "offset"));
    }

    std::vector<ImageRef> refs;
    result = store_.search_by_color(Color::from_rgb(rgb), count, offset, refs);
    if (result.failure()) return error_response(result);

    ApiResponse response;
    response.body = Json::Value(Json::arrayValue);
    for (const auto& ref : refs) {
        response.body.append(image_json(ref));
    }
    return response;
}

ApiResponse PaletteService::detail(int64_t id) {
    std::optional<ImageRef> ref;
    Result result = store_.get(id, ref);
    if (result.failure()) return error_response(result);
    if (!ref) {
        return error_response(Result::fail(ErrorCode::NOT_FOUND, "Image not found."));
    }

    std::vector<Color> colors;
    result = store_.get_colors(id, colors);
    if (result.failure()) return error_response(result);

    ApiResponse response;
    response.body = Json::Value(Json::objectValue);
    response.body["image"] = image_json(*ref);
    Json::Value palette(Json::arrayValue);
    for (const auto& color : colors) {
        palette.append(color_json(color));
    }
    response.body["colors"] = palette;
    return response;
}

}
