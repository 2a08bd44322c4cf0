#include "feed/unsplash_feed.hpp"
#include "core/log.hpp"
#include <json/json.h>
#include <memory>

namespace chromadex {

UnsplashFeed::UnsplashFeed(const Config& config, HttpClient& client)
    : config_(config), client_(client), retry_(config.retry) {}

std::string UnsplashFeed::page_url(int page) const {
    const char sep = config_.base_url.find('?') == std::string::npos ? '?' : '&';
    return config_.base_url + sep + "page=" + std::to_string(page) +
           "&per_page=" + std::to_string(config_.per_page);
}

Result UnsplashFeed::parse_page(const std::string& text, std::vector<ImageRef>& out) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errors;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
        return Result::fail(ErrorCode::INVALID_FORMAT, "feed page is not valid JSON: " + errors);
    }
    if (!root.isArray()) {
        return Result::fail(ErrorCode::INVALID_FORMAT, "feed page must be a JSON array");
    }

    std::vector<ImageRef> refs;
    refs.reserve(root.size());
    for (Json::ArrayIndex i = 0; i < root.size(); ++i) {
        const Json::Value& item = root[i];
        const Json::Value& origin = item["links"]["html"];
        const Json::Value& big = item["urls"]["regular"];
        const Json::Value& small = item["urls"]["small"];
        if (!origin.isString() || !big.isString() || !small.isString()) {
            log_warning("skipping feed item " + std::to_string(i) + " without links.html/urls");
            continue;
        }
        refs.emplace_back(origin.asString(), big.asString(), small.asString());
    }

    out = std::move(refs);
    return Result::ok();
}

Result UnsplashFeed::fetch_page_once(int page, std::vector<ImageRef>& out) {
    HttpRequest request;
    request.url = page_url(page);
    request.timeout_sec = config_.timeout_sec;
    request.headers["Authorization"] = "Client-ID " + config_.access_key;
    request.headers["Accept-Version"] = "v1";

    BufferingHandler handler(config_.max_response_bytes);
    HttpOutcome outcome = client_.get(request, handler);
    if (handler.overflowed()) {
        return Result::fail(ErrorCode::CONTENT_TOO_LARGE, "feed page exceeds size limit");
    }
    if (!outcome.completed()) {
        return Result::fail(ErrorCode::TRANSIENT_FETCH, outcome.error);
    }
    if (!handler.head().ok()) {
        return Result::fail(ErrorCode::TRANSIENT_FETCH,
                            "unexpected HTTP status " + std::to_string(handler.head().status));
    }
    return parse_page(handler.body_text(), out);
}

Result UnsplashFeed::fetch_page(int page, std::vector<ImageRef>& out) {
    log_debug("getting images for page " + std::to_string(page));
    Result result = retry_.run([&]() { return fetch_page_once(page, out); });
    if (result.success()) {
        log_debug("got " + std::to_string(out.size()) + " images for page " + std::to_string(page));
    }
    return result;
}

}
