#include "net/image_fetcher.hpp"
#include "core/log.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>

namespace chromadex {

namespace {

const char* const UNAVAILABLE_MESSAGE = "The requested resource is not available.";

// Validates each stage of the response as it arrives and stops the transfer
// on the first violation.
class ValidatingHandler : public HttpBodyHandler {
public:
    ValidatingHandler(const ImageFetcher& fetcher, std::vector<uint8_t>& body)
        : fetcher_(fetcher), body_(body) {}

    bool on_head(const HttpResponseHead& head) override {
        body_.clear();
        if (!head.ok()) {
            result_ = Result::fail(ErrorCode::TRANSIENT_FETCH,
                                   "unexpected HTTP status " + std::to_string(head.status), "url");
            return false;
        }

        result_ = fetcher_.validate_content_type(head.header("content-type").value_or(""));
        if (result_.failure()) return false;

        result_ = fetcher_.validate_content_length(head.header("content-length"));
        if (result_.failure()) return false;

        if (auto length = head.header("content-length")) {
            body_.reserve(static_cast<size_t>(std::stoull(*length)));
        }
        return true;
    }

    bool on_data(const uint8_t* data, size_t size) override {
        body_.insert(body_.end(), data, data + size);
        result_ = fetcher_.validate_size(body_.size());
        return result_.success();
    }

    const Result& result() const { return result_; }

private:
    const ImageFetcher& fetcher_;
    std::vector<uint8_t>& body_;
    Result result_;
};

bool parse_length(const std::string& text, unsigned long long& out) {
    if (text.empty() || text.size() > 19) return false;
    unsigned long long value = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        value = value * 10 + static_cast<unsigned long long>(c - '0');
    }
    out = value;
    return true;
}

}

ImageFetcher::ImageFetcher(const Config& config, HttpClient& client, const ImageDecoder& decoder)
    : config_(config), client_(client), decoder_(decoder), retry_(config.retry) {}

std::string ImageFetcher::too_large_message() const {
    char buf[128];
    std::snprintf(buf, sizeof(buf),
                  "The image file is too large. Maximum file size is %.2f Mb.",
                  static_cast<double>(config_.max_size_bytes) / (1024.0 * 1024.0));
    return buf;
}

std::string ImageFetcher::invalid_type_message() const {
    std::string types;
    for (size_t i = 0; i < config_.allowed_content_types.size(); ++i) {
        if (i > 0) types += ", ";
        types += config_.allowed_content_types[i];
    }
    return "Only " + types + " images are allowed.";
}

Result ImageFetcher::validate_url(const std::string& url) {
    std::string lower = to_lower_ascii(url);
    size_t scheme_end = std::string::npos;
    if (lower.compare(0, 7, "http://") == 0) {
        scheme_end = 7;
    } else if (lower.compare(0, 8, "https://") == 0) {
        scheme_end = 8;
    }
    if (scheme_end == std::string::npos) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "Not a valid URL.", "url");
    }

    size_t host_end = url.find_first_of("/?#", scheme_end);
    std::string authority = url.substr(scheme_end, host_end == std::string::npos ? std::string::npos
                                                                                  : host_end - scheme_end);
    size_t at = authority.rfind('@');
    if (at != std::string::npos) authority = authority.substr(at + 1);
    size_t colon = authority.rfind(':');
    std::string host = colon == std::string::npos ? authority : authority.substr(0, colon);

    bool valid = !host.empty() && host.find('.') != std::string::npos &&
                 host.front() != '.' && host.back() != '.';
    for (char c : host) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '.' && c != '-') {
            valid = false;
            break;
        }
    }
    if (!valid) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "Not a valid URL.", "url");
    }
    return Result::ok();
}

Result ImageFetcher::validate_content_type(const std::string& content_type) const {
    std::string media_type = to_lower_ascii(trim_ascii(content_type.substr(0, content_type.find(';'))));
    const auto& allowed = config_.allowed_content_types;
    auto matches = [&media_type](const std::string& type) { return to_lower_ascii(type) == media_type; };
    if (std::find_if(allowed.begin(), allowed.end(), matches) == allowed.end()) {
        return Result::fail(ErrorCode::INVALID_CONTENT_TYPE, invalid_type_message(), "image");
    }
    return Result::ok();
}

Result ImageFetcher::validate_content_length(const std::optional<std::string>& content_length) const {
    unsigned long long length = 0;
    if (!content_length || !parse_length(*content_length, length) || length == 0) {
        return Result::fail(ErrorCode::MISSING_CONTENT_LENGTH,
                            "Content-Length HTTP-header must be set.", "content_length");
    }
    if (length > config_.max_size_bytes) {
        return Result::fail(ErrorCode::CONTENT_TOO_LARGE, too_large_message(), "image");
    }
    return Result::ok();
}

Result ImageFetcher::validate_size(size_t size) const {
    if (size > config_.max_size_bytes) {
        return Result::fail(ErrorCode::CONTENT_TOO_LARGE, too_large_message(), "image");
    }
    return Result::ok();
}

Result ImageFetcher::fetch_once(const std::string& url, std::vector<uint8_t>& bytes) const {
    HttpRequest request;
    request.url = url;
    request.timeout_sec = config_.timeout_sec;

    ValidatingHandler handler(*this, bytes);
    HttpOutcome outcome = client_.get(request, handler);

    switch (outcome.kind) {
        case HttpOutcome::Kind::Completed:
        case HttpOutcome::Kind::Aborted:
            return handler.result();
        case HttpOutcome::Kind::TransportError:
            break;
    }
    return Result::fail(ErrorCode::TRANSIENT_FETCH, outcome.error, "url");
}

Result ImageFetcher::fetch(const std::string& url, std::vector<uint8_t>& bytes, const StopToken* stop) const {
    Result result = validate_url(url);
    if (result.failure()) return result;

    result = retry_.run([&]() { return fetch_once(url, bytes); }, stop);
    if (result.error == ErrorCode::TRANSIENT_FETCH) {
        log_warning("failed to fetch " + url + ": " + result.message);
        bytes.clear();
        return Result::fail(ErrorCode::TRANSIENT_FETCH, UNAVAILABLE_MESSAGE, "url");
    }
    if (result.failure()) {
        bytes.clear();
    }
    return result;
}

Result ImageFetcher::fetch_image(const std::string& url, std::vector<uint8_t>& bytes, RgbImage& image,
                                 const StopToken* stop) const {
    Result result = fetch(url, bytes, stop);
    if (result.failure()) return result;
    return decoder_.decode(bytes, image);
}

}
