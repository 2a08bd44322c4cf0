#include <iostream>
#include <cassert>
#include <algorithm>
#include <deque>
#include <map>
#include <string>
#include <vector>
#include <stdexcept>

#include "../src/core/types.hpp"
#include "../src/core/log.hpp"
#include "../src/core/stop_token.hpp"
#include "../src/net/http_client.hpp"
#include "../src/net/image_fetcher.hpp"
#include "../src/palette/image_decoder.hpp"
#include "../src/feed/unsplash_feed.hpp"

using namespace chromadex;

#define TEST(name) static void test_##name()
#define RUN_TEST(name) do { \
    std::cout << "Running " #name "... "; \
    try { \
        test_##name(); \
        std::cout << "PASSED\n"; \
    } catch (const std::exception& e) { \
        std::cout << "FAILED: " << e.what() << "\n"; \
        failures++; \
    } catch (...) { \
        std::cout << "FAILED: unknown exception\n"; \
        failures++; \
    } \
} while(0)

int failures = 0;

// Replays scripted responses in order; the last one repeats.
class FakeHttpClient : public HttpClient {
public:
    struct Response {
        bool transport_error = false;
        long status = 200;
        std::map<std::string, std::string> headers;
        std::string body;
        size_t chunk = 1024;
    };

    void push(const Response& response) { script_.push_back(response); }

    HttpOutcome get(const HttpRequest& request, HttpBodyHandler& handler) override {
        requests.push_back(request);
        if (script_.empty()) throw std::logic_error("no scripted response");
        Response response = script_.front();
        if (script_.size() > 1) script_.pop_front();

        HttpOutcome outcome;
        if (response.transport_error) {
            outcome.kind = HttpOutcome::Kind::TransportError;
            outcome.error = "connection refused";
            return outcome;
        }

        HttpResponseHead head;
        head.status = response.status;
        for (const auto& h : response.headers) {
            head.headers[to_lower_ascii(h.first)] = h.second;
        }
        outcome.status = response.status;
        if (!handler.on_head(head)) {
            outcome.kind = HttpOutcome::Kind::Aborted;
            return outcome;
        }

        const uint8_t* data = reinterpret_cast<const uint8_t*>(response.body.data());
        for (size_t offset = 0; offset < response.body.size(); offset += response.chunk) {
            size_t n = std::min(response.chunk, response.body.size() - offset);
            if (!handler.on_data(data + offset, n)) {
                outcome.kind = HttpOutcome::Kind::Aborted;
                return outcome;
            }
        }
        return outcome;
    }

    std::vector<HttpRequest> requests;

private:
    std::deque<Response> script_;
};

static FakeHttpClient::Response image_response(size_t size, const std::string& type = "image/jpeg") {
    FakeHttpClient::Response r;
    r.headers["Content-Type"] = type;
    r.headers["Content-Length"] = std::to_string(size);
    r.body.assign(size, 'x');
    return r;
}

static ImageFetcher::Config fast_config(size_t max_size = 1000) {
    ImageFetcher::Config cfg;
    cfg.max_size_bytes = max_size;
    cfg.retry.max_attempts = 3;
    cfg.retry.wait_sec = 0.0;
    return cfg;
}

static const char* const URL = "https://images.example.com/photo.jpg";

TEST(fetch_accepts_max_size) {
    FakeHttpClient http;
    http.push(image_response(1000));
    ImageDecoder decoder;
    ImageFetcher fetcher(fast_config(), http, decoder);

    std::vector<uint8_t> bytes;
    Result r = fetcher.fetch(URL, bytes);
    assert(r.success());
    assert(bytes.size() == 1000);
    assert(http.requests.size() == 1);
    assert(http.requests[0].url == URL);
}

TEST(fetch_rejects_max_plus_one) {
    FakeHttpClient http;
    http.push(image_response(1001));
    ImageDecoder decoder;
    ImageFetcher fetcher(fast_config(), http, decoder);

    std::vector<uint8_t> bytes;
    Result r = fetcher.fetch(URL, bytes);
    assert(r.error == ErrorCode::CONTENT_TOO_LARGE);
    assert(r.field == "image");
    assert(bytes.empty());
    // Validation failures are not retried.
    assert(http.requests.size() == 1);
}

TEST(too_large_message_in_megabytes) {
    FakeHttpClient http;
    ImageDecoder decoder;
    ImageFetcher fetcher(ImageFetcher::Config(), http, decoder);
    assert(fetcher.too_large_message() == "The image file is too large. Maximum file size is 5.00 Mb.");
    Result r = fetcher.validate_size(5242881);
    assert(r.error == ErrorCode::CONTENT_TOO_LARGE);
    assert(fetcher.validate_size(5242880).success());
}

TEST(fetch_requires_content_length) {
    FakeHttpClient http;
    FakeHttpClient::Response r = image_response(10);
    r.headers.erase("Content-Length");
    http.push(r);
    ImageDecoder decoder;
    ImageFetcher fetcher(fast_config(), http, decoder);

    std::vector<uint8_t> bytes;
    Result result = fetcher.fetch(URL, bytes);
    assert(result.error == ErrorCode::MISSING_CONTENT_LENGTH);
    assert(result.field == "content_length");
    assert(result.message == "Content-Length HTTP-header must be set.");

    assert(fetcher.validate_content_length(std::string("0")).error == ErrorCode::MISSING_CONTENT_LENGTH);
    assert(fetcher.validate_content_length(std::string("12abc")).error == ErrorCode::MISSING_CONTENT_LENGTH);
    assert(fetcher.validate_content_length(std::string("999")).success());
}

TEST(fetch_checks_content_type) {
    FakeHttpClient http;
    http.push(image_response(10, "image/gif"));
    ImageDecoder decoder;
    ImageFetcher fetcher(fast_config(), http, decoder);

    std::vector<uint8_t> bytes;
    Result r = fetcher.fetch(URL, bytes);
    assert(r.error == ErrorCode::INVALID_CONTENT_TYPE);
    assert(r.message == "Only image/jpeg, image/png images are allowed.");

    assert(fetcher.validate_content_type("image/png; charset=binary").success());
    assert(fetcher.validate_content_type("image/pngx").failure());
    assert(fetcher.validate_content_type("").failure());
}

TEST(content_type_is_case_insensitive) {
    FakeHttpClient http;
    http.push(image_response(10, "Image/JPEG ; charset=binary"));
    ImageDecoder decoder;
    ImageFetcher fetcher(fast_config(), http, decoder);

    std::vector<uint8_t> bytes;
    assert(fetcher.fetch(URL, bytes).success());
    assert(bytes.size() == 10);

    assert(fetcher.validate_content_type("image/JPEG").success());
    assert(fetcher.validate_content_type("Image/Png").success());
    assert(fetcher.validate_content_type("  image/png;q=1").success());
    assert(fetcher.validate_content_type("img/PNG").failure());
}

TEST(fetch_stops_streaming_past_limit) {
    FakeHttpClient http;
    // The declared length understates the body.
    FakeHttpClient::Response r = image_response(500);
    r.body.assign(4000, 'x');
    r.chunk = 256;
    http.push(r);
    ImageDecoder decoder;
    ImageFetcher fetcher(fast_config(), http, decoder);

    std::vector<uint8_t> bytes;
    Result result = fetcher.fetch(URL, bytes);
    assert(result.error == ErrorCode::CONTENT_TOO_LARGE);
    assert(bytes.empty());
}

TEST(fetch_retries_transient_failures) {
    FakeHttpClient http;
    FakeHttpClient::Response down;
    down.transport_error = true;
    http.push(down);
    http.push(image_response(64));
    ImageDecoder decoder;
    ImageFetcher fetcher(fast_config(), http, decoder);

    std::vector<uint8_t> bytes;
    Result r = fetcher.fetch(URL, bytes);
    assert(r.success());
    assert(http.requests.size() == 2);
    assert(bytes.size() == 64);
}

TEST(fetch_gives_up_after_max_attempts) {
    FakeHttpClient http;
    FakeHttpClient::Response unavailable;
    unavailable.status = 503;
    http.push(unavailable);
    ImageDecoder decoder;
    ImageFetcher fetcher(fast_config(), http, decoder);

    std::vector<uint8_t> bytes;
    Result r = fetcher.fetch(URL, bytes);
    assert(r.error == ErrorCode::TRANSIENT_FETCH);
    assert(r.field == "url");
    assert(r.message == "The requested resource is not available.");
    assert(http.requests.size() == 3);
}

TEST(fetch_cancelled_during_wait) {
    FakeHttpClient http;
    FakeHttpClient::Response down;
    down.transport_error = true;
    http.push(down);
    ImageDecoder decoder;
    ImageFetcher::Config cfg = fast_config();
    cfg.retry.wait_sec = 30.0;
    ImageFetcher fetcher(cfg, http, decoder);

    StopToken stop;
    stop.request_stop();
    std::vector<uint8_t> bytes;
    Result r = fetcher.fetch(URL, bytes, &stop);
    assert(r.error == ErrorCode::CANCELLED);
    assert(http.requests.size() == 1);
}

TEST(fetch_rejects_bad_urls) {
    FakeHttpClient http;
    ImageDecoder decoder;
    ImageFetcher fetcher(fast_config(), http, decoder);

    std::vector<uint8_t> bytes;
    const char* bad[] = {"ftp://example.com/a.jpg", "not a url", "http://localhost/a.jpg", "https://exa mple.com/"};
    for (const char* url : bad) {
        Result r = fetcher.fetch(url, bytes);
        assert(r.error == ErrorCode::INVALID_ARGUMENT);
        assert(r.field == "url");
    }
    assert(http.requests.empty());
    assert(ImageFetcher::validate_url("http://user@cdn.example.org:8080/x?y=1").success());
}

TEST(fetch_image_decodes_and_validates) {
    FakeHttpClient http;
    http.push(image_response(32));
    ImageDecoder decoder;
    ImageFetcher fetcher(fast_config(), http, decoder);

    std::vector<uint8_t> bytes;
    RgbImage image;
    Result r = fetcher.fetch_image(URL, bytes, image);
    assert(r.error == ErrorCode::INVALID_FORMAT);
    assert(r.message == "Invalid image format.");
}

TEST(unsplash_feed_request_and_parse) {
    FakeHttpClient http;
    FakeHttpClient::Response page;
    page.headers["Content-Type"] = "application/json";
    page.body = R"([{"links":{"html":"https://unsplash.com/photos/x"},)"
                R"("urls":{"regular":"https://images.unsplash.com/x","small":"https://images.unsplash.com/x-s"}}])";
    http.push(page);

    UnsplashFeed::Config cfg;
    cfg.access_key = "secret";
    cfg.per_page = 10;
    cfg.retry.wait_sec = 0.0;
    UnsplashFeed feed(cfg, http);

    std::vector<ImageRef> refs;
    Result r = feed.fetch_page(3, refs);
    assert(r.success());
    assert(refs.size() == 1);
    assert(refs[0].origin == "https://unsplash.com/photos/x");
    assert(http.requests.size() == 1);
    assert(http.requests[0].url == "https://api.unsplash.com/photos?page=3&per_page=10");
    assert(http.requests[0].headers.at("Authorization") == "Client-ID secret");
}

TEST(unsplash_feed_retries_then_fails) {
    FakeHttpClient http;
    FakeHttpClient::Response limited;
    limited.status = 403;
    http.push(limited);

    UnsplashFeed::Config cfg;
    cfg.retry.max_attempts = 2;
    cfg.retry.wait_sec = 0.0;
    UnsplashFeed feed(cfg, http);

    std::vector<ImageRef> refs;
    Result r = feed.fetch_page(1, refs);
    assert(r.error == ErrorCode::TRANSIENT_FETCH);
    assert(http.requests.size() == 2);
}

TEST(buffering_handler_limit) {
    BufferingHandler handler(4);
    HttpResponseHead head;
    head.status = 200;
    assert(handler.on_head(head));
    const uint8_t data[] = {1, 2, 3};
    assert(handler.on_data(data, 3));
    assert(!handler.on_data(data, 3));
    assert(handler.overflowed());
}

TEST(response_head_lookup) {
    HttpResponseHead head;
    head.headers["content-type"] = "image/png";
    assert(head.header("Content-Type") && *head.header("Content-Type") == "image/png");
    assert(!head.header("content-length"));
    assert(trim_ascii("  a b \r\n") == "a b");
}

int main() {
    set_log_level(LogLevel::Off);

    std::cout << "=== chromadex fetcher tests ===\n\n";

    std::cout << "--- Image Fetcher Tests ---\n";
    RUN_TEST(fetch_accepts_max_size);
    RUN_TEST(fetch_rejects_max_plus_one);
    RUN_TEST(too_large_message_in_megabytes);
    RUN_TEST(fetch_requires_content_length);
    RUN_TEST(fetch_checks_content_type);
    RUN_TEST(content_type_is_case_insensitive);
    RUN_TEST(fetch_stops_streaming_past_limit);
    RUN_TEST(fetch_retries_transient_failures);
    RUN_TEST(fetch_gives_up_after_max_attempts);
    RUN_TEST(fetch_cancelled_during_wait);
    RUN_TEST(fetch_rejects_bad_urls);
    RUN_TEST(fetch_image_decodes_and_validates);

    std::cout << "\n--- Feed Tests ---\n";
    RUN_TEST(unsplash_feed_request_and_parse);
    RUN_TEST(unsplash_feed_retries_then_fails);

    std::cout << "\n--- HTTP Helper Tests ---\n";
    RUN_TEST(buffering_handler_limit);
    RUN_TEST(response_head_lookup);

    std::cout << "\n=== Test Summary ===\n";
    std::cout << "Failures: " << failures << "\n";

    if (failures == 0) {
        std::cout << "\nAll tests passed!\n";
        return 0;
    } else {
        std::cout << "\nSome tests failed!\n";
        return 1;
    }
}
