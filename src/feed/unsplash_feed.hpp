#pragma once

#include "core/types.hpp"
#include "feed/feed_source.hpp"
#include "net/http_client.hpp"
#include "net/retry_policy.hpp"
#include <string>
#include <vector>

namespace chromadex {

// Photo listing from the Unsplash API.
class UnsplashFeed : public FeedSource {
public:
    struct Config {
        std::string base_url = "https://api.unsplash.com/photos";
        std::string access_key;
        int per_page = 30;
        int timeout_sec = 30;
        size_t max_response_bytes = 8 * 1024 * 1024;
        RetryPolicy::Config retry;
    };

    UnsplashFeed(const Config& config, HttpClient& client);

    Result fetch_page(int page, std::vector<ImageRef>& out) override;
    std::string name() const override { return "unsplash"; }

    std::string page_url(int page) const;

    // Maps links.html, urls.regular and urls.small of each listed photo.
    static Result parse_page(const std::string& text, std::vector<ImageRef>& out);

private:
    Config config_;
    HttpClient& client_;
    RetryPolicy retry_;

    Result fetch_page_once(int page, std::vector<ImageRef>& out);
};

}
