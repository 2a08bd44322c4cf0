#pragma once

#include "core/types.hpp"
#include "core/stop_token.hpp"
#include "net/http_client.hpp"
#include "net/retry_policy.hpp"
#include "palette/image_decoder.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace chromadex {

class ImageFetcher {
public:
    struct Config {
        std::vector<std::string> allowed_content_types = {"image/jpeg", "image/png"};
        size_t max_size_bytes = 5242880;
        int timeout_sec = 30;
        RetryPolicy::Config retry;
    };

    ImageFetcher(const Config& config, HttpClient& client, const ImageDecoder& decoder);

    // Downloads and validates raw bytes. Network failures are retried;
    // validation failures are returned immediately.
    Result fetch(const std::string& url, std::vector<uint8_t>& bytes,
                 const StopToken* stop = nullptr) const;

    // fetch() followed by decoding and the dimension check.
    Result fetch_image(const std::string& url, std::vector<uint8_t>& bytes, RgbImage& image,
                       const StopToken* stop = nullptr) const;

    // Absolute http(s) URL with a dotted host.
    static Result validate_url(const std::string& url);

    // Media type before any parameters, trimmed and compared case-insensitively.
    Result validate_content_type(const std::string& content_type) const;
    // A missing, unparseable or zero length counts as missing.
    Result validate_content_length(const std::optional<std::string>& content_length) const;
    Result validate_size(size_t size) const;

    std::string too_large_message() const;
    std::string invalid_type_message() const;

    const Config& config() const { return config_; }

private:
    Config config_;
    HttpClient& client_;
    const ImageDecoder& decoder_;
    RetryPolicy retry_;

    Result fetch_once(const std::string& url, std::vector<uint8_t>& bytes) const;
};

}
