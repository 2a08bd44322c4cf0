#pragma once

#include "core/types.hpp"
#include "core/color.hpp"
#include "core/worker_pool.hpp"
#include "net/image_fetcher.hpp"
#include "palette/cluster_extractor.hpp"
#include "palette/image_decoder.hpp"
#include "service/admission.hpp"
#include "store/image_store.hpp"
#include <json/json.h>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace chromadex {

struct ApiResponse {
    int status = 200;
    Json::Value body;
    std::map<std::string, std::string> headers;

    bool ok() const { return status >= 200 && status < 300; }
    std::string to_json(bool pretty = false) const;
};

// The public API: palette extraction, color search and image detail, as
// status codes and JSON bodies. Transport-neutral.
class PaletteService {
public:
    struct Config {
        RateLimiter::Rule extraction_rule{300, 10};
        RateLimiter::Rule search_rule{60, 15};
        int default_limit = 30;
        int max_limit = 100;
    };

    PaletteService(const Config& config, ImageStore& store, const ImageFetcher& fetcher,
                   const ImageDecoder& decoder, const ClusterExtractor& extractor, WorkerPool& pool,
                   RateLimiter& limiter, ConcurrencyGate& gate);

    // content_type, when given, is checked like a fetched response's.
    ApiResponse extract_from_bytes(const std::string& client, const std::vector<uint8_t>& bytes,
                                   const std::optional<std::string>& content_type);
    ApiResponse extract_from_url(const std::string& client, const std::string& url);

    // hex must be six lowercase hex digits.
    ApiResponse search(const std::string& client, const std::string& hex, std::optional<int> limit,
                       int offset);
    ApiResponse detail(int64_t id);

    static Json::Value color_json(const Color& color);
    static Json::Value image_json(const ImageRef& ref);
    static ApiResponse error_response(const Result& result);
    static bool is_search_hex(const std::string& hex);

private:
    Config config_;
    ImageStore& store_;
    const ImageFetcher& fetcher_;
    const ImageDecoder& decoder_;
    const ClusterExtractor& extractor_;
    WorkerPool& pool_;
    RateLimiter& limiter_;
    ConcurrencyGate& gate_;

    ApiResponse run_extraction(const std::vector<uint8_t>& bytes);
    static ApiResponse palette_response(const std::vector<Color>& colors);
};

}
