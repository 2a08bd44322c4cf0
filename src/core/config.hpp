#pragma once

#include "core/types.hpp"
#include "feed/page_cursor.hpp"
#include "feed/unsplash_feed.hpp"
#include "indexer/indexing_pipeline.hpp"
#include "net/image_fetcher.hpp"
#include "palette/cluster_extractor.hpp"
#include "palette/image_decoder.hpp"
#include "service/api_router.hpp"
#include "service/palette_service.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace chromadex {

constexpr int CONFIG_VERSION = 1;

struct ConfigImage {
    int min_width = 50;
    int min_height = 50;
    int max_width = 8000;
    int max_height = 8000;
    int64_t max_size_bytes = 5242880;
    std::vector<std::string> allowed_content_types = {"image/jpeg", "image/png"};
};

struct ConfigHttp {
    int timeout_sec = 30;
    double retry_wait_sec = 3.0;
    int retry_max_attempts = 5;
    double retry_backoff = 1.0;
};

struct ConfigIndexing {
    bool enabled = true;
    int interval_sec = 600;
    int start_page = 1;
    int end_page = 300;
    bool cyclic = true;
    bool rewrite_existing = false;
    int images_per_page = 30;
    std::string access_key;
    std::string base_url = "https://api.unsplash.com/photos";
};

struct ConfigRateLimit {
    int color_extraction_window_sec = 300;
    int color_extraction_limit = 10;
    int image_search_window_sec = 60;
    int image_search_limit = 15;
    int color_extraction_concurrency = 20;
};

struct ConfigExtraction {
    int max_clusters = 12;
    double merge_threshold = 20.0;
    int thumbnail_size = 300;
    int64_t seed = 0x5eed;
    int pool_size = 2;
};

struct ConfigStorage {
    std::string path = "chromadex.db";
};

struct ConfigCatalog {
    // Empty means the built-in catalog.
    std::string path;
};

struct ConfigServer {
    std::string host = "0.0.0.0";
    int port = 8080;
    int threads = 4;
    // Empty disables the CORS headers.
    std::string cors_allow_origin = "*";
};

struct ConfigLog {
    std::string level = "info";
};

struct Config {
    int version = CONFIG_VERSION;
    ConfigImage image;
    ConfigHttp http;
    ConfigIndexing indexing;
    ConfigRateLimit rate_limit;
    ConfigExtraction extraction;
    ConfigStorage storage;
    ConfigCatalog catalog;
    ConfigServer server;
    ConfigLog log;

    std::string config_path;

    bool validate(std::string& error) const;

    ImageDecoder::Config decoder_config() const;
    ImageFetcher::Config fetcher_config() const;
    ClusterExtractor::Config extractor_config() const;
    UnsplashFeed::Config feed_config() const;
    IndexingPipeline::Config pipeline_config() const;
    PaletteService::Config service_config() const;
    ApiRouter::Config router_config() const;

    static Config defaults();
    // On failure, error (if given) receives the reason.
    static std::optional<Config> load(const std::string& path, std::string* error = nullptr);
    static std::optional<Config> load_default();
    static std::string default_config_path();
    static std::string default_config_dir();
};

Config apply_cli_overrides(Config config, const struct Args& args);

// UNSPLASH_API_ACCESS_KEY replaces indexing.access_key when set.
void apply_env_overrides(Config& config);

}
