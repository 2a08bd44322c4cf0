#include "core/config.hpp"
#include "core/log.hpp"
#include "cli/args.hpp"
#include <toml.hpp>

#include <cstdlib>
#include <filesystem>

#include <unistd.h>
#include <pwd.h>

namespace chromadex {

namespace {

std::string get_home_dir() {
    const char* home = std::getenv("HOME");
    if (home) return std::string(home);
    struct passwd* pw = getpwuid(getuid());
    if (pw) return std::string(pw->pw_dir);
    return ".";
}

std::string get_app_data_dir() {
    const char* xdg_config = std::getenv("XDG_CONFIG_HOME");
    if (xdg_config) return std::string(xdg_config);
    return get_home_dir() + "/.config";
}

bool fail(std::string& error, const std::string& message) {
    error = message;
    return false;
}

}

Config Config::defaults() {
    Config cfg;
    cfg.version = CONFIG_VERSION;
    return cfg;
}

std::string Config::default_config_dir() {
    return get_app_data_dir() + "/chromadex";
}

std::string Config::default_config_path() {
    return default_config_dir() + "/config.toml";
}

bool Config::validate(std::string& error) const {
    if (image.min_width < 1 || image.min_height < 1) {
        return fail(error, "image.min_width and image.min_height must be at least 1");
    }
    if (image.max_width < image.min_width || image.max_height < image.min_height) {
        return fail(error, "image.max_width/max_height cannot be below the minimum");
    }
    if (image.max_size_bytes < 1) {
        return fail(error, "image.max_size_bytes must be positive");
    }
    if (image.allowed_content_types.empty()) {
        return fail(error, "image.allowed_content_types must not be empty");
    }
    if (http.timeout_sec < 1 || http.timeout_sec > 600) {
        return fail(error, "http.timeout_sec must be between 1 and 600");
    }
    if (http.retry_max_attempts < 1 || http.retry_max_attempts > 20) {
        return fail(error, "http.retry_max_attempts must be between 1 and 20");
    }
    if (http.retry_wait_sec < 0.0) {
        return fail(error, "http.retry_wait_sec must not be negative");
    }
    if (http.retry_backoff < 1.0) {
        return fail(error, "http.retry_backoff must be at least 1.0");
    }
    if (indexing.interval_sec < 0) {
        return fail(error, "indexing.interval_sec must not be negative");
    }
    if (indexing.start_page < 1) {
        return fail(error, "indexing.start_page must be at least 1");
    }
    if (indexing.end_page != 0 && indexing.end_page < indexing.start_page) {
        return fail(error, "indexing.end_page must be 0 (unbounded) or >= indexing.start_page");
    }
    if (indexing.images_per_page < 1 || indexing.images_per_page > 30) {
        return fail(error, "indexing.images_per_page must be between 1 and 30");
    }
    if (rate_limit.color_extraction_window_sec < 1 || rate_limit.image_search_window_sec < 1) {
        return fail(error, "rate_limit windows must be at least 1 second");
    }
    if (rate_limit.color_extraction_limit < 1 || rate_limit.image_search_limit < 1) {
        return fail(error, "rate_limit limits must be at least 1");
    }
    if (rate_limit.color_extraction_concurrency < 1) {
        return fail(error, "rate_limit.color_extraction_concurrency must be at least 1");
    }
    if (extraction.max_clusters < 1 || extraction.max_clusters > 64) {
        return fail(error, "extraction.max_clusters must be between 1 and 64");
    }
    if (extraction.merge_threshold < 0.0) {
        return fail(error, "extraction.merge_threshold must not be negative");
    }
    if (extraction.thumbnail_size < 1 || extraction.thumbnail_size > 4096) {
        return fail(error, "extraction.thumbnail_size must be between 1 and 4096");
    }
    if (extraction.pool_size < 1 || extraction.pool_size > 256) {
        return fail(error, "extraction.pool_size must be between 1 and 256");
    }
    if (server.host.empty()) {
        return fail(error, "server.host must not be empty");
    }
    if (server.port < 1 || server.port > 65535) {
        return fail(error, "server.port must be between 1 and 65535");
    }
    if (server.threads < 1 || server.threads > 256) {
        return fail(error, "server.threads must be between 1 and 256");
    }
    if (storage.path.empty()) {
        return fail(error, "storage.path must not be empty");
    }
    LogLevel level;
    if (!parse_log_level(log.level, level)) {
        return fail(error, "log.level must be 'debug', 'info', 'warning', 'error', or 'off'");
    }
    return true;
}

std::optional<Config> Config::load(const std::string& path, std::string* error) {
    std::string local_error;
    std::string& err = error ? *error : local_error;

    std::error_code ec;
    if (!std::filesystem::exists(std::filesystem::path(path), ec) || ec) {
        err = "file not found: " + path;
        return std::nullopt;
    }

    try {
        auto tbl = toml::parse_file(path);

        Config cfg = defaults();
        cfg.config_path = path;

        if (auto v = tbl["config_version"].value<int>()) {
            if (*v != CONFIG_VERSION) {
                err = "unsupported config_version " + std::to_string(*v);
                return std::nullopt;
            }
        }

        if (auto image = tbl["image"]) {
            if (auto v = image["min_width"].value<int>()) cfg.image.min_width = *v;
            if (auto v = image["min_height"].value<int>()) cfg.image.min_height = *v;
            if (auto v = image["max_width"].value<int>()) cfg.image.max_width = *v;
            if (auto v = image["max_height"].value<int>()) cfg.image.max_height = *v;
            if (auto v = image["max_size_bytes"].value<int64_t>()) cfg.image.max_size_bytes = *v;
            if (auto arr = image["allowed_content_types"].as_array()) {
                cfg.image.allowed_content_types.clear();
                for (const auto& el : *arr) {
                    if (auto s = el.value<std::string>()) cfg.image.allowed_content_types.push_back(*s);
                }
            }
        }

        if (auto http = tbl["http"]) {
            if (auto v = http["timeout_sec"].value<int>()) cfg.http.timeout_sec = *v;
            if (auto v = http["retry_wait_sec"].value<double>()) cfg.http.retry_wait_sec = *v;
            if (auto v = http["retry_max_attempts"].value<int>()) cfg.http.retry_max_attempts = *v;
            if (auto v = http["retry_backoff"].value<double>()) cfg.http.retry_backoff = *v;
        }

        if (auto indexing = tbl["indexing"]) {
            if (auto v = indexing["enabled"].value<bool>()) cfg.indexing.enabled = *v;
            if (auto v = indexing["interval_sec"].value<int>()) cfg.indexing.interval_sec = *v;
            if (auto v = indexing["start_page"].value<int>()) cfg.indexing.start_page = *v;
            if (auto v = indexing["end_page"].value<int>()) cfg.indexing.end_page = *v;
            if (auto v = indexing["cyclic"].value<bool>()) cfg.indexing.cyclic = *v;
            if (auto v = indexing["rewrite_existing"].value<bool>()) cfg.indexing.rewrite_existing = *v;
            if (auto v = indexing["images_per_page"].value<int>()) cfg.indexing.images_per_page = *v;
            if (auto v = indexing["access_key"].value<std::string>()) cfg.indexing.access_key = *v;
            if (auto v = indexing["base_url"].value<std::string>()) cfg.indexing.base_url = *v;
        }

        if (auto rate = tbl["rate_limit"]) {
            if (auto v = rate["color_extraction_window_sec"].value<int>()) cfg.rate_limit.color_extraction_window_sec = *v;
            if (auto v = rate["color_extraction_limit"].value<int>()) cfg.rate_limit.color_extraction_limit = *v;
            if (auto v = rate["image_search_window_sec"].value<int>()) cfg.rate_limit.image_search_window_sec = *v;
            if (auto v = rate["image_search_limit"].value<int>()) cfg.rate_limit.image_search_limit = *v;
            if (auto v = rate["color_extraction_concurrency"].value<int>()) cfg.rate_limit.color_extraction_concurrency = *v;
        }

        if (auto extraction = tbl["extraction"]) {
            if (auto v = extraction["max_clusters"].value<int>()) cfg.extraction.max_clusters = *v;
            if (auto v = extraction["merge_threshold"].value<double>()) cfg.extraction.merge_threshold = *v;
            if (auto v = extraction["thumbnail_size"].value<int>()) cfg.extraction.thumbnail_size = *v;
            if (auto v = extraction["seed"].value<int64_t>()) cfg.extraction.seed = *v;
            if (auto v = extraction["pool_size"].value<int>()) cfg.extraction.pool_size = *v;
        }

        if (auto server = tbl["server"]) {
            if (auto v = server["host"].value<std::string>()) cfg.server.host = *v;
            if (auto v = server["port"].value<int>()) cfg.server.port = *v;
            if (auto v = server["threads"].value<int>()) cfg.server.threads = *v;
            if (auto v = server["cors_allow_origin"].value<std::string>()) cfg.server.cors_allow_origin = *v;
        }

        if (auto v = tbl["storage"]["path"].value<std::string>()) cfg.storage.path = *v;
        if (auto v = tbl["catalog"]["path"].value<std::string>()) cfg.catalog.path = *v;
        if (auto v = tbl["log"]["level"].value<std::string>()) cfg.log.level = *v;

        if (!cfg.validate(err)) {
            return std::nullopt;
        }

        return cfg;
    } catch (const toml::parse_error& e) {
        err = std::string(e.description());
        return std::nullopt;
    }
}

std::optional<Config> Config::load_default() {
    std::string path = default_config_path();
    return load(path);
}

ImageDecoder::Config Config::decoder_config() const {
    ImageDecoder::Config c;
    c.min_width = image.min_width;
    c.min_height = image.min_height;
    c.max_width = image.max_width;
    c.max_height = image.max_height;
    return c;
}

ImageFetcher::Config Config::fetcher_config() const {
    ImageFetcher::Config c;
    c.allowed_content_types = image.allowed_content_types;
    c.max_size_bytes = static_cast<size_t>(image.max_size_bytes);
    c.timeout_sec = http.timeout_sec;
    c.retry.max_attempts = http.retry_max_attempts;
    c.retry.wait_sec = http.retry_wait_sec;
    c.retry.backoff = http.retry_backoff;
    return c;
}

ClusterExtractor::Config Config::extractor_config() const {
    ClusterExtractor::Config c;
    c.max_clusters = extraction.max_clusters;
    c.merge_threshold = extraction.merge_threshold;
    c.thumbnail_size = extraction.thumbnail_size;
    c.seed = static_cast<uint64_t>(extraction.seed);
    return c;
}

UnsplashFeed::Config Config::feed_config() const {
    UnsplashFeed::Config c;
    c.base_url = indexing.base_url;
    c.access_key = indexing.access_key;
    c.per_page = indexing.images_per_page;
    c.timeout_sec = http.timeout_sec;
    c.retry.max_attempts = http.retry_max_attempts;
    c.retry.wait_sec = http.retry_wait_sec;
    c.retry.backoff = http.retry_backoff;
    return c;
}

IndexingPipeline::Config Config::pipeline_config() const {
    IndexingPipeline::Config c;
    c.periodicity_sec = static_cast<double>(indexing.interval_sec);
    c.rewrite_existing = indexing.rewrite_existing;
    c.start_page = indexing.start_page;
    c.end_page = indexing.end_page;
    c.cyclic = indexing.cyclic;
    return c;
}

PaletteService::Config Config::service_config() const {
    PaletteService::Config c;
    c.extraction_rule.window_sec = rate_limit.color_extraction_window_sec;
    c.extraction_rule.limit = rate_limit.color_extraction_limit;
    c.search_rule.window_sec = rate_limit.image_search_window_sec;
    c.search_rule.limit = rate_limit.image_search_limit;
    return c;
}

ApiRouter::Config Config::router_config() const {
    ApiRouter::Config c;
    c.cors_allow_origin = server.cors_allow_origin;
    return c;
}

Config apply_cli_overrides(Config config, const Args& args) {
    if (!args.db_path.empty()) config.storage.path = args.db_path;
    if (!args.catalog_path.empty()) config.catalog.path = args.catalog_path;
    if (!args.log_level.empty()) config.log.level = args.log_level;

    if (args.start_page > 0) config.indexing.start_page = args.start_page;
    if (args.end_page >= 0) config.indexing.end_page = args.end_page;
    if (args.cyclic_set) config.indexing.cyclic = args.cyclic;
    if (args.rewrite) config.indexing.rewrite_existing = true;
    if (args.interval_sec >= 0) config.indexing.interval_sec = args.interval_sec;
    if (args.workers > 0) config.extraction.pool_size = args.workers;
    if (args.seed_set) config.extraction.seed = args.seed;
    if (!args.host.empty()) config.server.host = args.host;
    if (args.port > 0) config.server.port = args.port;
    return config;
}

void apply_env_overrides(Config& config) {
    const char* key = std::getenv("UNSPLASH_API_ACCESS_KEY");
    if (key && *key) config.indexing.access_key = key;
}

}
