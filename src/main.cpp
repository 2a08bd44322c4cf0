#include "core/types.hpp"
#include "core/config.hpp"
#include "core/color_space.hpp"
#include "core/log.hpp"
#include "core/stop_token.hpp"
#include "core/worker_pool.hpp"
#include "palette/color_catalog.hpp"
#include "palette/color_namer.hpp"
#include "palette/image_decoder.hpp"
#include "palette/cluster_extractor.hpp"
#include "net/http_client.hpp"
#include "net/image_fetcher.hpp"
#include "feed/unsplash_feed.hpp"
#include "store/sqlite_image_store.hpp"
#include "indexer/indexing_pipeline.hpp"
#include "service/admission.hpp"
#include "service/palette_service.hpp"
#include "service/api_router.hpp"
#include "server/http_server.hpp"
#include "cli/args.hpp"

#include <atomic>
#include <cctype>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <functional>
#include <iostream>
#include <iterator>
#include <utility>
#include <optional>
#include <thread>
#include <vector>

namespace {

std::atomic<bool> g_interrupted{false};

void handle_signal(int) {
    g_interrupted.store(true);
}

bool is_url(const std::string& target) {
    return target.rfind("http://", 0) == 0 || target.rfind("https://", 0) == 0;
}

std::string content_type_for(const std::string& path) {
    std::string::size_type dot = path.find_last_of('.');
    if (dot == std::string::npos) return "application/octet-stream";
    std::string ext = path.substr(dot + 1);
    for (char& c : ext) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (ext == "jpg" || ext == "jpeg") return "image/jpeg";
    if (ext == "png") return "image/png";
    if (ext == "gif") return "image/gif";
    if (ext == "webp") return "image/webp";
    return "application/octet-stream";
}

bool read_file(const std::string& path, std::vector<uint8_t>& out) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return false;
    out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    return !in.bad();
}

int print_response(const chromadex::ApiResponse& response, bool pretty) {
    if (response.ok()) {
        std::cout << response.to_json(pretty) << "\n";
        return 0;
    }
    std::cerr << "Error: " << response.status << " " << response.to_json(false) << "\n";
    auto retry = response.headers.find("Retry-After");
    if (retry != response.headers.end()) {
        std::cerr << "Retry-After: " << retry->second << "\n";
    }
    return 1;
}

void install_signal_handlers() {
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);
}

// After SIGINT/SIGTERM, calls on_signal on every poll until done is set, so a
// request made before the target was ready is repeated.
std::thread start_signal_watcher(chromadex::StopToken& done, std::function<void()> on_signal) {
    return std::thread([&done, on_signal]() {
        bool logged = false;
        while (!done.stop_requested()) {
            if (g_interrupted.load()) {
                if (!logged) {
                    chromadex::log_info("interrupted, shutting down");
                    logged = true;
                }
                on_signal();
            }
            done.sleep_for(std::chrono::milliseconds(100));
        }
    });
}

int run_index(const chromadex::Config& config, chromadex::HttpClient& http, chromadex::ImageStore& store,
              const chromadex::ImageFetcher& fetcher, const chromadex::ImageDecoder& decoder,
              const chromadex::ClusterExtractor& extractor, chromadex::WorkerPool& pool) {
    if (!config.indexing.enabled) {
        std::cerr << "Error: Indexing is disabled (indexing.enabled = false)\n";
        return 1;
    }
    if (config.indexing.access_key.empty()) {
        std::cerr << "Error: No Unsplash access key (set UNSPLASH_API_ACCESS_KEY or indexing.access_key)\n";
        return 1;
    }

    chromadex::UnsplashFeed feed(config.feed_config(), http);
    chromadex::IndexingPipeline pipeline(config.pipeline_config(), feed, store, fetcher, decoder, extractor, pool);

    install_signal_handlers();

    chromadex::StopToken stop;
    std::thread watcher = start_signal_watcher(stop, [&stop]() { stop.request_stop(); });

    chromadex::IndexingPipeline::RunStats stats = pipeline.run(stop);
    stop.request_stop();
    watcher.join();

    chromadex::log_info("indexed " + std::to_string(stats.indexed) + ", skipped " + std::to_string(stats.skipped) +
                        ", failed " + std::to_string(stats.failed) + " over " + std::to_string(stats.pages) +
                        " pages");
    return 0;
}

int run_serve(const chromadex::Config& config, chromadex::HttpClient& http, chromadex::ImageStore& store,
              const chromadex::ImageFetcher& fetcher, const chromadex::ImageDecoder& decoder,
              const chromadex::ClusterExtractor& extractor, chromadex::WorkerPool& pool,
              chromadex::PaletteService& service) {
    chromadex::ApiRouter router(config.router_config(), service);

    chromadex::HttpServer::Config server_config;
    server_config.host = config.server.host;
    server_config.port = config.server.port;
    server_config.threads = config.server.threads;
    server_config.max_body_bytes = static_cast<size_t>(config.image.max_size_bytes);
    chromadex::HttpServer server(server_config, router);

    std::optional<chromadex::UnsplashFeed> feed;
    std::optional<chromadex::IndexingPipeline> pipeline;
    if (!config.indexing.enabled) {
        chromadex::log_info("indexing disabled");
    } else if (config.indexing.access_key.empty()) {
        chromadex::log_warning("no Unsplash access key, indexing disabled");
    } else {
        feed.emplace(config.feed_config(), http);
        pipeline.emplace(config.pipeline_config(), *feed, store, fetcher, decoder, extractor, pool);
        pipeline->start();
    }

    install_signal_handlers();
    chromadex::StopToken done;
    std::thread watcher = start_signal_watcher(done, [&server]() { server.quit(); });

    server.run();
    done.request_stop();
    watcher.join();

    if (pipeline) {
        pipeline->stop();
        chromadex::IndexingPipeline::RunStats stats = pipeline->stats();
        chromadex::log_info("indexed " + std::to_string(stats.indexed) + ", skipped " +
                            std::to_string(stats.skipped) + ", failed " + std::to_string(stats.failed));
    }
    return 0;
}

}

int main(int argc, char* argv[]) {
    chromadex::Args args = chromadex::parse_args(argc, argv);

    if (args.show_help) {
        chromadex::print_help(argv[0]);
        return 0;
    }
    if (!args.error.empty()) {
        std::cerr << "Error: " << args.error << "\n";
        chromadex::print_help(argv[0]);
        return 1;
    }
    if (args.command == chromadex::Command::None) {
        std::cerr << "Error: No command specified\n";
        chromadex::print_help(argv[0]);
        return 1;
    }

    chromadex::Config config = chromadex::Config::defaults();
    if (!args.config_path.empty()) {
        std::string load_error;
        auto loaded = chromadex::Config::load(args.config_path, &load_error);
        if (!loaded) {
            std::cerr << "Error: Failed to load config file: " << args.config_path << " - " << load_error << "\n";
            return 1;
        }
        config = *loaded;
    } else if (auto loaded_default = chromadex::Config::load_default()) {
        config = *loaded_default;
    }
    chromadex::apply_env_overrides(config);
    config = chromadex::apply_cli_overrides(config, args);

    std::string config_error;
    if (!config.validate(config_error)) {
        std::cerr << "Error: Invalid config: " << config_error << "\n";
        return 1;
    }

    chromadex::LogLevel level = chromadex::LogLevel::Info;
    chromadex::parse_log_level(config.log.level, level);
    chromadex::set_log_level(level);

    chromadex::ColorSpace::init();

    chromadex::ColorCatalog catalog = chromadex::ColorCatalog::builtin();
    if (!config.catalog.path.empty()) {
        chromadex::Result result = chromadex::ColorCatalog::load_json(config.catalog.path, catalog);
        if (result.failure()) {
            std::cerr << "Error: Failed to load color catalog: " << config.catalog.path << " - " << result.message
                      << "\n";
            return 1;
        }
    }

    try {
        chromadex::ColorNamer namer(std::move(catalog));
        chromadex::ImageDecoder decoder(config.decoder_config());
        chromadex::ClusterExtractor extractor(config.extractor_config(), &namer);
        chromadex::CurlHttpClient http;
        chromadex::ImageFetcher fetcher(config.fetcher_config(), http, decoder);

        chromadex::SqliteImageStore::Config store_config;
        store_config.path = config.storage.path;
        chromadex::SqliteImageStore store(store_config);

        chromadex::WorkerPool pool(config.extraction.pool_size);
        pool.warm_up();

        if (args.command == chromadex::Command::Index) {
            int code = run_index(config, http, store, fetcher, decoder, extractor, pool);
            pool.shutdown();
            return code;
        }

        chromadex::MemoryCounterStore counters;
        chromadex::RateLimiter limiter(counters);
        chromadex::ConcurrencyGate gate(config.rate_limit.color_extraction_concurrency);

        chromadex::PaletteService::Config service_config = config.service_config();
        chromadex::PaletteService service(service_config, store, fetcher, decoder, extractor, pool, limiter, gate);

        if (args.command == chromadex::Command::Serve) {
            int code = run_serve(config, http, store, fetcher, decoder, extractor, pool, service);
            pool.shutdown();
            return code;
        }

        chromadex::ApiResponse response;
        switch (args.command) {
            case chromadex::Command::Extract:
                if (is_url(args.target)) {
                    response = service.extract_from_url(args.client, args.target);
                } else {
                    std::vector<uint8_t> bytes;
                    if (!read_file(args.target, bytes)) {
                        std::cerr << "Error: Failed to read file: " << args.target << "\n";
                        pool.shutdown();
                        return 1;
                    }
                    response = service.extract_from_bytes(args.client, bytes, content_type_for(args.target));
                }
                break;
            case chromadex::Command::Search: {
                std::optional<int> limit;
                if (args.limit >= 0) limit = args.limit;
                response = service.search(args.client, args.target, limit, args.offset);
                break;
            }
            case chromadex::Command::Show: {
                char* end = nullptr;
                long long id = std::strtoll(args.target.c_str(), &end, 10);
                if (end == args.target.c_str() || *end != '\0') {
                    std::cerr << "Error: Invalid image id: " << args.target << "\n";
                    pool.shutdown();
                    return 1;
                }
                response = service.detail(static_cast<int64_t>(id));
                break;
            }
            case chromadex::Command::Index:
            case chromadex::Command::Serve:
            case chromadex::Command::None:
                break;
        }

        pool.shutdown();
        return print_response(response, args.pretty);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
