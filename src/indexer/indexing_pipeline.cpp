#include "indexer/indexing_pipeline.hpp"
#include "core/log.hpp"
#include "feed/page_cursor.hpp"
#include <chrono>
#include <exception>
#include <future>

namespace chromadex {

IndexingPipeline::IndexingPipeline(const Config& config, FeedSource& feed, ImageStore& store,
                                   const ImageFetcher& fetcher, const ImageDecoder& decoder,
                                   const ClusterExtractor& extractor, WorkerPool& pool)
    : config_(config),
      feed_(feed),
      store_(store),
      fetcher_(fetcher),
      decoder_(decoder),
      extractor_(extractor),
      pool_(pool) {}

IndexingPipeline::~IndexingPipeline() {
    stop();
}

void IndexingPipeline::start() {
    if (running_.load()) return;
    if (thread_.joinable()) thread_.join();
    stop_.reset();
    running_.store(true);
    thread_ = std::thread([this]() {
        RunStats s = run(stop_);
        running_.store(false);
        log_info("indexing finished: " + std::to_string(s.pages) + " pages, " +
                 std::to_string(s.indexed) + " indexed, " + std::to_string(s.skipped) + " skipped, " +
                 std::to_string(s.failed) + " failed");
    });
}

void IndexingPipeline::stop() {
    stop_.request_stop();
    if (thread_.joinable()) {
        thread_.join();
    }
}

bool IndexingPipeline::running() const {
    return running_.load() && !stop_.stop_requested();
}

IndexingPipeline::RunStats IndexingPipeline::stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

void IndexingPipeline::record(Outcome outcome) {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    switch (outcome) {
        case Outcome::Indexed: ++stats_.indexed; break;
        case Outcome::Skipped: ++stats_.skipped; break;
        case Outcome::Failed: ++stats_.failed; break;
        case Outcome::Cancelled: break;
    }
}

bool IndexingPipeline::pause(const StopToken& stop) const {
    if (config_.periodicity_sec <= 0.0) return !stop.stop_requested();
    return stop.sleep_for(std::chrono::duration<double>(config_.periodicity_sec));
}

IndexingPipeline::RunStats IndexingPipeline::run(const StopToken& stop) {
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_ = RunStats();
    }

    PageCursor::Config cursor_config;
    cursor_config.start_page = config_.start_page;
    cursor_config.end_page = config_.end_page;
    cursor_config.cyclic = config_.cyclic;
    PageCursor cursor(cursor_config);

    while (!stop.stop_requested()) {
        std::optional<int> page = cursor.current();
        if (!page) break;

        std::vector<ImageRef> refs;
        Result result = feed_.fetch_page(*page, refs);
        if (result.failure()) {
            log_warning("failed to fetch page " + std::to_string(*page) + " from " + feed_.name() +
                        ": " + result.message);
            if (!pause(stop)) break;
            continue;
        }

        if (refs.empty()) {
            if (!cursor.on_empty_page()) {
                log_info("feed " + feed_.name() + " exhausted at page " + std::to_string(*page));
                break;
            }
            {
                std::lock_guard<std::mutex> lock(stats_mutex_);
                stats_.cycles = cursor.wraps();
            }
            log_info("feed " + feed_.name() + " exhausted at page " + std::to_string(*page) +
                     ", starting over");
            if (!pause(stop)) break;
            continue;
        }

        cursor.advance();
        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            ++stats_.pages;
            stats_.cycles = cursor.wraps();
        }

        index_page(refs, stop);

        if (cursor.exhausted()) {
            log_info("reached end page " + std::to_string(config_.end_page));
            break;
        }
        if (!pause(stop)) break;
    }

    return stats();
}

void IndexingPipeline::index_page(const std::vector<ImageRef>& refs, const StopToken& stop) {
    std::vector<std::future<Outcome>> futures;
    futures.reserve(refs.size());
    for (const auto& ref : refs) {
        futures.push_back(std::async(std::launch::async, [this, &ref, &stop]() {
            try {
                return index(ref, stop);
            } catch (const std::exception& e) {
                log_error("indexing " + ref.url_big + " failed: " + e.what());
                return Outcome::Failed;
            }
        }));
    }

    for (size_t i = 0; i < futures.size(); ++i) {
        record(futures[i].get());
        log_debug("processed (" + std::to_string(i + 1) + " of " + std::to_string(refs.size()) +
                  "): " + refs[i].url_big);
    }
}

IndexingPipeline::Outcome IndexingPipeline::index(const ImageRef& ref, const StopToken& stop) {
    if (stop.stop_requested()) return Outcome::Cancelled;

    if (!config_.rewrite_existing) {
        bool exists = false;
        Result result = store_.exists(ref.origin, exists);
        if (result.failure()) {
            log_warning("existence check for " + ref.origin + " failed: " + result.message);
            return Outcome::Failed;
        }
        if (exists) return Outcome::Skipped;
    }

    std::vector<uint8_t> bytes;
    Result result = fetcher_.fetch(ref.url_big, bytes, &stop);
    if (result.error == ErrorCode::CANCELLED) return Outcome::Cancelled;
    if (result.error == ErrorCode::TRANSIENT_FETCH) {
        log_warning("could not load image from " + ref.url_big);
        return Outcome::Failed;
    }
    if (result.failure()) {
        log_warning("validation error for " + ref.url_big + ": " + result.message);
        return Outcome::Failed;
    }

    std::vector<Color> colors;
    std::future<Result> extraction = pool_.submit([this, &bytes, &colors]() {
        return extractor_.extract_from_bytes(bytes, decoder_, colors);
    });
    result = extraction.get();
    if (result.failure()) {
        log_warning("validation error for " + ref.url_big + ": " + result.message);
        return Outcome::Failed;
    }

    int64_t id = 0;
    result = store_.replace(ref, colors, id);
    if (result.failure()) {
        log_error("failed to store " + ref.origin + ": " + result.message);
        return Outcome::Failed;
    }
    log_debug("indexed " + ref.origin + " as image " + std::to_string(id));
    return Outcome::Indexed;
}

}
